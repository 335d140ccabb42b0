// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief main() shared by every test executable.
 *
 * 1. **Worker mode**: argv[1] of the form "module.scenario" is handed to the
 *    registered dispatchers in order until one claims it. The worker sets up its
 *    own lifecycle through run_gtest_worker() or run_worker_bare().
 *
 * 2. **Test runner mode**: GoogleTest runs with no lifecycle initialized. Only
 *    PureApiTest style tests run in this process; anything that needs the Logger,
 *    CryptoUtils or the ZeroMQ context spawns a worker.
 */
#include "test_entrypoint.h"

#include <vector>

std::string g_self_exe_path;

static std::vector<WorkerDispatchFn> &worker_dispatchers()
{
    static std::vector<WorkerDispatchFn> list;
    return list;
}

void register_worker_dispatcher(WorkerDispatchFn fn)
{
    worker_dispatchers().push_back(fn);
}

int main(int argc, char **argv)
{
    g_self_exe_path = (argc >= 1) ? argv[0] : "";

    if (argc > 1)
    {
        const std::string mode_str = argv[1];
        if (mode_str.find('.') != std::string::npos && mode_str.rfind("--", 0) != 0)
        {
            for (auto fn : worker_dispatchers())
            {
                const int r = fn(argc, argv);
                if (r != -1)
                    return r;
            }
        }
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
