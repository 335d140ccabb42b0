#pragma once
/**
 * @file test_patterns.h
 * @brief The test patterns used across the federator test suite.
 *
 * The Logger, CryptoUtils and the ZeroMQ context are process-global lifecycle
 * modules. main() initializes none of them, so a test that needs one runs its
 * body in a child process.
 *
 * ## Pattern 1: PureApiTest
 *
 * In-process, no lifecycle. For parsers, filters, stores, the streamer against a
 * mock sink: everything whose logging may be silently dropped.
 *
 * ## Pattern 2: plain ::testing::Test with ThreadRacer
 *
 * In-process concurrency tests that need no lifecycle module.
 *
 * ## Pattern 3: IsolatedProcessTest
 *
 *   TEST_F(CryptoTest, Sha256Stream) {
 *       auto w = SpawnWorker("crypto.sha256_stream");
 *       ExpectWorkerOk(w);
 *   }
 *
 * The worker wraps its body in run_gtest_worker() with the modules it needs.
 */

#include "gtest/gtest.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"

#include <list>
#include <string>
#include <utility>
#include <vector>

namespace federator::tests
{

class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

/**
 * @brief Base class for tests that re-execute the test binary as worker processes.
 */
class IsolatedProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ASSERT_FALSE(g_self_exe_path.empty())
            << "g_self_exe_path is empty; test_entrypoint.cpp must set it in main()";
    }

    helper::WorkerProcess SpawnWorker(const std::string &scenario,
                                      std::vector<std::string> args = {},
                                      bool redirect_stderr_to_console = false)
    {
        return helper::WorkerProcess(g_self_exe_path, scenario, args, redirect_stderr_to_console);
    }

    /// Starts all workers before waiting on any. std::list because WorkerProcess cannot move.
    std::list<helper::WorkerProcess>
    SpawnWorkers(std::vector<std::pair<std::string, std::vector<std::string>>> scenarios)
    {
        std::list<helper::WorkerProcess> workers;
        for (auto &[scenario, args] : scenarios)
            workers.emplace_back(g_self_exe_path, scenario, args, false);
        return workers;
    }

    void ExpectWorkerOk(helper::WorkerProcess &proc,
                        std::vector<std::string> expected_stderr_substrings = {},
                        bool allow_expected_logger_errors = false)
    {
        proc.wait_for_exit();
        helper::expect_worker_ok(proc, expected_stderr_substrings, allow_expected_logger_errors);
    }

    void ExpectAllWorkersOk(std::list<helper::WorkerProcess> &workers)
    {
        for (auto &w : workers)
        {
            w.wait_for_exit();
            helper::expect_worker_ok(w);
        }
    }
};

} // namespace federator::tests
