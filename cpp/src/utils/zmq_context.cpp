#include "utils/zmq_context.hpp"
#include "fed_service.hpp"

#include <mutex>
#include <stdexcept>

namespace federator::utils
{

namespace
{
constexpr std::chrono::milliseconds kZMQContextShutdownTimeoutMs{2000};

std::mutex g_context_mutex;
std::unique_ptr<zmq::context_t> g_context;

void do_zmq_context_startup(const char * /*arg*/)
{
    zmq_context_startup();
}

void do_zmq_context_shutdown(const char * /*arg*/)
{
    zmq_context_shutdown();
}
} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        throw std::logic_error("ZMQContext: context requested before module startup");
    }
    return *g_context;
}

void zmq_context_startup()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        g_context = std::make_unique<zmq::context_t>(1);
        LOGGER_INFO("ZMQContext: ZeroMQ context created.");
    }
}

void zmq_context_shutdown()
{
    std::unique_ptr<zmq::context_t> doomed;
    {
        std::lock_guard<std::mutex> lock(g_context_mutex);
        doomed = std::move(g_context);
    }
    if (!doomed)
    {
        return;
    }
    doomed.reset();
    LOGGER_INFO("ZMQContext: ZeroMQ context destroyed.");
}

ModuleDef GetZMQContextModule()
{
    ModuleDef module("ZMQContext");
    module.add_dependency("federator::utils::Logger");
    module.set_startup(&do_zmq_context_startup);
    module.set_shutdown(&do_zmq_context_shutdown, kZMQContextShutdownTimeoutMs);
    return module;
}

} // namespace federator::utils
