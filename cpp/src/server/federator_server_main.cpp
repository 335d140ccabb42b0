#include "fed_transfer.hpp"

#include <csignal>

namespace
{
federator::transfer::TransferServer *g_server = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_server != nullptr)
    {
        g_server->stop();
    }
}
} // namespace

int main(int argc, char *argv[])
{
    using namespace federator;

    utils::LifecycleGuard lifecycle(utils::MakeModDefList(utils::Logger::GetLifecycleModule(),
                                                          crypto::GetLifecycleModule(),
                                                          utils::GetZMQContextModule()));

    const std::filesystem::path config_path =
        argc >= 2 ? argv[1] : std::filesystem::path{}; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    auto config = transfer::FederatorConfig::load(config_path);
    if (config.is_error())
    {
        LOGGER_ERROR("federator-server: {}", config.error_message());
        return 1;
    }
    auto logging = transfer::apply_logging(config.content().logging);
    if (logging.is_error())
    {
        LOGGER_ERROR("federator-server: {}", logging.error_message());
        return 1;
    }

    auto offsets = transfer::make_offset_store(config.content().offsets);
    if (offsets.is_error())
    {
        LOGGER_ERROR("federator-server: {}", offsets.error_message());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    transfer::TransferServer::Options options;
    options.config = std::move(config).content();
    if (options.config.topics.source == transfer::EventSourceKind::Memory)
    {
        LOGGER_WARN("federator-server: memory topics are empty in a standalone server");
        options.memory_topics = std::make_shared<transfer::MemoryTopicRegistry>();
    }
    const std::string endpoint = options.config.server.control_endpoint;

    transfer::TransferServer server(std::move(options), *offsets.content());
    g_server = &server;

    LOGGER_INFO("federator-server starting on {}", endpoint);
    try
    {
        server.run();
    }
    catch (const zmq::error_t &e)
    {
        g_server = nullptr;
        LOGGER_ERROR("federator-server: {}", e.what());
        return 1;
    }
    g_server = nullptr;
    return 0;
}
