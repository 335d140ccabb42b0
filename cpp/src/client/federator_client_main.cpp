#include "fed_transfer.hpp"

#include <charconv>
#include <csignal>

namespace
{
federator::transfer::TransferClient *g_client = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_client != nullptr)
    {
        g_client->cancel();
    }
}

void print_usage()
{
    fmt::print(stderr, "usage: federator_client [config.json] <topic> <start_offset> [destination]\n"
                       "       start_offset < 0 resumes after the last received resource\n");
}

bool parse_offset(std::string_view s, int64_t &out)
{
    const auto *end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc{} && ptr == end;
}
} // namespace

int main(int argc, char *argv[])
{
    using namespace federator;

    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    std::vector<std::string_view> args(argv + 1, argv + argc);
    std::filesystem::path config_path;
    if (!args.empty() && args.front().ends_with(".json"))
    {
        config_path = args.front();
        args.erase(args.begin());
    }
    int64_t start_offset = 0;
    if (args.size() < 2 || args.size() > 3 || !parse_offset(args[1], start_offset))
    {
        print_usage();
        return 1;
    }
    const std::string topic(args[0]);

    utils::LifecycleGuard lifecycle(utils::MakeModDefList(utils::Logger::GetLifecycleModule(),
                                                          crypto::GetLifecycleModule(),
                                                          utils::GetZMQContextModule()));

    auto config = transfer::FederatorConfig::load(config_path);
    if (config.is_error())
    {
        LOGGER_ERROR("federator-client: {}", config.error_message());
        return 1;
    }
    const auto &cfg = config.content();
    auto logging = transfer::apply_logging(cfg.logging);
    if (logging.is_error())
    {
        LOGGER_ERROR("federator-client: {}", logging.error_message());
        return 1;
    }

    std::unique_ptr<transfer::OffsetStore> offsets;
    if (cfg.client.offset_store_path.empty())
    {
        offsets = std::make_unique<transfer::InMemoryOffsetStore>();
    }
    else
    {
        auto opened = transfer::JsonFileOffsetStore::open(cfg.client.offset_store_path);
        if (opened.is_error())
        {
            LOGGER_ERROR("federator-client: {}", opened.error_message());
            return 1;
        }
        offsets = std::move(opened).content();
    }

    transfer::TransferClient client(cfg.client, *offsets);
    g_client = &client;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto report = args.size() == 3
                      ? client.process_topic(topic, start_offset, std::filesystem::path(args[2]))
                      : client.process_topic(topic, start_offset);
    g_client = nullptr;

    if (report.is_error())
    {
        LOGGER_ERROR("federator-client: transfer of '{}' failed ({}): {}", topic,
                     transfer::to_string(report.error()), report.error_message());
        return 1;
    }
    const auto &r = report.content();
    for (const auto &record : r.records)
    {
        fmt::print("{}\t{}\t{}\n", record.sequence_id, record.resource_name, record.payload);
    }
    for (const auto &file : r.files)
    {
        fmt::print("{}\n", file.string());
    }
    LOGGER_INFO("federator-client: {} resource(s), {} warning(s){}", r.resources_completed,
                r.warnings, r.cancelled ? ", cancelled" : "");
    return 0;
}
