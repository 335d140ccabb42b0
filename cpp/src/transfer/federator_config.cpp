#include "transfer/federator_config.hpp"
#include "fed_service.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace federator::transfer
{

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

std::chrono::milliseconds read_ms(const json &section, const char *key,
                                  std::chrono::milliseconds fallback)
{
    return std::chrono::milliseconds(section.value(key, static_cast<int64_t>(fallback.count())));
}

fs::path read_path(const json &section, const char *key, const fs::path &fallback)
{
    return fs::path(section.value(key, fallback.string()));
}

AccessGrant read_grant(const std::string &client, const std::string &topic, const json &attrs)
{
    if (!attrs.is_object())
    {
        throw std::invalid_argument(
            fmt::format("clients.{}.topics.{} must be an object", client, topic));
    }
    AccessGrant grant;
    for (const auto &[key, values] : attrs.items())
    {
        if (!values.is_array())
        {
            throw std::invalid_argument(fmt::format("clients.{}.topics.{}.{} must be an array of strings",
                                                    client, topic, key));
        }
        std::vector<std::string> allowed;
        for (const auto &v : values)
        {
            if (!v.is_string())
            {
                throw std::invalid_argument(fmt::format(
                    "clients.{}.topics.{}.{} must be an array of strings", client, topic, key));
            }
            allowed.push_back(v.get<std::string>());
        }
        grant.require(key, allowed);
    }
    return grant;
}

void apply_env_overrides(FederatorConfig &cfg)
{
    if (const char *env = std::getenv("FEDERATOR_CONTROL_ENDPOINT"))
    {
        LOGGER_INFO("FederatorConfig: FEDERATOR_CONTROL_ENDPOINT = {}", env);
        cfg.server.control_endpoint = env;
        cfg.client.server_endpoint = env;
    }
    if (const char *env = std::getenv("FEDERATOR_CLIENT_ID"))
    {
        LOGGER_INFO("FederatorConfig: FEDERATOR_CLIENT_ID = {}", env);
        cfg.client.id = env;
    }
}

} // namespace

TransferResult<FederatorConfig> FederatorConfig::from_json(const json &j)
{
    using R = TransferResult<FederatorConfig>;
    if (!j.is_object())
    {
        return R::error(TransferError::Configuration, "configuration root must be an object");
    }

    FederatorConfig cfg;
    try
    {
        const json empty = json::object();
        const auto section = [&](const char *name) -> const json &
        { return j.contains(name) ? j.at(name) : empty; };

        const auto &server = section("server");
        cfg.server.control_endpoint = server.value("control_endpoint", cfg.server.control_endpoint);
        cfg.server.data_bind_host = server.value("data_bind_host", cfg.server.data_bind_host);
        cfg.server.send_timeout = read_ms(server, "send_timeout_ms", cfg.server.send_timeout);

        const auto &stream = section("stream");
        if (stream.contains("chunk_size"))
        {
            // Read signed so a negative value is rejected instead of wrapping.
            const auto chunk_size = stream.at("chunk_size").get<int64_t>();
            if (chunk_size <= 0)
            {
                return R::error(TransferError::Configuration,
                                fmt::format("stream.chunk_size must be positive, got {}", chunk_size));
            }
            cfg.stream.chunk_size = static_cast<size_t>(chunk_size);
        }
        cfg.stream.poll_interval = read_ms(stream, "poll_interval_ms", cfg.stream.poll_interval);
        cfg.stream.idle_timeout = read_ms(stream, "idle_timeout_ms", cfg.stream.idle_timeout);

        const auto &topics = section("topics");
        if (topics.contains("source"))
        {
            const auto name = topics.at("source").get<std::string>();
            const auto kind = event_source_kind_from_string(name);
            if (!kind)
            {
                return R::error(TransferError::Configuration,
                                fmt::format("unknown topics.source '{}'", name));
            }
            cfg.topics.source = *kind;
        }
        cfg.topics.journal_dir = read_path(topics, "journal_dir", cfg.topics.journal_dir);

        const auto &files = section("files");
        cfg.files.local_root = read_path(files, "local_root", cfg.files.local_root);
        cfg.files.object_store_a_root =
            read_path(files, "object_store_a_root", cfg.files.object_store_a_root);
        cfg.files.object_store_b_root =
            read_path(files, "object_store_b_root", cfg.files.object_store_b_root);

        const auto &offsets = section("offsets");
        if (offsets.contains("store"))
        {
            const auto store = offsets.at("store").get<std::string>();
            if (format_tools::iequals(store, "memory"))
            {
                cfg.offsets.store = OffsetStoreKind::Memory;
            }
            else if (format_tools::iequals(store, "file"))
            {
                cfg.offsets.store = OffsetStoreKind::File;
            }
            else
            {
                return R::error(TransferError::Configuration,
                                fmt::format("unknown offsets.store '{}'", store));
            }
        }
        cfg.offsets.path = read_path(offsets, "path", cfg.offsets.path);

        for (const auto &[client_id, client_cfg] : section("clients").items())
        {
            auto &grants = cfg.clients[client_id];
            if (!client_cfg.contains("topics"))
            {
                continue;
            }
            for (const auto &[topic, attrs] : client_cfg.at("topics").items())
            {
                grants[topic] = read_grant(client_id, topic, attrs);
            }
        }

        const auto &client = section("client");
        cfg.client.id = client.value("id", cfg.client.id);
        cfg.client.server_endpoint = client.value("server_endpoint", cfg.client.server_endpoint);
        cfg.client.request_timeout = read_ms(client, "request_timeout_ms", cfg.client.request_timeout);
        cfg.client.stream_timeout = read_ms(client, "stream_timeout_ms", cfg.client.stream_timeout);
        cfg.client.offset_store_path =
            read_path(client, "offset_store_path", cfg.client.offset_store_path);

        const auto &logging = section("logging");
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.file = read_path(logging, "file", cfg.logging.file);
    }
    catch (const json::exception &e)
    {
        return R::error(TransferError::Configuration, fmt::format("bad configuration: {}", e.what()));
    }
    catch (const std::invalid_argument &e)
    {
        return R::error(TransferError::Configuration, e.what());
    }

    auto valid = cfg.validate();
    if (valid.is_error())
    {
        return valid.forward_error<FederatorConfig>();
    }
    return R::ok(std::move(cfg));
}

TransferResult<FederatorConfig> FederatorConfig::load(const fs::path &path)
{
    using R = TransferResult<FederatorConfig>;
    fs::path file = path;
    if (file.empty())
    {
        if (const char *env = std::getenv("FEDERATOR_CONFIG_FILE"))
        {
            file = env;
        }
    }

    json doc = json::object();
    if (file.empty())
    {
        LOGGER_INFO("FederatorConfig: no configuration file; using built-in defaults");
    }
    else
    {
        std::ifstream in(file);
        if (!in)
        {
            return R::error(TransferError::Configuration,
                            fmt::format("cannot read configuration '{}'", file.string()));
        }
        try
        {
            doc = json::parse(in);
        }
        catch (const json::exception &e)
        {
            return R::error(TransferError::Configuration,
                            fmt::format("'{}' is not valid JSON: {}", file.string(), e.what()));
        }
        LOGGER_INFO("FederatorConfig: loaded '{}'", file.string());
    }

    auto parsed = from_json(doc);
    if (parsed.is_error())
    {
        return parsed;
    }
    FederatorConfig cfg = std::move(parsed).content();
    apply_env_overrides(cfg);
    auto valid = cfg.validate();
    if (valid.is_error())
    {
        return valid.forward_error<FederatorConfig>();
    }
    return R::ok(std::move(cfg));
}

TransferVoid FederatorConfig::validate() const
{
    const auto bad = [](std::string msg)
    { return TransferVoid::error(TransferError::Configuration, std::move(msg)); };

    if (stream.chunk_size == 0)
        return bad("stream.chunk_size must be positive");
    if (stream.chunk_size > ChunkStreamer::kMaxChunkSize)
        return bad(fmt::format("stream.chunk_size must not exceed {}", ChunkStreamer::kMaxChunkSize));
    if (stream.poll_interval.count() <= 0)
        return bad("stream.poll_interval_ms must be positive");
    if (stream.idle_timeout < stream.poll_interval)
        return bad("stream.idle_timeout_ms must not be shorter than stream.poll_interval_ms");
    if (server.send_timeout.count() <= 0)
        return bad("server.send_timeout_ms must be positive");
    if (client.request_timeout.count() <= 0)
        return bad("client.request_timeout_ms must be positive");
    if (client.stream_timeout < stream.idle_timeout)
        return bad("client.stream_timeout_ms must not be shorter than stream.idle_timeout_ms");
    if (server.control_endpoint.empty())
        return bad("server.control_endpoint is empty");
    if (server.data_bind_host.empty())
        return bad("server.data_bind_host is empty");
    if (client.server_endpoint.empty())
        return bad("client.server_endpoint is empty");
    if (offsets.store == OffsetStoreKind::File && offsets.path.empty())
        return bad("offsets.path is required for the file store");
    if (topics.source == EventSourceKind::Journal && topics.journal_dir.empty())
        return bad("topics.journal_dir is required for the journal source");
    utils::Logger::Level level{};
    if (!utils::Logger::parse_level(logging.level, level))
        return bad(fmt::format("unknown logging.level '{}'", logging.level));
    return transfer_ok();
}

std::optional<AccessGrant> FederatorConfig::find_grant(const std::string &client_id,
                                                       const std::string &topic) const
{
    auto client_it = clients.find(client_id);
    if (client_it == clients.end())
    {
        return std::nullopt;
    }
    auto topic_it = client_it->second.find(topic);
    if (topic_it == client_it->second.end())
    {
        return std::nullopt;
    }
    return topic_it->second;
}

SessionSettings FederatorConfig::session_settings() const
{
    return SessionSettings{stream.chunk_size, stream.poll_interval, stream.idle_timeout};
}

TransferResult<std::unique_ptr<OffsetStore>> make_offset_store(const OffsetsSection &offsets)
{
    using R = TransferResult<std::unique_ptr<OffsetStore>>;
    if (offsets.store == OffsetStoreKind::Memory)
    {
        return R::ok(std::make_unique<InMemoryOffsetStore>());
    }
    auto opened = JsonFileOffsetStore::open(offsets.path);
    if (opened.is_error())
    {
        return opened.forward_error<std::unique_ptr<OffsetStore>>();
    }
    return R::ok(std::move(opened).content());
}

TransferVoid apply_logging(const LoggingSection &logging)
{
    auto &logger = utils::Logger::instance();
    utils::Logger::Level level{};
    if (!utils::Logger::parse_level(logging.level, level))
    {
        return TransferVoid::error(TransferError::Configuration,
                                   fmt::format("unknown logging.level '{}'", logging.level));
    }
    logger.set_level(level);
    if (!logging.file.empty() && !logger.set_logfile(logging.file.string()))
    {
        return TransferVoid::error(TransferError::Configuration,
                                   fmt::format("cannot log to '{}'", logging.file.string()));
    }
    return transfer_ok();
}

} // namespace federator::transfer
