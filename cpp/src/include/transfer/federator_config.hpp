#pragma once
/**
 * @file federator_config.hpp
 * @brief Server and client configuration loaded from one JSON file.
 *
 * ## Loading (priority low → high)
 *
 *  1. Built-in defaults (the member initializers below)
 *  2. The JSON file passed to `load()`, or `FEDERATOR_CONFIG_FILE` when none is passed
 *  3. `FEDERATOR_CONTROL_ENDPOINT` → `server.control_endpoint` and `client.server_endpoint`,
 *     `FEDERATOR_CLIENT_ID` → `client.id`
 *
 * The result is validated as a whole; an invalid configuration is rejected with
 * `TransferError::Configuration` and nothing of it is used.
 *
 * ## Example
 * @code
 * {
 *   "server":  {"control_endpoint": "tcp://0.0.0.0:5590", "data_bind_host": "0.0.0.0"},
 *   "stream":  {"chunk_size": 1000000, "poll_interval_ms": 2000, "idle_timeout_ms": 30000},
 *   "topics":  {"source": "journal", "journal_dir": "/var/lib/federator/topics"},
 *   "files":   {"local_root": "/srv/exports"},
 *   "offsets": {"store": "file", "path": "/var/lib/federator/offsets.json"},
 *   "clients": {"partner-a": {"topics": {"events": {"NATIONALITY": ["GBR"]}}}},
 *   "logging": {"level": "info", "file": ""}
 * }
 * @endcode
 */
#include "federator_utils_export.h"
#include "transfer/access_filter.hpp"
#include "transfer/errors.hpp"
#include "transfer/event_source.hpp"
#include "transfer/file_provider.hpp"
#include "transfer/offset_store.hpp"
#include "transfer/transfer_session.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

struct ServerSection
{
    std::string control_endpoint{"tcp://0.0.0.0:5590"};
    std::string data_bind_host{"0.0.0.0"};
    std::chrono::milliseconds send_timeout{10000};
};

struct StreamSection
{
    size_t chunk_size{1000000};
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::milliseconds idle_timeout{30000};
};

struct TopicsSection
{
    EventSourceKind source{EventSourceKind::Journal};
    std::filesystem::path journal_dir{"topics"};
};

enum class OffsetStoreKind
{
    Memory,
    File,
};

struct OffsetsSection
{
    OffsetStoreKind store{OffsetStoreKind::Memory};
    std::filesystem::path path{"offsets.json"};
};

struct ClientSection
{
    std::string id{"federator-client"};
    std::string server_endpoint{"tcp://127.0.0.1:5590"};
    std::chrono::milliseconds request_timeout{5000};
    /// Longest silence on the data socket before the client gives up.
    std::chrono::milliseconds stream_timeout{60000};
    /// Empty: resume offsets are kept in memory only.
    std::filesystem::path offset_store_path;
};

struct LoggingSection
{
    std::string level{"info"};
    /// Empty: log to the console.
    std::filesystem::path file;
};

class FEDERATOR_UTILS_EXPORT FederatorConfig
{
  public:
    ServerSection server;
    StreamSection stream;
    TopicsSection topics;
    FileRoots files;
    OffsetsSection offsets;
    /// client id → topic → grant
    std::map<std::string, std::map<std::string, AccessGrant>> clients;
    ClientSection client;
    LoggingSection logging;

    /// Defaults overlaid with @p j, validated. No environment lookups.
    [[nodiscard]] static TransferResult<FederatorConfig> from_json(const nlohmann::json &j);

    /**
     * @brief Reads @p path (or `FEDERATOR_CONFIG_FILE` when @p path is empty),
     *        then applies environment overrides and validates.
     *
     * With neither a path nor the variable set, the defaults are used.
     */
    [[nodiscard]] static TransferResult<FederatorConfig> load(const std::filesystem::path &path = {});

    [[nodiscard]] TransferVoid validate() const;

    /// Grant of @p client_id for @p topic; empty when the client may not read the topic.
    [[nodiscard]] std::optional<AccessGrant> find_grant(const std::string &client_id,
                                                        const std::string &topic) const;

    [[nodiscard]] SessionSettings session_settings() const;
};

/// Offset store selected by `offsets.store`.
FEDERATOR_UTILS_EXPORT TransferResult<std::unique_ptr<OffsetStore>>
make_offset_store(const OffsetsSection &offsets);

/// Applies `logging.level` and `logging.file` to the running Logger.
FEDERATOR_UTILS_EXPORT TransferVoid apply_logging(const LoggingSection &logging);

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
