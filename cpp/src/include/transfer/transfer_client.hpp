#pragma once
/**
 * @file transfer_client.hpp
 * @brief Receiving end: requests a session and assembles what arrives.
 *
 * `process_topic(topic, start)` collects record payloads in memory;
 * `process_topic(topic, start, destination)` requests a file transfer and writes
 * each verified file into @p destination. Both block until the server sends
 * COMPLETE or ERROR, the data socket stays silent for `client.stream_timeout`,
 * or cancel() is called.
 *
 * After every verified resource and every warning the client records the
 * sequence id in its own offset store, so a negative @p start_offset resumes
 * after the last resource this client received.
 */
#include "federator_utils_export.h"
#include "transfer/chunk_assembler.hpp"
#include "transfer/errors.hpp"
#include "transfer/federator_config.hpp"
#include "transfer/offset_store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

struct TransferReport
{
    std::string session_id;
    int64_t resources_completed{0};
    int64_t warnings{0};
    std::vector<ReceivedRecord> records;
    std::vector<std::filesystem::path> files;
    std::optional<int64_t> last_sequence_id;
    bool cancelled{false};
    nlohmann::json summary; ///< Server's COMPLETE body.
};

class FEDERATOR_UTILS_EXPORT TransferClient
{
  public:
    /// @p offsets must outlive the client.
    TransferClient(ClientSection settings, OffsetStore &offsets);

    TransferClient(const TransferClient &) = delete;
    TransferClient &operator=(const TransferClient &) = delete;

    /// Topic transfer; records are returned in the report.
    TransferResult<TransferReport> process_topic(const std::string &topic, int64_t start_offset);

    /// File transfer into @p destination_path.
    TransferResult<TransferReport> process_topic(const std::string &topic, int64_t start_offset,
                                                 const std::filesystem::path &destination_path);

    /// Asks the running process_topic() to cancel its session. Thread-safe.
    void cancel() noexcept { m_cancel_requested.store(true, std::memory_order_release); }

    [[nodiscard]] const ClientSection &settings() const noexcept { return m_settings; }

  private:
    struct Receiver;

    TransferResult<TransferReport> run(const std::string &topic, int64_t start_offset,
                                       Receiver &receiver);

    ClientSection m_settings;
    OffsetStore &m_offsets;
    std::atomic<bool> m_cancel_requested{false};
};

/// Replaces a wildcard bind host in @p data_endpoint with the host of @p control_endpoint.
FEDERATOR_UTILS_EXPORT std::string resolve_data_endpoint(const std::string &data_endpoint,
                                                         const std::string &control_endpoint);

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
