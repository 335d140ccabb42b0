#pragma once
/**
 * @file transfer_session.hpp
 * @brief One client's transfer of one topic: resolve offset, poll, filter, stream, persist.
 *
 * A session runs synchronously on the calling thread until the consumer stops
 * being available or the sink reports cancellation. For each record, in source
 * order:
 *
 * 1. the access filter decides; a denied record is logged, its offset is
 *    persisted and nothing is sent;
 * 2. an allowed record is streamed (topic transfer) or the file it names is
 *    streamed (file transfer), with the record offset as sequence id;
 * 3. only after the terminal chunk was sent is the offset persisted.
 *
 * A stream, file or offset-store failure ends the session with that error and
 * leaves the failed record's offset unpersisted.
 */
#include "federator_utils_export.h"
#include "transfer/access_filter.hpp"
#include "transfer/chunk_sink.hpp"
#include "transfer/chunk_streamer.hpp"
#include "transfer/errors.hpp"
#include "transfer/event_source.hpp"
#include "transfer/file_provider.hpp"
#include "transfer/offset_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

struct SessionSettings
{
    size_t chunk_size{1000000};
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::milliseconds idle_timeout{30000};
};

struct SessionRequest
{
    std::string client_id;
    std::string topic;
    AccessGrant grant;
    /// Negative: resume from the offset store.
    int64_t start_offset{-1};
};

struct SessionOutcome
{
    int64_t first_offset{0};
    int64_t delivered{0};
    int64_t denied{0};
    int64_t warnings{0};
    std::optional<int64_t> last_offset;
    bool cancelled{false};

    /// Body of the COMPLETE message.
    [[nodiscard]] nlohmann::json to_json() const;
};

class FEDERATOR_UTILS_EXPORT TransferSession
{
  public:
    TransferSession(SessionSettings settings, EventSourceContext sources, OffsetStore &offsets);

    /// Streams every admitted record payload of the topic.
    TransferResult<SessionOutcome> run_topic_transfer(const SessionRequest &request, ChunkSink &sink);

    /**
     * @brief Streams the file named by every admitted record of the topic.
     *
     * A record whose payload is not a usable file request is answered with a
     * WARNING, its offset is persisted and the session continues.
     */
    TransferResult<SessionOutcome> run_file_transfer(const SessionRequest &request,
                                                     const FileRoots &roots, ChunkSink &sink);

    /// Opens and streams one file. InvalidRequest when the file cannot be resolved.
    TransferResult<StreamStats> transfer_file(const FileTransferRequest &file_request,
                                              int64_t sequence_id, const FileRoots &roots,
                                              ChunkSink &sink) const;

    [[nodiscard]] const SessionSettings &settings() const noexcept { return m_settings; }

  private:
    enum class Delivery
    {
        Streamed,
        Warned,
    };
    using Deliver = std::function<TransferResult<Delivery>(const Record &)>;

    TransferResult<SessionOutcome> run(const SessionRequest &request, ChunkSink &sink,
                                       const Deliver &deliver);

    SessionSettings m_settings;
    EventSourceContext m_sources;
    OffsetStore &m_offsets;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
