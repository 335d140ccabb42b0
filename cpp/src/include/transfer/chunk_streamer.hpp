#pragma once
/**
 * @file chunk_streamer.hpp
 * @brief Splits one resource into data chunks plus a terminal checksum chunk.
 *
 * For a resource of `size` bytes and chunk size `C` the streamer emits
 * `ceil(size / C)` data chunks (indices 0..n-1, each carrying `total_chunks = n`)
 * and then one terminal chunk with `is_last_chunk = true`, no payload and the
 * base64 SHA-256 of all preceding bytes. Only one chunk buffer is held at a time.
 *
 * On a read or send failure the sink is told via `ChunkSink::fail()` and no
 * terminal chunk is sent. Cancellation stops before the next chunk without
 * failing the sink. `total_chunks` is fixed before the first read; a
 * resource that changes size while streaming shows up as a short read.
 */
#include "federator_utils_export.h"
#include "transfer/chunk_sink.hpp"
#include "transfer/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <string>
#include <string_view>

namespace federator::transfer
{

struct StreamStats
{
    int64_t data_chunks{0};
    int64_t bytes{0};
    std::string checksum;
};

class FEDERATOR_UTILS_EXPORT ChunkStreamer
{
  public:
    /// Largest chunk size whose chunk arithmetic stays within int64_t.
    static constexpr size_t kMaxChunkSize = static_cast<size_t>(std::numeric_limits<int64_t>::max());

    /// @throws std::invalid_argument if @p chunk_size is 0 or above kMaxChunkSize.
    explicit ChunkStreamer(size_t chunk_size);

    [[nodiscard]] size_t chunk_size() const noexcept { return m_chunk_size; }

    /**
     * @brief Streams @p size bytes read from @p in.
     * @return FileIO on a short or failed read, StreamTransport on a send failure,
     *         Cancelled when the sink reports cancellation between chunks.
     */
    TransferResult<StreamStats> stream(std::istream &in, int64_t size,
                                       const std::string &resource_name, int64_t sequence_id,
                                       ChunkSink &sink) const;

    /// Streams an in-memory payload, such as a topic record.
    TransferResult<StreamStats> stream_bytes(std::string_view data, const std::string &resource_name,
                                             int64_t sequence_id, ChunkSink &sink) const;

  private:
    size_t m_chunk_size;
};

} // namespace federator::transfer
