#include "transfer/chunk_streamer.hpp"
#include "fed_service.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace federator::transfer
{

namespace
{
constexpr int64_t kProgressEvery = 2;

// A cancelled stream is left open so the session can still report completion.
TransferResult<StreamStats> abort_stream(ChunkSink &sink, TransferError kind, std::string message)
{
    if (kind == TransferError::Cancelled)
    {
        LOGGER_INFO("Stream stopped: {}", message);
    }
    else
    {
        LOGGER_ERROR("Stream aborted ({}): {}", to_string(kind), message);
        sink.fail(kind, message);
    }
    return TransferResult<StreamStats>::error(kind, std::move(message));
}
} // namespace

ChunkStreamer::ChunkStreamer(size_t chunk_size) : m_chunk_size(chunk_size)
{
    if (m_chunk_size == 0)
    {
        throw std::invalid_argument("ChunkStreamer: chunk size must be positive");
    }
    if (m_chunk_size > kMaxChunkSize)
    {
        throw std::invalid_argument(
            fmt::format("ChunkStreamer: chunk size {} exceeds {}", m_chunk_size, kMaxChunkSize));
    }
}

TransferResult<StreamStats> ChunkStreamer::stream(std::istream &in, int64_t size,
                                                  const std::string &resource_name,
                                                  int64_t sequence_id, ChunkSink &sink) const
{
    if (size < 0)
    {
        return abort_stream(sink, TransferError::FileIO,
                            fmt::format("'{}' has negative size {}", resource_name, size));
    }
    const int64_t total = compute_total_chunks(size, static_cast<int64_t>(m_chunk_size));
    if (total > std::numeric_limits<int32_t>::max())
    {
        return abort_stream(sink, TransferError::Configuration,
                            fmt::format("'{}' needs {} chunks; raise the chunk size", resource_name,
                                        total));
    }

    crypto::Sha256Stream digest;
    StreamStats stats;
    std::string buffer;
    int64_t remaining = size;

    for (int64_t index = 0; index < total; ++index)
    {
        if (sink.is_cancelled())
        {
            return abort_stream(sink, TransferError::Cancelled,
                                fmt::format("'{}' cancelled at chunk {}", resource_name, index));
        }

        const auto want = static_cast<size_t>(
            std::min<int64_t>(remaining, static_cast<int64_t>(m_chunk_size)));
        buffer.resize(want);
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want)
        {
            return abort_stream(sink, TransferError::FileIO,
                                fmt::format("short read on '{}' at chunk {}: wanted {} got {}",
                                            resource_name, index, want, in.gcount()));
        }
        digest.update(buffer);

        TransferChunk chunk;
        chunk.resource_name = resource_name;
        chunk.sequence_id = sequence_id;
        chunk.chunk_index = static_cast<int32_t>(index);
        chunk.total_chunks = static_cast<int32_t>(total);
        chunk.file_size = size;
        chunk.payload = std::move(buffer);

        auto sent = sink.send_chunk(chunk);
        if (sent.is_error())
        {
            return abort_stream(sink, TransferError::StreamTransport, sent.error_message());
        }
        buffer = std::move(chunk.payload);
        remaining -= static_cast<int64_t>(want);
        stats.bytes += static_cast<int64_t>(want);
        ++stats.data_chunks;

        if ((index + 1) % kProgressEvery == 0)
        {
            LOGGER_DEBUG("'{}' seq {}: sent {}/{} chunks", resource_name, sequence_id, index + 1,
                         total);
        }
    }

    TransferChunk terminal;
    terminal.resource_name = resource_name;
    terminal.sequence_id = sequence_id;
    terminal.chunk_index = static_cast<int32_t>(total);
    terminal.total_chunks = static_cast<int32_t>(total);
    terminal.file_size = size;
    terminal.is_last_chunk = true;
    terminal.checksum = digest.finish_base64();

    auto sent = sink.send_chunk(terminal);
    if (sent.is_error())
    {
        return abort_stream(sink, TransferError::StreamTransport, sent.error_message());
    }
    stats.checksum = std::move(terminal.checksum);
    LOGGER_DEBUG("'{}' seq {}: {} bytes in {} chunks, checksum {}", resource_name, sequence_id,
                 stats.bytes, stats.data_chunks, stats.checksum);
    return TransferResult<StreamStats>::ok(std::move(stats));
}

TransferResult<StreamStats> ChunkStreamer::stream_bytes(std::string_view data,
                                                        const std::string &resource_name,
                                                        int64_t sequence_id, ChunkSink &sink) const
{
    std::istringstream in{std::string(data)};
    return stream(in, static_cast<int64_t>(data.size()), resource_name, sequence_id, sink);
}

} // namespace federator::transfer
