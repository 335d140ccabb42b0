#include "transfer/transfer_chunk.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace federator::transfer
{

nlohmann::json chunk_header_to_json(const TransferChunk &chunk)
{
    nlohmann::json j;
    j["resourceName"] = chunk.resource_name;
    j["sequenceId"] = chunk.sequence_id;
    j["chunkIndex"] = chunk.chunk_index;
    j["totalChunks"] = chunk.total_chunks;
    j["fileSize"] = chunk.file_size;
    j["isLastChunk"] = chunk.is_last_chunk;
    if (chunk.is_last_chunk)
    {
        j["checksum"] = chunk.checksum;
    }
    return j;
}

TransferResult<TransferChunk> chunk_from_wire(const nlohmann::json &header, std::string payload)
{
    TransferChunk chunk;
    try
    {
        chunk.resource_name = header.at("resourceName").get<std::string>();
        chunk.sequence_id = header.at("sequenceId").get<int64_t>();
        chunk.chunk_index = header.at("chunkIndex").get<int32_t>();
        chunk.total_chunks = header.at("totalChunks").get<int32_t>();
        chunk.file_size = header.at("fileSize").get<int64_t>();
        chunk.is_last_chunk = header.at("isLastChunk").get<bool>();
        if (chunk.is_last_chunk)
        {
            chunk.checksum = header.at("checksum").get<std::string>();
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        return TransferResult<TransferChunk>::error(
            TransferError::StreamTransport, fmt::format("malformed chunk header: {}", e.what()));
    }
    if (chunk.is_last_chunk && !payload.empty())
    {
        return TransferResult<TransferChunk>::error(
            TransferError::StreamTransport,
            fmt::format("terminal chunk of '{}' carries {} payload bytes", chunk.resource_name,
                        payload.size()));
    }
    chunk.payload = std::move(payload);
    return TransferResult<TransferChunk>::ok(std::move(chunk));
}

nlohmann::json warning_to_json(const StreamWarning &warning)
{
    return nlohmann::json{{"skipped_sequence_id", warning.skipped_sequence_id},
                          {"reason", warning.reason},
                          {"details", warning.details}};
}

TransferResult<StreamWarning> warning_from_json(const nlohmann::json &j)
{
    StreamWarning w;
    try
    {
        w.skipped_sequence_id = j.at("skipped_sequence_id").get<int64_t>();
        w.reason = j.at("reason").get<std::string>();
        w.details = j.value("details", std::string{});
    }
    catch (const nlohmann::json::exception &e)
    {
        return TransferResult<StreamWarning>::error(
            TransferError::StreamTransport, fmt::format("malformed warning: {}", e.what()));
    }
    return TransferResult<StreamWarning>::ok(std::move(w));
}

} // namespace federator::transfer
