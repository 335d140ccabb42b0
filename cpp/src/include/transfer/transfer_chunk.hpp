#pragma once
/**
 * @file transfer_chunk.hpp
 * @brief Wire units of a streamed resource and their JSON encoding.
 *
 * Every message on a session's data socket is framed as
 * `['C', msg_type, json_header (, payload)]`. The chunk payload travels as a
 * separate binary frame so it is never base64-inflated inside the JSON header.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace federator::transfer
{

/// Data-socket message types.
inline constexpr std::string_view kMsgChunk = "CHUNK";
inline constexpr std::string_view kMsgWarning = "WARNING";
inline constexpr std::string_view kMsgComplete = "COMPLETE";
inline constexpr std::string_view kMsgError = "ERROR";

/// Frame 0 of every federator message.
inline constexpr char kFrameTypeControl = 'C';

struct TransferChunk
{
    std::string resource_name;
    int64_t sequence_id{0};
    int32_t chunk_index{0};
    int32_t total_chunks{0};
    std::string payload; ///< Empty on the terminal chunk.
    int64_t file_size{0};
    bool is_last_chunk{false};
    std::string checksum; ///< Base64 SHA-256, set only on the terminal chunk.
};

/// A record that was consumed but could not be turned into a resource.
struct StreamWarning
{
    int64_t skipped_sequence_id{0};
    std::string reason; ///< DESERIALIZATION or VALIDATION
    std::string details;
};

/// Number of data chunks for @p size bytes: ceil(size / chunk_size). Zero for an empty resource.
[[nodiscard]] constexpr int64_t compute_total_chunks(int64_t size, int64_t chunk_size) noexcept
{
    if (size <= 0 || chunk_size <= 0)
    {
        return 0;
    }
    return (size + chunk_size - 1) / chunk_size;
}

/// JSON header of a chunk; the payload is not part of it.
FEDERATOR_UTILS_EXPORT nlohmann::json chunk_header_to_json(const TransferChunk &chunk);

/// Rebuilds a chunk from its header and payload frame.
FEDERATOR_UTILS_EXPORT TransferResult<TransferChunk>
chunk_from_wire(const nlohmann::json &header, std::string payload);

FEDERATOR_UTILS_EXPORT nlohmann::json warning_to_json(const StreamWarning &warning);
FEDERATOR_UTILS_EXPORT TransferResult<StreamWarning> warning_from_json(const nlohmann::json &j);

} // namespace federator::transfer
