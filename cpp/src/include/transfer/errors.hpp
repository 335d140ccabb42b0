#pragma once
/**
 * @file errors.hpp
 * @brief Error kinds reported by the transfer layer.
 */
#include "utils/result.hpp"

#include <string_view>

namespace federator::transfer
{

enum class TransferError
{
    LabelParse,        ///< Malformed security label; the record is denied.
    SourceUnavailable, ///< Event source closed or unreachable.
    StreamTransport,   ///< Writing to the wire failed; the resource is abandoned.
    FileIO,            ///< Reading or writing a file failed mid-resource.
    Configuration,     ///< Missing or invalid settings; fatal at session start.
    InvalidRequest,    ///< Malformed or unsafe request.
    Unauthorized,      ///< Client has no grant for the topic.
    Cancelled,         ///< Session stopped by the peer or by shutdown.
    OffsetStore,       ///< Offset could not be read or persisted.
};

constexpr std::string_view to_string(TransferError err) noexcept
{
    switch (err)
    {
    case TransferError::LabelParse:
        return "LABEL_PARSE";
    case TransferError::SourceUnavailable:
        return "SOURCE_UNAVAILABLE";
    case TransferError::StreamTransport:
        return "STREAM_TRANSPORT";
    case TransferError::FileIO:
        return "FILE_IO";
    case TransferError::Configuration:
        return "CONFIGURATION";
    case TransferError::InvalidRequest:
        return "INVALID_REQUEST";
    case TransferError::Unauthorized:
        return "UNAUTHORIZED";
    case TransferError::Cancelled:
        return "CANCELLED";
    case TransferError::OffsetStore:
        return "OFFSET_STORE";
    }
    return "UNKNOWN";
}

/// Inverse of to_string(); unknown codes map to StreamTransport.
constexpr TransferError transfer_error_from_string(std::string_view code) noexcept
{
    constexpr TransferError kAll[] = {
        TransferError::LabelParse,    TransferError::SourceUnavailable, TransferError::StreamTransport,
        TransferError::FileIO,        TransferError::Configuration,     TransferError::InvalidRequest,
        TransferError::Unauthorized,  TransferError::Cancelled,         TransferError::OffsetStore};
    for (const auto err : kAll)
    {
        if (to_string(err) == code)
        {
            return err;
        }
    }
    return TransferError::StreamTransport;
}

template <typename T> using TransferResult = utils::Result<T, TransferError>;
using TransferVoid = utils::VoidResult<TransferError>;

inline TransferVoid transfer_ok()
{
    return utils::ok_void<TransferError>();
}

} // namespace federator::transfer
