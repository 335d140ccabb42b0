// tests/test_layer3_transfer/transfer_test_sinks.h
#pragma once
/**
 * @file transfer_test_sinks.h
 * @brief ChunkSink test doubles: a gmock mock and a recording fake.
 */
#include "fed_transfer.hpp"

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace federator::tests::helper
{

class MockChunkSink : public federator::transfer::ChunkSink
{
  public:
    MOCK_METHOD(federator::transfer::TransferVoid, send_chunk,
                (const federator::transfer::TransferChunk &chunk), (override));
    MOCK_METHOD(federator::transfer::TransferVoid, send_warning,
                (const federator::transfer::StreamWarning &warning), (override));
    MOCK_METHOD(federator::transfer::TransferVoid, complete, (const nlohmann::json &summary),
                (override));
    MOCK_METHOD(void, fail, (federator::transfer::TransferError kind, std::string_view message),
                (noexcept, override));
    MOCK_METHOD(bool, is_cancelled, (), (const, noexcept, override));
};

/**
 * Records everything it is sent. `fail_on_chunk` makes the Nth send_chunk() call
 * (0-based) return StreamTransport; `cancel_after_chunks` flips is_cancelled()
 * once that many chunks went through.
 */
class RecordingSink : public federator::transfer::ChunkSink
{
  public:
    federator::transfer::TransferVoid send_chunk(const federator::transfer::TransferChunk &chunk) override
    {
        if (fail_on_chunk && chunks.size() == *fail_on_chunk)
        {
            return federator::transfer::TransferVoid::error(
                federator::transfer::TransferError::StreamTransport, "peer went away");
        }
        chunks.push_back(chunk);
        return federator::transfer::transfer_ok();
    }

    federator::transfer::TransferVoid
    send_warning(const federator::transfer::StreamWarning &warning) override
    {
        warnings.push_back(warning);
        return federator::transfer::transfer_ok();
    }

    federator::transfer::TransferVoid complete(const nlohmann::json &body) override
    {
        summary = body;
        ++complete_calls;
        return federator::transfer::transfer_ok();
    }

    void fail(federator::transfer::TransferError kind, std::string_view message) noexcept override
    {
        if (!failure)
        {
            failure = kind;
            failure_message = std::string(message);
        }
        ++fail_calls;
    }

    bool is_cancelled() const noexcept override
    {
        return cancelled || (cancel_after_chunks && chunks.size() >= *cancel_after_chunks);
    }

    /// Terminal chunks only, in arrival order.
    std::vector<federator::transfer::TransferChunk> terminal_chunks() const
    {
        std::vector<federator::transfer::TransferChunk> out;
        for (const auto &c : chunks)
            if (c.is_last_chunk)
                out.push_back(c);
        return out;
    }

    std::vector<federator::transfer::TransferChunk> chunks;
    std::vector<federator::transfer::StreamWarning> warnings;
    nlohmann::json summary;
    int complete_calls{0};
    int fail_calls{0};
    std::optional<federator::transfer::TransferError> failure;
    std::string failure_message;

    std::optional<size_t> fail_on_chunk;
    std::optional<size_t> cancel_after_chunks;
    bool cancelled{false};
};

} // namespace federator::tests::helper
