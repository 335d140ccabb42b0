#pragma once
/**
 * @file chunk_sink.hpp
 * @brief Destination of a session's chunk stream.
 *
 * `ChunkSink` is the transport seam: the streamer and the session only talk to
 * it, `ZmqChunkSink` puts the messages on a PUSH socket and tests substitute a
 * mock. After `fail()` or `complete()` nothing more is sent, and a second
 * `fail()` is a no-op.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"
#include "transfer/transfer_chunk.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

class FEDERATOR_UTILS_EXPORT ChunkSink
{
  public:
    virtual ~ChunkSink() = default;

    virtual TransferVoid send_chunk(const TransferChunk &chunk) = 0;
    virtual TransferVoid send_warning(const StreamWarning &warning) = 0;

    /// End of the session. @p summary is delivered to the receiver as the COMPLETE body.
    virtual TransferVoid complete(const nlohmann::json &summary) = 0;

    /// Best-effort error signal to the receiver; the stream is over afterwards.
    virtual void fail(TransferError kind, std::string_view message) noexcept = 0;

    /// True once the receiver or the server asked the session to stop.
    [[nodiscard]] virtual bool is_cancelled() const noexcept = 0;
};

/**
 * @class ZmqChunkSink
 * @brief PUSH-socket sink. Frames: `['C', type, json (, payload)]`.
 *
 * A send that does not complete within @p send_timeout is a StreamTransport
 * error. The socket is owned by the sink and closed with it.
 */
class FEDERATOR_UTILS_EXPORT ZmqChunkSink : public ChunkSink
{
  public:
    ZmqChunkSink(zmq::socket_t socket, std::chrono::milliseconds send_timeout,
                 std::shared_ptr<std::atomic<bool>> cancel_flag);
    ~ZmqChunkSink() override;

    ZmqChunkSink(const ZmqChunkSink &) = delete;
    ZmqChunkSink &operator=(const ZmqChunkSink &) = delete;

    TransferVoid send_chunk(const TransferChunk &chunk) override;
    TransferVoid send_warning(const StreamWarning &warning) override;
    TransferVoid complete(const nlohmann::json &summary) override;
    void fail(TransferError kind, std::string_view message) noexcept override;
    [[nodiscard]] bool is_cancelled() const noexcept override;

  private:
    TransferVoid send_message(std::string_view msg_type, const nlohmann::json &body,
                              const std::string *payload);

    zmq::socket_t m_socket;
    std::shared_ptr<std::atomic<bool>> m_cancel;
    bool m_finished{false};
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
