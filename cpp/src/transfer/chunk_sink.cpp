#include "transfer/chunk_sink.hpp"
#include "fed_service.hpp"

namespace federator::transfer
{

namespace
{
// Pending messages are dropped when the sink closes after the peer went away.
constexpr int kCloseLingerMs = 1000;
} // namespace

ZmqChunkSink::ZmqChunkSink(zmq::socket_t socket, std::chrono::milliseconds send_timeout,
                           std::shared_ptr<std::atomic<bool>> cancel_flag)
    : m_socket(std::move(socket)), m_cancel(std::move(cancel_flag))
{
    m_socket.set(zmq::sockopt::sndtimeo, static_cast<int>(send_timeout.count()));
    m_socket.set(zmq::sockopt::linger, kCloseLingerMs);
}

ZmqChunkSink::~ZmqChunkSink()
{
    m_socket.close();
}

TransferVoid ZmqChunkSink::send_message(std::string_view msg_type, const nlohmann::json &body,
                                        const std::string *payload)
{
    if (m_finished)
    {
        return TransferVoid::error(TransferError::StreamTransport, "stream already finished");
    }
    const std::string body_str = body.dump();
    const auto more = zmq::send_flags::sndmore;
    const auto last = zmq::send_flags::none;
    try
    {
        if (!m_socket.send(zmq::message_t(&kFrameTypeControl, 1), more) ||
            !m_socket.send(zmq::message_t(msg_type.data(), msg_type.size()), more) ||
            !m_socket.send(zmq::message_t(body_str.data(), body_str.size()),
                           payload != nullptr ? more : last) ||
            (payload != nullptr &&
             !m_socket.send(zmq::message_t(payload->data(), payload->size()), last)))
        {
            m_finished = true;
            return TransferVoid::error(TransferError::StreamTransport,
                                       fmt::format("send of {} timed out", msg_type));
        }
    }
    catch (const zmq::error_t &e)
    {
        m_finished = true;
        return TransferVoid::error(TransferError::StreamTransport,
                                   fmt::format("send of {} failed: {}", msg_type, e.what()),
                                   e.num());
    }
    return transfer_ok();
}

TransferVoid ZmqChunkSink::send_chunk(const TransferChunk &chunk)
{
    return send_message(kMsgChunk, chunk_header_to_json(chunk),
                        chunk.is_last_chunk ? nullptr : &chunk.payload);
}

TransferVoid ZmqChunkSink::send_warning(const StreamWarning &warning)
{
    return send_message(kMsgWarning, warning_to_json(warning), nullptr);
}

TransferVoid ZmqChunkSink::complete(const nlohmann::json &summary)
{
    auto sent = send_message(kMsgComplete, summary, nullptr);
    m_finished = true;
    return sent;
}

void ZmqChunkSink::fail(TransferError kind, std::string_view message) noexcept
{
    if (m_finished)
    {
        return;
    }
    try
    {
        nlohmann::json body;
        body["status"] = "error";
        body["error_code"] = std::string(to_string(kind));
        body["message"] = std::string(message);
        auto sent = send_message(kMsgError, body, nullptr);
        if (sent.is_error())
        {
            LOGGER_WARN("Stream error signal not delivered: {}", sent.error_message());
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("Stream error signal not delivered: {}", e.what());
    }
    m_finished = true;
}

bool ZmqChunkSink::is_cancelled() const noexcept
{
    return m_cancel && m_cancel->load(std::memory_order_acquire);
}

} // namespace federator::transfer
