#pragma once
/**
 * @file transfer_server.hpp
 * @brief Control endpoint that starts, cancels and runs transfer sessions.
 *
 * Control messages arrive on a ROUTER socket as `[identity, 'C', msg_type, json]`:
 *
 * | Request      | Body                                      | Reply                                   |
 * |--------------|-------------------------------------------|-----------------------------------------|
 * | `TOPIC_REQ`  | `{client_id, topic, start_offset}`        | `SESSION_ACK {session_id, data_endpoint}` |
 * | `FILE_REQ`   | `{client_id, topic, start_offset}`        | `SESSION_ACK {session_id, data_endpoint}` |
 * | `CANCEL_REQ` | `{session_id}`                            | `CANCEL_ACK {session_id}`               |
 *
 * Failures are answered with `ERROR {status, error_code, message}` where
 * error_code is one of UNAUTHORIZED, INVALID_REQUEST, SESSION_NOT_FOUND,
 * UNKNOWN_MSG_TYPE. A negative `start_offset` resumes from the server's offset
 * store.
 *
 * Every accepted request gets its own PUSH socket, bound to an ephemeral port on
 * `server.data_bind_host`, and its own worker thread running a TransferSession.
 * All control socket I/O happens on the thread calling run(); stop() is
 * thread-safe.
 */
#include "federator_utils_export.h"
#include "transfer/event_source.hpp"
#include "transfer/federator_config.hpp"
#include "transfer/offset_store.hpp"

#include <functional>
#include <memory>
#include <string>

namespace federator::transfer
{

class TransferServerImpl;

class FEDERATOR_UTILS_EXPORT TransferServer
{
  public:
    struct Options
    {
        FederatorConfig config;

        /// Required when `config.topics.source` is memory.
        std::shared_ptr<MemoryTopicRegistry> memory_topics;

        /// Called from run() after bind() with the actual control endpoint.
        /// Lets tests bind "tcp://127.0.0.1:*" and learn the port.
        std::function<void(const std::string &bound_endpoint)> on_ready;
    };

    /// @p offsets must outlive the server.
    TransferServer(Options options, OffsetStore &offsets);
    ~TransferServer();

    TransferServer(const TransferServer &) = delete;
    TransferServer &operator=(const TransferServer &) = delete;

    /**
     * @brief Main loop. Blocks until stop() is called, then cancels and joins
     *        every running session.
     * @throws zmq::error_t if the control endpoint cannot be bound.
     */
    void run();

    void stop();

    /// Sessions whose worker has not finished yet. Thread-safe.
    [[nodiscard]] size_t active_sessions() const;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<TransferServerImpl> pImpl;
};

} // namespace federator::transfer
