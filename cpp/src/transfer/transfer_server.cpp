#include "transfer/transfer_server.hpp"
#include "transfer/chunk_sink.hpp"
#include "transfer/transfer_chunk.hpp"
#include "transfer/transfer_session.hpp"
#include "fed_service.hpp"

#include <nlohmann/json.hpp>
#include <zmq_addon.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace federator::transfer
{

namespace
{
// Control poll timeout; finished sessions are reaped once per cycle.
constexpr std::chrono::milliseconds kPollTimeout{100};
} // namespace

// ============================================================================
// TransferServerImpl
// ============================================================================

class TransferServerImpl
{
  public:
    TransferServerImpl(TransferServer::Options opts, OffsetStore &store)
        : options(std::move(opts)), offsets(store)
    {
    }

    struct ActiveSession
    {
        std::string client_id;
        std::string topic;
        std::shared_ptr<std::atomic<bool>> cancel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread worker;
    };

    TransferServer::Options options;
    OffsetStore &offsets;
    std::atomic<bool> stop_requested{false};

    mutable std::mutex m_sessions_mu;
    std::map<std::string, ActiveSession> m_sessions;

    void run();

    void process_message(zmq::socket_t &socket, const zmq::message_t &identity,
                         const std::string &msg_type, const nlohmann::json &payload);

    nlohmann::json handle_session_req(const nlohmann::json &req, bool file_transfer);
    nlohmann::json handle_cancel_req(const nlohmann::json &req);

    void reap_finished();
    void shutdown_sessions();

    static void send_reply(zmq::socket_t &socket, const zmq::message_t &identity,
                           const std::string &msg_type_ack, const nlohmann::json &body);
    static nlohmann::json make_error(const std::string &error_code, const std::string &message);

  private:
    void session_main(std::string session_id, SessionRequest request, bool file_transfer,
                      zmq::socket_t data_socket, std::shared_ptr<std::atomic<bool>> cancel,
                      std::shared_ptr<std::atomic<bool>> done);
};

void TransferServerImpl::run()
{
    zmq::socket_t router(utils::get_zmq_context(), zmq::socket_type::router);
    router.set(zmq::sockopt::linger, 0);
    router.bind(options.config.server.control_endpoint);
    const std::string bound = router.get(zmq::sockopt::last_endpoint);
    if (options.on_ready)
    {
        options.on_ready(bound);
    }
    LOGGER_INFO("TransferServer: listening on {}", bound);

    while (!stop_requested.load(std::memory_order_acquire))
    {
        std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);

        reap_finished();

        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            continue;
        }

        std::vector<zmq::message_t> frames;
        static_cast<void>(zmq::recv_multipart(router, std::back_inserter(frames)));
        // Expected layout: [identity, 'C', msg_type_string, json_body]
        if (frames.size() < 4)
        {
            LOGGER_WARN("TransferServer: malformed message (expected 4 frames, got {})",
                        frames.size());
            continue;
        }

        try
        {
            const std::string msg_type = frames[2].to_string();
            const nlohmann::json payload = nlohmann::json::parse(frames[3].to_string());
            process_message(router, frames[0], msg_type, payload);
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("TransferServer: malformed JSON: {}", e.what());
            send_reply(router, frames[0], "ERROR",
                       make_error("INVALID_REQUEST", fmt::format("malformed JSON: {}", e.what())));
        }
    }

    shutdown_sessions();
    router.close();
    LOGGER_INFO("TransferServer: stopped.");
}

void TransferServerImpl::process_message(zmq::socket_t &socket, const zmq::message_t &identity,
                                         const std::string &msg_type,
                                         const nlohmann::json &payload)
{
    if (msg_type == "TOPIC_REQ" || msg_type == "FILE_REQ")
    {
        nlohmann::json resp = handle_session_req(payload, msg_type == "FILE_REQ");
        const std::string ack = (resp.value("status", "") == "success") ? "SESSION_ACK" : "ERROR";
        send_reply(socket, identity, ack, resp);
    }
    else if (msg_type == "CANCEL_REQ")
    {
        nlohmann::json resp = handle_cancel_req(payload);
        const std::string ack = (resp.value("status", "") == "success") ? "CANCEL_ACK" : "ERROR";
        send_reply(socket, identity, ack, resp);
    }
    else
    {
        LOGGER_WARN("TransferServer: unknown msg_type '{}'", msg_type);
        send_reply(socket, identity, "ERROR",
                   make_error("UNKNOWN_MSG_TYPE", "Unknown message type: " + msg_type));
    }
}

// ============================================================================
// Handlers
// ============================================================================

nlohmann::json TransferServerImpl::handle_session_req(const nlohmann::json &req, bool file_transfer)
{
    SessionRequest request;
    request.client_id = req.value("client_id", "");
    request.topic = req.value("topic", "");
    request.start_offset = req.value("start_offset", int64_t{-1});
    if (request.client_id.empty() || request.topic.empty())
    {
        return make_error("INVALID_REQUEST", "Missing or empty 'client_id' or 'topic'");
    }

    auto grant = options.config.find_grant(request.client_id, request.topic);
    if (!grant)
    {
        LOGGER_WARN("TransferServer: client '{}' has no grant for topic '{}'", request.client_id,
                    request.topic);
        return make_error(std::string(to_string(TransferError::Unauthorized)),
                          fmt::format("client '{}' may not read topic '{}'", request.client_id,
                                      request.topic));
    }
    request.grant = std::move(*grant);

    zmq::socket_t data(utils::get_zmq_context(), zmq::socket_type::push);
    try
    {
        data.bind(fmt::format("tcp://{}:*", options.config.server.data_bind_host));
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("TransferServer: cannot bind data socket: {}", e.what());
        return make_error(std::string(to_string(TransferError::StreamTransport)),
                          fmt::format("cannot bind data socket: {}", e.what()));
    }
    const std::string data_endpoint = data.get(zmq::sockopt::last_endpoint);
    const std::string session_id = fmt::format("{:016x}", crypto::generate_random_u64());

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto done = std::make_shared<std::atomic<bool>>(false);

    LOGGER_INFO("TransferServer: session {} for client '{}' {} '{}' on {}", session_id,
                request.client_id, file_transfer ? "file topic" : "topic", request.topic,
                data_endpoint);

    ActiveSession entry{request.client_id, request.topic, cancel, done, {}};
    entry.worker = std::thread(&TransferServerImpl::session_main, this, session_id,
                               std::move(request), file_transfer, std::move(data), cancel, done);
    {
        std::lock_guard<std::mutex> lock(m_sessions_mu);
        m_sessions.emplace(session_id, std::move(entry));
    }

    nlohmann::json resp;
    resp["status"] = "success";
    resp["session_id"] = session_id;
    resp["data_endpoint"] = data_endpoint;
    return resp;
}

nlohmann::json TransferServerImpl::handle_cancel_req(const nlohmann::json &req)
{
    const std::string session_id = req.value("session_id", "");
    std::lock_guard<std::mutex> lock(m_sessions_mu);
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end())
    {
        return make_error("SESSION_NOT_FOUND", fmt::format("no session '{}'", session_id));
    }
    it->second.cancel->store(true, std::memory_order_release);
    LOGGER_INFO("TransferServer: session {} cancelled by client", session_id);

    nlohmann::json resp;
    resp["status"] = "success";
    resp["session_id"] = session_id;
    return resp;
}

// ============================================================================
// Session workers
// ============================================================================

void TransferServerImpl::session_main(std::string session_id, SessionRequest request,
                                      bool file_transfer, zmq::socket_t data_socket,
                                      std::shared_ptr<std::atomic<bool>> cancel,
                                      std::shared_ptr<std::atomic<bool>> done)
{
    try
    {
        ZmqChunkSink sink(std::move(data_socket), options.config.server.send_timeout, cancel);
        EventSourceContext sources{options.config.topics.source, options.config.topics.journal_dir,
                                   options.memory_topics};
        TransferSession session(options.config.session_settings(), std::move(sources), offsets);

        auto outcome = file_transfer
                           ? session.run_file_transfer(request, options.config.files, sink)
                           : session.run_topic_transfer(request, sink);
        if (outcome.is_error())
        {
            LOGGER_ERROR("TransferServer: session {} failed ({}): {}", session_id,
                         to_string(outcome.error()), outcome.error_message());
        }
        else
        {
            LOGGER_INFO("TransferServer: session {} finished: {}", session_id,
                        outcome.content().to_json().dump());
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("TransferServer: session {} terminated by exception: {}", session_id, e.what());
    }
    done->store(true, std::memory_order_release);
}

void TransferServerImpl::reap_finished()
{
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mu);
        for (auto it = m_sessions.begin(); it != m_sessions.end();)
        {
            if (it->second.done->load(std::memory_order_acquire))
            {
                finished.push_back(std::move(it->second.worker));
                it = m_sessions.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
    for (auto &t : finished)
    {
        t.join();
    }
}

void TransferServerImpl::shutdown_sessions()
{
    std::map<std::string, ActiveSession> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mu);
        sessions.swap(m_sessions);
    }
    for (auto &[id, session] : sessions)
    {
        session.cancel->store(true, std::memory_order_release);
    }
    for (auto &[id, session] : sessions)
    {
        if (session.worker.joinable())
        {
            session.worker.join();
        }
    }
    if (!sessions.empty())
    {
        LOGGER_INFO("TransferServer: {} session(s) stopped", sessions.size());
    }
}

// ============================================================================
// Helpers
// ============================================================================

void TransferServerImpl::send_reply(zmq::socket_t &socket, const zmq::message_t &identity,
                                    const std::string &msg_type_ack, const nlohmann::json &body)
{
    // Reply layout: [identity, 'C', ack_type_string, json_body]
    const std::string body_str = body.dump();
    socket.send(zmq::message_t(identity.data(), identity.size()), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(&kFrameTypeControl, 1), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(msg_type_ack.data(), msg_type_ack.size()), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(body_str.data(), body_str.size()), zmq::send_flags::none);
}

nlohmann::json TransferServerImpl::make_error(const std::string &error_code,
                                              const std::string &message)
{
    nlohmann::json err;
    err["status"] = "error";
    err["error_code"] = error_code;
    err["message"] = message;
    return err;
}

// ============================================================================
// TransferServer: Pimpl delegation
// ============================================================================

TransferServer::TransferServer(Options options, OffsetStore &offsets)
    : pImpl(std::make_unique<TransferServerImpl>(std::move(options), offsets))
{
}

TransferServer::~TransferServer() = default;

void TransferServer::run()
{
    pImpl->run();
}

void TransferServer::stop()
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

size_t TransferServer::active_sessions() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_sessions_mu);
    size_t active = 0;
    for (const auto &[id, session] : pImpl->m_sessions)
    {
        if (!session.done->load(std::memory_order_acquire))
        {
            ++active;
        }
    }
    return active;
}

} // namespace federator::transfer
