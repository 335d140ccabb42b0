#include "transfer/transfer_client.hpp"
#include "transfer/transfer_chunk.hpp"
#include "fed_service.hpp"

#include <zmq_addon.hpp>

#include <chrono>
#include <vector>

namespace federator::transfer
{

namespace fs = std::filesystem;

namespace
{
constexpr std::chrono::milliseconds kPollTimeout{100};

/// Splits "tcp://host:port" into host and port; empty host when not in that form.
std::pair<std::string, std::string> split_tcp_endpoint(const std::string &endpoint)
{
    constexpr std::string_view kScheme = "tcp://";
    if (endpoint.rfind(kScheme, 0) != 0)
    {
        return {};
    }
    const auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon < kScheme.size())
    {
        return {};
    }
    return {endpoint.substr(kScheme.size(), colon - kScheme.size()), endpoint.substr(colon + 1)};
}

bool is_wildcard_host(const std::string &host)
{
    return host == "0.0.0.0" || host == "*" || host == "[::]" || host == "::";
}

void send_control(zmq::socket_t &socket, const std::string &msg_type, const nlohmann::json &body)
{
    // Request layout: ['C', msg_type_string, json_body]; the DEALER adds no identity frame.
    const std::string body_str = body.dump();
    socket.send(zmq::message_t(&kFrameTypeControl, 1), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(msg_type.data(), msg_type.size()), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(body_str.data(), body_str.size()), zmq::send_flags::none);
}

TransferError error_kind_of(const nlohmann::json &body)
{
    return transfer_error_from_string(body.value("error_code", std::string{}));
}
} // namespace

std::string resolve_data_endpoint(const std::string &data_endpoint,
                                  const std::string &control_endpoint)
{
    const auto [data_host, data_port] = split_tcp_endpoint(data_endpoint);
    if (!is_wildcard_host(data_host))
    {
        return data_endpoint;
    }
    auto control_host = split_tcp_endpoint(control_endpoint).first;
    if (control_host.empty() || is_wildcard_host(control_host))
    {
        control_host = "127.0.0.1";
    }
    return fmt::format("tcp://{}:{}", control_host, data_port);
}

// ============================================================================
// Receiver
// ============================================================================

struct TransferClient::Receiver
{
    std::optional<ChunkAssembler> files;
    RecordCollector records;

    [[nodiscard]] bool file_mode() const noexcept { return files.has_value(); }

    /// Sequence id of the resource @p chunk completed, if it completed one.
    TransferResult<std::optional<int64_t>> accept(const TransferChunk &chunk, TransferReport &report)
    {
        using R = TransferResult<std::optional<int64_t>>;
        if (file_mode())
        {
            auto done = files->accept(chunk);
            if (done.is_error())
            {
                return done.forward_error<std::optional<int64_t>>();
            }
            if (!done.content())
            {
                return R::ok(std::nullopt);
            }
            report.files.push_back(*done.content());
            return R::ok(chunk.sequence_id);
        }
        auto done = records.accept(chunk);
        if (done.is_error())
        {
            return done.forward_error<std::optional<int64_t>>();
        }
        if (!done.content())
        {
            return R::ok(std::nullopt);
        }
        report.records.push_back(std::move(*done.content()));
        return R::ok(chunk.sequence_id);
    }

    size_t discard_incomplete()
    {
        return file_mode() ? files->discard_incomplete() : records.discard_incomplete();
    }
};

// ============================================================================
// TransferClient
// ============================================================================

TransferClient::TransferClient(ClientSection settings, OffsetStore &offsets)
    : m_settings(std::move(settings)), m_offsets(offsets)
{
}

TransferResult<TransferReport> TransferClient::process_topic(const std::string &topic,
                                                             int64_t start_offset)
{
    Receiver receiver;
    return run(topic, start_offset, receiver);
}

TransferResult<TransferReport> TransferClient::process_topic(const std::string &topic,
                                                             int64_t start_offset,
                                                             const fs::path &destination_path)
{
    if (destination_path.empty())
    {
        return TransferResult<TransferReport>::error(TransferError::InvalidRequest,
                                                     "destination path is empty");
    }
    auto assembler = ChunkAssembler::create(destination_path);
    if (assembler.is_error())
    {
        return assembler.forward_error<TransferReport>();
    }
    Receiver receiver;
    receiver.files.emplace(std::move(assembler).content());
    return run(topic, start_offset, receiver);
}

TransferResult<TransferReport> TransferClient::run(const std::string &topic, int64_t start_offset,
                                                   Receiver &receiver)
{
    using R = TransferResult<TransferReport>;
    m_cancel_requested.store(false, std::memory_order_release);

    if (topic.empty())
    {
        return R::error(TransferError::InvalidRequest, "topic is empty");
    }
    int64_t start = start_offset;
    if (start < 0)
    {
        auto resumed = m_offsets.resume_offset(m_settings.id, topic);
        if (resumed.is_error())
        {
            return resumed.forward_error<TransferReport>();
        }
        start = resumed.content();
    }

    TransferReport report;
    try
    {
        auto &ctx = utils::get_zmq_context();
        zmq::socket_t control(ctx, zmq::socket_type::dealer);
        control.set(zmq::sockopt::linger, 0);
        control.connect(m_settings.server_endpoint);

        const std::string request_type = receiver.file_mode() ? "FILE_REQ" : "TOPIC_REQ";
        send_control(control, request_type,
                     {{"client_id", m_settings.id}, {"topic", topic}, {"start_offset", start}});
        LOGGER_INFO("TransferClient: {} for '{}' from offset {} sent to {}", request_type, topic,
                    start, m_settings.server_endpoint);

        std::vector<zmq::pollitem_t> ack_items = {{control.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(ack_items, m_settings.request_timeout);
        if ((ack_items[0].revents & ZMQ_POLLIN) == 0)
        {
            return R::error(TransferError::StreamTransport,
                            fmt::format("no reply from {} within {}ms", m_settings.server_endpoint,
                                        m_settings.request_timeout.count()));
        }
        std::vector<zmq::message_t> reply;
        static_cast<void>(zmq::recv_multipart(control, std::back_inserter(reply)));
        if (reply.size() < 3)
        {
            return R::error(TransferError::StreamTransport, "malformed reply from server");
        }
        const auto ack = nlohmann::json::parse(reply[2].to_string());
        if (reply[1].to_string() != "SESSION_ACK")
        {
            return R::error(error_kind_of(ack), ack.value("message", std::string{"request refused"}));
        }
        report.session_id = ack.at("session_id").get<std::string>();
        const std::string data_endpoint =
            resolve_data_endpoint(ack.at("data_endpoint").get<std::string>(),
                                  m_settings.server_endpoint);

        zmq::socket_t data(ctx, zmq::socket_type::pull);
        data.set(zmq::sockopt::linger, 0);
        data.connect(data_endpoint);
        LOGGER_INFO("TransferClient: session {} streaming from {}", report.session_id, data_endpoint);

        const auto cancel_session = [&]
        {
            send_control(control, "CANCEL_REQ", {{"session_id", report.session_id}});
        };
        const auto abort_with = [&](TransferError kind, std::string message)
        {
            const size_t discarded = receiver.discard_incomplete();
            LOGGER_ERROR("TransferClient: session {} failed ({}): {}; {} partial resource(s) discarded",
                         report.session_id, to_string(kind), message, discarded);
            return R::error(kind, std::move(message));
        };
        const auto record_progress = [&](int64_t sequence_id) -> TransferVoid
        {
            report.last_sequence_id = sequence_id;
            return m_offsets.set_offset(m_settings.id, topic, sequence_id);
        };

        bool cancel_sent = false;
        auto last_activity = std::chrono::steady_clock::now();
        while (true)
        {
            if (!cancel_sent && m_cancel_requested.load(std::memory_order_acquire))
            {
                cancel_session();
                cancel_sent = true;
                report.cancelled = true;
            }

            std::vector<zmq::pollitem_t> items = {{data.handle(), 0, ZMQ_POLLIN, 0},
                                                  {control.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);

            if ((items[1].revents & ZMQ_POLLIN) != 0)
            {
                std::vector<zmq::message_t> ctl;
                static_cast<void>(zmq::recv_multipart(control, std::back_inserter(ctl)));
                if (ctl.size() >= 2)
                {
                    LOGGER_DEBUG("TransferClient: control reply {}", ctl[1].to_string());
                }
            }

            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                if (std::chrono::steady_clock::now() - last_activity > m_settings.stream_timeout)
                {
                    if (!cancel_sent)
                    {
                        cancel_session();
                    }
                    return abort_with(TransferError::StreamTransport,
                                      fmt::format("no data for {}ms",
                                                  m_settings.stream_timeout.count()));
                }
                continue;
            }
            last_activity = std::chrono::steady_clock::now();

            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(data, std::back_inserter(frames)));
            // Layout: ['C', msg_type, json_header (, payload)]
            if (frames.size() < 3)
            {
                LOGGER_WARN("TransferClient: malformed data message ({} frames)", frames.size());
                continue;
            }
            const std::string msg_type = frames[1].to_string();
            const auto header = nlohmann::json::parse(frames[2].to_string());

            if (msg_type == kMsgChunk)
            {
                auto chunk = chunk_from_wire(header, frames.size() > 3 ? frames[3].to_string()
                                                                       : std::string{});
                if (chunk.is_error())
                {
                    cancel_session();
                    return abort_with(chunk.error(), chunk.error_message());
                }
                auto completed = receiver.accept(chunk.content(), report);
                if (completed.is_error())
                {
                    cancel_session();
                    return abort_with(completed.error(), completed.error_message());
                }
                if (completed.content())
                {
                    ++report.resources_completed;
                    auto stored = record_progress(*completed.content());
                    if (stored.is_error())
                    {
                        cancel_session();
                        return abort_with(TransferError::OffsetStore, stored.error_message());
                    }
                }
            }
            else if (msg_type == kMsgWarning)
            {
                auto warning = warning_from_json(header);
                if (warning.is_error())
                {
                    LOGGER_WARN("TransferClient: {}", warning.error_message());
                    continue;
                }
                const auto &w = warning.content();
                LOGGER_WARN("TransferClient: server skipped seq {} ({}): {}", w.skipped_sequence_id,
                            w.reason, w.details);
                ++report.warnings;
                auto stored = record_progress(w.skipped_sequence_id);
                if (stored.is_error())
                {
                    cancel_session();
                    return abort_with(TransferError::OffsetStore, stored.error_message());
                }
            }
            else if (msg_type == kMsgComplete)
            {
                report.summary = header;
                // Denied records advance the server's offset without reaching us.
                const auto server_last = header.value("last_offset", nlohmann::json());
                if (server_last.is_number_integer() &&
                    (!report.last_sequence_id ||
                     server_last.get<int64_t>() > *report.last_sequence_id))
                {
                    auto stored = record_progress(server_last.get<int64_t>());
                    if (stored.is_error())
                    {
                        return abort_with(TransferError::OffsetStore, stored.error_message());
                    }
                }
                const size_t discarded = receiver.discard_incomplete();
                if (discarded > 0)
                {
                    LOGGER_WARN("TransferClient: {} partial resource(s) discarded at completion",
                                discarded);
                }
                LOGGER_INFO("TransferClient: session {} complete: {} resource(s), {} warning(s)",
                            report.session_id, report.resources_completed, report.warnings);
                return R::ok(std::move(report));
            }
            else if (msg_type == kMsgError)
            {
                return abort_with(error_kind_of(header),
                                  header.value("message", std::string{"stream error"}));
            }
            else
            {
                LOGGER_WARN("TransferClient: unknown data message '{}'", msg_type);
            }
        }
    }
    catch (const zmq::error_t &e)
    {
        receiver.discard_incomplete();
        return R::error(TransferError::StreamTransport, fmt::format("zmq: {}", e.what()), e.num());
    }
    catch (const nlohmann::json::exception &e)
    {
        receiver.discard_incomplete();
        return R::error(TransferError::StreamTransport, fmt::format("malformed message: {}", e.what()));
    }
}

} // namespace federator::transfer
