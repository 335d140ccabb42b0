#include "transfer/transfer_session.hpp"
#include "transfer/record_consumer.hpp"
#include "fed_service.hpp"

namespace federator::transfer
{

namespace
{
bool chunk_size_valid(size_t chunk_size) noexcept
{
    return chunk_size > 0 && chunk_size <= ChunkStreamer::kMaxChunkSize;
}
} // namespace

nlohmann::json SessionOutcome::to_json() const
{
    nlohmann::json j;
    j["first_offset"] = first_offset;
    j["delivered"] = delivered;
    j["denied"] = denied;
    j["warnings"] = warnings;
    j["last_offset"] = last_offset ? nlohmann::json(*last_offset) : nlohmann::json(nullptr);
    j["cancelled"] = cancelled;
    return j;
}

TransferSession::TransferSession(SessionSettings settings, EventSourceContext sources,
                                 OffsetStore &offsets)
    : m_settings(settings), m_sources(std::move(sources)), m_offsets(offsets)
{
}

TransferResult<SessionOutcome> TransferSession::run(const SessionRequest &request, ChunkSink &sink,
                                                    const Deliver &deliver)
{
    using R = TransferResult<SessionOutcome>;
    const auto fail_session = [&sink](TransferError kind, const std::string &message)
    {
        LOGGER_ERROR("Session failed ({}): {}", to_string(kind), message);
        sink.fail(kind, message);
        return R::error(kind, message);
    };

    if (!chunk_size_valid(m_settings.chunk_size) || m_settings.poll_interval.count() <= 0 ||
        m_settings.idle_timeout.count() <= 0)
    {
        return fail_session(TransferError::Configuration,
                            fmt::format("chunk size must be in 1..{}; poll interval and idle "
                                        "timeout must be positive",
                                        ChunkStreamer::kMaxChunkSize));
    }

    SessionOutcome outcome;
    if (request.start_offset >= 0)
    {
        outcome.first_offset = request.start_offset;
    }
    else
    {
        auto resumed = m_offsets.resume_offset(request.client_id, request.topic);
        if (resumed.is_error())
        {
            return fail_session(TransferError::OffsetStore, resumed.error_message());
        }
        outcome.first_offset = resumed.content();
    }

    const RecordConsumer consumer(m_sources);
    auto opened = consumer.open(request.topic, outcome.first_offset, m_settings.poll_interval,
                                m_settings.idle_timeout);
    if (opened.is_error())
    {
        return fail_session(opened.error(), opened.error_message());
    }
    ConsumerSession session = std::move(opened).content();
    const AccessFilter filter(request.client_id, request.grant);

    LOGGER_INFO("Session start: client '{}' topic '{}' from offset {}", request.client_id,
                request.topic, outcome.first_offset);

    const auto persist = [&](int64_t offset) -> TransferVoid
    {
        auto stored = m_offsets.set_offset(request.client_id, request.topic, offset);
        if (stored.is_ok())
        {
            outcome.last_offset = offset;
        }
        return stored;
    };

    while (true)
    {
        if (sink.is_cancelled())
        {
            LOGGER_INFO("Session for client '{}' topic '{}' cancelled", request.client_id,
                        request.topic);
            outcome.cancelled = true;
            break;
        }
        if (!consumer.still_available(session))
        {
            break;
        }

        auto polled = consumer.poll(session);
        if (polled.is_error())
        {
            // Nothing past the last persisted offset is consumed; a new session retries from there.
            consumer.close(session);
            return fail_session(polled.error(), fmt::format("poll on '{}' failed: {}", request.topic,
                                                            polled.error_message()));
        }
        if (!polled.content())
        {
            continue;
        }
        const Record &record = *polled.content();

        const DecisionDetail decision = filter.evaluate(record);
        if (!decision.allowed())
        {
            LOGGER_INFO("Denied record {} on '{}' for client '{}': {}", record.offset, request.topic,
                        request.client_id, decision.reason);
            ++outcome.denied;
            auto stored = persist(record.offset);
            if (stored.is_error())
            {
                consumer.close(session);
                return fail_session(TransferError::OffsetStore, stored.error_message());
            }
            continue;
        }

        auto delivered = deliver(record);
        if (delivered.is_error())
        {
            consumer.close(session);
            if (delivered.error() == TransferError::Cancelled)
            {
                outcome.cancelled = true;
                break;
            }
            return fail_session(delivered.error(),
                                fmt::format("record {} on '{}' not delivered: {}", record.offset,
                                            request.topic, delivered.error_message()));
        }
        if (delivered.content() == Delivery::Warned)
        {
            ++outcome.warnings;
        }
        else
        {
            ++outcome.delivered;
        }

        auto stored = persist(record.offset);
        if (stored.is_error())
        {
            consumer.close(session);
            return fail_session(TransferError::OffsetStore, stored.error_message());
        }
    }

    consumer.close(session);
    LOGGER_INFO("Session end: client '{}' topic '{}' delivered {} denied {} warnings {}",
                request.client_id, request.topic, outcome.delivered, outcome.denied,
                outcome.warnings);

    auto completed = sink.complete(outcome.to_json());
    if (completed.is_error())
    {
        LOGGER_ERROR("Completion for '{}' not delivered: {}", request.topic,
                     completed.error_message());
        return completed.forward_error<SessionOutcome>();
    }
    return R::ok(outcome);
}

TransferResult<SessionOutcome> TransferSession::run_topic_transfer(const SessionRequest &request,
                                                                   ChunkSink &sink)
{
    if (!chunk_size_valid(m_settings.chunk_size))
    {
        return run(request, sink, {});
    }
    const ChunkStreamer streamer(m_settings.chunk_size);
    const Deliver deliver = [&](const Record &record) -> TransferResult<Delivery>
    {
        const std::string &name = record.key.empty() ? request.topic : record.key;
        auto streamed = streamer.stream_bytes(record.payload, name, record.offset, sink);
        if (streamed.is_error())
        {
            return streamed.forward_error<Delivery>();
        }
        return TransferResult<Delivery>::ok(Delivery::Streamed);
    };
    return run(request, sink, deliver);
}

TransferResult<SessionOutcome> TransferSession::run_file_transfer(const SessionRequest &request,
                                                                  const FileRoots &roots,
                                                                  ChunkSink &sink)
{
    const Deliver deliver = [&](const Record &record) -> TransferResult<Delivery>
    {
        StreamWarning warning;
        warning.skipped_sequence_id = record.offset;

        auto parsed = FileTransferRequest::from_payload(record.payload);
        if (parsed.is_ok())
        {
            auto streamed = transfer_file(parsed.content(), record.offset, roots, sink);
            if (streamed.is_ok())
            {
                return TransferResult<Delivery>::ok(Delivery::Streamed);
            }
            if (streamed.error() != TransferError::InvalidRequest)
            {
                return streamed.forward_error<Delivery>();
            }
            warning.reason = std::string(to_string(RequestRejection::Validation));
            warning.details = streamed.error_message();
        }
        else
        {
            warning.reason = std::string(to_string(parsed.error()));
            warning.details = parsed.error_message();
        }

        LOGGER_WARN("Skipping record {} on '{}' ({}): {}", record.offset, request.topic,
                    warning.reason, warning.details);
        auto sent = sink.send_warning(warning);
        if (sent.is_error())
        {
            sink.fail(TransferError::StreamTransport, sent.error_message());
            return sent.forward_error<Delivery>();
        }
        return TransferResult<Delivery>::ok(Delivery::Warned);
    };
    return run(request, sink, deliver);
}

TransferResult<StreamStats> TransferSession::transfer_file(const FileTransferRequest &file_request,
                                                           int64_t sequence_id,
                                                           const FileRoots &roots,
                                                           ChunkSink &sink) const
{
    if (!chunk_size_valid(m_settings.chunk_size))
    {
        return TransferResult<StreamStats>::error(
            TransferError::Configuration,
            fmt::format("chunk size {} is not in 1..{}", m_settings.chunk_size,
                        ChunkStreamer::kMaxChunkSize));
    }
    auto provider = make_file_provider(file_request.kind, roots);
    if (provider.is_error())
    {
        return provider.forward_error<StreamStats>();
    }
    auto opened = provider.content().open(file_request);
    if (opened.is_error())
    {
        return opened.forward_error<StreamStats>();
    }
    OpenedFile &file = opened.content();
    LOGGER_INFO("Streaming {} file '{}' ({} bytes) as seq {}", to_string(file_request.kind),
                file.resolved_path.string(), file.size, sequence_id);

    const ChunkStreamer streamer(m_settings.chunk_size);
    return streamer.stream(file.stream, file.size, file.resource_name, sequence_id, sink);
}

} // namespace federator::transfer
