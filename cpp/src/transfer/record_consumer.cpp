#include "transfer/record_consumer.hpp"
#include "fed_service.hpp"

namespace federator::transfer
{

ConsumerSession::ConsumerSession(std::string topic, int64_t start_offset,
                                 std::chrono::milliseconds poll_interval,
                                 std::chrono::milliseconds idle_timeout, EventSource source)
    : m_topic(std::move(topic)), m_start_offset(start_offset), m_poll_interval(poll_interval),
      m_idle_timeout(idle_timeout), m_last_record_time(Clock::now()), m_source(std::move(source))
{
}

TransferResult<ConsumerSession> RecordConsumer::open(const std::string &topic, int64_t start_offset,
                                                     std::chrono::milliseconds poll_interval,
                                                     std::chrono::milliseconds idle_timeout) const
{
    if (poll_interval.count() <= 0 || idle_timeout.count() <= 0)
    {
        return TransferResult<ConsumerSession>::error(
            TransferError::Configuration,
            fmt::format("poll interval ({}ms) and idle timeout ({}ms) must be positive",
                        poll_interval.count(), idle_timeout.count()));
    }
    if (start_offset < 0)
    {
        return TransferResult<ConsumerSession>::error(
            TransferError::InvalidRequest, fmt::format("negative start offset {}", start_offset));
    }

    auto source = make_event_source(m_ctx, topic, start_offset);
    if (source.is_error())
    {
        return source.forward_error<ConsumerSession>();
    }
    LOGGER_DEBUG("Consumer opened on '{}' ({}) at offset {}", topic, to_string(m_ctx.kind),
                 start_offset);
    return TransferResult<ConsumerSession>::ok(ConsumerSession(
        topic, start_offset, poll_interval, idle_timeout, std::move(source).content()));
}

TransferResult<std::optional<Record>> RecordConsumer::poll(ConsumerSession &session) const
{
    if (session.m_state == ConsumerState::Closed)
    {
        return TransferResult<std::optional<Record>>::error(
            TransferError::SourceUnavailable,
            fmt::format("consumer on '{}' is closed", session.m_topic));
    }

    session.m_state = ConsumerState::Polling;
    auto polled = session.m_source.poll(session.m_poll_interval);
    session.m_state = ConsumerState::Open;

    if (polled.is_ok() && polled.content().has_value())
    {
        const auto now = ConsumerSession::Clock::now();
        if (now > session.m_last_record_time)
        {
            session.m_last_record_time = now;
        }
    }
    return polled;
}

bool RecordConsumer::still_available(ConsumerSession &session) const
{
    if (session.m_state == ConsumerState::Closed)
    {
        return false;
    }
    if (session.m_source.is_closed())
    {
        LOGGER_INFO("Source for '{}' reports closed", session.m_topic);
        close_source(session, "source closed");
        return false;
    }
    const auto idle = ConsumerSession::Clock::now() - session.m_last_record_time;
    if (idle >= session.m_idle_timeout)
    {
        LOGGER_INFO("Closing consumer on '{}' due to inactivity timeout of {}ms", session.m_topic,
                    session.m_idle_timeout.count());
        close_source(session, "idle timeout");
        return false;
    }
    return true;
}

void RecordConsumer::close(ConsumerSession &session) const
{
    if (session.m_state == ConsumerState::Closed)
    {
        return;
    }
    close_source(session, "explicit close");
}

void RecordConsumer::close_source(ConsumerSession &session, const char *why) const
{
    if (session.m_state == ConsumerState::Closed)
    {
        return;
    }
    session.m_state = ConsumerState::Closed;
    auto closed = session.m_source.close();
    if (closed.is_error())
    {
        LOGGER_WARN("Error while closing source for '{}' ({}): {}", session.m_topic, why,
                    closed.error_message());
    }
}

} // namespace federator::transfer
