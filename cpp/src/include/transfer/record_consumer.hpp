#pragma once
/**
 * @file record_consumer.hpp
 * @brief Poll-driven consumption of one topic with idle-timeout detection.
 *
 * There is no timer thread. The caller checks `still_available()` before every
 * `poll()`; once nothing has arrived for `idle_timeout`, the check closes the
 * source and reports false. Detection latency is therefore bounded by the poll
 * interval.
 *
 * State machine: OPEN -> POLLING -> OPEN ... -> CLOSED. Nothing leaves CLOSED.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"
#include "transfer/event_source.hpp"

#include <chrono>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

enum class ConsumerState
{
    Open,
    Polling,
    Closed,
};

class FEDERATOR_UTILS_EXPORT ConsumerSession
{
  public:
    using Clock = std::chrono::steady_clock;

    ConsumerSession(ConsumerSession &&) noexcept = default;
    ConsumerSession &operator=(ConsumerSession &&) noexcept = default;
    ConsumerSession(const ConsumerSession &) = delete;
    ConsumerSession &operator=(const ConsumerSession &) = delete;

    [[nodiscard]] const std::string &topic() const noexcept { return m_topic; }
    [[nodiscard]] int64_t start_offset() const noexcept { return m_start_offset; }
    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return m_poll_interval; }
    [[nodiscard]] std::chrono::milliseconds idle_timeout() const noexcept { return m_idle_timeout; }
    [[nodiscard]] Clock::time_point last_record_time() const noexcept { return m_last_record_time; }
    [[nodiscard]] ConsumerState state() const noexcept { return m_state; }
    [[nodiscard]] const EventSource &source() const noexcept { return m_source; }

  private:
    friend class RecordConsumer;

    ConsumerSession(std::string topic, int64_t start_offset, std::chrono::milliseconds poll_interval,
                    std::chrono::milliseconds idle_timeout, EventSource source);

    std::string m_topic;
    int64_t m_start_offset;
    std::chrono::milliseconds m_poll_interval;
    std::chrono::milliseconds m_idle_timeout;
    Clock::time_point m_last_record_time;
    ConsumerState m_state{ConsumerState::Open};
    EventSource m_source;
};

class FEDERATOR_UTILS_EXPORT RecordConsumer
{
  public:
    explicit RecordConsumer(EventSourceContext ctx) : m_ctx(std::move(ctx)) {}

    /**
     * @brief Starts consumption of @p topic at @p start_offset (inclusive).
     * @return Configuration for non-positive intervals, SourceUnavailable if the
     *         source cannot be opened.
     */
    [[nodiscard]] TransferResult<ConsumerSession> open(const std::string &topic, int64_t start_offset,
                                                       std::chrono::milliseconds poll_interval,
                                                       std::chrono::milliseconds idle_timeout) const;

    /**
     * @brief Waits up to the poll interval for the next record.
     *
     * A record resets the idle clock. Source errors are returned to the caller,
     * who decides whether to keep polling.
     */
    [[nodiscard]] TransferResult<std::optional<Record>> poll(ConsumerSession &session) const;

    /**
     * @brief False once the source is closed or the session has been idle for the
     *        idle timeout. The idle case closes the source first; close errors are
     *        logged and do not reach the caller.
     */
    [[nodiscard]] bool still_available(ConsumerSession &session) const;

    /// Releases the source. Idempotent.
    void close(ConsumerSession &session) const;

  private:
    void close_source(ConsumerSession &session, const char *why) const;

    EventSourceContext m_ctx;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
