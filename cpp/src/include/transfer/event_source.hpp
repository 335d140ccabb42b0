#pragma once
/**
 * @file event_source.hpp
 * @brief Offset-addressable topic sources the record consumer reads from.
 *
 * Two kinds exist, selected by `EventSourceKind` through `make_event_source()`:
 *
 * - **Memory**: an in-process `MemoryTopicLog` shared through a
 *   `MemoryTopicRegistry`. Producers append, readers block on a condition variable.
 * - **Journal**: a JSON-lines file `<journal_dir>/<topic>.jsonl`. Each line is
 *   `{"offset": N, "key": "...", "headers": {...}, "payload": "..."}`; `offset`
 *   defaults to the zero-based line number. Polling tails the file for new lines.
 *
 * `EventSource` holds exactly one of them; there is no virtual dispatch.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

/// One addressable unit read from a topic.
struct Record
{
    int64_t offset{0};
    std::string key;
    std::map<std::string, std::string> headers;
    std::string payload;

    /// Header value by case-insensitive name.
    [[nodiscard]] FEDERATOR_UTILS_EXPORT std::optional<std::string_view>
    header(std::string_view name) const;
};

enum class EventSourceKind
{
    Memory,
    Journal,
};

FEDERATOR_UTILS_EXPORT std::string_view to_string(EventSourceKind kind) noexcept;
FEDERATOR_UTILS_EXPORT std::optional<EventSourceKind> event_source_kind_from_string(std::string_view s);

/**
 * @class MemoryTopicLog
 * @brief Append-only in-process log for one topic. Thread-safe.
 */
class FEDERATOR_UTILS_EXPORT MemoryTopicLog
{
  public:
    explicit MemoryTopicLog(int64_t first_offset = 0) : m_first_offset(first_offset) {}

    /// Appends a record and returns the offset assigned to it.
    int64_t append(std::map<std::string, std::string> headers, std::string payload,
                   std::string key = {});

    /// Marks the log as finished. Readers drain what is left, then see it as closed.
    void close();

    [[nodiscard]] bool is_closed() const;

    /// Offset the next append will receive.
    [[nodiscard]] int64_t end_offset() const;

    /**
     * @brief Waits up to @p timeout for the record at @p offset.
     *
     * Offsets before the first retained record are skipped forward to it.
     */
    [[nodiscard]] std::optional<Record> wait_for(int64_t offset, std::chrono::milliseconds timeout);

  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Record> m_records;
    int64_t m_first_offset;
    bool m_closed{false};
};

/**
 * @class MemoryTopicRegistry
 * @brief Topic name to `MemoryTopicLog` map shared by producers and sessions.
 */
class FEDERATOR_UTILS_EXPORT MemoryTopicRegistry
{
  public:
    /// Returns the log for @p topic, creating it (starting at @p first_offset) if absent.
    std::shared_ptr<MemoryTopicLog> get_or_create(const std::string &topic, int64_t first_offset = 0);

    [[nodiscard]] std::shared_ptr<MemoryTopicLog> find(const std::string &topic) const;

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<MemoryTopicLog>> m_topics;
};

class FEDERATOR_UTILS_EXPORT MemoryEventSource
{
  public:
    MemoryEventSource(std::shared_ptr<MemoryTopicLog> log, int64_t start_offset);

    TransferResult<std::optional<Record>> poll(std::chrono::milliseconds timeout);
    [[nodiscard]] bool is_closed() const;
    TransferVoid close();
    [[nodiscard]] size_t close_calls() const noexcept { return m_close_calls; }

  private:
    std::shared_ptr<MemoryTopicLog> m_log;
    int64_t m_next_offset;
    bool m_closed{false};
    size_t m_close_calls{0};
};

class FEDERATOR_UTILS_EXPORT JournalEventSource
{
  public:
    JournalEventSource(std::filesystem::path file, int64_t start_offset);

    TransferResult<std::optional<Record>> poll(std::chrono::milliseconds timeout);
    [[nodiscard]] bool is_closed() const noexcept { return m_closed; }
    TransferVoid close();
    [[nodiscard]] size_t close_calls() const noexcept { return m_close_calls; }

  private:
    enum class LineStatus
    {
        Ready,
        NoData,
    };
    LineStatus next_line(std::string &line);

    std::filesystem::path m_file;
    std::ifstream m_in;
    std::streamoff m_position{0};
    int64_t m_line_number{0};
    int64_t m_start_offset;
    bool m_closed{false};
    size_t m_close_calls{0};
};

/// Where `make_event_source()` finds topics of each kind.
struct EventSourceContext
{
    EventSourceKind kind{EventSourceKind::Journal};
    std::filesystem::path journal_dir;
    std::shared_ptr<MemoryTopicRegistry> memory_topics;
};

/**
 * @class EventSource
 * @brief Tagged union over the supported source kinds.
 */
class FEDERATOR_UTILS_EXPORT EventSource
{
  public:
    using Variant = std::variant<MemoryEventSource, JournalEventSource>;

    explicit EventSource(Variant impl) : m_impl(std::move(impl)) {}

    [[nodiscard]] EventSourceKind kind() const noexcept;

    /// Waits up to @p timeout for the next record. Empty when none arrived.
    TransferResult<std::optional<Record>> poll(std::chrono::milliseconds timeout);

    /// True when the source has been closed or has nothing more to deliver.
    [[nodiscard]] bool is_closed() const;

    TransferVoid close();

    /// Number of times close() has been invoked on this source.
    [[nodiscard]] size_t close_calls() const noexcept;

  private:
    Variant m_impl;
};

/**
 * @brief Opens @p topic at @p start_offset using the kind named in @p ctx.
 * @return SourceUnavailable if the journal directory or memory registry is missing.
 */
FEDERATOR_UTILS_EXPORT TransferResult<EventSource>
make_event_source(const EventSourceContext &ctx, const std::string &topic, int64_t start_offset);

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
