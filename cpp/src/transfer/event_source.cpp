#include "transfer/event_source.hpp"
#include "fed_service.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <thread>

namespace federator::transfer
{

namespace
{
// Granularity at which a journal tail re-checks the file for appended lines.
constexpr std::chrono::milliseconds kJournalTailInterval{20};
} // namespace

std::optional<std::string_view> Record::header(std::string_view name) const
{
    for (const auto &[k, v] : headers)
    {
        if (format_tools::iequals(k, name))
        {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

std::string_view to_string(EventSourceKind kind) noexcept
{
    switch (kind)
    {
    case EventSourceKind::Memory:
        return "memory";
    case EventSourceKind::Journal:
        return "journal";
    }
    return "unknown";
}

std::optional<EventSourceKind> event_source_kind_from_string(std::string_view s)
{
    if (format_tools::iequals(s, "memory"))
        return EventSourceKind::Memory;
    if (format_tools::iequals(s, "journal"))
        return EventSourceKind::Journal;
    return std::nullopt;
}

// ============================================================================
// MemoryTopicLog
// ============================================================================

int64_t MemoryTopicLog::append(std::map<std::string, std::string> headers, std::string payload,
                               std::string key)
{
    int64_t offset = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        offset = m_first_offset + static_cast<int64_t>(m_records.size());
        m_records.push_back(Record{.offset = offset,
                                   .key = std::move(key),
                                   .headers = std::move(headers),
                                   .payload = std::move(payload)});
    }
    m_cv.notify_all();
    return offset;
}

void MemoryTopicLog::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool MemoryTopicLog::is_closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

int64_t MemoryTopicLog::end_offset() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_first_offset + static_cast<int64_t>(m_records.size());
}

std::optional<Record> MemoryTopicLog::wait_for(int64_t offset, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    const int64_t wanted = std::max(offset, m_first_offset);
    const auto available = [&]
    { return m_closed || wanted < m_first_offset + static_cast<int64_t>(m_records.size()); };
    if (!m_cv.wait_for(lock, timeout, available))
    {
        return std::nullopt;
    }
    const int64_t index = wanted - m_first_offset;
    if (index >= static_cast<int64_t>(m_records.size()))
    {
        return std::nullopt; // closed and drained
    }
    return m_records[static_cast<size_t>(index)];
}

std::shared_ptr<MemoryTopicLog> MemoryTopicRegistry::get_or_create(const std::string &topic,
                                                                   int64_t first_offset)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &slot = m_topics[topic];
    if (!slot)
    {
        slot = std::make_shared<MemoryTopicLog>(first_offset);
    }
    return slot;
}

std::shared_ptr<MemoryTopicLog> MemoryTopicRegistry::find(const std::string &topic) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_topics.find(topic);
    return it == m_topics.end() ? nullptr : it->second;
}

// ============================================================================
// MemoryEventSource
// ============================================================================

MemoryEventSource::MemoryEventSource(std::shared_ptr<MemoryTopicLog> log, int64_t start_offset)
    : m_log(std::move(log)), m_next_offset(start_offset)
{
}

TransferResult<std::optional<Record>> MemoryEventSource::poll(std::chrono::milliseconds timeout)
{
    if (m_closed)
    {
        return TransferResult<std::optional<Record>>::error(TransferError::SourceUnavailable,
                                                            "memory source is closed");
    }
    auto record = m_log->wait_for(m_next_offset, timeout);
    if (record)
    {
        m_next_offset = record->offset + 1;
    }
    return TransferResult<std::optional<Record>>::ok(std::move(record));
}

bool MemoryEventSource::is_closed() const
{
    return m_closed || (m_log->is_closed() && m_next_offset >= m_log->end_offset());
}

TransferVoid MemoryEventSource::close()
{
    ++m_close_calls;
    m_closed = true;
    return transfer_ok();
}

// ============================================================================
// JournalEventSource
// ============================================================================

JournalEventSource::JournalEventSource(std::filesystem::path file, int64_t start_offset)
    : m_file(std::move(file)), m_start_offset(start_offset)
{
}

JournalEventSource::LineStatus JournalEventSource::next_line(std::string &line)
{
    if (!m_in.is_open())
    {
        m_in.open(m_file, std::ios::in | std::ios::binary);
        if (!m_in.is_open())
        {
            return LineStatus::NoData; // topic file not written yet
        }
    }
    m_in.clear();
    m_in.seekg(m_position);
    if (!std::getline(m_in, line))
    {
        return LineStatus::NoData;
    }
    if (m_in.eof())
    {
        return LineStatus::NoData; // partial line, writer has not finished it
    }
    m_position = m_in.tellg();
    return LineStatus::Ready;
}

TransferResult<std::optional<Record>> JournalEventSource::poll(std::chrono::milliseconds timeout)
{
    using R = TransferResult<std::optional<Record>>;
    if (m_closed)
    {
        return R::error(TransferError::SourceUnavailable,
                        fmt::format("journal '{}' is closed", m_file.string()));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (true)
    {
        if (next_line(line) == LineStatus::NoData)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return R::ok(std::nullopt);
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kJournalTailInterval, deadline - now));
            continue;
        }

        const int64_t line_number = m_line_number++;
        if (format_tools::trim(line).empty())
        {
            continue;
        }

        Record record;
        try
        {
            const auto j = nlohmann::json::parse(line);
            record.offset = j.value("offset", line_number);
            record.key = j.value("key", std::string{});
            record.payload = j.value("payload", std::string{});
            if (j.contains("headers"))
            {
                for (const auto &[name, value] : j.at("headers").items())
                {
                    record.headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
                }
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            return R::error(TransferError::SourceUnavailable,
                            fmt::format("malformed journal line {} in '{}': {}", line_number,
                                        m_file.string(), e.what()));
        }

        if (record.offset < m_start_offset)
        {
            continue;
        }
        return R::ok(std::move(record));
    }
}

TransferVoid JournalEventSource::close()
{
    ++m_close_calls;
    m_closed = true;
    if (m_in.is_open())
    {
        m_in.close();
    }
    return transfer_ok();
}

// ============================================================================
// EventSource
// ============================================================================

EventSourceKind EventSource::kind() const noexcept
{
    return std::holds_alternative<MemoryEventSource>(m_impl) ? EventSourceKind::Memory
                                                             : EventSourceKind::Journal;
}

TransferResult<std::optional<Record>> EventSource::poll(std::chrono::milliseconds timeout)
{
    return std::visit([timeout](auto &src) { return src.poll(timeout); }, m_impl);
}

bool EventSource::is_closed() const
{
    return std::visit([](const auto &src) { return src.is_closed(); }, m_impl);
}

TransferVoid EventSource::close()
{
    return std::visit([](auto &src) { return src.close(); }, m_impl);
}

size_t EventSource::close_calls() const noexcept
{
    return std::visit([](const auto &src) { return src.close_calls(); }, m_impl);
}

TransferResult<EventSource> make_event_source(const EventSourceContext &ctx, const std::string &topic,
                                              int64_t start_offset)
{
    if (topic.empty() || topic.find_first_of("/\\") != std::string::npos || topic == "." ||
        topic == "..")
    {
        return TransferResult<EventSource>::error(TransferError::InvalidRequest,
                                                  fmt::format("invalid topic name '{}'", topic));
    }
    switch (ctx.kind)
    {
    case EventSourceKind::Memory:
    {
        if (!ctx.memory_topics)
        {
            return TransferResult<EventSource>::error(TransferError::SourceUnavailable,
                                                      "no in-memory topic registry configured");
        }
        auto log = ctx.memory_topics->get_or_create(topic);
        return TransferResult<EventSource>::ok(
            EventSource(MemoryEventSource(std::move(log), start_offset)));
    }
    case EventSourceKind::Journal:
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(ctx.journal_dir, ec))
        {
            return TransferResult<EventSource>::error(
                TransferError::SourceUnavailable,
                fmt::format("journal directory '{}' does not exist", ctx.journal_dir.string()));
        }
        return TransferResult<EventSource>::ok(
            EventSource(JournalEventSource(ctx.journal_dir / (topic + ".jsonl"), start_offset)));
    }
    }
    return TransferResult<EventSource>::error(TransferError::Configuration,
                                              "unknown event source kind");
}

} // namespace federator::transfer
