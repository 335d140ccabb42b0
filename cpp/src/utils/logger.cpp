/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "fed_service.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace federator::format_tools;

namespace federator::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

static bool logger_is_running()
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread so a slow or
 *        failing callback never stalls the logging worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() = default;
    ~CallbackDispatcher() { shutdown(); }

    void start()
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (!m_worker.joinable() && !m_shutdown_requested.load())
        {
            m_worker = std::thread([this] { this->run(); });
        }
    }

    void post(std::function<void()> fn)
    {
        if (m_shutdown_requested.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_queue.push_back(std::move(fn));
        }
        m_cv.notify_one();
    }

    void shutdown()
    {
        if (m_shutdown_requested.exchange(true))
        {
            return;
        }
        m_cv.notify_one();
        if (m_worker.joinable())
        {
            m_worker.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(m_mutex);
                m_cv.wait(ul, [this] { return m_shutdown_requested.load() || !m_queue.empty(); });
                if (m_shutdown_requested.load() && m_queue.empty())
                {
                    return;
                }
                fn = std::move(m_queue.front());
                m_queue.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[LOGGER] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_shutdown_requested{false};
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

namespace
{

void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        FED_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &message);
    void write_to_sink(const LogMessage &msg);
    bool wait_for(Command &&cmd, std::future<bool> &future);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable())
    {
        FED_DEBUG("Logger Impl destroyed without a prior shutdown; stopping the worker now.");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    callback_dispatcher_.start();
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;
        const bool is_message = std::holds_alternative<LogMessage>(cmd);

        if (current_queue_size >= max_queue_size_hard ||
            (is_message && current_queue_size >= max_queue_size_soft))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

bool Logger::Impl::wait_for(Command &&cmd, std::future<bool> &future)
{
    (void)enqueue_command(std::move(cmd));
    return future.get();
}

void Logger::Impl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        fmt::print(stderr, "[LOGGER] {}\n", message);
    }
}

// Caller holds m_sink_mutex.
void Logger::Impl::write_to_sink(const LogMessage &msg)
{
    if (!sink_)
        return;
    try
    {
        sink_->write(msg, Sink::ASYNC_WRITE);
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Logger write to '{}' failed: {}", sink_->description(), e.what()));
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;
        bool stopping = false;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration_cast<std::chrono::duration<double>>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
            stopping = shutdown_requested_.load() && queue_.empty();
        }

        // Only the last sink switch in a batch takes effect.
        std::ptrdiff_t last_set_sink_idx = -1;
        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(local_queue.size()); ++i)
        {
            if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
            {
                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                {
                    write_to_sink(*msg);
                }
                continue;
            }

            std::visit(
                [&, this, i](auto &&arg)
                {
                    using T = std::decay_t<decltype(arg)>;

                    if constexpr (std::is_same_v<T, SetSinkCommand>)
                    {
                        if (i != last_set_sink_idx)
                        {
                            promise_set_safe(arg.promise, false);
                            return;
                        }
                        std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                        const std::string old_desc = sink_ ? sink_->description() : "null";
                        const std::string new_desc =
                            arg.new_sink ? arg.new_sink->description() : "null";
                        write_to_sink(make_internal_message(
                            Logger::Level::L_SYSTEM, make_buffer("Switching log sink to: {}", new_desc)));
                        if (sink_)
                        {
                            sink_->flush();
                        }
                        m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                        sink_ = std::move(arg.new_sink);
                        write_to_sink(make_internal_message(
                            Logger::Level::L_SYSTEM, make_buffer("Log sink switched from: {}", old_desc)));
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                    {
                        report_error(arg.error_message);
                        promise_set_safe(arg.promise, false);
                    }
                    else if constexpr (std::is_same_v<T, FlushCommand>)
                    {
                        std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                        if (sink_)
                        {
                            sink_->flush();
                        }
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                    {
                        error_callback_ = std::move(arg.callback);
                        promise_set_safe(arg.promise, true);
                    }
                },
                local_queue[i]);
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            write_to_sink(make_internal_message(
                Logger::Level::L_WARNING,
                make_buffer("Logger dropped {} messages over {:.2f}s due to a full queue.",
                            dropped_count, dropping_duration_s)));
        }

        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            write_to_sink(make_internal_message(Logger::Level::L_SYSTEM,
                                                make_buffer("Logger is shutting down.")));
            if (sink_)
            {
                sink_->flush();
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::set_console()
{
    if (!logger_is_running())
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    return pImpl->wait_for(SetSinkCommand{std::make_unique<ConsoleSink>(), promise}, future);
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!logger_is_running())
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        (void)pImpl->wait_for(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what()),
                                     promise_err},
            future_err);
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    return pImpl->wait_for(SetSinkCommand{std::move(sink), promise}, future);
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_running())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    (void)pImpl->wait_for(FlushCommand{promise}, future);
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_running())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    (void)pImpl->wait_for(SetErrorCallbackCommand{std::move(cb), promise}, future);
}

bool Logger::parse_level(std::string_view name, Level &out) noexcept
{
    const std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "SYSTEM"};
    for (size_t i = 0; i < std::size(names); ++i)
    {
        if (iequals(name, names[i]))
        {
            out = static_cast<Level>(i);
            return true;
        }
    }
    if (iequals(name, "WARN"))
    {
        out = Level::L_WARNING;
        return true;
    }
    out = Level::L_INFO;
    return false;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return logger_is_running() &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!logger_is_running())
        return false;
    try
    {
        return pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        FED_DEBUG("Logger failed to enqueue a message: {}", e.what());
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        return enqueue_log(lvl, make_buffer("{}", body));
    }
    catch (const std::exception &e)
    {
        FED_DEBUG("Logger failed to enqueue a message: {}", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle API.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("federator::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace federator::utils
