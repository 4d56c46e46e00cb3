/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue logger.
 ******************************************************************************/

#include <condition_variable>
#include <cstdio>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/logger.hpp"

namespace workerpool::utils
{

namespace
{

uint64_t current_thread_id() noexcept
{
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

std::string formatted_time(std::chrono::system_clock::time_point tp)
{
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", fmt::localtime(tt), micros);
}

} // namespace

const char *to_string(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE:
        return "TRACE";
    case Logger::Level::L_DEBUG:
        return "DEBUG";
    case Logger::Level::L_INFO:
        return "INFO";
    case Logger::Level::L_WARNING:
        return "WARN";
    case Logger::Level::L_ERROR:
        return "ERROR";
    case Logger::Level::L_SYSTEM:
        return "SYSTEM";
    }
    return "UNK";
}

std::optional<Logger::Level> level_from_string(std::string_view name) noexcept
{
    if (name == "trace")
        return Logger::Level::L_TRACE;
    if (name == "debug")
        return Logger::Level::L_DEBUG;
    if (name == "info")
        return Logger::Level::L_INFO;
    if (name == "warning" || name == "warn")
        return Logger::Level::L_WARNING;
    if (name == "error")
        return Logger::Level::L_ERROR;
    if (name == "system")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

// ============================================================================
// Messages and sinks
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

static std::string format_message(const LogMessage &msg)
{
    return fmt::format("[WKP] [{:<6}] [{}] [TID:{:5}] {}\n", to_string(msg.level),
                       formatted_time(msg.timestamp), msg.thread_id % 100000, msg.body);
}

class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : m_path(path)
    {
        m_file = std::fopen(path.c_str(), "a");
        if (m_file == nullptr)
        {
            throw std::runtime_error(fmt::format("Cannot open log file '{}'", path));
        }
    }

    ~FileSink() override
    {
        if (m_file != nullptr)
        {
            std::fclose(m_file);
        }
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
        if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
        {
            throw std::runtime_error(fmt::format("Short write to log file '{}'", m_path));
        }
    }

    void flush() override { std::fflush(m_file); }
    std::string description() const override { return "File: " + m_path; }

  private:
    std::string m_path;
    std::FILE *m_file{nullptr};
};

/**
 * @class CallbackDispatcher
 * @brief Runs user error callbacks on their own thread so a slow or throwing
 *        callback cannot stall the logging worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() { worker_ = std::thread([this] { run(); }); }
    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[workerpool::Logger] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

// --- Command Definitions ---
struct SetSinkCommand
{
    std::function<std::unique_ptr<Sink>()> make_sink;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void process(Command &cmd);
    void report_error(std::string msg);
    bool enqueue_command(Command &&cmd);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned by the worker thread.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    shutdown();
}

bool LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return true;
        }
    }
    if (const auto *msg = std::get_if<LogMessage>(&cmd))
    {
        fmt::print(stderr, "[workerpool::Logger-fallback] {}", format_message(*msg));
    }
    return false;
}

void LoggerImpl::report_error(std::string msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(msg)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[workerpool::Logger] {}\n", msg);
    }
}

void LoggerImpl::process(Command &cmd)
{
    std::visit(
        [this](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                    sink_->write(arg);
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                std::unique_ptr<Sink> next;
                try
                {
                    next = arg.make_sink();
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Sink creation failed: {}", e.what()));
                    return;
                }
                const std::string old_desc = sink_ ? sink_->description() : "null";
                if (sink_)
                {
                    sink_->write({Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                                  current_thread_id(),
                                  "Switching log sink to: " + next->description()});
                    sink_->flush();
                }
                sink_ = std::move(next);
                sink_->write({Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                              current_thread_id(), "Log sink switched from: " + old_desc});
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                    sink_->flush();
                arg.promise->set_value();
            }
            else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
            {
                error_callback_ = std::move(arg.callback);
            }
        },
        cmd);
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop = shutdown_requested_.load();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                {
                    flush->promise->set_value();
                }
            }
        }
        local_queue.clear();

        if (stop)
        {
            if (sink_)
                sink_->flush();
            break;
        }
    }
}

void LoggerImpl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
            return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    callback_dispatcher_.shutdown();
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger g_logger;
    return g_logger;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{[] { return std::make_unique<ConsoleSink>(); }});
}

void Logger::set_logfile(const std::string &utf8_path)
{
    pImpl->enqueue_command(
        SetSinkCommand{[utf8_path] { return std::make_unique<FileSink>(utf8_path); }});
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    if (pImpl->enqueue_command(FlushCommand{promise}))
    {
        future.wait();
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

bool Logger::is_running() const noexcept
{
    return !pImpl->shutdown_requested_.load(std::memory_order_acquire);
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return lvl >= pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(
            LogMessage{lvl, std::chrono::system_clock::now(), current_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[workerpool::Logger] dropped message: {}\n", e.what());
    }
}

} // namespace workerpool::utils
