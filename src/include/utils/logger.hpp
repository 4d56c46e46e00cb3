/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility for the worker pool.
 *
 * **Command-Queue Pattern**
 * Application threads never touch a sink. A call such as `LOGGER_INFO(...)`
 * formats its body with fmt and pushes a command onto a queue; a single worker
 * thread is the sole consumer and performs all I/O (console or file). Sink
 * switches, flushes and callback registration travel through the same queue,
 * so their effect is ordered with respect to surrounding log lines.
 *
 * **Thread Safety**
 * - All public methods are thread-safe.
 * - `flush()` and `shutdown()` block the caller; every other call returns
 *   immediately.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("Instance {} entered ready", id);
 *
 * auto &logger = Logger::instance();
 * logger.set_logfile("/var/log/workerpool.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // drains the queue and joins the worker
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "workerpool_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef WKP_LOGGER_FMT_BUFFER_RESERVE
#define WKP_LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

namespace workerpool::utils
{

struct LoggerImpl;

class WORKERPOOL_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink changes are commands; they take effect in queue order.

    /// Switch logging to stderr. Non-blocking.
    void set_console();

    /**
     * @brief Switch logging to a file opened in append mode. Non-blocking.
     *
     * If the file cannot be opened the current sink stays active and the
     * failure is reported through the write error callback.
     */
    void set_logfile(const std::string &utf8_path);

    /**
     * @brief Waits until every message queued before this call is written.
     */
    void flush();

    /**
     * @brief Drains the queue, flushes the sink and joins the worker thread.
     *
     * Idempotent. Messages logged after shutdown are written straight to
     * stderr with a fallback prefix.
     */
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept;

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Sets a callback invoked when a sink fails to open or write.
     *
     * The callback runs on a dispatcher thread, never on the logging worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

/// Parses "trace", "debug", "info", "warning"/"warn", "error", "system".
WORKERPOOL_EXPORT std::optional<Logger::Level> level_from_string(std::string_view name) noexcept;
WORKERPOOL_EXPORT const char *to_string(Logger::Level lvl) noexcept;

#ifndef WKP_LOGGER_COMPILE_LEVEL
#define WKP_LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= WKP_LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(WKP_LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace workerpool::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::workerpool::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::workerpool::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::workerpool::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::workerpool::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::workerpool::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::workerpool::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
