/**
 * @file logger.hpp
 * @brief Level-filtered console logger.
 *
 * Messages are filtered against a per-thread severity threshold, stamped with
 * the local time, the thread name and the calling site, and written to
 * standard output one line per message:
 *
 * @code
 * 2024-05-01 12:00:00.123 worker-1  WARN [Worker.run()]:42 queue is full
 * 2024-05-01 12:00:00.124 main * DEBUG [app.main()]:17 no threshold set
 * @endcode
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#include "levelog/core/call_site.hpp"
#include "levelog/core/error.hpp"
#include "levelog/core/export.hpp"
#include "levelog/core/severity.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace levelog {
namespace core {

/**
 * @struct LogEntry
 * @brief One formatted-but-not-yet-written log line.
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string thread_name;
    bool unfiltered = false;  ///< No threshold was active when the entry was made
    Severity severity = Severity::DEBUG;
    std::string caller_tag;
    std::string message;
};

/**
 * @class Logger
 * @brief Process-wide logger with a per-thread severity threshold.
 *
 * The process default level is set once at startup. A thread that logs
 * without having been configured adopts the default on its first call and
 * keeps it, even if the default changes later. With no default and no thread
 * configuration, every message is written and marked with `*`.
 *
 * Usage:
 * @code
 * Logger::instance().setDefaultLevel("INFO");
 * Logger::instance().configure("debug");   // this thread only
 * LEVELOG_INFO("Loaded {} records", count);
 * @endcode
 */
class LEVELOG_CORE_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Set or clear the process-wide default level.
     * @throws InvalidConfigurationError if the label is not a known severity.
     */
    void setDefaultLevel(const std::optional<std::string>& level);

    /**
     * @brief The process-wide default level, if one is set.
     */
    std::optional<Severity> defaultLevel() const;

    /**
     * @brief Configure the calling thread from the process default.
     * @throws InvalidConfigurationError if no default is set.
     */
    Severity configure();

    /**
     * @brief Configure the calling thread's threshold.
     * @param level Case-insensitive label; std::nullopt uses the process default.
     * @return The canonical severity now active on this thread.
     * @throws InvalidConfigurationError on an unknown label, or when no level
     *         is given and no default is set.
     */
    Severity configure(const std::optional<std::string>& level);

    /**
     * @brief The calling thread's active threshold, without lazy initialisation.
     */
    std::optional<Severity> threadLevel() const;

    /**
     * @brief Forget the calling thread's threshold.
     */
    void resetThread();

    /**
     * @brief Whether a message at @p severity would be written by this thread.
     *
     * Performs the same lazy initialisation from the default as logging does.
     */
    bool isEnabled(Severity severity);

    void debug(const std::string& message, const CallSite& site = LEVELOG_CALLER_SITE) {
        log(Severity::DEBUG, message, site);
    }

    void info(const std::string& message, const CallSite& site = LEVELOG_CALLER_SITE) {
        log(Severity::INFO, message, site);
    }

    void warn(const std::string& message, const CallSite& site = LEVELOG_CALLER_SITE) {
        log(Severity::WARN, message, site);
    }

    void error(const std::string& message, const CallSite& site = LEVELOG_CALLER_SITE) {
        log(Severity::ERROR, message, site);
    }

    /**
     * @brief Filter, format and write one message. Never throws on
     *        missing configuration.
     *
     * Without an explicit site the caller's file, function and line are
     * captured where the compiler supports it; the scope is then the file stem.
     */
    void log(Severity severity, const std::string& message, const CallSite& site = LEVELOG_CALLER_SITE);

    /**
     * @brief Log with `{}` placeholders substituted by @p args in order.
     *
     * Arguments are only formatted if the message passes the filter.
     */
    template<typename... Args>
    void logf(Severity severity, const CallSite& site, const std::string& format, Args&&... args) {
        if (!isEnabled(severity)) {
            return;
        }
        log(severity, formatMessage(format.c_str(), std::forward<Args>(args)...), site);
    }

    /**
     * @brief Local time as `YYYY-MM-DD hh:mm:ss.sss`.
     */
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);

    /**
     * @brief Render an entry as a single line, without the trailing newline.
     */
    static std::string formatLine(const LogEntry& entry);

private:
    static constexpr int kNoLevel = -1;

    Logger() : default_level_(kNoLevel) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief The thread's threshold, adopting the default on first use.
     */
    std::optional<Severity> resolveThreshold();

    void write(const std::string& line);

    static std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    std::atomic<int> default_level_;
    std::mutex mutex_;
};

}  // namespace core
}  // namespace levelog

// =============================================================================
// Convenience Macros
// =============================================================================

#define LEVELOG_DEBUG(...) \
    ::levelog::core::Logger::instance().logf(::levelog::core::Severity::DEBUG, LEVELOG_CALL_SITE, __VA_ARGS__)

#define LEVELOG_INFO(...) \
    ::levelog::core::Logger::instance().logf(::levelog::core::Severity::INFO, LEVELOG_CALL_SITE, __VA_ARGS__)

#define LEVELOG_WARN(...) \
    ::levelog::core::Logger::instance().logf(::levelog::core::Severity::WARN, LEVELOG_CALL_SITE, __VA_ARGS__)

#define LEVELOG_ERROR(...) \
    ::levelog::core::Logger::instance().logf(::levelog::core::Severity::ERROR, LEVELOG_CALL_SITE, __VA_ARGS__)
