/**
 * @file logger.cpp
 * @brief Logger configuration, filtering and output.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#include "levelog/core/logger.hpp"
#include "levelog/core/thread_context.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace levelog {
namespace core {

void Logger::setDefaultLevel(const std::optional<std::string>& level) {
    if (!level) {
        default_level_.store(kNoLevel, std::memory_order_relaxed);
        return;
    }
    default_level_.store(severityRank(parseSeverity(*level)), std::memory_order_relaxed);
}

std::optional<Severity> Logger::defaultLevel() const {
    int level = default_level_.load(std::memory_order_relaxed);
    if (level == kNoLevel) {
        return std::nullopt;
    }
    return static_cast<Severity>(level);
}

Severity Logger::configure() {
    return configure(std::nullopt);
}

Severity Logger::configure(const std::optional<std::string>& level) {
    Severity severity;

    if (level) {
        severity = parseSeverity(*level);
    } else {
        auto fallback = defaultLevel();
        if (!fallback) {
            throw InvalidConfigurationError("No log level given and no default log level configured");
        }
        severity = *fallback;
    }

    currentThreadContext().threshold = severity;
    return severity;
}

std::optional<Severity> Logger::threadLevel() const {
    return currentThreadContext().threshold;
}

void Logger::resetThread() {
    currentThreadContext().threshold.reset();
}

std::optional<Severity> Logger::resolveThreshold() {
    ThreadContext& context = currentThreadContext();

    // Sticky: once adopted, later default changes are not seen by this thread.
    if (!context.threshold) {
        context.threshold = defaultLevel();
    }
    return context.threshold;
}

bool Logger::isEnabled(Severity severity) {
    auto threshold = resolveThreshold();
    return !threshold || passesThreshold(severity, *threshold);
}

void Logger::log(Severity severity, const std::string& message, const CallSite& site) {
    auto threshold = resolveThreshold();
    if (threshold && !passesThreshold(severity, *threshold)) {
        return;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_name = currentThreadName();
    entry.unfiltered = !threshold;
    entry.severity = severity;
    entry.caller_tag = callerTag(site);
    entry.message = message;

    write(formatLine(entry));
}

std::string Logger::formatTimestamp(std::chrono::system_clock::time_point time) {
    auto time_t_now = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatLine(const LogEntry& entry) {
    std::ostringstream oss;

    oss << formatTimestamp(entry.timestamp) << ' '
        << entry.thread_name << ' '
        << (entry.unfiltered ? "*" : "") << ' '
        << severityToString(entry.severity) << ' '
        << entry.caller_tag << ' '
        << entry.message;

    return oss.str();
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << std::endl;
}

}  // namespace core
}  // namespace levelog
