/**
 * @file severity.hpp
 * @brief Severity levels recognised by the logger.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#include "levelog/core/export.hpp"

#include <optional>
#include <string>

namespace levelog {
namespace core {

/**
 * @enum Severity
 * @brief Logging severity levels, ordered by increasing importance.
 */
enum class Severity : int {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Canonical uppercase label of a severity.
 */
inline const char* severityToString(Severity severity) {
    switch (severity) {
        case Severity::DEBUG: return "DEBUG";
        case Severity::INFO:  return "INFO";
        case Severity::WARN:  return "WARN";
        case Severity::ERROR: return "ERROR";
        default:              return "?????";
    }
}

/**
 * @brief Numeric rank used for filtering.
 */
inline int severityRank(Severity severity) {
    return static_cast<int>(severity);
}

/**
 * @brief True if a message at @p severity passes a @p threshold.
 */
inline bool passesThreshold(Severity severity, Severity threshold) {
    return severityRank(severity) >= severityRank(threshold);
}

/**
 * @brief Parse a severity label, ignoring case.
 * @param label Label such as "warn" or "Error".
 * @return The severity, or std::nullopt if the label is not one of the four.
 */
LEVELOG_CORE_API std::optional<Severity> tryParseSeverity(const std::string& label);

/**
 * @brief Parse a severity label, ignoring case.
 * @throws InvalidConfigurationError if the label is not recognised.
 */
LEVELOG_CORE_API Severity parseSeverity(const std::string& label);

}  // namespace core
}  // namespace levelog
