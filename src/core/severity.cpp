/**
 * @file severity.cpp
 * @brief Severity label parsing.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#include "levelog/core/severity.hpp"
#include "levelog/core/error.hpp"

#include <algorithm>
#include <cctype>

namespace levelog {
namespace core {

namespace {

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

}  // namespace

std::optional<Severity> tryParseSeverity(const std::string& label) {
    const std::string canonical = toUpper(label);

    if (canonical == "DEBUG") return Severity::DEBUG;
    if (canonical == "INFO") return Severity::INFO;
    if (canonical == "WARN") return Severity::WARN;
    if (canonical == "ERROR") return Severity::ERROR;
    return std::nullopt;
}

Severity parseSeverity(const std::string& label) {
    auto severity = tryParseSeverity(label);
    if (!severity) {
        throw InvalidConfigurationError("Invalid log level: " + toUpper(label));
    }
    return *severity;
}

}  // namespace core
}  // namespace levelog
