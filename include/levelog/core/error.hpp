/**
 * @file error.hpp
 * @brief Exception type for logger configuration failures.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace levelog {
namespace core {

/**
 * @class InvalidConfigurationError
 * @brief Raised when a log level cannot be resolved or is not recognised.
 *
 * Configuration mistakes are fatal to the configuring call. Emission never
 * raises this.
 */
class InvalidConfigurationError : public std::runtime_error {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace core
}  // namespace levelog
