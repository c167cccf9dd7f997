/**
 * @file thread_context.hpp
 * @brief Per-thread logging state.
 *
 * Each thread owns one ThreadContext, created on first use and destroyed with
 * the thread. It is only ever touched by its owning thread, so it needs no
 * locking.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#include "levelog/core/export.hpp"
#include "levelog/core/severity.hpp"

#include <optional>
#include <string>

namespace levelog {
namespace core {

/**
 * @struct ThreadContext
 * @brief Logging state owned by one thread.
 */
struct ThreadContext {
    std::optional<Severity> threshold;  ///< Active threshold, unset until configured
    std::string name;                   ///< Thread name, empty until named or first logged
};

/**
 * @brief The calling thread's context.
 */
LEVELOG_CORE_API ThreadContext& currentThreadContext();

/**
 * @brief Name of the calling thread.
 *
 * The name given to setCurrentThreadName(), otherwise "thread-N" where N is
 * a process-wide sequence number assigned on the thread's first request.
 */
LEVELOG_CORE_API std::string currentThreadName();

/**
 * @brief Name the calling thread for log output.
 */
LEVELOG_CORE_API void setCurrentThreadName(const std::string& name);

}  // namespace core
}  // namespace levelog
