/**
 * @file call_site.hpp
 * @brief Call-site capture and caller-tag formatting.
 *
 * The logging macros capture the site of the call with LEVELOG_CALL_SITE, so
 * the first frame outside the logger is known without walking the stack.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#include "levelog/core/export.hpp"

#include <string>

namespace levelog {
namespace core {

/**
 * @struct CallSite
 * @brief Source location of a logging call.
 *
 * A default-constructed CallSite is unresolved and produces an empty tag.
 */
struct CallSite {
    const char* file = nullptr;       ///< __FILE__
    const char* function = nullptr;   ///< __func__
    const char* signature = nullptr;  ///< __PRETTY_FUNCTION__ / __FUNCSIG__
    int line = 0;                     ///< __LINE__

    bool resolved() const {
        return line > 0 && (function != nullptr || signature != nullptr);
    }

    /**
     * @brief Site without a signature; the tag then uses the file stem as scope.
     */
    static CallSite current(const char* file, const char* function, int line) {
        CallSite site;
        site.file = file;
        site.function = function;
        site.line = line;
        return site;
    }
};

/**
 * @brief Format a call site as `[Scope.function()]:line`.
 *
 * Scope is the innermost class or namespace enclosing the function, with
 * template arguments removed. Free functions at global or anonymous namespace
 * scope use the stem of the source file instead.
 *
 * @return The tag, or an empty string for an unresolved site.
 */
LEVELOG_CORE_API std::string callerTag(const CallSite& site);

/**
 * @brief File name without directories and extension ("src/worker.cpp" -> "worker").
 */
LEVELOG_CORE_API std::string sourceStem(const char* file);

}  // namespace core
}  // namespace levelog

#if defined(_MSC_VER)
    #define LEVELOG_FUNCTION_SIGNATURE __FUNCSIG__
#else
    #define LEVELOG_FUNCTION_SIGNATURE __PRETTY_FUNCTION__
#endif

/// Default argument capturing the caller of the function that declares it.
#if defined(__GNUC__) || defined(__clang__)
    #define LEVELOG_CALLER_SITE \
        ::levelog::core::CallSite::current(__builtin_FILE(), __builtin_FUNCTION(), __builtin_LINE())
#else
    #define LEVELOG_CALLER_SITE ::levelog::core::CallSite{}
#endif

/// Captures the current source location as a levelog::core::CallSite.
#define LEVELOG_CALL_SITE \
    ::levelog::core::CallSite{__FILE__, __func__, LEVELOG_FUNCTION_SIGNATURE, __LINE__}
