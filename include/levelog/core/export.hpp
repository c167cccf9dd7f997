/**
 * @file export.hpp
 * @brief Symbol visibility macros for the levelog_core shared library.
 *
 * LEVELOG_CORE_BUILD is defined only while compiling levelog_core itself.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LEVELOG_CORE_BUILD)
        #define LEVELOG_CORE_API __declspec(dllexport)
    #else
        #define LEVELOG_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LEVELOG_CORE_BUILD)
        #define LEVELOG_CORE_API __attribute__((visibility("default")))
    #else
        #define LEVELOG_CORE_API
    #endif
#else
    #define LEVELOG_CORE_API
#endif
