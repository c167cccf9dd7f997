/**
 * @file thread_context.cpp
 * @brief Thread-local logging state and thread naming.
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#include "levelog/core/thread_context.hpp"

#include <atomic>

namespace levelog {
namespace core {

namespace {

std::atomic<unsigned long> g_next_thread_number{1};

}  // namespace

ThreadContext& currentThreadContext() {
    thread_local ThreadContext context;
    return context;
}

std::string currentThreadName() {
    ThreadContext& context = currentThreadContext();

    // Unnamed threads are numbered in order of their first request
    if (context.name.empty()) {
        context.name = "thread-" + std::to_string(
            g_next_thread_number.fetch_add(1, std::memory_order_relaxed));
    }
    return context.name;
}

void setCurrentThreadName(const std::string& name) {
    currentThreadContext().name = name;
}

}  // namespace core
}  // namespace levelog
