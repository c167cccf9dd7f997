/**
 * @file main.cpp
 * @brief levelog demo entry point
 *
 * Resolves the default log level from the command line or environment,
 * then runs a few worker threads, each optionally with its own threshold.
 */

#include <levelog/demo/config.hpp>
#include <levelog/demo/worker.hpp>
#include <levelog/core/logger.hpp>
#include <levelog/core/thread_context.hpp>

#include <exception>
#include <iostream>
#include <thread>
#include <vector>

using namespace levelog;
using namespace levelog::demo;

int main(int argc, char* argv[]) {
    Config config;

    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid option value: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    applyEnvironment(config);

    // Validate every level before any thread starts logging
    try {
        core::Logger::instance().setDefaultLevel(config.log_level);
        for (const auto& level : config.worker_levels) {
            core::parseSeverity(level);
        }
    } catch (const core::InvalidConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    core::setCurrentThreadName("main");
    LEVELOG_INFO("levelog demo starting {} workers", config.workers);

    std::vector<std::thread> threads;
    for (int i = 0; i < config.workers; ++i) {
        std::optional<std::string> level;
        if (static_cast<size_t>(i) < config.worker_levels.size()) {
            level = config.worker_levels[i];
        }

        threads.emplace_back([i, level, &config]() {
            Worker worker(i + 1, level, config.messages);
            worker.run();
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    LEVELOG_INFO("All workers finished");
    return 0;
}
