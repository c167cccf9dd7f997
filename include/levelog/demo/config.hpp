/**
 * @file config.hpp
 * @brief levelog demo configuration and CLI parsing
 */

#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace levelog {
namespace demo {

/// Environment variable consulted when --log-level is not given.
constexpr const char* kLogLevelEnvVar = "LEVELOG_LEVEL";

/**
 * @brief Demo configuration structure
 */
struct Config {
    std::optional<std::string> log_level;     ///< Process default level; unset = unfiltered
    int workers = 2;                          ///< Number of worker threads
    int messages = 3;                         ///< Jobs each worker processes
    std::vector<std::string> worker_levels;   ///< Per-worker thresholds, in worker order
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "levelog demo - leveled console logging from worker threads\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --log-level <level>     Default level: DEBUG, INFO, WARN, ERROR\n"
              << "                          (default: $" << kLogLevelEnvVar << ", else unfiltered)\n"
              << "  --workers <n>           Number of worker threads (default: 2)\n"
              << "  --messages <n>          Jobs per worker (default: 3)\n"
              << "  --worker-level <level>  Threshold for the next worker; repeat per worker\n"
              << "\n  --help                  Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --log-level WARN --workers 3 --worker-level debug\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 * @throws std::invalid_argument / std::out_of_range on malformed numbers
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = std::string(value);
        } else if (std::strcmp(arg, "--workers") == 0) {
            config.workers = std::stoi(value);
        } else if (std::strcmp(arg, "--messages") == 0) {
            config.messages = std::stoi(value);
        } else if (std::strcmp(arg, "--worker-level") == 0) {
            config.worker_levels.emplace_back(value);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Fill in the default level from the environment if the command line
 *        did not set one.
 */
inline void applyEnvironment(Config& config) {
    if (config.log_level) {
        return;
    }
    const char* value = std::getenv(kLogLevelEnvVar);
    if (value != nullptr && *value != '\0') {
        config.log_level = std::string(value);
    }
}

} // namespace demo
} // namespace levelog
