/**
 * @file worker.hpp
 * @brief Demo worker thread with its own log verbosity.
 */

#pragma once

#include <optional>
#include <string>

namespace levelog {
namespace demo {

/**
 * @class Worker
 * @brief Processes a number of simulated jobs, logging as it goes.
 *
 * A worker given a level configures its own thread with it; otherwise the
 * thread adopts the process default on its first log call.
 */
class Worker {
public:
    Worker(int id, std::optional<std::string> level, int jobs);

    /**
     * @brief Run all jobs on the calling thread.
     * @throws core::InvalidConfigurationError if the worker level is invalid.
     */
    void run();

    const std::string& name() const { return name_; }

private:
    void process(int job);

    int id_;
    std::string name_;
    std::optional<std::string> level_;
    int jobs_;
};

} // namespace demo
} // namespace levelog
