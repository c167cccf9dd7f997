/**
 * @file worker.cpp
 * @brief Demo worker implementation
 */

#include <levelog/demo/worker.hpp>
#include <levelog/core/logger.hpp>
#include <levelog/core/thread_context.hpp>

#include <utility>

namespace levelog {
namespace demo {

Worker::Worker(int id, std::optional<std::string> level, int jobs)
    : id_(id)
    , name_("worker-" + std::to_string(id))
    , level_(std::move(level))
    , jobs_(jobs)
{
}

void Worker::run() {
    core::setCurrentThreadName(name_);

    if (level_) {
        core::Logger::instance().configure(*level_);
    }

    LEVELOG_INFO("Worker {} starting {} jobs", id_, jobs_);

    for (int job = 1; job <= jobs_; ++job) {
        process(job);
    }

    LEVELOG_INFO("Worker {} finished", id_);
}

void Worker::process(int job) {
    LEVELOG_DEBUG("Job {} picked up", job);

    if (job % 4 == 0) {
        LEVELOG_WARN("Job {} needed a retry", job);
    }
    if (job % 5 == 0) {
        LEVELOG_ERROR("Job {} failed", job);
        return;
    }

    LEVELOG_DEBUG("Job {} done", job);
}

} // namespace demo
} // namespace levelog
