#pragma once

#include "upl/core/config.hpp"
#include "upl/core/result.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace upl::pipeline {

/**
 * @brief Background executor for pipeline stages
 *
 * Jobs run on a pool of threads driving one io_context. A job that fails
 * with a transient error (is_retryable) is re-posted after an exponential
 * backoff on a steady_timer, up to `max_attempts`. When the attempts run
 * out, `on_exhausted` receives the last error. Business failures are never
 * retried and never reach `on_exhausted`.
 *
 * A job that throws counts as an Internal (transient) failure.
 */
class JobRunner {
public:
    using Job = std::function<upl::Result<void>()>;
    using ExhaustedHandler = std::function<void(const upl::Error&)>;

    JobRunner(std::size_t threads, core::RetryConfig retry);
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    void submit(std::string name, Job job, ExhaustedHandler on_exhausted = {});

    /// Blocks until no job is running, queued or waiting on a backoff timer.
    void wait_idle();

    /// Stops the workers; queued work and pending retries are dropped.
    void stop();

    [[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const;

    [[nodiscard]] std::size_t pending() const;

private:
    struct JobState {
        std::string name;
        Job job;
        ExhaustedHandler on_exhausted;
        int attempt = 0;
    };

    void run_attempt(std::shared_ptr<JobState> state);
    void finish_one();

    core::RetryConfig retry_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t pending_ = 0;
    std::atomic<bool> stopped_{false};
};

} // namespace upl::pipeline
