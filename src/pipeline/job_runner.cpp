#include "upl/pipeline/job_runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace upl::pipeline {

JobRunner::JobRunner(std::size_t threads, core::RetryConfig retry)
    : retry_(retry), work_(boost::asio::make_work_guard(io_)) {
    const auto count = std::max<std::size_t>(1, threads);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { io_.run(); });
    }
}

JobRunner::~JobRunner() {
    stop();
}

void JobRunner::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    work_.reset();
    io_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    {
        std::lock_guard lock(mutex_);
        pending_ = 0;
    }
    idle_.notify_all();
}

std::chrono::milliseconds JobRunner::backoff_for(int attempt) const {
    const double factor = std::pow(retry_.backoff_multiplier, std::max(0, attempt - 1));
    const double millis = static_cast<double>(retry_.initial_backoff.count()) * factor;
    const double capped = std::min(millis, static_cast<double>(retry_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::size_t JobRunner::pending() const {
    std::lock_guard lock(mutex_);
    return pending_;
}

void JobRunner::submit(std::string name, Job job, ExhaustedHandler on_exhausted) {
    if (stopped_) {
        spdlog::warn("[JobRunner] dropping job {}: runner stopped", name);
        return;
    }
    auto state = std::make_shared<JobState>();
    state->name = std::move(name);
    state->job = std::move(job);
    state->on_exhausted = std::move(on_exhausted);

    {
        std::lock_guard lock(mutex_);
        ++pending_;
    }
    boost::asio::post(io_, [this, state] { run_attempt(state); });
}

void JobRunner::run_attempt(std::shared_ptr<JobState> state) {
    ++state->attempt;

    upl::Result<void> result = upl::Ok();
    try {
        result = state->job();
    } catch (const std::exception& e) {
        result = upl::Err<void>(ErrorKind::Internal, std::string("Unhandled exception: ") + e.what());
    }

    if (result.is_ok()) {
        spdlog::debug("[JobRunner] {} succeeded on attempt {}", state->name, state->attempt);
        finish_one();
        return;
    }

    const auto& error = result.error();
    if (!upl::is_retryable(error)) {
        spdlog::info("[JobRunner] {} stopped: {}", state->name, upl::describe(error));
        finish_one();
        return;
    }

    if (state->attempt >= retry_.max_attempts || stopped_) {
        spdlog::error("[JobRunner] {} exhausted after {} attempts: {}",
                      state->name, state->attempt, upl::describe(error));
        if (state->on_exhausted) {
            try {
                state->on_exhausted(error);
            } catch (const std::exception& e) {
                spdlog::error("[JobRunner] exhausted handler for {} threw: {}", state->name, e.what());
            }
        }
        finish_one();
        return;
    }

    const auto delay = backoff_for(state->attempt);
    spdlog::warn("[JobRunner] {} attempt {} failed ({}), retrying in {}ms",
                 state->name, state->attempt, upl::describe(error), delay.count());

    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    timer->async_wait([this, state, timer](const boost::system::error_code& ec) {
        if (ec) {
            spdlog::warn("[JobRunner] retry timer for {} cancelled", state->name);
            finish_one();
            return;
        }
        run_attempt(state);
    });
}

void JobRunner::finish_one() {
    {
        std::lock_guard lock(mutex_);
        if (pending_ > 0) {
            --pending_;
        }
    }
    idle_.notify_all();
}

void JobRunner::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return pending_ == 0; });
}

} // namespace upl::pipeline
