#include "upl/pipeline/job_runner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>

using upl::ErrorKind;
using upl::pipeline::JobRunner;

namespace {

upl::core::RetryConfig fast_retry(int attempts) {
    upl::core::RetryConfig retry;
    retry.max_attempts = attempts;
    retry.initial_backoff = std::chrono::milliseconds(1);
    retry.backoff_multiplier = 2.0;
    retry.max_backoff = std::chrono::milliseconds(5);
    return retry;
}

} // namespace

TEST(JobRunnerTest, RunsSubmittedJobs) {
    JobRunner runner(2, fast_retry(3));
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        runner.submit("job_" + std::to_string(i), [&ran]() -> upl::Result<void> {
            ran++;
            return upl::Ok();
        });
    }
    runner.wait_idle();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(runner.pending(), 0u);
}

TEST(JobRunnerTest, RetriesTransientFailuresUntilSuccess) {
    JobRunner runner(1, fast_retry(3));
    std::atomic<int> attempts{0};
    std::atomic<bool> exhausted{false};

    runner.submit("flaky", [&attempts]() -> upl::Result<void> {
        if (++attempts < 3) {
            return upl::Err<void>(ErrorKind::Storage, "disk busy");
        }
        return upl::Ok();
    }, [&exhausted](const upl::Error&) { exhausted = true; });

    runner.wait_idle();
    EXPECT_EQ(attempts.load(), 3);
    EXPECT_FALSE(exhausted.load());
}

TEST(JobRunnerTest, ExhaustedHandlerGetsTheLastError) {
    JobRunner runner(1, fast_retry(3));
    std::atomic<int> attempts{0};
    std::string last_message;
    ErrorKind last_kind = ErrorKind::Internal;

    runner.submit("always_times_out", [&attempts]() -> upl::Result<void> {
        const int n = ++attempts;
        return upl::Err<void>(ErrorKind::ScanTimeout, "timeout " + std::to_string(n));
    }, [&](const upl::Error& error) {
        last_kind = error.kind;
        last_message = error.message;
    });

    runner.wait_idle();
    EXPECT_EQ(attempts.load(), 3);
    EXPECT_EQ(last_kind, ErrorKind::ScanTimeout);
    EXPECT_EQ(last_message, "timeout 3");
}

TEST(JobRunnerTest, BusinessFailuresAreNotRetried) {
    JobRunner runner(1, fast_retry(5));
    std::atomic<int> attempts{0};
    std::atomic<bool> exhausted{false};

    runner.submit("infected", [&attempts]() -> upl::Result<void> {
        attempts++;
        return upl::Err<void>(ErrorKind::Assembly, "chunk 8 missing");
    }, [&exhausted](const upl::Error&) { exhausted = true; });

    runner.wait_idle();
    EXPECT_EQ(attempts.load(), 1);
    EXPECT_FALSE(exhausted.load());
}

TEST(JobRunnerTest, ThrowingJobCountsAsTransient) {
    JobRunner runner(1, fast_retry(2));
    std::atomic<int> attempts{0};
    std::atomic<bool> exhausted{false};

    runner.submit("throws", [&attempts]() -> upl::Result<void> {
        attempts++;
        throw std::runtime_error("boom");
    }, [&exhausted](const upl::Error& error) {
        EXPECT_EQ(error.kind, ErrorKind::Internal);
        exhausted = true;
    });

    runner.wait_idle();
    EXPECT_EQ(attempts.load(), 2);
    EXPECT_TRUE(exhausted.load());
}

TEST(JobRunnerTest, BackoffGrowsAndIsCapped) {
    upl::core::RetryConfig retry;
    retry.initial_backoff = std::chrono::milliseconds(1000);
    retry.backoff_multiplier = 2.0;
    retry.max_backoff = std::chrono::milliseconds(5000);
    JobRunner runner(1, retry);

    EXPECT_EQ(runner.backoff_for(1).count(), 1000);
    EXPECT_EQ(runner.backoff_for(2).count(), 2000);
    EXPECT_EQ(runner.backoff_for(3).count(), 4000);
    EXPECT_EQ(runner.backoff_for(4).count(), 5000);
}

TEST(JobRunnerTest, StoppedRunnerDropsNewJobs) {
    JobRunner runner(1, fast_retry(1));
    runner.stop();

    std::atomic<bool> ran{false};
    runner.submit("late", [&ran]() -> upl::Result<void> {
        ran = true;
        return upl::Ok();
    });
    runner.wait_idle();
    EXPECT_FALSE(ran.load());
}
