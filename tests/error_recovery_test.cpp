#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include "core/error_recovery.hpp"

class ErrorRecoveryTest : public ::testing::Test
{
protected:
    // Sleeps for `duration` and then marks `finished`
    static std::function<int()> slowJob(std::chrono::milliseconds duration, std::shared_ptr<std::atomic<bool>> finished)
    {
        return [duration, finished]()
        {
            std::this_thread::sleep_for(duration);
            finished->store(true);
            return 0;
        };
    }

    std::shared_ptr<WorkerRegistry> workers_ = std::make_shared<WorkerRegistry>(4);
};

TEST_F(ErrorRecoveryTest, ReturnsValueBeforeDeadline)
{
    int value = ErrorRecovery::callWithTimeout([]()
                                               { return 42; },
                                               std::chrono::milliseconds(1000), "quick", workers_);
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(workers_->waitForIdle(std::chrono::milliseconds(1000)));
    EXPECT_EQ(workers_->abandoned(), 0u);
}

TEST_F(ErrorRecoveryTest, TimedOutWorkerIsTrackedUntilItFinishes)
{
    auto finished = std::make_shared<std::atomic<bool>>(false);

    EXPECT_THROW(ErrorRecovery::callWithTimeout(slowJob(std::chrono::milliseconds(300), finished),
                                                std::chrono::milliseconds(20), "slow", workers_),
                 OperationTimeoutError);

    EXPECT_FALSE(finished->load());
    EXPECT_EQ(workers_->running(), 1u);
    EXPECT_EQ(workers_->abandoned(), 1u);

    ASSERT_TRUE(workers_->waitForIdle(std::chrono::milliseconds(2000)));
    EXPECT_TRUE(finished->load());
    EXPECT_EQ(workers_->running(), 0u);
    EXPECT_EQ(workers_->abandoned(), 0u);
}

TEST_F(ErrorRecoveryTest, RefusesWorkWhileAbandonedLimitIsReached)
{
    auto limited = std::make_shared<WorkerRegistry>(1);
    auto stuck = std::make_shared<std::atomic<bool>>(false);
    EXPECT_THROW(ErrorRecovery::callWithTimeout(slowJob(std::chrono::milliseconds(300), stuck),
                                                std::chrono::milliseconds(10), "stuck", limited),
                 OperationTimeoutError);

    auto refused = std::make_shared<std::atomic<bool>>(false);
    EXPECT_THROW(ErrorRecovery::callWithTimeout(slowJob(std::chrono::milliseconds(0), refused),
                                                std::chrono::milliseconds(1000), "refused", limited),
                 OperationTimeoutError);
    EXPECT_EQ(limited->running(), 1u);

    ASSERT_TRUE(limited->waitForIdle(std::chrono::milliseconds(2000)));
    EXPECT_FALSE(refused->load());

    int value = ErrorRecovery::callWithTimeout([]()
                                               { return 7; },
                                               std::chrono::milliseconds(1000), "after-drain", limited);
    EXPECT_EQ(value, 7);
}

TEST_F(ErrorRecoveryTest, PropagatesExceptions)
{
    EXPECT_THROW(ErrorRecovery::callWithTimeout([]() -> int
                                                { throw std::runtime_error("boom"); },
                                                std::chrono::milliseconds(1000), "failing", workers_),
                 std::runtime_error);
    EXPECT_TRUE(workers_->waitForIdle(std::chrono::milliseconds(1000)));
}

TEST_F(ErrorRecoveryTest, NonPositiveTimeoutRunsInline)
{
    const auto caller = std::this_thread::get_id();
    auto worker = ErrorRecovery::callWithTimeout([]()
                                                 { return std::this_thread::get_id(); },
                                                 std::chrono::milliseconds(0), "inline", workers_);
    EXPECT_EQ(worker, caller);
    EXPECT_EQ(workers_->running(), 0u);
}

TEST_F(ErrorRecoveryTest, DeadlineRequiresRegistry)
{
    EXPECT_THROW(ErrorRecovery::callWithTimeout([]()
                                                { return 1; },
                                                std::chrono::milliseconds(100), "unowned", nullptr),
                 std::invalid_argument);
}
