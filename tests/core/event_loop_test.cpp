// ProctorSFU - Exam Proctoring Media Server
// Tests for the event loop executor

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "proctorsfu/core/event_loop.hpp"

namespace proctorsfu {
namespace core {
namespace test {

namespace {

constexpr auto WAIT_LIMIT = std::chrono::seconds(5);

} // anonymous namespace

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_.start();
    }

    void TearDown() override {
        loop_.stop();
    }

    // Blocks until every task posted before this call has run
    void drain() {
        std::promise<void> done;
        auto future = done.get_future();
        loop_.post([&done]() { done.set_value(); });
        ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    }

    EventLoop loop_;
};

TEST_F(EventLoopTest, RunsPostedTasksInOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop_.post([&order, i]() { order.push_back(i); });
    }
    drain();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(EventLoopTest, TasksRunOnLoopThread) {
    std::promise<bool> inLoop;
    auto future = inLoop.get_future();

    loop_.post([this, &inLoop]() { inLoop.set_value(loop_.isInLoopThread()); });

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_FALSE(loop_.isInLoopThread());
}

TEST_F(EventLoopTest, DelayedTaskRunsAfterDelay) {
    std::promise<uint64_t> ranAt;
    auto future = ranAt.get_future();
    uint64_t postedAt = loop_.nowMs();

    loop_.postDelayed(30, [this, &ranAt]() { ranAt.set_value(loop_.nowMs()); });

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_GE(future.get() - postedAt, 30u);
}

TEST_F(EventLoopTest, DelayedTasksOrderedByDeadline) {
    std::mutex mutex;
    std::vector<std::string> order;
    std::promise<void> done;
    auto future = done.get_future();

    loop_.postDelayed(40, [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("late");
        done.set_value();
    });
    loop_.postDelayed(10, [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("early");
    });

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<std::string>{"early", "late"}));
}

TEST_F(EventLoopTest, CancelledTaskDoesNotRun) {
    std::atomic<bool> ran{false};
    TaskId id = loop_.postDelayed(20, [&ran]() { ran = true; });
    ASSERT_NE(id, INVALID_TASK_ID);

    loop_.cancel(id);
    loop_.cancel(id);
    loop_.cancel(9999);

    std::promise<void> later;
    auto future = later.get_future();
    loop_.postDelayed(60, [&later]() { later.set_value(); });
    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_FALSE(ran.load());
}

TEST_F(EventLoopTest, TaskCanPostFromInsideLoop) {
    std::promise<void> nested;
    auto future = nested.get_future();

    loop_.post([this, &nested]() {
        loop_.postDelayed(1, [&nested]() { nested.set_value(); });
    });

    EXPECT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
}

TEST_F(EventLoopTest, ExceptionReportedAndLoopContinues) {
    std::promise<std::string> reported;
    auto future = reported.get_future();
    loop_.setErrorHandler([&reported](const std::string& message) { reported.set_value(message); });

    loop_.post([]() { throw std::runtime_error("router vanished"); });
    std::atomic<bool> afterRan{false};
    loop_.post([&afterRan]() { afterRan = true; });
    drain();

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_NE(future.get().find("router vanished"), std::string::npos);
    EXPECT_TRUE(afterRan.load());
}

TEST_F(EventLoopTest, NonStandardExceptionReportedAndLoopContinues) {
    std::promise<std::string> reported;
    auto future = reported.get_future();
    loop_.setErrorHandler([&reported](const std::string& message) { reported.set_value(message); });

    loop_.post([]() { throw 42; });
    std::atomic<bool> afterRan{false};
    loop_.post([&afterRan]() { afterRan = true; });
    drain();

    ASSERT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_NE(future.get().find("unknown exception"), std::string::npos);
    EXPECT_TRUE(afterRan.load());
}

TEST_F(EventLoopTest, EmptyTasksIgnored) {
    loop_.post(IExecutor::Task());

    EXPECT_EQ(loop_.postDelayed(10, IExecutor::Task()), INVALID_TASK_ID);
    drain();
}

TEST(EventLoopLifecycleTest, StopRunsQueuedTasksAndDropsDelayed) {
    EventLoop loop;
    loop.start();
    EXPECT_TRUE(loop.isRunning());

    std::atomic<int> immediate{0};
    std::atomic<bool> delayedRan{false};
    loop.postDelayed(10000, [&delayedRan]() { delayedRan = true; });
    for (int i = 0; i < 3; ++i) {
        loop.post([&immediate]() { immediate++; });
    }

    loop.stop();
    loop.stop();

    EXPECT_FALSE(loop.isRunning());
    EXPECT_EQ(immediate.load(), 3);
    EXPECT_FALSE(delayedRan.load());
}

TEST(EventLoopLifecycleTest, RestartAfterStop) {
    EventLoop loop;
    loop.start();
    loop.stop();
    loop.start();

    std::promise<void> ran;
    auto future = ran.get_future();
    loop.post([&ran]() { ran.set_value(); });

    EXPECT_EQ(future.wait_for(WAIT_LIMIT), std::future_status::ready);
    loop.stop();
}

TEST(EventLoopLifecycleTest, NowMsIsMonotonic) {
    EventLoop loop;
    uint64_t first = loop.nowMs();
    uint64_t second = loop.nowMs();

    EXPECT_GE(second, first);
}

} // namespace test
} // namespace core
} // namespace proctorsfu
