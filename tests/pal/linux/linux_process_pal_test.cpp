// ProctorSFU - Exam Proctoring Media Server
// Tests for the Linux Process PAL using /bin/sh children

#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "proctorsfu/pal/linux/linux_process_pal.hpp"

namespace proctorsfu {
namespace pal {
namespace test {

namespace {

constexpr auto WAIT_LIMIT = std::chrono::seconds(10);

ProcessOptions shell(const std::string& script) {
    ProcessOptions options;
    options.executable = "/bin/sh";
    options.args = {"-c", script};
    return options;
}

} // anonymous namespace

class LinuxProcessPALTest : public ::testing::Test {
protected:
    // Captures output lines and the exit status of one child
    struct Observer {
        std::mutex mutex;
        std::vector<std::string> lines;
        std::promise<ProcessExitStatus> exit;
    };

    core::Result<ProcessHandle, ProcessError> spawn(const ProcessOptions& options,
                                                    std::shared_ptr<Observer> observer) {
        return processPal_.spawn(
            options,
            [observer](const std::string& line) {
                std::lock_guard<std::mutex> lock(observer->mutex);
                observer->lines.push_back(line);
            },
            [observer](const ProcessExitStatus& status) {
                observer->exit.set_value(status);
            });
    }

    linux::LinuxProcessPAL processPal_;
};

TEST_F(LinuxProcessPALTest, CapturesStderrLinesAndExitCode) {
    auto observer = std::make_shared<Observer>();
    auto exitFuture = observer->exit.get_future();

    auto handle = spawn(shell("echo 'Input #0, sdp' >&2; printf 'frame=1\\rframe=2\\n' >&2; exit 3"),
                        observer);

    ASSERT_TRUE(handle.isSuccess()) << handle.error().message;
    ASSERT_EQ(exitFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    ProcessExitStatus status = exitFuture.get();
    EXPECT_TRUE(status.exited);
    EXPECT_EQ(status.exitCode, 3);

    std::lock_guard<std::mutex> lock(observer->mutex);
    EXPECT_EQ(observer->lines, (std::vector<std::string>{"Input #0, sdp", "frame=1", "frame=2"}));
}

TEST_F(LinuxProcessPALTest, TrailingPartialLineDelivered) {
    auto observer = std::make_shared<Observer>();
    auto exitFuture = observer->exit.get_future();

    ASSERT_TRUE(spawn(shell("printf 'no newline' >&2"), observer).isSuccess());

    ASSERT_EQ(exitFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    std::lock_guard<std::mutex> lock(observer->mutex);
    ASSERT_EQ(observer->lines.size(), 1u);
    EXPECT_EQ(observer->lines[0], "no newline");
}

TEST_F(LinuxProcessPALTest, MissingExecutableReportedBySpawn) {
    ProcessOptions options;
    options.executable = "/nonexistent/encoder-binary";

    auto handle = processPal_.spawn(options, nullptr, nullptr);

    ASSERT_TRUE(handle.isError());
    EXPECT_EQ(handle.error().code, ProcessErrorCode::ExecutableNotFound);
}

TEST_F(LinuxProcessPALTest, EmptyExecutableRejected) {
    auto handle = processPal_.spawn(ProcessOptions{}, nullptr, nullptr);

    ASSERT_TRUE(handle.isError());
    EXPECT_EQ(handle.error().code, ProcessErrorCode::SpawnFailed);
}

TEST_F(LinuxProcessPALTest, BadWorkingDirectoryFailsSpawn) {
    ProcessOptions options = shell("true");
    options.workingDirectory = "/nonexistent/recordings";

    auto handle = processPal_.spawn(options, nullptr, nullptr);

    EXPECT_TRUE(handle.isError());
}

TEST_F(LinuxProcessPALTest, TerminateSendsSigterm) {
    auto observer = std::make_shared<Observer>();
    auto exitFuture = observer->exit.get_future();
    auto handle = spawn(shell("exec sleep 30"), observer);
    ASSERT_TRUE(handle.isSuccess());
    EXPECT_TRUE(processPal_.isAlive(handle.value()));

    ASSERT_TRUE(processPal_.terminate(handle.value(), 3000).isSuccess());

    ASSERT_EQ(exitFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    ProcessExitStatus status = exitFuture.get();
    EXPECT_TRUE(status.signaled);
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_FALSE(processPal_.isAlive(handle.value()));
}

TEST_F(LinuxProcessPALTest, TerminateEscalatesToSigkill) {
    auto observer = std::make_shared<Observer>();
    auto exitFuture = observer->exit.get_future();
    auto handle = spawn(shell("trap '' TERM; while true; do sleep 1; done"), observer);
    ASSERT_TRUE(handle.isSuccess());

    ASSERT_TRUE(processPal_.terminate(handle.value(), 200).isSuccess());

    ASSERT_EQ(exitFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    ProcessExitStatus status = exitFuture.get();
    EXPECT_TRUE(status.signaled);
    EXPECT_EQ(status.signal, SIGKILL);
}

TEST_F(LinuxProcessPALTest, TerminateIsIdempotent) {
    auto observer = std::make_shared<Observer>();
    auto exitFuture = observer->exit.get_future();
    auto handle = spawn(shell("exec sleep 30"), observer);
    ASSERT_TRUE(handle.isSuccess());

    EXPECT_TRUE(processPal_.terminate(handle.value(), 3000).isSuccess());
    EXPECT_TRUE(processPal_.terminate(handle.value(), 3000).isSuccess());
    ASSERT_EQ(exitFuture.wait_for(WAIT_LIMIT), std::future_status::ready);
    EXPECT_TRUE(processPal_.terminate(handle.value(), 3000).isSuccess());
}

TEST_F(LinuxProcessPALTest, TerminateUnknownHandle) {
    auto result = processPal_.terminate(ProcessHandle{999999}, 100);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::InvalidHandle);
    EXPECT_FALSE(processPal_.isAlive(ProcessHandle{999999}));
}

TEST(LinuxProcessPALLifecycleTest, DestructorKillsRunningChildren) {
    auto exited = std::make_shared<std::promise<ProcessExitStatus>>();
    auto future = exited->get_future();
    {
        linux::LinuxProcessPAL processPal;
        auto handle = processPal.spawn(shell("exec sleep 30"), nullptr,
            [exited](const ProcessExitStatus& status) { exited->set_value(status); });
        ASSERT_TRUE(handle.isSuccess());
        EXPECT_EQ(processPal.liveCount(), 1u);
    }

    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_TRUE(future.get().signaled);
}

} // namespace test
} // namespace pal
} // namespace proctorsfu
