// ProctorSFU - Exam Proctoring Media Server
// Single-threaded task executor with delayed tasks
//
// Responsibilities:
// - Serialize all session-fabric work onto one thread
// - Run delayed tasks (polls, restart delays) on the same thread
// - Accept posts from any thread (network, engine, process monitors)

#ifndef PROCTORSFU_CORE_EVENT_LOOP_HPP
#define PROCTORSFU_CORE_EVENT_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace proctorsfu {
namespace core {

using TaskId = uint64_t;
constexpr TaskId INVALID_TASK_ID = 0;

/**
 * @brief Where continuations run.
 *
 * Components never block; they post follow-up work instead. Tests use a
 * manually driven implementation with virtual time.
 */
class IExecutor {
public:
    using Task = std::function<void()>;

    virtual ~IExecutor() = default;

    /**
     * @brief Queue a task to run as soon as possible, after already queued ones.
     */
    virtual void post(Task task) = 0;

    /**
     * @brief Queue a task to run no earlier than delayMs from now.
     * @return Id usable with cancel()
     */
    virtual TaskId postDelayed(uint32_t delayMs, Task task) = 0;

    /**
     * @brief Cancel a delayed task that has not started. Unknown ids are ignored.
     */
    virtual void cancel(TaskId id) = 0;

    /**
     * @brief Monotonic milliseconds, only meaningful as differences.
     */
    virtual uint64_t nowMs() const = 0;
};

/**
 * @brief IExecutor backed by a dedicated thread.
 *
 * Tasks run in FIFO order; delayed tasks with equal deadlines run in the
 * order they were posted. An exception escaping a task is caught, reported
 * through the error handler, and does not stop the loop.
 *
 * ## Thread Safety
 * post(), postDelayed() and cancel() may be called from any thread,
 * including from inside a running task.
 */
class EventLoop : public IExecutor {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /**
     * @brief Start the loop thread. Calling start() twice has no effect.
     */
    void start();

    /**
     * @brief Stop the loop and join its thread.
     *
     * Immediate tasks queued before stop() still run; pending delayed tasks
     * are dropped. Safe to call more than once; must not be called from the
     * loop thread.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief True when called from the loop thread.
     */
    bool isInLoopThread() const;

    void setErrorHandler(ErrorHandler handler);

    // IExecutor
    void post(Task task) override;
    TaskId postDelayed(uint32_t delayMs, Task task) override;
    void cancel(TaskId id) override;
    uint64_t nowMs() const override;

private:
    using Clock = std::chrono::steady_clock;

    void run();
    void runTask(Task& task);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    // Ordered by (deadline, sequence)
    std::map<std::pair<Clock::time_point, TaskId>, Task> delayed_;
    std::unordered_map<TaskId, Clock::time_point> delayedIndex_;
    TaskId nextTaskId_{1};

    ErrorHandler errorHandler_;
    std::thread thread_;
    std::thread::id loopThreadId_;
    std::atomic<bool> running_{false};
    bool stopRequested_{false};
    Clock::time_point epoch_;
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_EVENT_LOOP_HPP
