// ProctorSFU - Exam Proctoring Media Server
// Event loop implementation

#include "proctorsfu/core/event_loop.hpp"

#include <exception>
#include <string>

namespace proctorsfu {
namespace core {

EventLoop::EventLoop()
    : epoch_(Clock::now()) {
}

EventLoop::~EventLoop() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopRequested_ = false;
    running_ = true;
    thread_ = std::thread(&EventLoop::run, this);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    thread_ = std::thread();
    delayed_.clear();
    delayedIndex_.clear();
}

bool EventLoop::isRunning() const {
    return running_.load();
}

bool EventLoop::isInLoopThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loopThreadId_ == std::this_thread::get_id();
}

void EventLoop::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorHandler_ = std::move(handler);
}

// =============================================================================
// Scheduling
// =============================================================================

void EventLoop::post(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

TaskId EventLoop::postDelayed(uint32_t delayMs, Task task) {
    if (!task) {
        return INVALID_TASK_ID;
    }
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextTaskId_++;
        auto deadline = Clock::now() + std::chrono::milliseconds(delayMs);
        delayed_.emplace(std::make_pair(deadline, id), std::move(task));
        delayedIndex_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delayedIndex_.find(id);
    if (it == delayedIndex_.end()) {
        return;
    }
    delayed_.erase(std::make_pair(it->second, id));
    delayedIndex_.erase(it);
}

uint64_t EventLoop::nowMs() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - epoch_).count());
}

// =============================================================================
// Loop Thread
// =============================================================================

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    loopThreadId_ = std::this_thread::get_id();

    while (true) {
        // Promote due delayed tasks in deadline order
        auto now = Clock::now();
        while (!delayed_.empty() && delayed_.begin()->first.first <= now) {
            auto node = delayed_.begin();
            delayedIndex_.erase(node->first.second);
            ready_.push_back(std::move(node->second));
            delayed_.erase(node);
        }

        if (!ready_.empty()) {
            Task task = std::move(ready_.front());
            ready_.pop_front();
            lock.unlock();
            runTask(task);
            lock.lock();
            continue;
        }

        if (stopRequested_) {
            break;
        }

        if (delayed_.empty()) {
            cv_.wait(lock);
        } else {
            cv_.wait_until(lock, delayed_.begin()->first.first);
        }
    }

    loopThreadId_ = std::thread::id();
    running_ = false;
}

void EventLoop::runTask(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = errorHandler_;
        }
        if (handler) {
            handler(std::string("Unhandled exception in event loop task: ") + e.what());
        }
    } catch (...) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = errorHandler_;
        }
        if (handler) {
            handler("Unhandled unknown exception in event loop task");
        }
    }
}

} // namespace core
} // namespace proctorsfu
