// ProctorSFU - Exam Proctoring Media Server
// Linux Process PAL Implementation
//
// Uses fork/execvp with a stderr pipe and one monitor thread per child

#ifndef PROCTORSFU_PAL_LINUX_LINUX_PROCESS_PAL_HPP
#define PROCTORSFU_PAL_LINUX_LINUX_PROCESS_PAL_HPP

#include "proctorsfu/pal/process_pal.hpp"
#include "proctorsfu/pal/pal_types.hpp"
#include "proctorsfu/core/result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#if defined(__linux__)
#include <sys/types.h>

namespace proctorsfu {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of IProcessPAL.
 *
 * This implementation uses:
 * - fork() and execvp(), with a close-on-exec status pipe so exec failures
 *   are reported synchronously by spawn()
 * - poll() on the stderr pipe from a monitor thread
 * - waitpid() to reap the child and deliver its exit status
 *
 * The destructor kills children that are still running and joins every
 * monitor thread.
 */
class LinuxProcessPAL : public IProcessPAL {
public:
    LinuxProcessPAL();
    ~LinuxProcessPAL() override;

    LinuxProcessPAL(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL& operator=(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL(LinuxProcessPAL&&) = delete;
    LinuxProcessPAL& operator=(LinuxProcessPAL&&) = delete;

    core::Result<ProcessHandle, ProcessError> spawn(
        const ProcessOptions& options,
        ProcessOutputCallback onOutput,
        ProcessExitCallback onExit
    ) override;

    core::Result<void, ProcessError> terminate(ProcessHandle handle, uint32_t graceMs) override;

    bool isAlive(ProcessHandle handle) const override;

    /**
     * @brief Number of children not yet reaped.
     */
    size_t liveCount() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Child {
        pid_t pid = -1;
        int stderrFd = -1;
        std::thread monitor;
        std::atomic<bool> exited{false};          ///< Reaped
        std::atomic<bool> finished{false};        ///< Monitor thread is about to return
        std::atomic<bool> terminateRequested{false};
        std::atomic<bool> killSent{false};
        std::atomic<int64_t> killDeadlineMs{0};   ///< Steady-clock ms, valid once terminateRequested
        ProcessOutputCallback onOutput;
        ProcessExitCallback onExit;
    };

    void monitor(std::shared_ptr<Child> child);
    void reapFinishedMonitors();
    void escalateIfDue(Child& child);
    static int64_t steadyNowMs();
    static void emitLines(std::string& pending, const char* data, size_t size,
                          const ProcessOutputCallback& onOutput);

    mutable std::mutex childrenMutex_;
    std::unordered_map<pid_t, std::shared_ptr<Child>> children_;
    std::atomic<bool> shuttingDown_{false};
};

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
#endif // PROCTORSFU_PAL_LINUX_LINUX_PROCESS_PAL_HPP
