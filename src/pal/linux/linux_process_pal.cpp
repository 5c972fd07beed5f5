// ProctorSFU - Exam Proctoring Media Server
// Linux Process PAL Implementation

#include "proctorsfu/pal/linux/linux_process_pal.hpp"

#if defined(__linux__)

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <vector>

namespace proctorsfu {
namespace pal {
namespace linux {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessExitStatus decodeWaitStatus(int status) {
    ProcessExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxProcessPAL::LinuxProcessPAL() = default;

LinuxProcessPAL::~LinuxProcessPAL() {
    shuttingDown_ = true;

    std::unordered_map<pid_t, std::shared_ptr<Child>> children;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        children.swap(children_);
    }

    for (auto& pair : children) {
        if (!pair.second->exited.load()) {
            kill(pair.first, SIGKILL);
        }
    }
    for (auto& pair : children) {
        if (pair.second->monitor.joinable()) {
            pair.second->monitor.join();
        }
    }
}

// =============================================================================
// Process Operations
// =============================================================================

core::Result<ProcessHandle, ProcessError> LinuxProcessPAL::spawn(
    const ProcessOptions& options,
    ProcessOutputCallback onOutput,
    ProcessExitCallback onExit
) {
    if (options.executable.empty()) {
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::SpawnFailed, "Executable not specified", 0});
    }

    reapFinishedMonitors();

    // argv is built before fork; only async-signal-safe calls follow in the child
    std::vector<std::string> argStorage;
    argStorage.reserve(options.args.size() + 1);
    argStorage.push_back(options.executable);
    argStorage.insert(argStorage.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    argv.reserve(argStorage.size() + 1);
    for (auto& arg : argStorage) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    int stderrPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (pipe2(stderrPipe, O_CLOEXEC) < 0) {
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::PipeFailed,
                         "pipe2 failed: " + std::string(strerror(errno)), errno});
    }
    if (pipe2(statusPipe, O_CLOEXEC) < 0) {
        int err = errno;
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::PipeFailed,
                         "pipe2 failed: " + std::string(strerror(err)), err});
    }

    const char* workingDirectory =
        options.workingDirectory.empty() ? nullptr : options.workingDirectory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::SpawnFailed,
                         "fork failed: " + std::string(strerror(err)), err});
    }

    if (pid == 0) {
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
        }
        dup2(stderrPipe[1], STDERR_FILENO);
        if (workingDirectory != nullptr && chdir(workingDirectory) < 0) {
            int err = errno;
            ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(stderrPipe[1]);
    closeFd(statusPipe[1]);

    // The status pipe closes on a successful exec; data means exec failed
    int execErrno = 0;
    ssize_t n;
    do {
        n = read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        closeFd(stderrPipe[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ProcessErrorCode code = (execErrno == ENOENT || execErrno == EACCES)
            ? ProcessErrorCode::ExecutableNotFound
            : ProcessErrorCode::SpawnFailed;
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{code,
                         "exec " + options.executable + " failed: " + std::string(strerror(execErrno)),
                         execErrno});
    }

    auto child = std::make_shared<Child>();
    child->pid = pid;
    child->stderrFd = stderrPipe[0];
    child->onOutput = std::move(onOutput);
    child->onExit = std::move(onExit);

    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        children_[pid] = child;
        child->monitor = std::thread(&LinuxProcessPAL::monitor, this, child);
    }

    return core::Result<ProcessHandle, ProcessError>::success(
        ProcessHandle{static_cast<uint64_t>(pid)});
}

core::Result<void, ProcessError> LinuxProcessPAL::terminate(ProcessHandle handle, uint32_t graceMs) {
    std::shared_ptr<Child> child;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        auto it = children_.find(static_cast<pid_t>(handle.value));
        if (it == children_.end()) {
            return core::Result<void, ProcessError>::error(
                ProcessError{ProcessErrorCode::InvalidHandle,
                             "Unknown process " + std::to_string(handle.value), 0});
        }
        child = it->second;
    }

    if (child->exited.load() || child->terminateRequested.exchange(true)) {
        return core::Result<void, ProcessError>::success();
    }

    child->killDeadlineMs = steadyNowMs() + static_cast<int64_t>(graceMs);
    if (kill(child->pid, SIGTERM) < 0 && errno != ESRCH) {
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::SignalFailed,
                         "kill failed: " + std::string(strerror(errno)), errno});
    }
    return core::Result<void, ProcessError>::success();
}

bool LinuxProcessPAL::isAlive(ProcessHandle handle) const {
    std::lock_guard<std::mutex> lock(childrenMutex_);
    auto it = children_.find(static_cast<pid_t>(handle.value));
    return it != children_.end() && !it->second->exited.load();
}

size_t LinuxProcessPAL::liveCount() const {
    std::lock_guard<std::mutex> lock(childrenMutex_);
    size_t count = 0;
    for (const auto& pair : children_) {
        if (!pair.second->exited.load()) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Monitoring
// =============================================================================

void LinuxProcessPAL::monitor(std::shared_ptr<Child> child) {
    std::string pending;
    char buffer[4096];

    while (true) {
        escalateIfDue(*child);

        struct pollfd pfd;
        pfd.fd = child->stderrFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(child->stderrFd, buffer, sizeof(buffer));
        if (n > 0) {
            emitLines(pending, buffer, static_cast<size_t>(n), child->onOutput);
        } else if (n == 0) {
            break;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }

    if (!pending.empty() && child->onOutput) {
        child->onOutput(pending);
    }
    closeFd(child->stderrFd);

    // stderr closed; the process may still be running
    int status = 0;
    ProcessExitStatus exitStatus;
    while (true) {
        pid_t result = waitpid(child->pid, &status, WNOHANG);
        if (result == child->pid) {
            exitStatus = decodeWaitStatus(status);
            break;
        }
        if (result < 0 && errno != EINTR) {
            break;
        }
        escalateIfDue(*child);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    child->exited = true;
    if (child->onExit) {
        child->onExit(exitStatus);
    }
    // Callbacks may own objects that hold this PAL
    child->onOutput = nullptr;
    child->onExit = nullptr;
    child->finished = true;
}

void LinuxProcessPAL::escalateIfDue(Child& child) {
    if (shuttingDown_.load() && !child.killSent.exchange(true)) {
        kill(child.pid, SIGKILL);
        return;
    }
    if (child.terminateRequested.load() && !child.killSent.load() &&
        steadyNowMs() >= child.killDeadlineMs.load()) {
        child.killSent = true;
        kill(child.pid, SIGKILL);
    }
}

void LinuxProcessPAL::reapFinishedMonitors() {
    std::vector<std::shared_ptr<Child>> finished;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        for (auto it = children_.begin(); it != children_.end(); ) {
            if (it->second->finished.load() &&
                it->second->monitor.get_id() != std::this_thread::get_id()) {
                finished.push_back(it->second);
                it = children_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& child : finished) {
        if (child->monitor.joinable()) {
            child->monitor.join();
        }
    }
}

int64_t LinuxProcessPAL::steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

void LinuxProcessPAL::emitLines(
    std::string& pending,
    const char* data,
    size_t size,
    const ProcessOutputCallback& onOutput
) {
    for (size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n' || c == '\r') {
            if (!pending.empty() && onOutput) {
                onOutput(pending);
            }
            pending.clear();
        } else {
            pending.push_back(c);
        }
    }
}

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
