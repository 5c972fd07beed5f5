// ProctorSFU - Exam Proctoring Media Server
// Platform Abstraction Layer - Child Process Interface
//
// Launches and supervises helper processes (the recording encoder). Output
// arrives line by line from stderr; exit is reported exactly once.

#ifndef PROCTORSFU_PAL_PROCESS_PAL_HPP
#define PROCTORSFU_PAL_PROCESS_PAL_HPP

#include "proctorsfu/pal/pal_types.hpp"
#include "proctorsfu/core/result.hpp"

namespace proctorsfu {
namespace pal {

/**
 * @brief Abstract interface for child process management.
 *
 * ## Thread Safety
 * - All methods are thread-safe
 * - Output and exit callbacks run on an internal monitor thread
 * - The exit callback is the last callback for a given handle
 */
class IProcessPAL {
public:
    virtual ~IProcessPAL() = default;

    /**
     * @brief Start a child process.
     *
     * stdin and stdout are redirected to /dev/null; stderr is captured.
     *
     * @param options Executable, arguments and working directory
     * @param onOutput Called per stderr line ('\n' or '\r' terminated)
     * @param onExit Called once when the child has been reaped
     * @return ExecutableNotFound if exec failed, SpawnFailed or PipeFailed otherwise
     */
    virtual core::Result<ProcessHandle, ProcessError> spawn(
        const ProcessOptions& options,
        ProcessOutputCallback onOutput,
        ProcessExitCallback onExit
    ) = 0;

    /**
     * @brief Ask the child to exit with SIGTERM, escalating to SIGKILL.
     *
     * Returns immediately. Calling it again, or after the child has exited,
     * has no further effect.
     *
     * @param graceMs Time allowed between SIGTERM and SIGKILL
     * @return InvalidHandle for unknown handles
     */
    virtual core::Result<void, ProcessError> terminate(ProcessHandle handle, uint32_t graceMs) = 0;

    /**
     * @brief True until the child has been reaped.
     */
    virtual bool isAlive(ProcessHandle handle) const = 0;
};

} // namespace pal
} // namespace proctorsfu

#endif // PROCTORSFU_PAL_PROCESS_PAL_HPP
