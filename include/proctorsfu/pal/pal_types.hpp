// ProctorSFU - Exam Proctoring Media Server
// Platform Abstraction Layer - Common Types
//
// Handles, error structures, options and callbacks shared by the PAL
// interfaces (network, process, logging).

#ifndef PROCTORSFU_PAL_PAL_TYPES_HPP
#define PROCTORSFU_PAL_PAL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace proctorsfu {

namespace core {
template<typename T, typename E> class Result;
}

namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent socket handle.
 *
 * Wraps the native descriptor so it cannot be mixed up with other integers.
 */
struct SocketHandle {
    uint64_t value;

    bool operator==(const SocketHandle& other) const { return value == other.value; }
    bool operator!=(const SocketHandle& other) const { return value != other.value; }
};

/**
 * @brief Handle for a spawned child process.
 */
struct ProcessHandle {
    uint64_t value;

    bool operator==(const ProcessHandle& other) const { return value == other.value; }
    bool operator!=(const ProcessHandle& other) const { return value != other.value; }
};

constexpr SocketHandle INVALID_SOCKET_HANDLE{0};
constexpr ProcessHandle INVALID_PROCESS_HANDLE{0};

// =============================================================================
// Error Codes
// =============================================================================

enum class NetworkErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    // Initialization errors
    InitializationFailed = 100,
    AlreadyInitialized = 101,
    NotInitialized = 102,

    // Socket errors
    SocketCreationFailed = 200,
    BindFailed = 201,
    ListenFailed = 202,
    AcceptFailed = 203,
    ConnectionReset = 206,
    ConnectionRefused = 207,
    ConnectionClosed = 208,

    // I/O errors
    ReadFailed = 300,
    WriteFailed = 301,
    WouldBlock = 302,
    Timeout = 303,
    Interrupted = 304,

    // Address errors
    AddressInUse = 400,
    AddressNotAvailable = 401,
    InvalidAddress = 402,
    HostUnreachable = 403,
    NetworkUnreachable = 404,

    // Resource errors
    TooManyOpenFiles = 500,
    OutOfMemory = 501,

    PermissionDenied = 600,
};

enum class ProcessErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    SpawnFailed = 100,
    ExecutableNotFound = 101,
    PipeFailed = 102,
    InvalidHandle = 200,
    SignalFailed = 201,
};

/**
 * @brief Log levels for the logging PAL, most verbose first.
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// =============================================================================
// Error Structures
// =============================================================================

/**
 * @brief Network error with the underlying errno for diagnostics.
 */
struct NetworkError {
    NetworkErrorCode code;
    std::string message;
    int32_t systemErrorCode;

    NetworkError(NetworkErrorCode c = NetworkErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

struct ProcessError {
    ProcessErrorCode code;
    std::string message;
    int32_t systemErrorCode;

    ProcessError(ProcessErrorCode c = ProcessErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

// =============================================================================
// Configuration Structures
// =============================================================================

struct ServerOptions {
    int backlog = 128;
    bool reuseAddr = true;
    bool reusePort = false;
    int receiveBufferSize = 0;   ///< 0 = system default
    int sendBufferSize = 0;      ///< 0 = system default
};

enum class SocketOption : uint32_t {
    NoDelay,
    KeepAlive,
    SendBufferSize,
    ReceiveBufferSize,
};

struct ServerSocket {
    SocketHandle handle;
    std::string address;
    uint16_t port;
};

/**
 * @brief Launch parameters for a child process.
 *
 * args excludes argv[0]; the executable is resolved through PATH when it
 * contains no slash.
 */
struct ProcessOptions {
    std::string executable;
    std::vector<std::string> args;
    std::string workingDirectory;   ///< Empty = inherit
};

/**
 * @brief How a child process ended.
 */
struct ProcessExitStatus {
    bool exited = false;       ///< Normal exit via exit()/return
    int exitCode = 0;          ///< Valid when exited
    bool signaled = false;     ///< Terminated by a signal
    int signal = 0;            ///< Valid when signaled
};

/**
 * @brief Source location attached to PAL log records.
 */
struct LogContext {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
};

// =============================================================================
// Callback Types
// =============================================================================

using AcceptCallback = std::function<void(core::Result<SocketHandle, NetworkError>)>;

/**
 * @brief Receives the bytes read, or ConnectionClosed on orderly shutdown.
 */
using ReadCallback = std::function<void(core::Result<std::vector<uint8_t>, NetworkError>)>;

/**
 * @brief Receives the number of bytes written.
 */
using WriteCallback = std::function<void(core::Result<size_t, NetworkError>)>;

/**
 * @brief One line of the child's stderr, without the trailing newline.
 */
using ProcessOutputCallback = std::function<void(const std::string& line)>;

using ProcessExitCallback = std::function<void(const ProcessExitStatus& status)>;

class ILogSink;

} // namespace pal
} // namespace proctorsfu

#endif // PROCTORSFU_PAL_PAL_TYPES_HPP
