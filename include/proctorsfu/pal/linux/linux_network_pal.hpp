// ProctorSFU - Exam Proctoring Media Server
// Linux Network PAL Implementation
//
// Uses epoll for event notification and BSD sockets for networking

#ifndef PROCTORSFU_PAL_LINUX_LINUX_NETWORK_PAL_HPP
#define PROCTORSFU_PAL_LINUX_LINUX_NETWORK_PAL_HPP

#include "proctorsfu/pal/network_pal.hpp"
#include "proctorsfu/pal/pal_types.hpp"
#include "proctorsfu/core/result.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

#if defined(__linux__)

namespace proctorsfu {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of INetworkPAL using epoll.
 *
 * This implementation uses:
 * - epoll in edge-triggered mode, one registration per socket
 * - an eventfd to wake epoll_wait when operations are queued
 * - non-blocking BSD sockets
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Requests from other threads are queued and applied on the loop thread
 * - Callbacks run on the loop thread with no internal lock held, so they
 *   may issue further requests
 */
class LinuxNetworkPAL : public INetworkPAL {
public:
    LinuxNetworkPAL();

    /**
     * @brief Stops the event loop and closes all sockets.
     */
    ~LinuxNetworkPAL() override;

    LinuxNetworkPAL(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL& operator=(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL(LinuxNetworkPAL&&) = delete;
    LinuxNetworkPAL& operator=(LinuxNetworkPAL&&) = delete;

    // =========================================================================
    // INetworkPAL Implementation
    // =========================================================================

    core::Result<void, NetworkError> initialize() override;
    void runEventLoop() override;
    void stopEventLoop() override;
    bool isRunning() const override;

    core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) override;

    void asyncAccept(const ServerSocket& server, AcceptCallback callback) override;

    void asyncRead(SocketHandle socket, size_t maxBytes, ReadCallback callback) override;

    void asyncWrite(
        SocketHandle socket,
        std::vector<uint8_t> data,
        WriteCallback callback
    ) override;

    void closeSocket(SocketHandle socket) override;

    core::Result<void, NetworkError> setSocketOption(
        SocketHandle socket,
        SocketOption option,
        int value
    ) override;

    core::Result<uint16_t, NetworkError> getLocalPort(SocketHandle socket) const override;

    bool probeUdpPort(const std::string& address, uint16_t port) const override;

private:
    using Completion = std::function<void()>;

    struct WriteRequest {
        std::vector<uint8_t> data;
        size_t offset = 0;
        WriteCallback callback;
    };

    /**
     * @brief Socket state information.
     */
    struct SocketInfo {
        int fd = -1;
        bool isServer = false;
        AcceptCallback acceptCallback;
        ReadCallback readCallback;
        size_t maxReadBytes = 0;
        std::deque<WriteRequest> writeQueue;
    };

    /**
     * @brief Request queued by a caller thread for the event loop.
     */
    struct PendingOp {
        enum class Type { Accept, Read, Write };
        Type type = Type::Read;
        SocketHandle socket = INVALID_SOCKET_HANDLE;
        AcceptCallback acceptCb;
        ReadCallback readCb;
        WriteCallback writeCb;
        size_t maxBytes = 0;
        std::vector<uint8_t> writeData;
    };

    bool setNonBlocking(int fd);
    bool registerWithEpoll(int fd, uint32_t events, bool modify = false);
    void unregisterFromEpoll(int fd);
    uint32_t interestMask(const SocketInfo& info) const;
    void wake();

    void processEvents();
    void processPendingOps();

    // The helpers below run with socketsMutex_ held and only queue completions
    void drainAccept(int fd, std::vector<Completion>& completions);
    void tryRead(SocketInfo& info, std::vector<Completion>& completions);
    void flushWrites(SocketInfo& info, std::vector<Completion>& completions);

    NetworkError errnoToNetworkError(int err) const;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    int epollFd_{-1};

    mutable std::mutex socketsMutex_;
    std::unordered_map<int, SocketInfo> sockets_;

    mutable std::mutex opsMutex_;
    std::queue<PendingOp> pendingOps_;

    // Eventfd for waking up epoll
    int wakeEventFd_{-1};
};

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
#endif // PROCTORSFU_PAL_LINUX_LINUX_NETWORK_PAL_HPP
