// ProctorSFU - Exam Proctoring Media Server
// Linux Network PAL Implementation using epoll

#include "proctorsfu/pal/linux/linux_network_pal.hpp"

#if defined(__linux__)

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

namespace proctorsfu {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxNetworkPAL::LinuxNetworkPAL() = default;

LinuxNetworkPAL::~LinuxNetworkPAL() {
    stopEventLoop();

    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        for (auto& pair : sockets_) {
            if (pair.first >= 0) {
                close(pair.first);
            }
        }
        sockets_.clear();
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }

    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Initialization
// =============================================================================

core::Result<void, NetworkError> LinuxNetworkPAL::initialize() {
    if (initialized_.load()) {
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::AlreadyInitialized, "Network PAL already initialized", 0}
        );
    }

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "epoll_create1 failed: " + std::string(strerror(errno)), errno}
        );
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        int err = errno;
        close(epollFd_);
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "eventfd failed: " + std::string(strerror(err)), err}
        );
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeEventFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        int err = errno;
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "epoll_ctl failed: " + std::string(strerror(err)), err}
        );
    }

    initialized_ = true;
    return core::Result<void, NetworkError>::success();
}

// =============================================================================
// Event Loop
// =============================================================================

void LinuxNetworkPAL::runEventLoop() {
    if (!initialized_.load()) {
        return;
    }

    running_ = true;

    while (!stopRequested_.load()) {
        processPendingOps();
        processEvents();
    }

    running_ = false;
}

void LinuxNetworkPAL::stopEventLoop() {
    stopRequested_ = true;
    wake();
}

bool LinuxNetworkPAL::isRunning() const {
    return running_.load();
}

void LinuxNetworkPAL::wake() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        ssize_t result = write(wakeEventFd_, &val, sizeof(val));
        (void)result;
    }
}

void LinuxNetworkPAL::processEvents() {
    const int maxEvents = 64;
    struct epoll_event events[maxEvents];

    int nfds = epoll_wait(epollFd_, events, maxEvents, 100);
    if (nfds <= 0) {
        return;
    }

    std::vector<Completion> completions;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == wakeEventFd_) {
                uint64_t val;
                while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
                }
                continue;
            }

            auto it = sockets_.find(fd);
            if (it == sockets_.end()) {
                continue;
            }

            if (it->second.isServer) {
                drainAccept(fd, completions);
                continue;
            }

            if (events[i].events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) {
                tryRead(it->second, completions);
            }
            if (events[i].events & EPOLLOUT) {
                flushWrites(it->second, completions);
            }
        }
    }

    for (auto& completion : completions) {
        completion();
    }
}

void LinuxNetworkPAL::processPendingOps() {
    std::queue<PendingOp> ops;
    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        std::swap(ops, pendingOps_);
    }

    std::vector<Completion> completions;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);

        while (!ops.empty()) {
            PendingOp op = std::move(ops.front());
            ops.pop();

            int fd = static_cast<int>(op.socket.value);
            auto it = sockets_.find(fd);
            if (it == sockets_.end()) {
                NetworkError notFound{NetworkErrorCode::ConnectionClosed, "Socket not found", 0};
                if (op.type == PendingOp::Type::Accept && op.acceptCb) {
                    auto cb = std::move(op.acceptCb);
                    completions.push_back([cb, notFound]() {
                        cb(core::Result<SocketHandle, NetworkError>::error(notFound));
                    });
                } else if (op.type == PendingOp::Type::Read && op.readCb) {
                    auto cb = std::move(op.readCb);
                    completions.push_back([cb, notFound]() {
                        cb(core::Result<std::vector<uint8_t>, NetworkError>::error(notFound));
                    });
                } else if (op.type == PendingOp::Type::Write && op.writeCb) {
                    auto cb = std::move(op.writeCb);
                    completions.push_back([cb, notFound]() {
                        cb(core::Result<size_t, NetworkError>::error(notFound));
                    });
                }
                continue;
            }

            SocketInfo& info = it->second;
            switch (op.type) {
                case PendingOp::Type::Accept:
                    info.acceptCallback = std::move(op.acceptCb);
                    registerWithEpoll(fd, interestMask(info), true);
                    drainAccept(fd, completions);
                    break;

                case PendingOp::Type::Read:
                    info.readCallback = std::move(op.readCb);
                    info.maxReadBytes = op.maxBytes;
                    registerWithEpoll(fd, interestMask(info), true);
                    tryRead(info, completions);
                    break;

                case PendingOp::Type::Write: {
                    WriteRequest request;
                    request.data = std::move(op.writeData);
                    request.callback = std::move(op.writeCb);
                    info.writeQueue.push_back(std::move(request));
                    flushWrites(info, completions);
                    registerWithEpoll(fd, interestMask(info), true);
                    break;
                }
            }
        }
    }

    for (auto& completion : completions) {
        completion();
    }
}

void LinuxNetworkPAL::drainAccept(int fd, std::vector<Completion>& completions) {
    auto serverIt = sockets_.find(fd);
    if (serverIt == sockets_.end() || !serverIt->second.acceptCallback) {
        return;
    }
    AcceptCallback callback = serverIt->second.acceptCallback;

    // Collect first: inserting into sockets_ invalidates serverIt
    std::vector<int> accepted;
    while (true) {
        struct sockaddr_in clientAddr;
        socklen_t addrLen = sizeof(clientAddr);
        int clientFd = accept4(fd, reinterpret_cast<struct sockaddr*>(&clientAddr), &addrLen,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (clientFd >= 0) {
            accepted.push_back(clientFd);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            NetworkError error = errnoToNetworkError(errno);
            completions.push_back([callback, error]() {
                callback(core::Result<SocketHandle, NetworkError>::error(error));
            });
        }
        break;
    }

    for (int clientFd : accepted) {
        SocketInfo clientInfo;
        clientInfo.fd = clientFd;
        sockets_[clientFd] = std::move(clientInfo);
        registerWithEpoll(clientFd, EPOLLIN | EPOLLRDHUP | EPOLLET, false);

        SocketHandle handle{static_cast<uint64_t>(clientFd)};
        completions.push_back([callback, handle]() {
            callback(core::Result<SocketHandle, NetworkError>::success(handle));
        });
    }
}

void LinuxNetworkPAL::tryRead(SocketInfo& info, std::vector<Completion>& completions) {
    if (!info.readCallback) {
        return;
    }

    std::vector<uint8_t> buffer(info.maxReadBytes > 0 ? info.maxReadBytes : 4096);
    ssize_t bytesRead;
    do {
        bytesRead = read(info.fd, buffer.data(), buffer.size());
    } while (bytesRead < 0 && errno == EINTR);

    if (bytesRead > 0) {
        buffer.resize(static_cast<size_t>(bytesRead));
        ReadCallback cb = std::move(info.readCallback);
        info.readCallback = nullptr;
        completions.push_back([cb, data = std::move(buffer)]() mutable {
            cb(core::Result<std::vector<uint8_t>, NetworkError>::success(std::move(data)));
        });
    } else if (bytesRead == 0) {
        ReadCallback cb = std::move(info.readCallback);
        info.readCallback = nullptr;
        completions.push_back([cb]() {
            cb(core::Result<std::vector<uint8_t>, NetworkError>::error(
                NetworkError{NetworkErrorCode::ConnectionClosed, "Connection closed by peer", 0}));
        });
    } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
        ReadCallback cb = std::move(info.readCallback);
        info.readCallback = nullptr;
        NetworkError error = errnoToNetworkError(errno);
        completions.push_back([cb, error]() {
            cb(core::Result<std::vector<uint8_t>, NetworkError>::error(error));
        });
    }
}

void LinuxNetworkPAL::flushWrites(SocketInfo& info, std::vector<Completion>& completions) {
    const bool hadPending = !info.writeQueue.empty();

    while (!info.writeQueue.empty()) {
        WriteRequest& request = info.writeQueue.front();
        const uint8_t* data = request.data.data() + request.offset;
        size_t remaining = request.data.size() - request.offset;

        if (remaining > 0) {
            ssize_t bytesWritten = send(info.fd, data, remaining, MSG_NOSIGNAL);
            if (bytesWritten < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                NetworkError error = errnoToNetworkError(errno);
                for (auto& failed : info.writeQueue) {
                    if (failed.callback) {
                        auto cb = std::move(failed.callback);
                        completions.push_back([cb, error]() {
                            cb(core::Result<size_t, NetworkError>::error(error));
                        });
                    }
                }
                info.writeQueue.clear();
                break;
            }
            request.offset += static_cast<size_t>(bytesWritten);
            if (request.offset < request.data.size()) {
                continue;
            }
        }

        size_t total = request.data.size();
        if (request.callback) {
            auto cb = std::move(request.callback);
            completions.push_back([cb, total]() {
                cb(core::Result<size_t, NetworkError>::success(total));
            });
        }
        info.writeQueue.pop_front();
    }

    if (hadPending && info.writeQueue.empty()) {
        // Drop EPOLLOUT interest
        registerWithEpoll(info.fd, interestMask(info), true);
    }
}

// =============================================================================
// Server Socket Operations
// =============================================================================

core::Result<ServerSocket, NetworkError> LinuxNetworkPAL::createServer(
    const std::string& address,
    uint16_t port,
    const ServerOptions& options
) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "Invalid IPv4 address: " + address, 0}
        );
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::SocketCreationFailed,
                         "socket failed: " + std::string(strerror(errno)), errno}
        );
    }

    if (options.reuseAddr) {
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    }
    if (options.reusePort) {
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
    }
    if (options.receiveBufferSize > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &options.receiveBufferSize,
                   sizeof(options.receiveBufferSize));
    }
    if (options.sendBufferSize > 0) {
        setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &options.sendBufferSize,
                   sizeof(options.sendBufferSize));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        NetworkError error = errnoToNetworkError(err);
        if (error.code != NetworkErrorCode::AddressInUse) {
            error.code = NetworkErrorCode::BindFailed;
        }
        error.message = "bind failed: " + std::string(strerror(err));
        return core::Result<ServerSocket, NetworkError>::error(error);
    }

    if (listen(fd, options.backlog) < 0) {
        int err = errno;
        close(fd);
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::ListenFailed,
                         "listen failed: " + std::string(strerror(err)), err}
        );
    }

    setNonBlocking(fd);

    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        SocketInfo info;
        info.fd = fd;
        info.isServer = true;
        sockets_[fd] = std::move(info);
        registerWithEpoll(fd, EPOLLIN | EPOLLET, false);
    }

    ServerSocket server;
    server.handle = SocketHandle{static_cast<uint64_t>(fd)};
    server.address = address;
    server.port = port;
    if (port == 0) {
        auto bound = getLocalPort(server.handle);
        if (bound.isSuccess()) {
            server.port = bound.value();
        }
    }

    return core::Result<ServerSocket, NetworkError>::success(server);
}

// =============================================================================
// Async I/O Operations
// =============================================================================

void LinuxNetworkPAL::asyncAccept(const ServerSocket& server, AcceptCallback callback) {
    PendingOp op;
    op.type = PendingOp::Type::Accept;
    op.socket = server.handle;
    op.acceptCb = std::move(callback);

    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        pendingOps_.push(std::move(op));
    }
    wake();
}

void LinuxNetworkPAL::asyncRead(SocketHandle socket, size_t maxBytes, ReadCallback callback) {
    PendingOp op;
    op.type = PendingOp::Type::Read;
    op.socket = socket;
    op.readCb = std::move(callback);
    op.maxBytes = maxBytes;

    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        pendingOps_.push(std::move(op));
    }
    wake();
}

void LinuxNetworkPAL::asyncWrite(
    SocketHandle socket,
    std::vector<uint8_t> data,
    WriteCallback callback
) {
    PendingOp op;
    op.type = PendingOp::Type::Write;
    op.socket = socket;
    op.writeCb = std::move(callback);
    op.writeData = std::move(data);

    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        pendingOps_.push(std::move(op));
    }
    wake();
}

// =============================================================================
// Socket Management
// =============================================================================

void LinuxNetworkPAL::closeSocket(SocketHandle socket) {
    if (socket == INVALID_SOCKET_HANDLE) {
        return;
    }

    int fd = static_cast<int>(socket.value);

    std::lock_guard<std::mutex> lock(socketsMutex_);
    auto it = sockets_.find(fd);
    if (it == sockets_.end()) {
        return;
    }
    sockets_.erase(it);
    unregisterFromEpoll(fd);
    close(fd);
}

core::Result<void, NetworkError> LinuxNetworkPAL::setSocketOption(
    SocketHandle socket,
    SocketOption option,
    int value
) {
    int fd = static_cast<int>(socket.value);

    int result = 0;
    switch (option) {
        case SocketOption::NoDelay:
            result = setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &value, sizeof(value));
            break;

        case SocketOption::KeepAlive:
            result = setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &value, sizeof(value));
            break;

        case SocketOption::SendBufferSize:
            result = setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &value, sizeof(value));
            break;

        case SocketOption::ReceiveBufferSize:
            result = setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &value, sizeof(value));
            break;
    }

    if (result < 0) {
        return core::Result<void, NetworkError>::error(errnoToNetworkError(errno));
    }
    return core::Result<void, NetworkError>::success();
}

core::Result<uint16_t, NetworkError> LinuxNetworkPAL::getLocalPort(SocketHandle socket) const {
    int fd = static_cast<int>(socket.value);

    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(addr);

    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) < 0) {
        return core::Result<uint16_t, NetworkError>::error(errnoToNetworkError(errno));
    }

    return core::Result<uint16_t, NetworkError>::success(ntohs(addr.sin_port));
}

bool LinuxNetworkPAL::probeUdpPort(const std::string& address, uint16_t port) const {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return false;
    }
    bool available = bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return available;
}

// =============================================================================
// Helper Functions
// =============================================================================

bool LinuxNetworkPAL::setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

uint32_t LinuxNetworkPAL::interestMask(const SocketInfo& info) const {
    uint32_t events = EPOLLIN | EPOLLET;
    if (!info.isServer) {
        events |= EPOLLRDHUP;
    }
    if (!info.writeQueue.empty()) {
        events |= EPOLLOUT;
    }
    return events;
}

bool LinuxNetworkPAL::registerWithEpoll(int fd, uint32_t events, bool modify) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    int op = modify ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    return epoll_ctl(epollFd_, op, fd, &ev) >= 0;
}

void LinuxNetworkPAL::unregisterFromEpoll(int fd) {
    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
}

NetworkError LinuxNetworkPAL::errnoToNetworkError(int err) const {
    NetworkErrorCode code;
    std::string message;

    switch (err) {
        case ECONNREFUSED:
            code = NetworkErrorCode::ConnectionRefused;
            message = "Connection refused";
            break;

        case ECONNRESET:
        case EPIPE:
            code = NetworkErrorCode::ConnectionReset;
            message = "Connection reset by peer";
            break;

        case EADDRINUSE:
            code = NetworkErrorCode::AddressInUse;
            message = "Address already in use";
            break;

        case EADDRNOTAVAIL:
            code = NetworkErrorCode::AddressNotAvailable;
            message = "Address not available";
            break;

        case ENETUNREACH:
            code = NetworkErrorCode::NetworkUnreachable;
            message = "Network unreachable";
            break;

        case EHOSTUNREACH:
            code = NetworkErrorCode::HostUnreachable;
            message = "Host unreachable";
            break;

        case ETIMEDOUT:
            code = NetworkErrorCode::Timeout;
            message = "Connection timed out";
            break;

        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
            code = NetworkErrorCode::WouldBlock;
            message = "Operation would block";
            break;

        case EINTR:
            code = NetworkErrorCode::Interrupted;
            message = "Operation interrupted";
            break;

        case EACCES:
        case EPERM:
            code = NetworkErrorCode::PermissionDenied;
            message = "Permission denied";
            break;

        case EMFILE:
        case ENFILE:
            code = NetworkErrorCode::TooManyOpenFiles;
            message = "Too many open files";
            break;

        case ENOMEM:
            code = NetworkErrorCode::OutOfMemory;
            message = "Out of memory";
            break;

        default:
            code = NetworkErrorCode::Unknown;
            message = "Unknown error: " + std::string(strerror(err));
            break;
    }

    return NetworkError{code, message, err};
}

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
