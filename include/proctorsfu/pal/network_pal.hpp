// ProctorSFU - Exam Proctoring Media Server
// Platform Abstraction Layer - Network Interface
//
// Asynchronous TCP I/O for the signaling listener, plus the UDP bind probe
// the recorder port allocator relies on.

#ifndef PROCTORSFU_PAL_NETWORK_PAL_HPP
#define PROCTORSFU_PAL_NETWORK_PAL_HPP

#include "proctorsfu/pal/pal_types.hpp"
#include "proctorsfu/core/result.hpp"

#include <string>
#include <vector>

namespace proctorsfu {
namespace pal {

/**
 * @brief Reactor-style network interface.
 *
 * ## Thread Safety
 * - All methods are thread-safe
 * - Callbacks are invoked on the thread running runEventLoop()
 * - Callbacks must not block; they hand work to the application executor
 *
 * ## Lifecycle
 * 1. initialize()
 * 2. createServer() and asyncAccept()
 * 3. runEventLoop() on a dedicated thread
 * 4. stopEventLoop() from any thread
 */
class INetworkPAL {
public:
    virtual ~INetworkPAL() = default;

    // =========================================================================
    // Event Loop Control
    // =========================================================================

    /**
     * @brief Set up the platform event notification mechanism.
     * @return AlreadyInitialized on a second call
     */
    virtual core::Result<void, NetworkError> initialize() = 0;

    /**
     * @brief Process I/O events until stopEventLoop() is called. Blocks.
     */
    virtual void runEventLoop() = 0;

    /**
     * @brief Make runEventLoop() return. Callable from any thread.
     */
    virtual void stopEventLoop() = 0;

    virtual bool isRunning() const = 0;

    // =========================================================================
    // Server Socket Operations
    // =========================================================================

    /**
     * @brief Create, bind and listen on a TCP socket.
     *
     * Port 0 binds an ephemeral port; read it back with getLocalPort().
     */
    virtual core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) = 0;

    /**
     * @brief Register the accept callback of a server socket.
     *
     * The callback stays registered and fires once per accepted connection
     * until the server socket is closed.
     */
    virtual void asyncAccept(
        const ServerSocket& server,
        AcceptCallback callback
    ) = 0;

    // =========================================================================
    // Connection I/O
    // =========================================================================

    /**
     * @brief Read up to maxBytes once data is available.
     *
     * One-shot: call again from the callback to keep reading. An orderly
     * shutdown by the peer is reported as ConnectionClosed.
     */
    virtual void asyncRead(
        SocketHandle socket,
        size_t maxBytes,
        ReadCallback callback
    ) = 0;

    /**
     * @brief Write all of data, then report the byte count.
     *
     * Writes on one socket complete in the order they were issued.
     */
    virtual void asyncWrite(
        SocketHandle socket,
        std::vector<uint8_t> data,
        WriteCallback callback
    ) = 0;

    /**
     * @brief Close a socket. Pending callbacks on it are dropped.
     */
    virtual void closeSocket(SocketHandle socket) = 0;

    virtual core::Result<void, NetworkError> setSocketOption(
        SocketHandle socket,
        SocketOption option,
        int value
    ) = 0;

    virtual core::Result<uint16_t, NetworkError> getLocalPort(
        SocketHandle socket
    ) const = 0;

    // =========================================================================
    // UDP
    // =========================================================================

    /**
     * @brief True if a UDP socket can be bound to address:port right now.
     *
     * The probe socket is closed before returning.
     */
    virtual bool probeUdpPort(const std::string& address, uint16_t port) const = 0;
};

} // namespace pal
} // namespace proctorsfu

#endif // PROCTORSFU_PAL_NETWORK_PAL_HPP
