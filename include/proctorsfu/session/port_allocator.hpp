// ProctorSFU - Exam Proctoring Media Server
// Port Allocator - Leases local UDP ports for recorder endpoints
//
// Responsibilities:
// - Hand out ports from [minPort, maxPort) with a wrap-around counter
// - Skip ports that fail the availability probe or are still leased
// - Return ports to the pool when a recording releases them

#ifndef PROCTORSFU_SESSION_PORT_ALLOCATOR_HPP
#define PROCTORSFU_SESSION_PORT_ALLOCATOR_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"

namespace proctorsfu {
namespace session {

/**
 * @brief Answers whether a UDP port can be bound right now.
 */
using PortProbe = std::function<bool(uint16_t port)>;

/**
 * @brief Wrap-around UDP port allocator.
 *
 * Candidates are visited in order starting after the last port issued.
 * Availability is best-effort: a port that passes the probe may still be
 * taken by another process before the encoder binds it.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 */
class PortAllocator {
public:
    /**
     * @param minPort First port of the range (inclusive)
     * @param maxPort End of the range (exclusive), must be greater than minPort
     * @param probe Availability check; an empty probe accepts every port
     */
    PortAllocator(uint16_t minPort, uint16_t maxPort, PortProbe probe = PortProbe());

    /**
     * @brief Next port in the range that is neither leased nor busy.
     * @return RecordingError when the whole range has been tried
     */
    core::Result<uint16_t, core::Error> acquire();

    /**
     * @brief Return a leased port. Unknown ports are ignored.
     */
    void release(uint16_t port);

    bool isLeased(uint16_t port) const;
    size_t leasedCount() const;

    uint16_t minPort() const { return minPort_; }
    uint16_t maxPort() const { return maxPort_; }

private:
    uint16_t advance();

    const uint16_t minPort_;
    const uint16_t maxPort_;
    PortProbe probe_;

    mutable std::mutex mutex_;
    uint16_t next_;
    std::set<uint16_t> leased_;
};

} // namespace session
} // namespace proctorsfu

#endif // PROCTORSFU_SESSION_PORT_ALLOCATOR_HPP
