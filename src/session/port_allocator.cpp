// ProctorSFU - Exam Proctoring Media Server
// Port Allocator Implementation

#include "proctorsfu/session/port_allocator.hpp"

#include <stdexcept>
#include <string>

namespace proctorsfu {
namespace session {

PortAllocator::PortAllocator(uint16_t minPort, uint16_t maxPort, PortProbe probe)
    : minPort_(minPort)
    , maxPort_(maxPort)
    , probe_(std::move(probe))
    , next_(minPort) {
    if (minPort >= maxPort) {
        throw std::invalid_argument(
            "PortAllocator: empty range [" + std::to_string(minPort) + ", " +
            std::to_string(maxPort) + ")");
    }
}

uint16_t PortAllocator::advance() {
    uint16_t port = next_;
    ++next_;
    if (next_ >= maxPort_) {
        next_ = minPort_;
    }
    return port;
}

core::Result<uint16_t, core::Error> PortAllocator::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint32_t rangeSize = static_cast<uint32_t>(maxPort_) - minPort_;
    for (uint32_t attempt = 0; attempt < rangeSize; ++attempt) {
        uint16_t candidate = advance();
        if (leased_.count(candidate) > 0) {
            continue;
        }
        if (probe_ && !probe_(candidate)) {
            continue;
        }
        leased_.insert(candidate);
        return core::Result<uint16_t, core::Error>::success(candidate);
    }

    return core::Result<uint16_t, core::Error>::error(core::Error(
        core::ErrorCode::RecordingError,
        "No free recorder port",
        "range [" + std::to_string(minPort_) + ", " + std::to_string(maxPort_) + ")"));
}

void PortAllocator::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    leased_.erase(port);
}

bool PortAllocator::isLeased(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.count(port) > 0;
}

size_t PortAllocator::leasedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.size();
}

} // namespace session
} // namespace proctorsfu
