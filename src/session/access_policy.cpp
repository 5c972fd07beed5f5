// ProctorSFU - Exam Proctoring Media Server
// Access Policy Implementation

#include "proctorsfu/session/access_policy.hpp"

#include <algorithm>

namespace proctorsfu {
namespace session {

AccessPolicy::AccessPolicy(core::RoleHierarchy hierarchy)
    : hierarchy_(std::move(hierarchy)) {
}

bool AccessPolicy::canAccessStream(core::Role viewerRole, core::Role publisherRole) const {
    auto it = hierarchy_.find(viewerRole);
    if (it == hierarchy_.end()) {
        return false;
    }
    const auto& visible = it->second;
    return std::find(visible.begin(), visible.end(), publisherRole) != visible.end();
}

std::vector<VisibleProducer> AccessPolicy::accessibleProducers(
    const ISessionRegistry& registry,
    const RoomId& roomId,
    core::Role viewerRole,
    ConnectionId excludeConnection
) const {
    std::vector<VisibleProducer> result;

    for (const auto& peer : registry.peersInRoom(roomId)) {
        if (peer.connectionId == excludeConnection) {
            continue;
        }
        if (!canAccessStream(viewerRole, peer.role)) {
            continue;
        }
        for (const auto& producer : registry.producersOf(peer.connectionId)) {
            VisibleProducer entry;
            entry.producerId = producer.id;
            entry.userId = peer.userId;
            entry.mediaRole = producer.mediaRole;
            entry.kind = producer.kind;
            result.push_back(std::move(entry));
        }
    }
    return result;
}

std::vector<ConnectionId> AccessPolicy::permittedViewers(
    const ISessionRegistry& registry,
    const RoomId& roomId,
    core::Role publisherRole,
    ConnectionId excludeConnection
) const {
    std::vector<ConnectionId> result;

    for (const auto& peer : registry.peersInRoom(roomId)) {
        if (peer.connectionId == excludeConnection) {
            continue;
        }
        if (canAccessStream(peer.role, publisherRole)) {
            result.push_back(peer.connectionId);
        }
    }
    return result;
}

} // namespace session
} // namespace proctorsfu
