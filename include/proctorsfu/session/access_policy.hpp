// ProctorSFU - Exam Proctoring Media Server
// Access Policy - Role hierarchy for stream visibility
//
// Responsibilities:
// - Decide whether a viewer role may consume a publisher role's streams
// - Enumerate the producers a viewer may see when joining a room
// - Enumerate the viewers to notify about a newly published producer

#ifndef PROCTORSFU_SESSION_ACCESS_POLICY_HPP
#define PROCTORSFU_SESSION_ACCESS_POLICY_HPP

#include <vector>

#include "proctorsfu/core/config_manager.hpp"
#include "proctorsfu/core/types.hpp"
#include "proctorsfu/session/session_registry.hpp"

namespace proctorsfu {
namespace session {

/**
 * @brief Producer entry as announced to a viewer.
 */
struct VisibleProducer {
    ProducerId producerId;
    UserId userId;
    core::MediaRole mediaRole = core::MediaRole::Webcam;
    core::MediaKind kind = core::MediaKind::Video;
};

/**
 * @brief Role hierarchy lookup.
 *
 * The hierarchy is not transitive: with the default table an admin sees
 * invigilators but not the students those invigilators see.
 */
class AccessPolicy {
public:
    explicit AccessPolicy(core::RoleHierarchy hierarchy = core::defaultRoleHierarchy());

    /**
     * @brief True iff publisherRole is listed under viewerRole.
     */
    bool canAccessStream(core::Role viewerRole, core::Role publisherRole) const;

    /**
     * @brief Producers in roomId whose owners the viewer may access.
     *
     * Producers owned by excludeConnection (normally the viewer itself)
     * are left out.
     */
    std::vector<VisibleProducer> accessibleProducers(
        const ISessionRegistry& registry,
        const RoomId& roomId,
        core::Role viewerRole,
        ConnectionId excludeConnection = core::INVALID_CONNECTION_ID
    ) const;

    /**
     * @brief Peers in roomId allowed to see a publisher of the given role.
     */
    std::vector<ConnectionId> permittedViewers(
        const ISessionRegistry& registry,
        const RoomId& roomId,
        core::Role publisherRole,
        ConnectionId excludeConnection = core::INVALID_CONNECTION_ID
    ) const;

    const core::RoleHierarchy& hierarchy() const { return hierarchy_; }

private:
    core::RoleHierarchy hierarchy_;
};

} // namespace session
} // namespace proctorsfu

#endif // PROCTORSFU_SESSION_ACCESS_POLICY_HPP
