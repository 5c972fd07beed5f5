// ProctorSFU - Exam Proctoring Media Server
// Session Registry - Tracks rooms, peers and their media resources
//
// Responsibilities:
// - Maintain flat id-keyed tables of rooms, peers, transports, producers
//   and consumers
// - Enforce room lifetime: a room exists only while it has peers
// - Cascade removals (peer -> owned resources, producer -> its consumers)
// - Map producers to the recording sessions capturing them
// - Emit domain events for lifecycle changes

#ifndef PROCTORSFU_SESSION_SESSION_REGISTRY_HPP
#define PROCTORSFU_SESSION_SESSION_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace session {

using core::ConnectionId;
using core::ConsumerId;
using core::ProducerId;
using core::RecordingSessionId;
using core::RoomId;
using core::RouterId;
using core::TransportId;
using core::UserId;

// =============================================================================
// Table Rows
// =============================================================================

/**
 * @brief A room and the router that serves it.
 */
struct RoomInfo {
    RoomId id;
    RouterId routerId;
    std::set<ConnectionId> peers;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastActivity;
};

/**
 * @brief A participant connected to exactly one room.
 *
 * Resource lists hold ids into the registry's other tables. Two entries in
 * recordingSessions may name the same session when webcam video and audio
 * are recorded together.
 */
struct PeerInfo {
    ConnectionId connectionId = core::INVALID_CONNECTION_ID;
    UserId userId;
    core::Role role = core::Role::Student;
    RoomId roomId;
    std::optional<std::string> examId;
    std::optional<std::string> batchId;
    std::vector<TransportId> transports;
    std::vector<ProducerId> producers;
    std::vector<ConsumerId> consumers;
    std::map<ProducerId, RecordingSessionId> recordingSessions;
    std::chrono::steady_clock::time_point joinedAt;
};

struct TransportInfo {
    TransportId id;
    ConnectionId owner = core::INVALID_CONNECTION_ID;
    core::TransportDirection direction = core::TransportDirection::Send;
};

struct ProducerInfo {
    ProducerId id;
    ConnectionId owner = core::INVALID_CONNECTION_ID;
    TransportId transportId;
    core::MediaKind kind = core::MediaKind::Video;
    core::MediaRole mediaRole = core::MediaRole::Webcam;
    std::chrono::steady_clock::time_point createdAt;
};

struct ConsumerInfo {
    ConsumerId id;
    ConnectionId owner = core::INVALID_CONNECTION_ID;
    ProducerId producerId;
    TransportId transportId;
};

// =============================================================================
// Operation Results
// =============================================================================

/**
 * @brief Parameters of a join.
 */
struct JoinRequest {
    RoomId roomId;
    ConnectionId connectionId = core::INVALID_CONNECTION_ID;
    UserId userId;
    core::Role role = core::Role::Student;
    std::optional<std::string> examId;
    std::optional<std::string> batchId;
};

/**
 * @brief Everything released when a peer left.
 *
 * The caller closes the listed engine resources, tears down the recording
 * sessions, and closes routerToClose when the room was deleted.
 */
struct LeaveOutcome {
    PeerInfo peer;
    std::vector<ConsumerInfo> remoteConsumers;  ///< Other peers' consumers of this peer's producers
    bool roomDeleted = false;
    RouterId routerToClose;
};

struct JoinOutcome {
    PeerInfo peer;
    std::optional<LeaveOutcome> replaced;  ///< Previous membership of the same connection
};

/**
 * @brief A removed producer and the consumers that went with it.
 */
struct ProducerRemoval {
    ProducerInfo producer;
    std::vector<ConsumerInfo> consumers;
    std::optional<RecordingSessionId> recordingSession;
};

// =============================================================================
// Domain Events
// =============================================================================

struct SessionEvent {
    enum class Type {
        RoomCreated,
        RoomClosed,
        PeerJoined,
        PeerLeft,
        ProducerAdded,
        ProducerRemoved,
        ConsumerAdded
    };

    Type type = Type::RoomCreated;
    RoomId roomId;
    ConnectionId connectionId = core::INVALID_CONNECTION_ID;
    UserId userId;
    std::string resourceId;     ///< Router, producer or consumer id, depending on type

    static SessionEvent roomCreated(const RoomId& room, const RouterId& router) {
        SessionEvent event;
        event.type = Type::RoomCreated;
        event.roomId = room;
        event.resourceId = router;
        return event;
    }

    static SessionEvent roomClosed(const RoomId& room, const RouterId& router) {
        SessionEvent event;
        event.type = Type::RoomClosed;
        event.roomId = room;
        event.resourceId = router;
        return event;
    }

    static SessionEvent peerJoined(const PeerInfo& peer) {
        SessionEvent event;
        event.type = Type::PeerJoined;
        event.roomId = peer.roomId;
        event.connectionId = peer.connectionId;
        event.userId = peer.userId;
        return event;
    }

    static SessionEvent peerLeft(const PeerInfo& peer) {
        SessionEvent event;
        event.type = Type::PeerLeft;
        event.roomId = peer.roomId;
        event.connectionId = peer.connectionId;
        event.userId = peer.userId;
        return event;
    }

    static SessionEvent producerAdded(const RoomId& room, const ProducerInfo& producer) {
        SessionEvent event;
        event.type = Type::ProducerAdded;
        event.roomId = room;
        event.connectionId = producer.owner;
        event.resourceId = producer.id;
        return event;
    }

    static SessionEvent producerRemoved(const RoomId& room, const ProducerInfo& producer) {
        SessionEvent event;
        event.type = Type::ProducerRemoved;
        event.roomId = room;
        event.connectionId = producer.owner;
        event.resourceId = producer.id;
        return event;
    }

    static SessionEvent consumerAdded(const RoomId& room, const ConsumerInfo& consumer) {
        SessionEvent event;
        event.type = Type::ConsumerAdded;
        event.roomId = room;
        event.connectionId = consumer.owner;
        event.resourceId = consumer.id;
        return event;
    }
};

using SessionEventCallback = std::function<void(const SessionEvent&)>;

// =============================================================================
// Session Registry Interface
// =============================================================================

/**
 * @brief Single source of truth for who is connected and what they own.
 *
 * Lookups return snapshots; callers holding a snapshot across an
 * asynchronous step must look the row up again before relying on it.
 */
class ISessionRegistry {
public:
    virtual ~ISessionRegistry() = default;

    // -------------------------------------------------------------------------
    // Rooms
    // -------------------------------------------------------------------------

    /**
     * @brief Create a room served by routerId.
     * @return RoomError if the id is already in use
     */
    virtual core::Result<RoomInfo, core::Error> createRoom(
        const RoomId& roomId,
        const RouterId& routerId
    ) = 0;

    /**
     * @brief Return the existing room, or create it with routerId.
     *
     * The returned routerId differs from the argument when the room already
     * existed; the caller then owns the unused router.
     */
    virtual core::Result<RoomInfo, core::Error> getOrCreateRoom(
        const RoomId& roomId,
        const RouterId& routerId
    ) = 0;

    virtual std::optional<RoomInfo> findRoomById(const RoomId& roomId) const = 0;

    /**
     * @brief Room of the given connection.
     * @return PeerNotFound if the connection has not joined
     */
    virtual core::Result<RoomInfo, core::Error> findRoom(ConnectionId connectionId) const = 0;

    // -------------------------------------------------------------------------
    // Peers
    // -------------------------------------------------------------------------

    /**
     * @brief Add a peer to an existing room.
     *
     * Idempotent per connection: a previous membership is removed first and
     * reported in JoinOutcome::replaced.
     *
     * @return RoomError if the room does not exist
     */
    virtual core::Result<JoinOutcome, core::Error> join(const JoinRequest& request) = 0;

    /**
     * @brief Remove a peer with everything it owns.
     * @return PeerNotFound if the connection has not joined
     */
    virtual core::Result<LeaveOutcome, core::Error> leave(ConnectionId connectionId) = 0;

    virtual std::optional<PeerInfo> findPeer(ConnectionId connectionId) const = 0;

    virtual std::vector<PeerInfo> peersInRoom(const RoomId& roomId) const = 0;

    // -------------------------------------------------------------------------
    // Transports
    // -------------------------------------------------------------------------

    virtual core::Result<void, core::Error> addTransport(const TransportInfo& transport) = 0;

    /**
     * @brief Transport owned by connectionId.
     * @return TransportError if unknown or owned by another connection
     */
    virtual core::Result<TransportInfo, core::Error> findOwnedTransport(
        ConnectionId connectionId,
        const TransportId& transportId
    ) const = 0;

    virtual std::optional<TransportInfo> findTransportByDirection(
        ConnectionId connectionId,
        core::TransportDirection direction
    ) const = 0;

    // -------------------------------------------------------------------------
    // Producers and Consumers
    // -------------------------------------------------------------------------

    virtual core::Result<void, core::Error> addProducer(const ProducerInfo& producer) = 0;

    virtual std::optional<ProducerInfo> findProducer(const ProducerId& producerId) const = 0;

    virtual std::vector<ProducerInfo> producersOf(ConnectionId connectionId) const = 0;

    /**
     * @brief Remove a producer and every consumer of it.
     */
    virtual core::Result<ProducerRemoval, core::Error> removeProducer(
        const ProducerId& producerId
    ) = 0;

    virtual core::Result<void, core::Error> addConsumer(const ConsumerInfo& consumer) = 0;

    virtual std::optional<ConsumerInfo> findConsumer(const ConsumerId& consumerId) const = 0;

    // -------------------------------------------------------------------------
    // Recording Sessions
    // -------------------------------------------------------------------------

    /**
     * @brief Point a producer of connectionId at a recording session.
     */
    virtual core::Result<void, core::Error> bindRecording(
        ConnectionId connectionId,
        const ProducerId& producerId,
        RecordingSessionId sessionId
    ) = 0;

    /**
     * @brief Drop the mapping, but only while it still names sessionId.
     */
    virtual void unbindRecording(
        ConnectionId connectionId,
        const ProducerId& producerId,
        RecordingSessionId sessionId
    ) = 0;

    virtual std::optional<RecordingSessionId> recordingFor(
        ConnectionId connectionId,
        const ProducerId& producerId
    ) const = 0;

    // -------------------------------------------------------------------------
    // Statistics and Events
    // -------------------------------------------------------------------------

    virtual size_t roomCount() const = 0;
    virtual size_t peerCount() const = 0;

    virtual void setEventCallback(SessionEventCallback callback) = 0;
};

// =============================================================================
// Session Registry Implementation
// =============================================================================

/**
 * @brief In-memory ISessionRegistry.
 *
 * ## Thread Safety
 * Tables are guarded by a shared_mutex. Events are emitted after the lock
 * is released, so callbacks may query the registry.
 */
class SessionRegistry : public ISessionRegistry {
public:
    SessionRegistry();
    ~SessionRegistry() override;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    core::Result<RoomInfo, core::Error> createRoom(
        const RoomId& roomId, const RouterId& routerId) override;
    core::Result<RoomInfo, core::Error> getOrCreateRoom(
        const RoomId& roomId, const RouterId& routerId) override;
    std::optional<RoomInfo> findRoomById(const RoomId& roomId) const override;
    core::Result<RoomInfo, core::Error> findRoom(ConnectionId connectionId) const override;

    core::Result<JoinOutcome, core::Error> join(const JoinRequest& request) override;
    core::Result<LeaveOutcome, core::Error> leave(ConnectionId connectionId) override;
    std::optional<PeerInfo> findPeer(ConnectionId connectionId) const override;
    std::vector<PeerInfo> peersInRoom(const RoomId& roomId) const override;

    core::Result<void, core::Error> addTransport(const TransportInfo& transport) override;
    core::Result<TransportInfo, core::Error> findOwnedTransport(
        ConnectionId connectionId, const TransportId& transportId) const override;
    std::optional<TransportInfo> findTransportByDirection(
        ConnectionId connectionId, core::TransportDirection direction) const override;

    core::Result<void, core::Error> addProducer(const ProducerInfo& producer) override;
    std::optional<ProducerInfo> findProducer(const ProducerId& producerId) const override;
    std::vector<ProducerInfo> producersOf(ConnectionId connectionId) const override;
    core::Result<ProducerRemoval, core::Error> removeProducer(
        const ProducerId& producerId) override;

    core::Result<void, core::Error> addConsumer(const ConsumerInfo& consumer) override;
    std::optional<ConsumerInfo> findConsumer(const ConsumerId& consumerId) const override;

    core::Result<void, core::Error> bindRecording(
        ConnectionId connectionId, const ProducerId& producerId,
        RecordingSessionId sessionId) override;
    void unbindRecording(
        ConnectionId connectionId, const ProducerId& producerId,
        RecordingSessionId sessionId) override;
    std::optional<RecordingSessionId> recordingFor(
        ConnectionId connectionId, const ProducerId& producerId) const override;

    size_t roomCount() const override;
    size_t peerCount() const override;

    void setEventCallback(SessionEventCallback callback) override;

private:
    /**
     * @brief Remove a peer; caller holds the exclusive lock.
     *
     * The room is kept even when empty if its id equals keepRoom.
     */
    LeaveOutcome removePeerLocked(
        std::unordered_map<ConnectionId, PeerInfo>::iterator peerIt,
        const RoomId& keepRoom,
        std::vector<SessionEvent>& events
    );

    void touchRoomLocked(const RoomId& roomId);
    void emitEvents(const std::vector<SessionEvent>& events);

    std::unordered_map<RoomId, RoomInfo> rooms_;
    std::unordered_map<ConnectionId, PeerInfo> peers_;
    std::unordered_map<TransportId, TransportInfo> transports_;
    std::unordered_map<ProducerId, ProducerInfo> producers_;
    std::unordered_map<ConsumerId, ConsumerInfo> consumers_;
    mutable std::shared_mutex tablesMutex_;

    SessionEventCallback eventCallback_;
    mutable std::mutex callbackMutex_;
};

} // namespace session
} // namespace proctorsfu

#endif // PROCTORSFU_SESSION_SESSION_REGISTRY_HPP
