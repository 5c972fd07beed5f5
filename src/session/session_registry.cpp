// ProctorSFU - Exam Proctoring Media Server
// Session Registry Implementation
//
// All tables live behind one shared_mutex. Mutations collect their domain
// events while locked and emit them after the lock is released.

#include "proctorsfu/session/session_registry.hpp"

#include <algorithm>

namespace proctorsfu {
namespace session {

namespace {

core::Error peerNotFound(ConnectionId connectionId) {
    return core::Error(
        core::ErrorCode::PeerNotFound,
        "Peer not found",
        "connection " + std::to_string(connectionId));
}

template<typename T>
void eraseValue(std::vector<T>& values, const T& value) {
    values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

SessionRegistry::SessionRegistry() = default;

SessionRegistry::~SessionRegistry() = default;

// =============================================================================
// Rooms
// =============================================================================

core::Result<RoomInfo, core::Error> SessionRegistry::createRoom(
    const RoomId& roomId,
    const RouterId& routerId
) {
    RoomInfo room;
    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        if (rooms_.count(roomId) > 0) {
            return core::Result<RoomInfo, core::Error>::error(core::Error(
                core::ErrorCode::RoomError,
                "Room '" + roomId + "' already exists"));
        }

        room.id = roomId;
        room.routerId = routerId;
        room.createdAt = std::chrono::steady_clock::now();
        room.lastActivity = room.createdAt;
        rooms_.emplace(roomId, room);
    }

    emitEvents({SessionEvent::roomCreated(roomId, routerId)});
    return core::Result<RoomInfo, core::Error>::success(room);
}

core::Result<RoomInfo, core::Error> SessionRegistry::getOrCreateRoom(
    const RoomId& roomId,
    const RouterId& routerId
) {
    {
        std::shared_lock<std::shared_mutex> lock(tablesMutex_);
        auto it = rooms_.find(roomId);
        if (it != rooms_.end()) {
            return core::Result<RoomInfo, core::Error>::success(it->second);
        }
    }

    auto created = createRoom(roomId, routerId);
    if (created.isError()) {
        // Lost a creation race; the winner's room is the answer
        auto existing = findRoomById(roomId);
        if (existing) {
            return core::Result<RoomInfo, core::Error>::success(*existing);
        }
    }
    return created;
}

std::optional<RoomInfo> SessionRegistry::findRoomById(const RoomId& roomId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::Result<RoomInfo, core::Error> SessionRegistry::findRoom(ConnectionId connectionId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return core::Result<RoomInfo, core::Error>::error(peerNotFound(connectionId));
    }

    auto roomIt = rooms_.find(peerIt->second.roomId);
    if (roomIt == rooms_.end()) {
        return core::Result<RoomInfo, core::Error>::error(core::Error(
            core::ErrorCode::RoomError,
            "Room not found",
            "room " + peerIt->second.roomId));
    }
    return core::Result<RoomInfo, core::Error>::success(roomIt->second);
}

// =============================================================================
// Peers
// =============================================================================

core::Result<JoinOutcome, core::Error> SessionRegistry::join(const JoinRequest& request) {
    std::vector<SessionEvent> events;
    JoinOutcome outcome;

    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        if (rooms_.count(request.roomId) == 0) {
            return core::Result<JoinOutcome, core::Error>::error(core::Error(
                core::ErrorCode::RoomError,
                "Room '" + request.roomId + "' does not exist"));
        }

        auto existing = peers_.find(request.connectionId);
        if (existing != peers_.end()) {
            outcome.replaced = removePeerLocked(existing, request.roomId, events);
        }

        PeerInfo peer;
        peer.connectionId = request.connectionId;
        peer.userId = request.userId;
        peer.role = request.role;
        peer.roomId = request.roomId;
        peer.examId = request.examId;
        peer.batchId = request.batchId;
        peer.joinedAt = std::chrono::steady_clock::now();

        peers_.emplace(peer.connectionId, peer);
        rooms_[request.roomId].peers.insert(peer.connectionId);
        touchRoomLocked(request.roomId);

        outcome.peer = peer;
        events.push_back(SessionEvent::peerJoined(peer));
    }

    emitEvents(events);
    return core::Result<JoinOutcome, core::Error>::success(std::move(outcome));
}

core::Result<LeaveOutcome, core::Error> SessionRegistry::leave(ConnectionId connectionId) {
    std::vector<SessionEvent> events;
    LeaveOutcome outcome;

    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        auto it = peers_.find(connectionId);
        if (it == peers_.end()) {
            return core::Result<LeaveOutcome, core::Error>::error(peerNotFound(connectionId));
        }
        outcome = removePeerLocked(it, RoomId(), events);
    }

    emitEvents(events);
    return core::Result<LeaveOutcome, core::Error>::success(std::move(outcome));
}

LeaveOutcome SessionRegistry::removePeerLocked(
    std::unordered_map<ConnectionId, PeerInfo>::iterator peerIt,
    const RoomId& keepRoom,
    std::vector<SessionEvent>& events
) {
    LeaveOutcome outcome;
    outcome.peer = peerIt->second;
    const PeerInfo& peer = outcome.peer;

    // Consumers other peers hold on this peer's producers go first
    for (const auto& producerId : peer.producers) {
        for (auto it = consumers_.begin(); it != consumers_.end(); ) {
            if (it->second.producerId == producerId && it->second.owner != peer.connectionId) {
                auto owner = peers_.find(it->second.owner);
                if (owner != peers_.end()) {
                    eraseValue(owner->second.consumers, it->first);
                }
                outcome.remoteConsumers.push_back(it->second);
                it = consumers_.erase(it);
            } else {
                ++it;
            }
        }
        producers_.erase(producerId);
    }

    for (const auto& consumerId : peer.consumers) {
        consumers_.erase(consumerId);
    }
    for (const auto& transportId : peer.transports) {
        transports_.erase(transportId);
    }

    peers_.erase(peerIt);
    events.push_back(SessionEvent::peerLeft(peer));

    auto roomIt = rooms_.find(peer.roomId);
    if (roomIt != rooms_.end()) {
        roomIt->second.peers.erase(peer.connectionId);
        roomIt->second.lastActivity = std::chrono::steady_clock::now();
        if (roomIt->second.peers.empty() && roomIt->first != keepRoom) {
            outcome.roomDeleted = true;
            outcome.routerToClose = roomIt->second.routerId;
            events.push_back(SessionEvent::roomClosed(roomIt->first, roomIt->second.routerId));
            rooms_.erase(roomIt);
        }
    }

    return outcome;
}

std::optional<PeerInfo> SessionRegistry::findPeer(ConnectionId connectionId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto it = peers_.find(connectionId);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerInfo> SessionRegistry::peersInRoom(const RoomId& roomId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    std::vector<PeerInfo> result;
    auto roomIt = rooms_.find(roomId);
    if (roomIt == rooms_.end()) {
        return result;
    }

    result.reserve(roomIt->second.peers.size());
    for (ConnectionId connectionId : roomIt->second.peers) {
        auto peerIt = peers_.find(connectionId);
        if (peerIt != peers_.end()) {
            result.push_back(peerIt->second);
        }
    }
    return result;
}

// =============================================================================
// Transports
// =============================================================================

core::Result<void, core::Error> SessionRegistry::addTransport(const TransportInfo& transport) {
    std::unique_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(transport.owner);
    if (peerIt == peers_.end()) {
        return core::Result<void, core::Error>::error(peerNotFound(transport.owner));
    }
    if (transports_.count(transport.id) > 0) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::TransportError,
            "Transport already registered",
            "transport " + transport.id));
    }

    transports_.emplace(transport.id, transport);
    peerIt->second.transports.push_back(transport.id);
    touchRoomLocked(peerIt->second.roomId);
    return core::Result<void, core::Error>::success();
}

core::Result<TransportInfo, core::Error> SessionRegistry::findOwnedTransport(
    ConnectionId connectionId,
    const TransportId& transportId
) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto it = transports_.find(transportId);
    if (it == transports_.end() || it->second.owner != connectionId) {
        return core::Result<TransportInfo, core::Error>::error(core::Error(
            core::ErrorCode::TransportError,
            "Transport not found",
            "transport " + transportId));
    }
    return core::Result<TransportInfo, core::Error>::success(it->second);
}

std::optional<TransportInfo> SessionRegistry::findTransportByDirection(
    ConnectionId connectionId,
    core::TransportDirection direction
) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return std::nullopt;
    }
    for (const auto& transportId : peerIt->second.transports) {
        auto it = transports_.find(transportId);
        if (it != transports_.end() && it->second.direction == direction) {
            return it->second;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Producers and Consumers
// =============================================================================

core::Result<void, core::Error> SessionRegistry::addProducer(const ProducerInfo& producer) {
    RoomId roomId;
    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        auto peerIt = peers_.find(producer.owner);
        if (peerIt == peers_.end()) {
            return core::Result<void, core::Error>::error(peerNotFound(producer.owner));
        }
        auto transportIt = transports_.find(producer.transportId);
        if (transportIt == transports_.end() || transportIt->second.owner != producer.owner) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::TransportError,
                "Transport not found",
                "transport " + producer.transportId));
        }

        producers_[producer.id] = producer;
        peerIt->second.producers.push_back(producer.id);
        roomId = peerIt->second.roomId;
        touchRoomLocked(roomId);
    }

    emitEvents({SessionEvent::producerAdded(roomId, producer)});
    return core::Result<void, core::Error>::success();
}

std::optional<ProducerInfo> SessionRegistry::findProducer(const ProducerId& producerId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto it = producers_.find(producerId);
    if (it == producers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProducerInfo> SessionRegistry::producersOf(ConnectionId connectionId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    std::vector<ProducerInfo> result;
    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return result;
    }
    for (const auto& producerId : peerIt->second.producers) {
        auto it = producers_.find(producerId);
        if (it != producers_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

core::Result<ProducerRemoval, core::Error> SessionRegistry::removeProducer(
    const ProducerId& producerId
) {
    ProducerRemoval removal;
    RoomId roomId;

    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        auto it = producers_.find(producerId);
        if (it == producers_.end()) {
            return core::Result<ProducerRemoval, core::Error>::error(core::Error(
                core::ErrorCode::RoomError,
                "Producer not found",
                "producer " + producerId));
        }
        removal.producer = it->second;
        producers_.erase(it);

        for (auto consumerIt = consumers_.begin(); consumerIt != consumers_.end(); ) {
            if (consumerIt->second.producerId == producerId) {
                auto owner = peers_.find(consumerIt->second.owner);
                if (owner != peers_.end()) {
                    eraseValue(owner->second.consumers, consumerIt->first);
                }
                removal.consumers.push_back(consumerIt->second);
                consumerIt = consumers_.erase(consumerIt);
            } else {
                ++consumerIt;
            }
        }

        auto peerIt = peers_.find(removal.producer.owner);
        if (peerIt != peers_.end()) {
            PeerInfo& peer = peerIt->second;
            eraseValue(peer.producers, producerId);
            auto recIt = peer.recordingSessions.find(producerId);
            if (recIt != peer.recordingSessions.end()) {
                removal.recordingSession = recIt->second;
                peer.recordingSessions.erase(recIt);
            }
            roomId = peer.roomId;
            touchRoomLocked(roomId);
        }
    }

    emitEvents({SessionEvent::producerRemoved(roomId, removal.producer)});
    return core::Result<ProducerRemoval, core::Error>::success(std::move(removal));
}

core::Result<void, core::Error> SessionRegistry::addConsumer(const ConsumerInfo& consumer) {
    RoomId roomId;
    {
        std::unique_lock<std::shared_mutex> lock(tablesMutex_);

        auto peerIt = peers_.find(consumer.owner);
        if (peerIt == peers_.end()) {
            return core::Result<void, core::Error>::error(peerNotFound(consumer.owner));
        }
        if (producers_.count(consumer.producerId) == 0) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::RoomError,
                "Producer not found",
                "producer " + consumer.producerId));
        }
        auto transportIt = transports_.find(consumer.transportId);
        if (transportIt == transports_.end() || transportIt->second.owner != consumer.owner) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::TransportError,
                "Transport not found",
                "transport " + consumer.transportId));
        }

        consumers_[consumer.id] = consumer;
        peerIt->second.consumers.push_back(consumer.id);
        roomId = peerIt->second.roomId;
        touchRoomLocked(roomId);
    }

    emitEvents({SessionEvent::consumerAdded(roomId, consumer)});
    return core::Result<void, core::Error>::success();
}

std::optional<ConsumerInfo> SessionRegistry::findConsumer(const ConsumerId& consumerId) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto it = consumers_.find(consumerId);
    if (it == consumers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Recording Sessions
// =============================================================================

core::Result<void, core::Error> SessionRegistry::bindRecording(
    ConnectionId connectionId,
    const ProducerId& producerId,
    RecordingSessionId sessionId
) {
    std::unique_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return core::Result<void, core::Error>::error(peerNotFound(connectionId));
    }
    auto producerIt = producers_.find(producerId);
    if (producerIt == producers_.end() || producerIt->second.owner != connectionId) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::RoomError,
            "Producer not found",
            "producer " + producerId));
    }

    peerIt->second.recordingSessions[producerId] = sessionId;
    return core::Result<void, core::Error>::success();
}

void SessionRegistry::unbindRecording(
    ConnectionId connectionId,
    const ProducerId& producerId,
    RecordingSessionId sessionId
) {
    std::unique_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return;
    }
    auto& sessions = peerIt->second.recordingSessions;
    auto it = sessions.find(producerId);
    if (it != sessions.end() && it->second == sessionId) {
        sessions.erase(it);
    }
}

std::optional<RecordingSessionId> SessionRegistry::recordingFor(
    ConnectionId connectionId,
    const ProducerId& producerId
) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);

    auto peerIt = peers_.find(connectionId);
    if (peerIt == peers_.end()) {
        return std::nullopt;
    }
    auto it = peerIt->second.recordingSessions.find(producerId);
    if (it == peerIt->second.recordingSessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Statistics and Events
// =============================================================================

size_t SessionRegistry::roomCount() const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    return rooms_.size();
}

size_t SessionRegistry::peerCount() const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    return peers_.size();
}

void SessionRegistry::setEventCallback(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    eventCallback_ = std::move(callback);
}

void SessionRegistry::touchRoomLocked(const RoomId& roomId) {
    auto it = rooms_.find(roomId);
    if (it != rooms_.end()) {
        it->second.lastActivity = std::chrono::steady_clock::now();
    }
}

void SessionRegistry::emitEvents(const std::vector<SessionEvent>& events) {
    SessionEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = eventCallback_;
    }

    if (!callback) {
        return;
    }
    for (const auto& event : events) {
        callback(event);
    }
}

} // namespace session
} // namespace proctorsfu
