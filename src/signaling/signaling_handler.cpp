// ProctorSFU - Exam Proctoring Media Server
// Signaling Handler Implementation

#include "proctorsfu/signaling/signaling_handler.hpp"

#include <chrono>

#include "proctorsfu/signaling/signaling_codec.hpp"

namespace proctorsfu {
namespace signaling {

namespace {

const std::string LOG_CATEGORY = "Signaling";

core::Error peerNotFound(ConnectionId connectionId) {
    return core::Error(core::ErrorCode::PeerNotFound, "Peer not found",
                       "connection " + std::to_string(connectionId));
}

core::Error producerNotFound(const core::ProducerId& producerId) {
    return core::Error(core::ErrorCode::RoomError, "Producer not found", producerId);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

SignalingHandler::SignalingHandler(
    session::ISessionRegistry& registry,
    engine::MediaEngineAdapter& engine,
    const session::AccessPolicy& policy,
    recording::RecordingOrchestrator& recorder,
    INotifier& notifier,
    std::shared_ptr<core::StructuredLogger> logger)
    : registry_(registry)
    , engine_(engine)
    , policy_(policy)
    , recorder_(recorder)
    , notifier_(notifier)
    , logger_(std::move(logger))
    , alive_(std::make_shared<std::atomic<bool>>(true)) {
    registry_.setEventCallback([this](const session::SessionEvent& event) {
        onRegistryEvent(event);
    });
}

SignalingHandler::~SignalingHandler() {
    alive_->store(false);
    registry_.setEventCallback(nullptr);
}

// =============================================================================
// join-room
// =============================================================================

void SignalingHandler::joinRoom(
    const ClientContext& client,
    const JoinRoomRequest& request,
    Reply<JoinRoomReply> reply)
{
    if (client.identity.role && *client.identity.role != request.role) {
        reply.reject(core::Error(core::ErrorCode::Authorization,
            "Role not permitted",
            std::string("token role ") + core::roleToString(*client.identity.role) +
            ", requested " + core::roleToString(request.role)));
        return;
    }

    auto room = registry_.findRoomById(request.roomId);
    if (room) {
        completeJoin(client, request, room->routerId, reply);
        return;
    }

    joining_.insert(client.connectionId);
    auto& waiters = pendingRooms_[request.roomId];
    waiters.push_back(PendingJoin{client, request, reply});
    if (waiters.size() > 1) {
        return;
    }

    auto alive = alive_;
    const core::RoomId roomId = request.roomId;
    engine_.createRouter([this, alive, roomId](core::Result<core::RouterId, core::Error> result) {
        if (alive->load()) {
            onRouterCreated(roomId, std::move(result));
        }
    });
}

void SignalingHandler::onRouterCreated(
    const core::RoomId& roomId,
    core::Result<core::RouterId, core::Error> result)
{
    auto it = pendingRooms_.find(roomId);
    if (it == pendingRooms_.end()) {
        if (result.isSuccess()) {
            engine_.closeRouter(result.value());
        }
        return;
    }
    std::vector<PendingJoin> waiters = std::move(it->second);
    pendingRooms_.erase(it);

    if (result.isError()) {
        logger_->error("Cannot create router for room " + roomId + ": " +
                       result.error().toString(), LOG_CATEGORY);
    }

    for (auto& waiter : waiters) {
        auto slot = joining_.find(waiter.client.connectionId);
        if (slot == joining_.end()) {
            continue;
        }
        joining_.erase(slot);

        if (result.isError()) {
            waiter.reply.reject(result.error());
        } else {
            completeJoin(waiter.client, waiter.request, result.value(), waiter.reply);
        }
    }

    if (result.isSuccess()) {
        auto room = registry_.findRoomById(roomId);
        if (!room || room->routerId != result.value()) {
            engine_.closeRouter(result.value());
        }
    }
}

void SignalingHandler::completeJoin(
    const ClientContext& client,
    const JoinRoomRequest& request,
    const core::RouterId& routerId,
    const Reply<JoinRoomReply>& reply)
{
    auto capabilities = engine_.routerCapabilities(routerId);
    if (capabilities.isError()) {
        reply.reject(capabilities.error());
        return;
    }

    auto room = registry_.getOrCreateRoom(request.roomId, routerId);
    if (room.isError()) {
        reply.reject(room.error());
        return;
    }
    if (room.value().routerId != routerId) {
        capabilities = engine_.routerCapabilities(room.value().routerId);
        if (capabilities.isError()) {
            reply.reject(capabilities.error());
            return;
        }
    }

    session::JoinRequest joinRequest;
    joinRequest.roomId = request.roomId;
    joinRequest.connectionId = client.connectionId;
    joinRequest.userId = client.identity.userId;
    joinRequest.role = request.role;
    joinRequest.examId = request.examId;
    joinRequest.batchId = request.batchId;

    auto joined = registry_.join(joinRequest);
    if (joined.isError()) {
        reply.reject(joined.error());
        return;
    }
    if (joined.value().replaced) {
        releasePeer(*joined.value().replaced);
    }

    reply.resolve(JoinRoomReply{capabilities.value()});
    pushExistingProducers(joined.value().peer);
}

// =============================================================================
// Transports
// =============================================================================

void SignalingHandler::createTransport(
    const ClientContext& client,
    const CreateTransportRequest& request,
    Reply<TransportReply> reply)
{
    const ConnectionId connectionId = client.connectionId;
    auto room = registry_.findRoom(connectionId);
    if (room.isError()) {
        reply.reject(room.error());
        return;
    }

    auto alive = alive_;
    const core::RoomId roomId = room.value().id;
    const core::TransportDirection direction = request.direction;
    engine_.createTransport(room.value().routerId, direction,
        [this, alive, connectionId, roomId, direction, reply](
            core::Result<engine::WebRtcTransportParams, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                reply.reject(result.error());
                return;
            }
            const engine::WebRtcTransportParams& params = result.value();

            auto peer = registry_.findPeer(connectionId);
            if (!peer || peer->roomId != roomId) {
                engine_.closeTransport(params.id);
                reply.reject(peerNotFound(connectionId));
                return;
            }

            session::TransportInfo transport;
            transport.id = params.id;
            transport.owner = connectionId;
            transport.direction = direction;
            auto added = registry_.addTransport(transport);
            if (added.isError()) {
                engine_.closeTransport(params.id);
                reply.reject(added.error());
                return;
            }

            TransportReply data;
            data.transportId = params.id;
            data.iceParameters = params.iceParameters;
            data.iceCandidates = params.iceCandidates;
            data.dtlsParameters = params.dtlsParameters;
            reply.resolve(std::move(data));
        });
}

void SignalingHandler::connectTransport(
    const ClientContext& client,
    const ConnectTransportRequest& request,
    Reply<Ack> reply)
{
    if (!registry_.findPeer(client.connectionId)) {
        reply.reject(peerNotFound(client.connectionId));
        return;
    }
    auto transport = registry_.findOwnedTransport(client.connectionId, request.transportId);
    if (transport.isError()) {
        reply.reject(transport.error());
        return;
    }

    engine_.connectTransport(request.transportId, request.dtlsParameters,
        [reply](core::Result<void, core::Error> result) {
            if (result.isError()) {
                reply.reject(result.error());
                return;
            }
            reply.resolve(Ack{});
        });
}

// =============================================================================
// produce
// =============================================================================

void SignalingHandler::produce(
    const ClientContext& client,
    const ProduceRequest& request,
    Reply<ProduceReply> reply)
{
    const ConnectionId connectionId = client.connectionId;
    auto peer = registry_.findPeer(connectionId);
    if (!peer) {
        reply.reject(peerNotFound(connectionId));
        return;
    }
    auto transport = registry_.findOwnedTransport(connectionId, request.transportId);
    if (transport.isError()) {
        reply.reject(transport.error());
        return;
    }
    if (transport.value().direction != core::TransportDirection::Send) {
        reply.reject(core::Error(core::ErrorCode::TransportError,
                                 "Transport is not a send transport", request.transportId));
        return;
    }

    core::JsonValue appData = request.appData;
    appData.set("userId", core::JsonValue::string(peer->userId));
    appData.set("mediaRole", core::JsonValue::string(core::mediaRoleToString(request.mediaRole)));

    auto alive = alive_;
    const ProduceRequest produced = request;
    engine_.produce(request.transportId, request.kind, request.rtpParameters, appData,
        [this, alive, connectionId, produced, reply](core::Result<core::ProducerId, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                reply.reject(result.error());
                return;
            }
            const core::ProducerId producerId = result.value();

            auto owner = registry_.findPeer(connectionId);
            auto transport = registry_.findOwnedTransport(connectionId, produced.transportId);
            if (!owner || transport.isError()) {
                engine_.closeProducer(producerId);
                reply.reject(owner ? transport.error() : peerNotFound(connectionId));
                return;
            }

            session::ProducerInfo producer;
            producer.id = producerId;
            producer.owner = connectionId;
            producer.transportId = produced.transportId;
            producer.kind = produced.kind;
            producer.mediaRole = produced.mediaRole;
            producer.createdAt = std::chrono::steady_clock::now();
            auto added = registry_.addProducer(producer);
            if (added.isError()) {
                engine_.closeProducer(producerId);
                reply.reject(added.error());
                return;
            }

            reply.resolve(ProduceReply{producerId});
            announceProducer(*owner, producer);
            recorder_.onProducerCreated(connectionId, producerId);
        });
}

// =============================================================================
// consume
// =============================================================================

void SignalingHandler::consume(
    const ClientContext& client,
    const ConsumeRequest& request,
    Reply<ConsumeReply> reply)
{
    const ConnectionId connectionId = client.connectionId;
    auto peer = registry_.findPeer(connectionId);
    if (!peer) {
        reply.reject(peerNotFound(connectionId));
        return;
    }
    auto room = registry_.findRoomById(peer->roomId);
    if (!room) {
        reply.reject(core::Error(core::ErrorCode::RoomError, "Room not found", peer->roomId));
        return;
    }

    auto producer = registry_.findProducer(request.producerId);
    if (!producer) {
        reply.reject(producerNotFound(request.producerId));
        return;
    }
    auto owner = registry_.findPeer(producer->owner);
    if (!owner || owner->roomId != peer->roomId) {
        reply.reject(core::Error(core::ErrorCode::RoomError,
                                 "Producer is not in this room", request.producerId));
        return;
    }
    if (!policy_.canAccessStream(peer->role, owner->role)) {
        reply.reject(core::Error(core::ErrorCode::Authorization,
            "Not allowed to consume this producer",
            std::string(core::roleToString(peer->role)) + " -> " + core::roleToString(owner->role)));
        return;
    }

    const core::RouterId routerId = room->routerId;
    auto recv = registry_.findTransportByDirection(connectionId, core::TransportDirection::Recv);
    if (recv) {
        consumeOn(client, request, routerId, recv->id, reply);
        return;
    }

    auto alive = alive_;
    const core::RoomId roomId = peer->roomId;
    engine_.createTransport(routerId, core::TransportDirection::Recv,
        [this, alive, client, request, routerId, roomId, reply](
            core::Result<engine::WebRtcTransportParams, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                reply.reject(result.error());
                return;
            }
            const core::TransportId transportId = result.value().id;

            auto current = registry_.findPeer(client.connectionId);
            if (!current || current->roomId != roomId) {
                engine_.closeTransport(transportId);
                reply.reject(peerNotFound(client.connectionId));
                return;
            }

            session::TransportInfo transport;
            transport.id = transportId;
            transport.owner = client.connectionId;
            transport.direction = core::TransportDirection::Recv;
            auto added = registry_.addTransport(transport);
            if (added.isError()) {
                engine_.closeTransport(transportId);
                reply.reject(added.error());
                return;
            }
            consumeOn(client, request, routerId, transportId, reply);
        });
}

void SignalingHandler::consumeOn(
    const ClientContext& client,
    const ConsumeRequest& request,
    const core::RouterId& routerId,
    const core::TransportId& transportId,
    Reply<ConsumeReply> reply)
{
    auto alive = alive_;
    const ConnectionId connectionId = client.connectionId;
    const core::ProducerId producerId = request.producerId;
    engine_.consume(routerId, transportId, producerId, request.rtpCapabilities, false,
        [this, alive, connectionId, producerId, transportId, reply](
            core::Result<engine::ConsumerParams, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                reply.reject(result.error());
                return;
            }
            const engine::ConsumerParams& params = result.value();

            if (!registry_.findPeer(connectionId)) {
                engine_.closeConsumer(params.id);
                reply.reject(peerNotFound(connectionId));
                return;
            }
            auto transport = registry_.findOwnedTransport(connectionId, transportId);
            if (transport.isError()) {
                engine_.closeConsumer(params.id);
                reply.reject(transport.error());
                return;
            }

            session::ConsumerInfo consumer;
            consumer.id = params.id;
            consumer.owner = connectionId;
            consumer.producerId = producerId;
            consumer.transportId = transportId;
            auto added = registry_.addConsumer(consumer);
            if (added.isError()) {
                engine_.closeConsumer(params.id);
                reply.reject(added.error());
                return;
            }

            ConsumeReply data;
            data.consumerId = params.id;
            data.producerId = producerId;
            data.kind = params.kind;
            data.rtpParameters = params.rtpParameters;
            reply.resolve(std::move(data));
        });
}

// =============================================================================
// get-producers / close-producer
// =============================================================================

void SignalingHandler::getProducers(const ClientContext& client, Reply<Ack> reply) {
    auto peer = registry_.findPeer(client.connectionId);
    if (!peer) {
        reply.reject(peerNotFound(client.connectionId));
        return;
    }
    reply.resolve(Ack{});
    pushExistingProducers(*peer);
}

void SignalingHandler::closeProducer(
    const ClientContext& client,
    const CloseProducerRequest& request,
    Reply<Ack> reply)
{
    auto peer = registry_.findPeer(client.connectionId);
    if (!peer) {
        reply.reject(peerNotFound(client.connectionId));
        return;
    }
    auto producer = registry_.findProducer(request.producerId);
    if (!producer) {
        reply.reject(producerNotFound(request.producerId));
        return;
    }
    if (producer->owner != client.connectionId) {
        reply.reject(core::Error(core::ErrorCode::Authorization,
                                 "Producer belongs to another peer", request.producerId));
        return;
    }

    auto removal = registry_.removeProducer(request.producerId);
    if (removal.isError()) {
        reply.reject(removal.error());
        return;
    }
    releaseProducer(removal.value(), *peer);
    reply.resolve(Ack{});
}

// =============================================================================
// disconnect
// =============================================================================

void SignalingHandler::disconnect(ConnectionId connectionId) {
    joining_.erase(connectionId);

    auto left = registry_.leave(connectionId);
    if (left.isError()) {
        logger_->debug("Connection " + std::to_string(connectionId) +
                       " closed without joining", LOG_CATEGORY);
        return;
    }
    releasePeer(left.value());
}

// =============================================================================
// Helpers
// =============================================================================

void SignalingHandler::releasePeer(const session::LeaveOutcome& outcome) {
    const session::PeerInfo& peer = outcome.peer;

    recorder_.onPeerLeft(outcome, recording::ExitReason::Disconnect);

    for (const auto& consumer : outcome.remoteConsumers) {
        engine_.closeConsumer(consumer.id);
    }
    for (const auto& consumerId : peer.consumers) {
        engine_.closeConsumer(consumerId);
    }
    for (const auto& producerId : peer.producers) {
        engine_.closeProducer(producerId);
    }
    for (const auto& transportId : peer.transports) {
        engine_.closeTransport(transportId);
    }

    if (!outcome.roomDeleted && !peer.producers.empty()) {
        auto viewers = policy_.permittedViewers(registry_, peer.roomId, peer.role, peer.connectionId);
        for (const auto& producerId : peer.producers) {
            core::JsonValue data = core::JsonValue::object();
            data.set("producerId", core::JsonValue::string(producerId));
            for (ConnectionId viewer : viewers) {
                notifier_.push(viewer, events::PRODUCER_CLOSED, data);
            }
        }
    }

    if (outcome.roomDeleted && !outcome.routerToClose.empty()) {
        engine_.closeRouter(outcome.routerToClose);
    }
}

void SignalingHandler::releaseProducer(
    const session::ProducerRemoval& removal,
    const session::PeerInfo& owner)
{
    for (const auto& consumer : removal.consumers) {
        engine_.closeConsumer(consumer.id);
    }
    engine_.closeProducer(removal.producer.id);
    recorder_.onProducerClosed(removal);

    core::JsonValue data = core::JsonValue::object();
    data.set("producerId", core::JsonValue::string(removal.producer.id));
    for (ConnectionId viewer :
         policy_.permittedViewers(registry_, owner.roomId, owner.role, owner.connectionId)) {
        notifier_.push(viewer, events::PRODUCER_CLOSED, data);
    }
}

void SignalingHandler::pushExistingProducers(const session::PeerInfo& peer) {
    auto producers = policy_.accessibleProducers(registry_, peer.roomId, peer.role,
                                                 peer.connectionId);
    notifier_.push(peer.connectionId, events::EXISTING_PRODUCERS, producerList(producers));
}

void SignalingHandler::announceProducer(
    const session::PeerInfo& owner,
    const session::ProducerInfo& producer)
{
    session::VisibleProducer visible;
    visible.producerId = producer.id;
    visible.userId = owner.userId;
    visible.mediaRole = producer.mediaRole;
    visible.kind = producer.kind;

    const core::JsonValue data = producerAnnouncement(visible);
    for (ConnectionId viewer :
         policy_.permittedViewers(registry_, owner.roomId, owner.role, owner.connectionId)) {
        notifier_.push(viewer, events::NEW_PRODUCER, data);
    }
}

void SignalingHandler::onRegistryEvent(const session::SessionEvent& event) {
    using Type = session::SessionEvent::Type;

    core::LogContext context;
    context.roomId = event.roomId;
    context.connectionId = event.connectionId;
    context.userId = event.userId;

    core::SessionEventType type = core::SessionEventType::RoomCreated;
    switch (event.type) {
        case Type::RoomCreated: type = core::SessionEventType::RoomCreated; break;
        case Type::RoomClosed: type = core::SessionEventType::RoomClosed; break;
        case Type::PeerJoined: type = core::SessionEventType::PeerJoined; break;
        case Type::PeerLeft: type = core::SessionEventType::PeerLeft; break;
        case Type::ProducerAdded:
            type = core::SessionEventType::ProducerCreated;
            context.producerId = event.resourceId;
            break;
        case Type::ProducerRemoved:
            type = core::SessionEventType::ProducerClosed;
            context.producerId = event.resourceId;
            break;
        case Type::ConsumerAdded: type = core::SessionEventType::ConsumerCreated; break;
    }
    logger_->logSessionEvent(type, context, event.resourceId);
}

} // namespace signaling
} // namespace proctorsfu
