// ProctorSFU - Exam Proctoring Media Server
// Tests for SignalingHandler

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "proctorsfu/signaling/signaling_handler.hpp"

#include "session_fabric.hpp"

namespace proctorsfu {
namespace signaling {
namespace test {

using core::MediaKind;
using core::MediaRole;
using core::Role;
using proctorsfu::test::Captured;
using proctorsfu::test::SessionFabric;
using proctorsfu::test::captureInto;

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

JoinRoomRequest joinRequest(Role role, const std::string& roomId = "batch-1") {
    JoinRoomRequest request;
    request.roomId = roomId;
    request.role = role;
    request.examId = "exam-1";
    request.batchId = roomId;
    return request;
}

} // anonymous namespace

class SignalingHandlerTest : public ::testing::Test {
protected:
    std::shared_ptr<Captured<Ack>> closeProducer(core::ConnectionId connectionId,
                                                 const core::ProducerId& producerId) {
        CloseProducerRequest request;
        request.producerId = producerId;
        auto slot = std::make_shared<Captured<Ack>>();
        fabric_.handler.closeProducer(SessionFabric::client(connectionId, ""), request,
                                      captureInto(slot));
        fabric_.settle();
        return slot;
    }

    std::shared_ptr<Captured<Ack>> connect(core::ConnectionId connectionId,
                                           const core::TransportId& transportId) {
        ConnectTransportRequest request;
        request.transportId = transportId;
        request.dtlsParameters = core::JsonValue::object();
        auto slot = std::make_shared<Captured<Ack>>();
        fabric_.handler.connectTransport(SessionFabric::client(connectionId, ""), request,
                                         captureInto(slot));
        fabric_.settle();
        return slot;
    }

    SessionFabric fabric_;
};

// =============================================================================
// join-room
// =============================================================================

TEST_F(SignalingHandlerTest, JoinCreatesRoomAndReturnsCapabilities) {
    auto joined = fabric_.join(1, Role::Student);

    ASSERT_TRUE(joined->ok());
    EXPECT_EQ(joined->value().routerCapabilities["router"].getString(), "router-1");
    EXPECT_EQ(fabric_.registry.roomCount(), 1u);

    auto existing = fabric_.notifier.to(1, events::EXISTING_PRODUCERS);
    ASSERT_EQ(existing.size(), 1u);
    EXPECT_TRUE(existing[0].data.isArray());
    EXPECT_TRUE(existing[0].data.items().empty());
}

TEST_F(SignalingHandlerTest, SecondJoinReusesRoomRouter) {
    fabric_.join(1, Role::Student);
    auto second = fabric_.join(2, Role::Invigilator);

    ASSERT_TRUE(second->ok());
    EXPECT_EQ(second->value().routerCapabilities["router"].getString(), "router-1");
    EXPECT_EQ(fabric_.engine->routersCreated, 1);
}

TEST_F(SignalingHandlerTest, ConcurrentJoinsShareOneRouter) {
    auto first = std::make_shared<Captured<JoinRoomReply>>();
    auto second = std::make_shared<Captured<JoinRoomReply>>();

    fabric_.handler.joinRoom(SessionFabric::client(1, "a"), joinRequest(Role::Student),
                             captureInto(first));
    fabric_.handler.joinRoom(SessionFabric::client(2, "b"), joinRequest(Role::Student),
                             captureInto(second));
    fabric_.settle();

    ASSERT_TRUE(first->ok());
    ASSERT_TRUE(second->ok());
    EXPECT_EQ(fabric_.engine->routersCreated, 1);
    EXPECT_EQ(fabric_.registry.peersInRoom("batch-1").size(), 2u);
    EXPECT_TRUE(fabric_.engine->closedRouters.empty());
}

TEST_F(SignalingHandlerTest, RouterFailureRejectsEveryWaiter) {
    fabric_.engine->failCreateRouter = true;
    auto first = std::make_shared<Captured<JoinRoomReply>>();
    auto second = std::make_shared<Captured<JoinRoomReply>>();

    fabric_.handler.joinRoom(SessionFabric::client(1, "a"), joinRequest(Role::Student),
                             captureInto(first));
    fabric_.handler.joinRoom(SessionFabric::client(2, "b"), joinRequest(Role::Student),
                             captureInto(second));
    fabric_.settle();

    ASSERT_TRUE(first->result && second->result);
    EXPECT_EQ(first->code(), core::ErrorCode::EngineError);
    EXPECT_EQ(second->code(), core::ErrorCode::EngineError);
    EXPECT_EQ(fabric_.registry.roomCount(), 0u);

    // A later join retries router creation
    fabric_.engine->failCreateRouter = false;
    EXPECT_TRUE(fabric_.join(3, Role::Student)->ok());
}

TEST_F(SignalingHandlerTest, TokenRoleMustMatchRequestedRole) {
    auto slot = std::make_shared<Captured<JoinRoomReply>>();

    fabric_.handler.joinRoom(SessionFabric::client(1, "a", Role::Student),
                             joinRequest(Role::Invigilator), captureInto(slot));
    fabric_.settle();

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::Authorization);
    EXPECT_EQ(slot->result->error().message, "Role not permitted");
    EXPECT_EQ(fabric_.engine->routersCreated, 0);
}

TEST_F(SignalingHandlerTest, MatchingTokenRoleIsAccepted) {
    auto slot = std::make_shared<Captured<JoinRoomReply>>();

    fabric_.handler.joinRoom(SessionFabric::client(1, "a", Role::Invigilator),
                             joinRequest(Role::Invigilator), captureInto(slot));
    fabric_.settle();

    EXPECT_TRUE(slot->ok());
    EXPECT_EQ(fabric_.registry.findPeer(1)->role, Role::Invigilator);
}

TEST_F(SignalingHandlerTest, DisconnectWhileRouterPendingDropsJoin) {
    auto slot = std::make_shared<Captured<JoinRoomReply>>();
    fabric_.handler.joinRoom(SessionFabric::client(1, "a"), joinRequest(Role::Student),
                             captureInto(slot));

    fabric_.handler.disconnect(1);
    fabric_.settle();

    EXPECT_EQ(slot->deliveries, 0);
    EXPECT_EQ(fabric_.registry.roomCount(), 0u);
    EXPECT_TRUE(contains(fabric_.engine->closedRouters, "router-1"));
}

TEST_F(SignalingHandlerTest, RejoinReleasesPreviousMembership) {
    auto tid = fabric_.studentWithTransport(1, "batch-1");
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    ASSERT_EQ(fabric_.orchestrator.activeCount(), 1u);
    auto encoder = fabric_.launcher.last();
    ASSERT_NE(encoder, nullptr);

    auto rejoined = fabric_.join(1, Role::Student, "batch-2");

    ASSERT_TRUE(rejoined->ok());
    EXPECT_EQ(fabric_.registry.findPeer(1)->roomId, "batch-2");
    EXPECT_TRUE(contains(fabric_.engine->closedProducers, pid));
    EXPECT_TRUE(contains(fabric_.engine->closedTransports, tid));
    EXPECT_TRUE(contains(fabric_.engine->closedRouters, "router-1"));
    EXPECT_EQ(fabric_.registry.roomCount(), 1u);
    EXPECT_EQ(fabric_.orchestrator.activeCount(), 0u);
    EXPECT_EQ(encoder->terminateCalls, 1);
    EXPECT_EQ(encoder->state(), recording::EncoderState::Exited);
    EXPECT_EQ(fabric_.ports.leasedCount(), 0u);
}

TEST_F(SignalingHandlerTest, PeerJoinIsLogged) {
    fabric_.join(1, Role::Student);

    EXPECT_TRUE(fabric_.logSink->contains("Event: room_created"));
    EXPECT_TRUE(fabric_.logSink->contains("Event: peer_joined"));
}

// =============================================================================
// Transports
// =============================================================================

TEST_F(SignalingHandlerTest, CreateTransportBeforeJoinIsPeerNotFound) {
    CreateTransportRequest request;
    auto slot = std::make_shared<Captured<TransportReply>>();

    fabric_.handler.createTransport(SessionFabric::client(1, ""), request, captureInto(slot));
    fabric_.settle();

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::PeerNotFound);
}

TEST_F(SignalingHandlerTest, CreateTransportReturnsIceAndDtls) {
    fabric_.join(1, Role::Student);
    CreateTransportRequest request;
    auto slot = std::make_shared<Captured<TransportReply>>();

    fabric_.handler.createTransport(SessionFabric::client(1, ""), request, captureInto(slot));
    fabric_.settle();

    ASSERT_TRUE(slot->ok());
    EXPECT_FALSE(slot->value().transportId.empty());
    EXPECT_EQ(slot->value().iceParameters["usernameFragment"].getString(), "ufrag");
    EXPECT_TRUE(slot->value().dtlsParameters.isObject());
    EXPECT_TRUE(fabric_.registry.findOwnedTransport(1, slot->value().transportId).isSuccess());
}

TEST_F(SignalingHandlerTest, TransportCreatedAfterLeaveIsClosed) {
    fabric_.join(1, Role::Student);
    fabric_.join(2, Role::Student);
    CreateTransportRequest request;
    auto slot = std::make_shared<Captured<TransportReply>>();

    fabric_.handler.createTransport(SessionFabric::client(1, ""), request, captureInto(slot));
    fabric_.handler.disconnect(1);
    fabric_.settle();

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::PeerNotFound);
    EXPECT_EQ(fabric_.engine->closedTransports.size(), 1u);
    EXPECT_TRUE(fabric_.engine->openTransports.empty());
}

TEST_F(SignalingHandlerTest, ConnectTransport) {
    auto tid = fabric_.studentWithTransport(1);

    EXPECT_TRUE(connect(1, tid)->ok());
    EXPECT_EQ(fabric_.engine->connectedTransports.count(tid), 1u);
}

TEST_F(SignalingHandlerTest, ConnectForeignTransportIsTransportError) {
    auto tid = fabric_.studentWithTransport(1);
    fabric_.join(2, Role::Student);

    auto slot = connect(2, tid);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::TransportError);
}

// =============================================================================
// produce
// =============================================================================

TEST_F(SignalingHandlerTest, ProduceRegistersProducer) {
    auto tid = fabric_.studentWithTransport(1);

    auto slot = fabric_.produce(1, tid, MediaKind::Video, MediaRole::Webcam);

    ASSERT_TRUE(slot->ok());
    auto producer = fabric_.registry.findProducer(slot->value().producerId);
    ASSERT_TRUE(producer.has_value());
    EXPECT_EQ(producer->owner, 1u);
    EXPECT_EQ(producer->mediaRole, MediaRole::Webcam);

    const core::JsonValue& appData = fabric_.engine->producerAppData[slot->value().producerId];
    EXPECT_EQ(appData["userId"].getString(), "user-1");
    EXPECT_EQ(appData["mediaRole"].getString(), "webcam");
}

TEST_F(SignalingHandlerTest, ProduceOnRecvTransportIsRejected) {
    fabric_.join(1, Role::Student);
    auto recv = fabric_.createTransport(1, core::TransportDirection::Recv);

    auto slot = fabric_.produce(1, recv, MediaKind::Video, MediaRole::Webcam);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::TransportError);
    EXPECT_TRUE(fabric_.engine->openProducers.empty());
}

TEST_F(SignalingHandlerTest, ProduceOnForeignTransportIsRejected) {
    auto tid = fabric_.studentWithTransport(1);
    fabric_.join(2, Role::Student);

    auto slot = fabric_.produce(2, tid, MediaKind::Video, MediaRole::Webcam);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::TransportError);
}

TEST_F(SignalingHandlerTest, ProduceBeforeJoinIsPeerNotFound) {
    auto slot = fabric_.produce(1, "transport-x", MediaKind::Video, MediaRole::Webcam);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::PeerNotFound);
}

TEST_F(SignalingHandlerTest, ProducerCreatedAfterLeaveIsClosed) {
    auto tid = fabric_.studentWithTransport(1);
    fabric_.join(2, Role::Student);

    auto slot = fabric_.produce(1, tid, MediaKind::Video, MediaRole::Webcam, false);
    fabric_.handler.disconnect(1);
    fabric_.settle();

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::PeerNotFound);
    EXPECT_TRUE(fabric_.engine->openProducers.empty());
    EXPECT_EQ(fabric_.orchestrator.activeCount(), 0u);
}

TEST_F(SignalingHandlerTest, InvigilatorIsToldAboutNewStudentProducer) {
    fabric_.join(10, Role::Invigilator);
    fabric_.join(2, Role::Student);
    auto tid = fabric_.studentWithTransport(1);
    fabric_.notifier.clear();

    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Screen);

    auto announced = fabric_.notifier.to(10, events::NEW_PRODUCER);
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].data["producerId"].getString(), pid);
    EXPECT_EQ(announced[0].data["userId"].getString(), "user-1");
    EXPECT_EQ(announced[0].data["mediaRole"].getString(), "screen");
    EXPECT_EQ(announced[0].data["kind"].getString(), "video");

    EXPECT_TRUE(fabric_.notifier.to(2, events::NEW_PRODUCER).empty());
    EXPECT_TRUE(fabric_.notifier.to(1, events::NEW_PRODUCER).empty());
}

TEST_F(SignalingHandlerTest, AdminIsNotToldAboutStudentProducers) {
    fabric_.join(20, Role::Admin);
    auto tid = fabric_.studentWithTransport(1);

    fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);

    EXPECT_TRUE(fabric_.notifier.to(20, events::NEW_PRODUCER).empty());
}

TEST_F(SignalingHandlerTest, LateInvigilatorReceivesExistingProducers) {
    auto tid = fabric_.studentWithTransport(1);
    fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.publish(1, tid, MediaKind::Audio, MediaRole::Mic);

    fabric_.join(10, Role::Invigilator);

    auto existing = fabric_.notifier.to(10, events::EXISTING_PRODUCERS);
    ASSERT_EQ(existing.size(), 1u);
    EXPECT_EQ(existing[0].data.items().size(), 2u);
}

TEST_F(SignalingHandlerTest, GetProducersResolvesThenPushes) {
    auto tid = fabric_.studentWithTransport(1);
    fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);
    fabric_.notifier.clear();

    auto slot = std::make_shared<Captured<Ack>>();
    fabric_.handler.getProducers(SessionFabric::client(10, ""), captureInto(slot));
    fabric_.settle();

    EXPECT_TRUE(slot->ok());
    auto existing = fabric_.notifier.to(10, events::EXISTING_PRODUCERS);
    ASSERT_EQ(existing.size(), 1u);
    EXPECT_EQ(existing[0].data.items().size(), 1u);
}

// =============================================================================
// consume
// =============================================================================

TEST_F(SignalingHandlerTest, InvigilatorConsumesStudentStream) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);

    auto slot = fabric_.consume(10, pid);

    ASSERT_TRUE(slot->ok());
    EXPECT_EQ(slot->value().producerId, pid);
    EXPECT_EQ(slot->value().kind, MediaKind::Video);
    EXPECT_TRUE(slot->value().rtpParameters["codecs"].isArray());
    EXPECT_FALSE(fabric_.engine->consumeCalls.back().paused);

    auto recv = fabric_.registry.findTransportByDirection(10, core::TransportDirection::Recv);
    ASSERT_TRUE(recv.has_value());
    EXPECT_EQ(fabric_.registry.findConsumer(slot->value().consumerId)->transportId, recv->id);
}

TEST_F(SignalingHandlerTest, ConsumeReusesRecvTransport) {
    auto tid = fabric_.studentWithTransport(1);
    auto video = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    auto audio = fabric_.publish(1, tid, MediaKind::Audio, MediaRole::Mic);
    fabric_.join(10, Role::Invigilator);

    auto first = fabric_.consume(10, video);
    auto second = fabric_.consume(10, audio);

    ASSERT_TRUE(first->ok());
    ASSERT_TRUE(second->ok());
    EXPECT_EQ(fabric_.registry.findConsumer(first->value().consumerId)->transportId,
              fabric_.registry.findConsumer(second->value().consumerId)->transportId);
    EXPECT_EQ(fabric_.registry.findPeer(10)->transports.size(), 1u);
}

TEST_F(SignalingHandlerTest, StudentCannotConsumeStudent) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(2, Role::Student);

    auto slot = fabric_.consume(2, pid);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::Authorization);
}

TEST_F(SignalingHandlerTest, ConsumeUnknownProducerIsRoomError) {
    fabric_.join(10, Role::Invigilator);

    auto slot = fabric_.consume(10, "producer-missing");

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::RoomError);
}

TEST_F(SignalingHandlerTest, ConsumeAcrossRoomsIsRoomError) {
    auto tid = fabric_.studentWithTransport(1, "batch-1");
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator, "batch-2");

    auto slot = fabric_.consume(10, pid);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::RoomError);
    EXPECT_EQ(slot->result->error().message, "Producer is not in this room");
}

TEST_F(SignalingHandlerTest, IncompatibleCapabilitiesAreEngineError) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);
    fabric_.engine->rejectConsume = true;

    auto slot = fabric_.consume(10, pid);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::EngineError);
    EXPECT_TRUE(fabric_.registry.findPeer(10)->consumers.empty());
}

// =============================================================================
// close-producer
// =============================================================================

TEST_F(SignalingHandlerTest, OwnerClosesProducer) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);
    auto consumed = fabric_.consume(10, pid);
    ASSERT_TRUE(consumed->ok());

    auto slot = closeProducer(1, pid);

    ASSERT_TRUE(slot->ok());
    EXPECT_FALSE(fabric_.registry.findProducer(pid).has_value());
    EXPECT_TRUE(contains(fabric_.engine->closedProducers, pid));
    EXPECT_TRUE(contains(fabric_.engine->closedConsumers, consumed->value().consumerId));

    auto closed = fabric_.notifier.to(10, events::PRODUCER_CLOSED);
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0].data["producerId"].getString(), pid);
}

TEST_F(SignalingHandlerTest, OtherPeerCannotCloseProducer) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);

    auto slot = closeProducer(10, pid);

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::Authorization);
    EXPECT_TRUE(fabric_.registry.findProducer(pid).has_value());
}

TEST_F(SignalingHandlerTest, CloseUnknownProducerIsRoomError) {
    fabric_.join(1, Role::Student);

    auto slot = closeProducer(1, "nope");

    ASSERT_TRUE(slot->result.has_value());
    EXPECT_EQ(slot->code(), core::ErrorCode::RoomError);
}

// =============================================================================
// disconnect
// =============================================================================

TEST_F(SignalingHandlerTest, DisconnectReleasesPeerResources) {
    auto tid = fabric_.studentWithTransport(1);
    auto pid = fabric_.publish(1, tid, MediaKind::Video, MediaRole::Webcam);
    fabric_.join(10, Role::Invigilator);
    auto consumed = fabric_.consume(10, pid);
    fabric_.notifier.clear();

    fabric_.disconnect(1);

    EXPECT_FALSE(fabric_.registry.findPeer(1).has_value());
    EXPECT_TRUE(contains(fabric_.engine->closedProducers, pid));
    EXPECT_TRUE(contains(fabric_.engine->closedTransports, tid));
    EXPECT_TRUE(contains(fabric_.engine->closedConsumers, consumed->value().consumerId));
    EXPECT_TRUE(fabric_.registry.findPeer(10)->consumers.empty());
    EXPECT_EQ(fabric_.notifier.to(10, events::PRODUCER_CLOSED).size(), 1u);
    EXPECT_TRUE(fabric_.engine->closedRouters.empty());
}

TEST_F(SignalingHandlerTest, LastPeerLeavingClosesRouter) {
    fabric_.join(1, Role::Student);

    fabric_.disconnect(1);

    EXPECT_EQ(fabric_.registry.roomCount(), 0u);
    EXPECT_EQ(fabric_.engine->closedRouters, std::vector<std::string>{"router-1"});
    EXPECT_TRUE(fabric_.engine->openRouters.empty());
}

TEST_F(SignalingHandlerTest, DisconnectOfUnknownConnectionIsHarmless) {
    fabric_.disconnect(77);

    EXPECT_EQ(fabric_.registry.peerCount(), 0u);
    EXPECT_TRUE(fabric_.logSink->contains("closed without joining"));
}

} // namespace test
} // namespace signaling
} // namespace proctorsfu
