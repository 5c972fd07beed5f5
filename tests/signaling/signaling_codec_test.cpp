// ProctorSFU - Exam Proctoring Media Server
// Tests for the signaling JSON codec

#include <gtest/gtest.h>

#include "proctorsfu/signaling/signaling_codec.hpp"

namespace proctorsfu {
namespace signaling {
namespace test {

namespace {

core::JsonValue parse(const std::string& text) {
    auto parsed = core::JsonValue::parse(text);
    EXPECT_TRUE(parsed.isSuccess()) << text;
    return parsed.isSuccess() ? parsed.value() : core::JsonValue();
}

} // anonymous namespace

// =============================================================================
// Envelope
// =============================================================================

TEST(SignalingCodecTest, DecodeEnvelope) {
    auto envelope = decodeEnvelope(R"({"event":"join-room","ackId":7,"data":{"roomId":"r1"}})");

    ASSERT_TRUE(envelope.isSuccess());
    EXPECT_EQ(envelope.value().event, "join-room");
    EXPECT_EQ(envelope.value().ackId.value_or(-1), 7);
    EXPECT_EQ(envelope.value().data["roomId"].getString(), "r1");
}

TEST(SignalingCodecTest, DecodeEnvelopeWithoutAckId) {
    auto envelope = decodeEnvelope(R"({"event":"disconnect"})");

    ASSERT_TRUE(envelope.isSuccess());
    EXPECT_FALSE(envelope.value().ackId.has_value());
    EXPECT_TRUE(envelope.value().data.isNull());
}

TEST(SignalingCodecTest, MalformedEnvelopes) {
    EXPECT_EQ(decodeEnvelope("{not json").error().code, core::ErrorCode::ValidationError);
    EXPECT_EQ(decodeEnvelope("[1,2]").error().code, core::ErrorCode::ValidationError);
    EXPECT_EQ(decodeEnvelope(R"({"ackId":1})").error().code, core::ErrorCode::ValidationError);
    EXPECT_EQ(decodeEnvelope(R"({"event":""})").error().code, core::ErrorCode::ValidationError);
}

TEST(SignalingCodecTest, PeekAckId) {
    EXPECT_EQ(peekAckId(R"({"ackId":3})").value_or(-1), 3);
    EXPECT_FALSE(peekAckId("garbage").has_value());
}

TEST(SignalingCodecTest, EncodeSuccess) {
    core::JsonValue data = core::JsonValue::object();
    data.set("producerId", core::JsonValue::string("p1"));

    auto reply = parse(encodeSuccess(5, data));

    EXPECT_EQ(reply["ackId"].getInt(), 5);
    EXPECT_TRUE(reply["ok"].getBool());
    EXPECT_EQ(reply["data"]["producerId"].getString(), "p1");
}

TEST(SignalingCodecTest, EncodeFailureCarriesTaxonomyCode) {
    auto reply = parse(encodeFailure(9, core::Error(core::ErrorCode::Authorization, "nope")));

    EXPECT_EQ(reply["ackId"].getInt(), 9);
    EXPECT_FALSE(reply["ok"].getBool(true));
    EXPECT_EQ(reply["error"]["code"].getString(), "AUTHZ_ERROR");
    EXPECT_EQ(reply["error"]["message"].getString(), "nope");
}

TEST(SignalingCodecTest, EncodePush) {
    auto push = parse(encodePush(events::PRODUCER_CLOSED, core::JsonValue::string("p1")));

    EXPECT_EQ(push["event"].getString(), "producer-closed");
    EXPECT_EQ(push["data"].getString(), "p1");
    EXPECT_FALSE(push.contains("ackId"));
}

// =============================================================================
// Requests
// =============================================================================

TEST(SignalingCodecTest, DecodeJoinRoom) {
    auto request = decodeJoinRoom(parse(
        R"({"roomId":"batch-1","role":"student","examId":"e1","batchId":42})"));

    ASSERT_TRUE(request.isSuccess());
    EXPECT_EQ(request.value().roomId, "batch-1");
    EXPECT_EQ(request.value().role, core::Role::Student);
    EXPECT_EQ(request.value().examId.value_or(""), "e1");
    EXPECT_EQ(request.value().batchId.value_or(""), "42");
}

TEST(SignalingCodecTest, DecodeJoinRoomRejectsUnknownRole) {
    auto request = decodeJoinRoom(parse(R"({"roomId":"r","role":"proctor"})"));

    ASSERT_TRUE(request.isError());
    EXPECT_EQ(request.error().code, core::ErrorCode::ValidationError);
}

TEST(SignalingCodecTest, DecodeJoinRoomRequiresRoomId) {
    EXPECT_TRUE(decodeJoinRoom(parse(R"({"role":"student"})")).isError());
    EXPECT_TRUE(decodeJoinRoom(parse(R"({"roomId":"","role":"student"})")).isError());
}

TEST(SignalingCodecTest, DecodeCreateTransport) {
    EXPECT_EQ(decodeCreateTransport(parse(R"({"direction":"recv"})")).value().direction,
              core::TransportDirection::Recv);
    EXPECT_TRUE(decodeCreateTransport(parse(R"({"direction":"both"})")).isError());
}

TEST(SignalingCodecTest, DecodeConnectTransport) {
    auto request = decodeConnectTransport(parse(
        R"({"transportId":"t1","dtlsParameters":{"role":"client"}})"));

    ASSERT_TRUE(request.isSuccess());
    EXPECT_EQ(request.value().transportId, "t1");
    EXPECT_EQ(request.value().dtlsParameters["role"].getString(), "client");

    EXPECT_TRUE(decodeConnectTransport(parse(R"({"transportId":"t1"})")).isError());
}

TEST(SignalingCodecTest, DecodeProduce) {
    auto request = decodeProduce(parse(
        R"({"transportId":"t1","kind":"video","rtpParameters":{},"appData":{"mediaRole":"screen"}})"));

    ASSERT_TRUE(request.isSuccess());
    EXPECT_EQ(request.value().kind, core::MediaKind::Video);
    EXPECT_EQ(request.value().mediaRole, core::MediaRole::Screen);
}

TEST(SignalingCodecTest, DecodeProduceAcceptsTypeAlias) {
    auto request = decodeProduce(parse(
        R"({"transportId":"t1","kind":"audio","rtpParameters":{},"appData":{"type":"mic"}})"));

    ASSERT_TRUE(request.isSuccess());
    EXPECT_EQ(request.value().mediaRole, core::MediaRole::Mic);
}

TEST(SignalingCodecTest, DecodeProduceRequiresMediaRole) {
    auto request = decodeProduce(parse(R"({"transportId":"t1","kind":"video","rtpParameters":{}})"));

    ASSERT_TRUE(request.isError());
    EXPECT_NE(request.error().message.find("mediaRole"), std::string::npos);
}

TEST(SignalingCodecTest, DecodeConsumeAndCloseProducer) {
    auto consume = decodeConsume(parse(R"({"producerId":"p1","rtpCapabilities":{}})"));
    ASSERT_TRUE(consume.isSuccess());
    EXPECT_EQ(consume.value().producerId, "p1");
    EXPECT_TRUE(decodeConsume(parse(R"({"producerId":"p1"})")).isError());

    EXPECT_EQ(decodeCloseProducer(parse(R"({"producerId":"p2"})")).value().producerId, "p2");
    EXPECT_TRUE(decodeCloseProducer(parse("{}")).isError());
}

// =============================================================================
// Replies
// =============================================================================

TEST(SignalingCodecTest, ConsumeReplyJson) {
    ConsumeReply reply;
    reply.consumerId = "c1";
    reply.producerId = "p1";
    reply.kind = core::MediaKind::Audio;
    reply.rtpParameters = core::JsonValue::object();

    core::JsonValue json = toJson(reply);

    EXPECT_EQ(json["consumerId"].getString(), "c1");
    EXPECT_EQ(json["producerId"].getString(), "p1");
    EXPECT_EQ(json["kind"].getString(), "audio");
    EXPECT_TRUE(json["rtpParameters"].isObject());
}

TEST(SignalingCodecTest, ProducerListJson) {
    session::VisibleProducer producer;
    producer.producerId = "p1";
    producer.userId = "alice";
    producer.mediaRole = core::MediaRole::Screen;
    producer.kind = core::MediaKind::Video;

    core::JsonValue list = producerList({producer});

    ASSERT_EQ(list.items().size(), 1u);
    EXPECT_EQ(list.items()[0]["producerId"].getString(), "p1");
    EXPECT_EQ(list.items()[0]["userId"].getString(), "alice");
    EXPECT_EQ(list.items()[0]["mediaRole"].getString(), "screen");
    EXPECT_EQ(list.items()[0]["kind"].getString(), "video");
}

} // namespace test
} // namespace signaling
} // namespace proctorsfu
