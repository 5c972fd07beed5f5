// ProctorSFU - Exam Proctoring Media Server
// Tests for SignalingDispatcher

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "proctorsfu/signaling/signaling_dispatcher.hpp"

namespace proctorsfu {
namespace signaling {
namespace test {

/**
 * @brief Records calls; replies are settled by the test.
 */
class MockSignalingHandler : public ISignalingHandler {
public:
    std::vector<std::string> calls;
    std::vector<ConnectionId> disconnects;
    std::vector<Reply<JoinRoomReply>> joinReplies;
    JoinRoomRequest lastJoin;
    ProduceRequest lastProduce;
    core::Role lastTokenRole = core::Role::Student;
    bool rejectAll = false;

    void joinRoom(const ClientContext& client, const JoinRoomRequest& request,
                  Reply<JoinRoomReply> reply) override {
        calls.push_back(events::JOIN_ROOM);
        lastJoin = request;
        lastTokenRole = client.identity.role.value_or(core::Role::Student);
        joinReplies.push_back(reply);
    }

    void createTransport(const ClientContext&, const CreateTransportRequest&,
                         Reply<TransportReply> reply) override {
        calls.push_back(events::CREATE_TRANSPORT);
        TransportReply data;
        data.transportId = "t1";
        settle(reply, data);
    }

    void connectTransport(const ClientContext&, const ConnectTransportRequest&,
                          Reply<Ack> reply) override {
        calls.push_back(events::CONNECT_TRANSPORT);
        settle(reply, Ack{});
    }

    void produce(const ClientContext&, const ProduceRequest& request,
                 Reply<ProduceReply> reply) override {
        calls.push_back(events::PRODUCE);
        lastProduce = request;
        settle(reply, ProduceReply{"p1"});
    }

    void consume(const ClientContext&, const ConsumeRequest& request,
                 Reply<ConsumeReply> reply) override {
        calls.push_back(events::CONSUME);
        ConsumeReply data;
        data.consumerId = "c1";
        data.producerId = request.producerId;
        data.rtpParameters = core::JsonValue::object();
        settle(reply, data);
    }

    void getProducers(const ClientContext&, Reply<Ack> reply) override {
        calls.push_back(events::GET_PRODUCERS);
        settle(reply, Ack{});
    }

    void closeProducer(const ClientContext&, const CloseProducerRequest&,
                       Reply<Ack> reply) override {
        calls.push_back(events::CLOSE_PRODUCER);
        settle(reply, Ack{});
    }

    void disconnect(ConnectionId connectionId) override {
        disconnects.push_back(connectionId);
    }

private:
    template<typename T>
    void settle(const Reply<T>& reply, T value) {
        if (rejectAll) {
            reply.reject(core::Error(core::ErrorCode::RoomError, "rejected"));
        } else {
            reply.resolve(std::move(value));
        }
    }
};

class SignalingDispatcherTest : public ::testing::Test {
protected:
    SignalingDispatcherTest()
        : dispatcher_(handler_, [this](ConnectionId connectionId, const std::string& text) {
              sent_.emplace_back(connectionId, text);
          }) {}

    ClientContext client(ConnectionId connectionId = 1) {
        ClientContext context;
        context.connectionId = connectionId;
        context.identity.userId = "user";
        return context;
    }

    core::JsonValue lastSent() {
        EXPECT_FALSE(sent_.empty());
        if (sent_.empty()) {
            return core::JsonValue();
        }
        auto parsed = core::JsonValue::parse(sent_.back().second);
        EXPECT_TRUE(parsed.isSuccess());
        return parsed.isSuccess() ? parsed.value() : core::JsonValue();
    }

    MockSignalingHandler handler_;
    std::vector<std::pair<ConnectionId, std::string>> sent_;
    SignalingDispatcher dispatcher_;
};

TEST_F(SignalingDispatcherTest, RoutesJoinRoom) {
    dispatcher_.dispatch(client(), R"({"event":"join-room","ackId":1,"data":{"roomId":"r1","role":"invigilator"}})");

    ASSERT_EQ(handler_.calls.size(), 1u);
    EXPECT_EQ(handler_.lastJoin.roomId, "r1");
    EXPECT_EQ(handler_.lastJoin.role, core::Role::Invigilator);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(SignalingDispatcherTest, DeferredReplyCarriesAckId) {
    dispatcher_.dispatch(client(4), R"({"event":"join-room","ackId":12,"data":{"roomId":"r1","role":"student"}})");
    ASSERT_EQ(handler_.joinReplies.size(), 1u);

    core::JsonValue caps = core::JsonValue::object();
    caps.set("codecs", core::JsonValue::array());
    handler_.joinReplies[0].resolve(JoinRoomReply{caps});

    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].first, 4u);
    core::JsonValue reply = lastSent();
    EXPECT_EQ(reply["ackId"].getInt(), 12);
    EXPECT_TRUE(reply["ok"].getBool());
    EXPECT_TRUE(reply["data"]["routerCapabilities"]["codecs"].isArray());
}

TEST_F(SignalingDispatcherTest, ReplyIsSentOnlyOnce) {
    dispatcher_.dispatch(client(), R"({"event":"join-room","ackId":1,"data":{"roomId":"r1","role":"student"}})");

    handler_.joinReplies[0].reject(core::Error(core::ErrorCode::EngineError, "first"));
    handler_.joinReplies[0].reject(core::Error(core::ErrorCode::EngineError, "second"));

    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(lastSent()["error"]["message"].getString(), "first");
}

TEST_F(SignalingDispatcherTest, ProduceReply) {
    dispatcher_.dispatch(client(), R"({"event":"produce","ackId":2,"data":{"transportId":"t1","kind":"audio","rtpParameters":{},"appData":{"mediaRole":"mic"}}})");

    EXPECT_EQ(handler_.lastProduce.mediaRole, core::MediaRole::Mic);
    core::JsonValue reply = lastSent();
    EXPECT_EQ(reply["ackId"].getInt(), 2);
    EXPECT_EQ(reply["data"]["producerId"].getString(), "p1");
}

TEST_F(SignalingDispatcherTest, HandlerErrorIsEncoded) {
    handler_.rejectAll = true;

    dispatcher_.dispatch(client(), R"({"event":"get-producers","ackId":3})");

    core::JsonValue reply = lastSent();
    EXPECT_FALSE(reply["ok"].getBool(true));
    EXPECT_EQ(reply["error"]["code"].getString(), "ROOM_ERROR");
}

TEST_F(SignalingDispatcherTest, RoutesEveryRequestEvent) {
    dispatcher_.dispatch(client(), R"({"event":"create-transport","ackId":1,"data":{"direction":"send"}})");
    dispatcher_.dispatch(client(), R"({"event":"connect-transport","ackId":2,"data":{"transportId":"t1","dtlsParameters":{}}})");
    dispatcher_.dispatch(client(), R"({"event":"consume","ackId":3,"data":{"producerId":"p1","rtpCapabilities":{}}})");
    dispatcher_.dispatch(client(), R"({"event":"close-producer","ackId":4,"data":{"producerId":"p1"}})");

    std::vector<std::string> expected = {
        events::CREATE_TRANSPORT, events::CONNECT_TRANSPORT, events::CONSUME, events::CLOSE_PRODUCER
    };
    EXPECT_EQ(handler_.calls, expected);
    ASSERT_EQ(sent_.size(), 4u);
    EXPECT_EQ(lastSent()["ackId"].getInt(), 4);
}

TEST_F(SignalingDispatcherTest, MalformedJsonIsValidationError) {
    dispatcher_.dispatch(client(), "{broken");

    core::JsonValue reply = lastSent();
    EXPECT_EQ(reply["error"]["code"].getString(), "VALIDATION_ERROR");
    EXPECT_FALSE(reply.contains("ackId"));
    EXPECT_TRUE(handler_.calls.empty());
}

TEST_F(SignalingDispatcherTest, InvalidPayloadKeepsAckId) {
    dispatcher_.dispatch(client(), R"({"event":"consume","ackId":8,"data":{}})");

    core::JsonValue reply = lastSent();
    EXPECT_EQ(reply["ackId"].getInt(), 8);
    EXPECT_EQ(reply["error"]["code"].getString(), "VALIDATION_ERROR");
    EXPECT_TRUE(handler_.calls.empty());
}

TEST_F(SignalingDispatcherTest, UnknownEventIsValidationError) {
    dispatcher_.dispatch(client(), R"({"event":"teleport","ackId":5})");

    core::JsonValue reply = lastSent();
    EXPECT_EQ(reply["ackId"].getInt(), 5);
    EXPECT_EQ(reply["error"]["message"].getString(), "Unknown event");
}

TEST_F(SignalingDispatcherTest, DisconnectEventAndTransportClose) {
    dispatcher_.dispatch(client(6), R"({"event":"disconnect"})");
    dispatcher_.disconnect(7);

    EXPECT_EQ(handler_.disconnects, (std::vector<ConnectionId>{6, 7}));
    EXPECT_TRUE(sent_.empty());
}

} // namespace test
} // namespace signaling
} // namespace proctorsfu
