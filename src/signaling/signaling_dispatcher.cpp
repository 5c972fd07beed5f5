// ProctorSFU - Exam Proctoring Media Server
// Signaling Dispatcher Implementation

#include "proctorsfu/signaling/signaling_dispatcher.hpp"

#include "proctorsfu/signaling/signaling_codec.hpp"

namespace proctorsfu {
namespace signaling {

SignalingDispatcher::SignalingDispatcher(ISignalingHandler& handler, OutboundSink sink)
    : handler_(handler)
    , sink_(std::move(sink)) {
}

template<typename T>
Reply<T> SignalingDispatcher::replyFor(ConnectionId connectionId, std::optional<int64_t> ackId) {
    OutboundSink sink = sink_;
    return Reply<T>([sink, connectionId, ackId](core::Result<T, core::Error> result) {
        if (!sink) {
            return;
        }
        if (result.isSuccess()) {
            sink(connectionId, encodeSuccess(ackId, toJson(result.value())));
        } else {
            sink(connectionId, encodeFailure(ackId, result.error()));
        }
    });
}

void SignalingDispatcher::sendFailure(
    ConnectionId connectionId,
    std::optional<int64_t> ackId,
    const core::Error& error)
{
    if (sink_) {
        sink_(connectionId, encodeFailure(ackId, error));
    }
}

void SignalingDispatcher::dispatch(const ClientContext& client, const std::string& text) {
    const ConnectionId connectionId = client.connectionId;

    auto envelope = decodeEnvelope(text);
    if (envelope.isError()) {
        sendFailure(connectionId, peekAckId(text), envelope.error());
        return;
    }
    const Envelope& message = envelope.value();
    const std::string& event = message.event;
    const auto ackId = message.ackId;

    if (event == events::JOIN_ROOM) {
        auto request = decodeJoinRoom(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.joinRoom(client, request.value(), replyFor<JoinRoomReply>(connectionId, ackId));
    } else if (event == events::CREATE_TRANSPORT) {
        auto request = decodeCreateTransport(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.createTransport(client, request.value(), replyFor<TransportReply>(connectionId, ackId));
    } else if (event == events::CONNECT_TRANSPORT) {
        auto request = decodeConnectTransport(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.connectTransport(client, request.value(), replyFor<Ack>(connectionId, ackId));
    } else if (event == events::PRODUCE) {
        auto request = decodeProduce(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.produce(client, request.value(), replyFor<ProduceReply>(connectionId, ackId));
    } else if (event == events::CONSUME) {
        auto request = decodeConsume(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.consume(client, request.value(), replyFor<ConsumeReply>(connectionId, ackId));
    } else if (event == events::GET_PRODUCERS) {
        handler_.getProducers(client, replyFor<Ack>(connectionId, ackId));
    } else if (event == events::CLOSE_PRODUCER) {
        auto request = decodeCloseProducer(message.data);
        if (request.isError()) {
            sendFailure(connectionId, ackId, request.error());
            return;
        }
        handler_.closeProducer(client, request.value(), replyFor<Ack>(connectionId, ackId));
    } else if (event == events::DISCONNECT) {
        handler_.disconnect(connectionId);
    } else {
        sendFailure(connectionId, ackId,
                    core::Error(core::ErrorCode::ValidationError, "Unknown event", event));
    }
}

void SignalingDispatcher::disconnect(ConnectionId connectionId) {
    handler_.disconnect(connectionId);
}

} // namespace signaling
} // namespace proctorsfu
