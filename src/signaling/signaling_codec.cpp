// ProctorSFU - Exam Proctoring Media Server
// Signaling Codec Implementation

#include "proctorsfu/signaling/signaling_codec.hpp"

namespace proctorsfu {
namespace signaling {

namespace {

core::Error invalid(const std::string& message) {
    return core::Error(core::ErrorCode::ValidationError, message);
}

core::Error missingField(const std::string& field) {
    return invalid("Missing or invalid field: " + field);
}

/**
 * @brief Non-empty string member, or nothing.
 */
std::optional<std::string> stringField(const core::JsonValue& data, const std::string& key) {
    const core::JsonValue& value = data[key];
    if (value.isString() && !value.getString().empty()) {
        return value.getString();
    }
    if (value.isNumber()) {
        return value.serialize();
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Envelope
// =============================================================================

core::Result<Envelope, core::Error> decodeEnvelope(const std::string& text) {
    auto parsed = core::JsonValue::parse(text);
    if (parsed.isError()) {
        return core::Result<Envelope, core::Error>::error(parsed.error());
    }

    const core::JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return core::Result<Envelope, core::Error>::error(invalid("Message must be a JSON object"));
    }

    Envelope envelope;
    if (root["ackId"].isNumber()) {
        envelope.ackId = root["ackId"].getInt();
    }
    if (!root["event"].isString() || root["event"].getString().empty()) {
        return core::Result<Envelope, core::Error>::error(missingField("event"));
    }
    envelope.event = root["event"].getString();
    envelope.data = root["data"];
    return core::Result<Envelope, core::Error>::success(std::move(envelope));
}

std::optional<int64_t> peekAckId(const std::string& text) {
    auto parsed = core::JsonValue::parse(text);
    if (parsed.isSuccess() && parsed.value()["ackId"].isNumber()) {
        return parsed.value()["ackId"].getInt();
    }
    return std::nullopt;
}

std::string encodeSuccess(std::optional<int64_t> ackId, const core::JsonValue& data) {
    core::JsonValue reply = core::JsonValue::object();
    if (ackId) {
        reply.set("ackId", core::JsonValue::number(static_cast<double>(*ackId)));
    }
    reply.set("ok", core::JsonValue::boolean(true));
    reply.set("data", data.isNull() ? core::JsonValue::object() : data);
    return reply.serialize();
}

std::string encodeFailure(std::optional<int64_t> ackId, const core::Error& error) {
    core::JsonValue body = core::JsonValue::object();
    body.set("code", core::JsonValue::string(core::errorCodeToString(error.code)));
    body.set("message", core::JsonValue::string(error.message));

    core::JsonValue reply = core::JsonValue::object();
    if (ackId) {
        reply.set("ackId", core::JsonValue::number(static_cast<double>(*ackId)));
    }
    reply.set("ok", core::JsonValue::boolean(false));
    reply.set("error", body);
    return reply.serialize();
}

std::string encodePush(const std::string& event, const core::JsonValue& data) {
    core::JsonValue push = core::JsonValue::object();
    push.set("event", core::JsonValue::string(event));
    push.set("data", data);
    return push.serialize();
}

// =============================================================================
// Requests
// =============================================================================

core::Result<JoinRoomRequest, core::Error> decodeJoinRoom(const core::JsonValue& data) {
    using R = core::Result<JoinRoomRequest, core::Error>;

    JoinRoomRequest request;
    auto roomId = stringField(data, "roomId");
    if (!roomId) {
        return R::error(missingField("roomId"));
    }
    request.roomId = *roomId;

    auto role = core::roleFromString(data["role"].getString());
    if (!role) {
        return R::error(missingField("role"));
    }
    request.role = *role;

    request.examId = stringField(data, "examId");
    request.batchId = stringField(data, "batchId");
    return R::success(std::move(request));
}

core::Result<CreateTransportRequest, core::Error> decodeCreateTransport(const core::JsonValue& data) {
    using R = core::Result<CreateTransportRequest, core::Error>;

    auto direction = core::transportDirectionFromString(data["direction"].getString());
    if (!direction) {
        return R::error(missingField("direction"));
    }
    CreateTransportRequest request;
    request.direction = *direction;
    return R::success(request);
}

core::Result<ConnectTransportRequest, core::Error> decodeConnectTransport(const core::JsonValue& data) {
    using R = core::Result<ConnectTransportRequest, core::Error>;

    ConnectTransportRequest request;
    auto transportId = stringField(data, "transportId");
    if (!transportId) {
        return R::error(missingField("transportId"));
    }
    if (!data["dtlsParameters"].isObject()) {
        return R::error(missingField("dtlsParameters"));
    }
    request.transportId = *transportId;
    request.dtlsParameters = data["dtlsParameters"];
    return R::success(std::move(request));
}

core::Result<ProduceRequest, core::Error> decodeProduce(const core::JsonValue& data) {
    using R = core::Result<ProduceRequest, core::Error>;

    ProduceRequest request;
    auto transportId = stringField(data, "transportId");
    if (!transportId) {
        return R::error(missingField("transportId"));
    }
    request.transportId = *transportId;

    auto kind = core::mediaKindFromString(data["kind"].getString());
    if (!kind) {
        return R::error(missingField("kind"));
    }
    request.kind = *kind;

    if (!data["rtpParameters"].isObject()) {
        return R::error(missingField("rtpParameters"));
    }
    request.rtpParameters = data["rtpParameters"];

    const core::JsonValue& appData = data["appData"];
    std::string roleName = appData["mediaRole"].getString();
    if (roleName.empty()) {
        roleName = appData["type"].getString();
    }
    auto mediaRole = core::mediaRoleFromString(roleName);
    if (!mediaRole) {
        return R::error(missingField("appData.mediaRole"));
    }
    request.mediaRole = *mediaRole;
    request.appData = appData.isObject() ? appData : core::JsonValue::object();
    return R::success(std::move(request));
}

core::Result<ConsumeRequest, core::Error> decodeConsume(const core::JsonValue& data) {
    using R = core::Result<ConsumeRequest, core::Error>;

    ConsumeRequest request;
    auto producerId = stringField(data, "producerId");
    if (!producerId) {
        return R::error(missingField("producerId"));
    }
    if (!data["rtpCapabilities"].isObject()) {
        return R::error(missingField("rtpCapabilities"));
    }
    request.producerId = *producerId;
    request.rtpCapabilities = data["rtpCapabilities"];
    return R::success(std::move(request));
}

core::Result<CloseProducerRequest, core::Error> decodeCloseProducer(const core::JsonValue& data) {
    using R = core::Result<CloseProducerRequest, core::Error>;

    auto producerId = stringField(data, "producerId");
    if (!producerId) {
        return R::error(missingField("producerId"));
    }
    CloseProducerRequest request;
    request.producerId = *producerId;
    return R::success(request);
}

// =============================================================================
// Replies and Pushes
// =============================================================================

core::JsonValue toJson(const Ack&) {
    return core::JsonValue::object();
}

core::JsonValue toJson(const JoinRoomReply& reply) {
    core::JsonValue data = core::JsonValue::object();
    data.set("routerCapabilities", reply.routerCapabilities);
    return data;
}

core::JsonValue toJson(const TransportReply& reply) {
    core::JsonValue data = core::JsonValue::object();
    data.set("transportId", core::JsonValue::string(reply.transportId));
    data.set("iceParameters", reply.iceParameters);
    data.set("iceCandidates", reply.iceCandidates);
    data.set("dtlsParameters", reply.dtlsParameters);
    return data;
}

core::JsonValue toJson(const ProduceReply& reply) {
    core::JsonValue data = core::JsonValue::object();
    data.set("producerId", core::JsonValue::string(reply.producerId));
    return data;
}

core::JsonValue toJson(const ConsumeReply& reply) {
    core::JsonValue data = core::JsonValue::object();
    data.set("consumerId", core::JsonValue::string(reply.consumerId));
    data.set("producerId", core::JsonValue::string(reply.producerId));
    data.set("kind", core::JsonValue::string(core::mediaKindToString(reply.kind)));
    data.set("rtpParameters", reply.rtpParameters);
    return data;
}

core::JsonValue producerAnnouncement(const session::VisibleProducer& producer) {
    core::JsonValue data = core::JsonValue::object();
    data.set("producerId", core::JsonValue::string(producer.producerId));
    data.set("userId", core::JsonValue::string(producer.userId));
    data.set("mediaRole", core::JsonValue::string(core::mediaRoleToString(producer.mediaRole)));
    data.set("kind", core::JsonValue::string(core::mediaKindToString(producer.kind)));
    return data;
}

core::JsonValue producerList(const std::vector<session::VisibleProducer>& producers) {
    core::JsonValue list = core::JsonValue::array();
    for (const auto& producer : producers) {
        list.push(producerAnnouncement(producer));
    }
    return list;
}

} // namespace signaling
} // namespace proctorsfu
