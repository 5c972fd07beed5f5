// ProctorSFU - Exam Proctoring Media Server
// Signaling Codec - JSON envelope and payload conversion
//
// Request:  {"event": "...", "ackId": N, "data": {...}}
// Reply:    {"ackId": N, "ok": true, "data": {...}}
//           {"ackId": N, "ok": false, "error": {"code": "...", "message": "..."}}
// Push:     {"event": "...", "data": ...}

#ifndef PROCTORSFU_SIGNALING_SIGNALING_CODEC_HPP
#define PROCTORSFU_SIGNALING_SIGNALING_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/json_value.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/session/access_policy.hpp"
#include "proctorsfu/signaling/signaling_types.hpp"

namespace proctorsfu {
namespace signaling {

struct Envelope {
    std::string event;
    std::optional<int64_t> ackId;
    core::JsonValue data;
};

// =============================================================================
// Envelope
// =============================================================================

/**
 * @brief Parse an incoming message.
 * @return ValidationError for malformed JSON or a missing event name
 */
core::Result<Envelope, core::Error> decodeEnvelope(const std::string& text);

/**
 * @brief Best-effort ackId of a message that failed to decode.
 */
std::optional<int64_t> peekAckId(const std::string& text);

std::string encodeSuccess(std::optional<int64_t> ackId, const core::JsonValue& data);
std::string encodeFailure(std::optional<int64_t> ackId, const core::Error& error);
std::string encodePush(const std::string& event, const core::JsonValue& data);

// =============================================================================
// Requests
// =============================================================================

core::Result<JoinRoomRequest, core::Error> decodeJoinRoom(const core::JsonValue& data);
core::Result<CreateTransportRequest, core::Error> decodeCreateTransport(const core::JsonValue& data);
core::Result<ConnectTransportRequest, core::Error> decodeConnectTransport(const core::JsonValue& data);

/**
 * @brief appData.mediaRole selects the media role; appData.type is accepted as an alias.
 */
core::Result<ProduceRequest, core::Error> decodeProduce(const core::JsonValue& data);
core::Result<ConsumeRequest, core::Error> decodeConsume(const core::JsonValue& data);
core::Result<CloseProducerRequest, core::Error> decodeCloseProducer(const core::JsonValue& data);

// =============================================================================
// Replies and Pushes
// =============================================================================

core::JsonValue toJson(const Ack& reply);
core::JsonValue toJson(const JoinRoomReply& reply);
core::JsonValue toJson(const TransportReply& reply);
core::JsonValue toJson(const ProduceReply& reply);
core::JsonValue toJson(const ConsumeReply& reply);

/**
 * @brief {producerId, userId, mediaRole, kind}
 */
core::JsonValue producerAnnouncement(const session::VisibleProducer& producer);

core::JsonValue producerList(const std::vector<session::VisibleProducer>& producers);

} // namespace signaling
} // namespace proctorsfu

#endif // PROCTORSFU_SIGNALING_SIGNALING_CODEC_HPP
