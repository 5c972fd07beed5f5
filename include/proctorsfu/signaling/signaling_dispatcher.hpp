// ProctorSFU - Exam Proctoring Media Server
// Signaling Dispatcher - Routes decoded messages to the handler
//
// Responsibilities:
// - Decode envelopes and request payloads
// - Build a typed reply per request and encode its outcome
// - Answer malformed or unknown messages with VALIDATION_ERROR

#ifndef PROCTORSFU_SIGNALING_SIGNALING_DISPATCHER_HPP
#define PROCTORSFU_SIGNALING_SIGNALING_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <string>

#include "proctorsfu/signaling/signaling_handler.hpp"

namespace proctorsfu {
namespace signaling {

/**
 * @brief Writes an encoded message to one connection.
 */
using OutboundSink = std::function<void(ConnectionId, const std::string&)>;

class SignalingDispatcher {
public:
    SignalingDispatcher(ISignalingHandler& handler, OutboundSink sink);

    /**
     * @brief Process one text message from a client.
     *
     * The reply may be sent later, once the handler's asynchronous work
     * completes.
     */
    void dispatch(const ClientContext& client, const std::string& text);

    /**
     * @brief Forward a transport-level disconnect.
     */
    void disconnect(ConnectionId connectionId);

private:
    template<typename T>
    Reply<T> replyFor(ConnectionId connectionId, std::optional<int64_t> ackId);

    void sendFailure(ConnectionId connectionId, std::optional<int64_t> ackId,
                     const core::Error& error);

    ISignalingHandler& handler_;
    OutboundSink sink_;
};

} // namespace signaling
} // namespace proctorsfu

#endif // PROCTORSFU_SIGNALING_SIGNALING_DISPATCHER_HPP
