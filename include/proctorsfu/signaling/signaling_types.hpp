// ProctorSFU - Exam Proctoring Media Server
// Signaling request, reply and notification types

#ifndef PROCTORSFU_SIGNALING_SIGNALING_TYPES_HPP
#define PROCTORSFU_SIGNALING_SIGNALING_TYPES_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/json_value.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/token_verifier.hpp"
#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace signaling {

using core::ConnectionId;

// =============================================================================
// Event Names
// =============================================================================

namespace events {
constexpr const char* JOIN_ROOM = "join-room";
constexpr const char* CREATE_TRANSPORT = "create-transport";
constexpr const char* CONNECT_TRANSPORT = "connect-transport";
constexpr const char* PRODUCE = "produce";
constexpr const char* CONSUME = "consume";
constexpr const char* GET_PRODUCERS = "get-producers";
constexpr const char* CLOSE_PRODUCER = "close-producer";
constexpr const char* DISCONNECT = "disconnect";

// Server pushes
constexpr const char* EXISTING_PRODUCERS = "existing-producers";
constexpr const char* NEW_PRODUCER = "new-producer";
constexpr const char* PRODUCER_CLOSED = "producer-closed";
} // namespace events

// =============================================================================
// Connection Context
// =============================================================================

/**
 * @brief A signaling connection and the identity it authenticated with.
 */
struct ClientContext {
    ConnectionId connectionId = core::INVALID_CONNECTION_ID;
    core::Identity identity;
};

// =============================================================================
// Requests
// =============================================================================

struct JoinRoomRequest {
    core::RoomId roomId;
    core::Role role = core::Role::Student;
    std::optional<std::string> examId;
    std::optional<std::string> batchId;
};

struct CreateTransportRequest {
    core::TransportDirection direction = core::TransportDirection::Send;
};

struct ConnectTransportRequest {
    core::TransportId transportId;
    core::JsonValue dtlsParameters;
};

struct ProduceRequest {
    core::TransportId transportId;
    core::MediaKind kind = core::MediaKind::Video;
    core::JsonValue rtpParameters;
    core::MediaRole mediaRole = core::MediaRole::Webcam;
    core::JsonValue appData;
};

struct ConsumeRequest {
    core::ProducerId producerId;
    core::JsonValue rtpCapabilities;
};

struct CloseProducerRequest {
    core::ProducerId producerId;
};

// =============================================================================
// Replies
// =============================================================================

/**
 * @brief Reply with an empty data object.
 */
struct Ack {};

struct JoinRoomReply {
    core::JsonValue routerCapabilities;
};

struct TransportReply {
    core::TransportId transportId;
    core::JsonValue iceParameters;
    core::JsonValue iceCandidates;
    core::JsonValue dtlsParameters;
};

struct ProduceReply {
    core::ProducerId producerId;
};

struct ConsumeReply {
    core::ConsumerId consumerId;
    core::ProducerId producerId;
    core::MediaKind kind = core::MediaKind::Video;
    core::JsonValue rtpParameters;
};

/**
 * @brief Single-use reply channel for one request.
 *
 * Copies share one channel; only the first resolve() or reject() is
 * delivered. Dropping every copy without settling sends nothing.
 */
template<typename T>
class Reply {
public:
    using Callback = std::function<void(core::Result<T, core::Error>)>;

    explicit Reply(Callback callback)
        : state_(std::make_shared<State>()) {
        state_->callback = std::move(callback);
    }

    void resolve(T value) const {
        settle(core::Result<T, core::Error>::success(std::move(value)));
    }

    void reject(core::Error error) const {
        settle(core::Result<T, core::Error>::error(std::move(error)));
    }

    bool isSettled() const {
        return state_->settled;
    }

private:
    struct State {
        Callback callback;
        bool settled = false;
    };

    void settle(core::Result<T, core::Error> result) const {
        if (state_->settled) {
            return;
        }
        state_->settled = true;
        Callback callback = std::move(state_->callback);
        state_->callback = nullptr;
        if (callback) {
            callback(std::move(result));
        }
    }

    std::shared_ptr<State> state_;
};

// =============================================================================
// Notifications
// =============================================================================

/**
 * @brief Delivers server-initiated pushes to connections.
 *
 * Pushes to a connection are delivered after replies sent before them.
 */
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void push(ConnectionId connectionId,
                      const std::string& event,
                      const core::JsonValue& data) = 0;
};

} // namespace signaling
} // namespace proctorsfu

#endif // PROCTORSFU_SIGNALING_SIGNALING_TYPES_HPP
