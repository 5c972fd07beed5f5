// ProctorSFU - Exam Proctoring Media Server
// WebSocket Handshake - HTTP/1.1 upgrade request processing
//
// Implements the server side of the RFC 6455 opening handshake:
// - Buffer the request until the blank line ending the header block
// - Validate method, Upgrade, Connection, Sec-WebSocket-Key and version 13
// - Extract the access token from the query string or a bearer header
// - Build the 101 Switching Protocols reply and the 400/401 rejections
//
// State transitions: WaitingRequest -> Complete | Failed

#ifndef PROCTORSFU_PROTOCOL_WEBSOCKET_HANDSHAKE_HPP
#define PROCTORSFU_PROTOCOL_WEBSOCKET_HANDSHAKE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proctorsfu {
namespace protocol {

namespace websocket {
    constexpr size_t MAX_REQUEST_SIZE = 8192;    // Upper bound for the header block
    constexpr const char* ACCEPT_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    constexpr const char* SUPPORTED_VERSION = "13";
}

enum class HandshakeState {
    WaitingRequest,   ///< Collecting the request header block
    Complete,         ///< Valid upgrade request received
    Failed            ///< Terminal; reply with a rejection and close
};

struct HandshakeError {
    enum class Code {
        MalformedRequest,     ///< Request line or headers unparsable
        NotUpgrade,           ///< Missing or wrong Upgrade/Connection headers
        MissingKey,           ///< No Sec-WebSocket-Key
        UnsupportedVersion,   ///< Sec-WebSocket-Version other than 13
        RequestTooLarge       ///< Header block exceeded MAX_REQUEST_SIZE
    };

    Code code;
    std::string message;

    HandshakeError(Code c = Code::MalformedRequest, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

struct HandshakeResult {
    bool success;
    size_t bytesConsumed;                  ///< Bytes of this input that belonged to the request
    std::optional<HandshakeError> error;

    static HandshakeResult ok(size_t consumed) {
        return HandshakeResult{true, consumed, std::nullopt};
    }

    static HandshakeResult fail(HandshakeError err) {
        return HandshakeResult{false, 0, std::move(err)};
    }
};

/**
 * @brief Parsed upgrade request.
 *
 * Header names are stored lower-cased.
 */
struct UpgradeRequest {
    std::string method;
    std::string target;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string key;

    /**
     * @brief The "token" query parameter, else the bearer credential of
     *        the Authorization header.
     */
    std::optional<std::string> token;
};

class WebSocketHandshake {
public:
    WebSocketHandshake();

    WebSocketHandshake(const WebSocketHandshake&) = delete;
    WebSocketHandshake& operator=(const WebSocketHandshake&) = delete;

    /**
     * @brief Feed bytes read from the socket.
     *
     * Bytes after the header block are not consumed; they are the first
     * WebSocket frames and belong to the frame codec.
     */
    HandshakeResult processData(const uint8_t* data, size_t length);

    HandshakeState getState() const { return state_; }
    bool isComplete() const { return state_ == HandshakeState::Complete; }

    /**
     * @brief The parsed request. Valid once isComplete().
     */
    const UpgradeRequest& request() const { return request_; }

    /**
     * @brief base64(SHA-1(key + GUID)).
     */
    static std::string computeAcceptKey(const std::string& key);

    static std::vector<uint8_t> buildAcceptResponse(const std::string& key);

    /**
     * @brief Plain HTTP rejection, e.g. 400 Bad Request or 401 Unauthorized.
     */
    static std::vector<uint8_t> buildRejectResponse(int status, const std::string& reason);

private:
    HandshakeResult parseRequest(const std::string& block);
    HandshakeResult failWith(HandshakeError::Code code, const std::string& message);

    HandshakeState state_;
    std::string buffer_;
    UpgradeRequest request_;
};

/**
 * @brief Percent-decoding of a query component; '+' becomes a space.
 */
std::string urlDecode(const std::string& value);

} // namespace protocol
} // namespace proctorsfu

#endif // PROCTORSFU_PROTOCOL_WEBSOCKET_HANDSHAKE_HPP
