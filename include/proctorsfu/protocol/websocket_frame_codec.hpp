// ProctorSFU - Exam Proctoring Media Server
// WebSocket Frame Codec - RFC 6455 framing
//
// Responsibilities:
// - Incrementally decode masked client frames (7, 16 and 64-bit lengths)
// - Reassemble fragmented messages from continuation frames
// - Surface ping, pong and close control frames as messages
// - Enforce a maximum message size
// - Encode unmasked server frames

#ifndef PROCTORSFU_PROTOCOL_WEBSOCKET_FRAME_CODEC_HPP
#define PROCTORSFU_PROTOCOL_WEBSOCKET_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proctorsfu/core/result.hpp"

namespace proctorsfu {
namespace protocol {

enum class Opcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

namespace close_code {
    constexpr uint16_t NORMAL = 1000;
    constexpr uint16_t GOING_AWAY = 1001;
    constexpr uint16_t PROTOCOL_ERROR = 1002;
    constexpr uint16_t MESSAGE_TOO_BIG = 1009;
}

/**
 * @brief A complete message or control frame.
 */
struct WebSocketMessage {
    Opcode opcode = Opcode::Text;
    std::vector<uint8_t> payload;

    std::string text() const {
        return std::string(payload.begin(), payload.end());
    }

    /**
     * @brief Status code of a Close frame, if it carries one.
     */
    std::optional<uint16_t> closeCode() const;
};

struct FrameError {
    enum class Code {
        ProtocolError,    ///< Violates RFC 6455 framing rules
        MessageTooBig     ///< Message exceeds the configured limit
    };

    Code code;
    std::string message;

    FrameError(Code c = Code::ProtocolError, std::string msg = "")
        : code(c), message(std::move(msg)) {}

    /**
     * @brief Close status to send before dropping the connection.
     */
    uint16_t closeStatus() const {
        return code == Code::MessageTooBig ? close_code::MESSAGE_TOO_BIG
                                           : close_code::PROTOCOL_ERROR;
    }
};

/**
 * @brief Server-side frame codec for one connection.
 *
 * After an error the codec stays failed and decodes nothing further.
 */
class WebSocketFrameCodec {
public:
    explicit WebSocketFrameCodec(size_t maxMessageBytes);

    /**
     * @brief Append received bytes and return every message they complete.
     */
    core::Result<std::vector<WebSocketMessage>, FrameError> feed(const uint8_t* data, size_t length);

    bool hasFailed() const { return failed_; }
    size_t bufferedBytes() const { return buffer_.size(); }

    static std::vector<uint8_t> encodeFrame(Opcode opcode, const uint8_t* payload, size_t length);
    static std::vector<uint8_t> encodeText(const std::string& text);
    static std::vector<uint8_t> encodePong(const std::vector<uint8_t>& payload);
    static std::vector<uint8_t> encodeClose(uint16_t status, const std::string& reason = "");

private:
    core::Result<std::vector<WebSocketMessage>, FrameError> fail(FrameError::Code code,
                                                                 const std::string& message);

    size_t maxMessageBytes_;
    std::vector<uint8_t> buffer_;
    std::vector<uint8_t> fragments_;
    std::optional<Opcode> fragmentOpcode_;
    bool failed_;
};

} // namespace protocol
} // namespace proctorsfu

#endif // PROCTORSFU_PROTOCOL_WEBSOCKET_FRAME_CODEC_HPP
