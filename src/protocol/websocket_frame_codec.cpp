// ProctorSFU - Exam Proctoring Media Server
// WebSocket Frame Codec Implementation

#include "proctorsfu/protocol/websocket_frame_codec.hpp"

#include <algorithm>

namespace proctorsfu {
namespace protocol {

namespace {

constexpr uint8_t FIN_BIT = 0x80;
constexpr uint8_t RSV_BITS = 0x70;
constexpr uint8_t OPCODE_MASK = 0x0F;
constexpr uint8_t MASK_BIT = 0x80;
constexpr uint8_t LENGTH_MASK = 0x7F;
constexpr uint8_t LENGTH_16 = 126;
constexpr uint8_t LENGTH_64 = 127;
constexpr size_t MAX_CONTROL_PAYLOAD = 125;

bool isControl(uint8_t opcode) {
    return (opcode & 0x08) != 0;
}

bool isKnownOpcode(uint8_t opcode) {
    switch (opcode) {
        case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::optional<uint16_t> WebSocketMessage::closeCode() const {
    if (opcode != Opcode::Close || payload.size() < 2) {
        return std::nullopt;
    }
    return static_cast<uint16_t>((payload[0] << 8) | payload[1]);
}

WebSocketFrameCodec::WebSocketFrameCodec(size_t maxMessageBytes)
    : maxMessageBytes_(maxMessageBytes)
    , failed_(false) {
}

core::Result<std::vector<WebSocketMessage>, FrameError> WebSocketFrameCodec::fail(
    FrameError::Code code,
    const std::string& message)
{
    failed_ = true;
    buffer_.clear();
    fragments_.clear();
    fragmentOpcode_.reset();
    return core::Result<std::vector<WebSocketMessage>, FrameError>::error(FrameError(code, message));
}

core::Result<std::vector<WebSocketMessage>, FrameError> WebSocketFrameCodec::feed(
    const uint8_t* data,
    size_t length)
{
    using ResultType = core::Result<std::vector<WebSocketMessage>, FrameError>;

    if (failed_) {
        return ResultType::error(FrameError(FrameError::Code::ProtocolError, "Codec has failed"));
    }
    if (data != nullptr && length > 0) {
        buffer_.insert(buffer_.end(), data, data + length);
    }

    std::vector<WebSocketMessage> messages;
    size_t offset = 0;

    while (buffer_.size() - offset >= 2) {
        const uint8_t* frame = buffer_.data() + offset;
        const size_t available = buffer_.size() - offset;

        const bool fin = (frame[0] & FIN_BIT) != 0;
        const uint8_t opcode = frame[0] & OPCODE_MASK;
        const bool masked = (frame[1] & MASK_BIT) != 0;

        if ((frame[0] & RSV_BITS) != 0) {
            return fail(FrameError::Code::ProtocolError, "Reserved bits set");
        }
        if (!isKnownOpcode(opcode)) {
            return fail(FrameError::Code::ProtocolError, "Unknown opcode");
        }
        if (!masked) {
            return fail(FrameError::Code::ProtocolError, "Client frame not masked");
        }

        size_t headerSize = 2;
        uint64_t payloadLength = frame[1] & LENGTH_MASK;
        if (payloadLength == LENGTH_16) {
            if (available < 4) {
                break;
            }
            payloadLength = (static_cast<uint64_t>(frame[2]) << 8) | frame[3];
            headerSize = 4;
        } else if (payloadLength == LENGTH_64) {
            if (available < 10) {
                break;
            }
            payloadLength = 0;
            for (size_t i = 0; i < 8; ++i) {
                payloadLength = (payloadLength << 8) | frame[2 + i];
            }
            if ((payloadLength >> 63) != 0) {
                return fail(FrameError::Code::ProtocolError, "Invalid payload length");
            }
            headerSize = 10;
        }

        if (isControl(opcode)) {
            if (!fin || payloadLength > MAX_CONTROL_PAYLOAD) {
                return fail(FrameError::Code::ProtocolError, "Invalid control frame");
            }
        } else if (payloadLength + fragments_.size() > maxMessageBytes_) {
            return fail(FrameError::Code::MessageTooBig, "Message exceeds size limit");
        }

        const size_t frameSize = headerSize + 4 + static_cast<size_t>(payloadLength);
        if (available < frameSize) {
            break;
        }

        const uint8_t* mask = frame + headerSize;
        const uint8_t* payloadStart = mask + 4;
        std::vector<uint8_t> payload(static_cast<size_t>(payloadLength));
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = payloadStart[i] ^ mask[i % 4];
        }
        offset += frameSize;

        if (isControl(opcode)) {
            WebSocketMessage message;
            message.opcode = static_cast<Opcode>(opcode);
            message.payload = std::move(payload);
            messages.push_back(std::move(message));
            continue;
        }

        if (opcode == static_cast<uint8_t>(Opcode::Continuation)) {
            if (!fragmentOpcode_) {
                return fail(FrameError::Code::ProtocolError, "Unexpected continuation frame");
            }
        } else {
            if (fragmentOpcode_) {
                return fail(FrameError::Code::ProtocolError, "Expected continuation frame");
            }
            fragmentOpcode_ = static_cast<Opcode>(opcode);
        }
        fragments_.insert(fragments_.end(), payload.begin(), payload.end());

        if (fin) {
            WebSocketMessage message;
            message.opcode = *fragmentOpcode_;
            message.payload = std::move(fragments_);
            messages.push_back(std::move(message));
            fragments_.clear();
            fragmentOpcode_.reset();
        }
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return ResultType::success(std::move(messages));
}

std::vector<uint8_t> WebSocketFrameCodec::encodeFrame(
    Opcode opcode,
    const uint8_t* payload,
    size_t length)
{
    std::vector<uint8_t> frame;
    frame.reserve(length + 10);
    frame.push_back(static_cast<uint8_t>(FIN_BIT | static_cast<uint8_t>(opcode)));

    if (length < LENGTH_16) {
        frame.push_back(static_cast<uint8_t>(length));
    } else if (length <= 0xFFFF) {
        frame.push_back(LENGTH_16);
        frame.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        frame.push_back(LENGTH_64);
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(length) >> shift) & 0xFF));
        }
    }

    if (payload != nullptr && length > 0) {
        frame.insert(frame.end(), payload, payload + length);
    }
    return frame;
}

std::vector<uint8_t> WebSocketFrameCodec::encodeText(const std::string& text) {
    return encodeFrame(Opcode::Text, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::vector<uint8_t> WebSocketFrameCodec::encodePong(const std::vector<uint8_t>& payload) {
    return encodeFrame(Opcode::Pong, payload.data(), payload.size());
}

std::vector<uint8_t> WebSocketFrameCodec::encodeClose(uint16_t status, const std::string& reason) {
    std::vector<uint8_t> payload;
    payload.push_back(static_cast<uint8_t>(status >> 8));
    payload.push_back(static_cast<uint8_t>(status & 0xFF));
    size_t reasonLength = std::min(reason.size(), MAX_CONTROL_PAYLOAD - 2);
    payload.insert(payload.end(), reason.begin(), reason.begin() + static_cast<std::ptrdiff_t>(reasonLength));
    return encodeFrame(Opcode::Close, payload.data(), payload.size());
}

} // namespace protocol
} // namespace proctorsfu
