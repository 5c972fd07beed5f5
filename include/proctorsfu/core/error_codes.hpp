// ProctorSFU - Exam Proctoring Media Server
// Error taxonomy shared by every component

#ifndef PROCTORSFU_CORE_ERROR_CODES_HPP
#define PROCTORSFU_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace proctorsfu {
namespace core {

/**
 * @brief Error categories reported to clients and logs.
 *
 * Each category maps to a stable wire string (see errorCodeToString) that
 * signaling replies carry in their "code" field.
 */
enum class ErrorCode : uint32_t {
    Success = 0,

    // Identity (100-199)
    Authentication = 100,   ///< Missing or invalid credentials
    Authorization = 101,    ///< Authenticated but not allowed

    // Session fabric (200-299)
    RoomError = 200,        ///< Room missing or not in a usable state
    PeerNotFound = 201,     ///< Connection has no peer record
    TransportError = 202,   ///< Transport missing or not owned by the caller

    // Media (300-399)
    EngineError = 300,      ///< Media engine primitive failed
    RecordingError = 301,   ///< Recording pipeline failed

    // Generic (900-999)
    ValidationError = 900,  ///< Malformed request payload
    InternalError = 901,
};

/**
 * @brief Stable wire identifier for an error code.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "OK";
        case ErrorCode::Authentication: return "AUTH_ERROR";
        case ErrorCode::Authorization: return "AUTHZ_ERROR";
        case ErrorCode::RoomError: return "ROOM_ERROR";
        case ErrorCode::PeerNotFound: return "PEER_NOT_FOUND";
        case ErrorCode::TransportError: return "TRANSPORT_ERROR";
        case ErrorCode::EngineError: return "ENGINE_ERROR";
        case ErrorCode::RecordingError: return "RECORDING_ERROR";
        case ErrorCode::ValidationError: return "VALIDATION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

/**
 * @brief Error value carried by core::Result.
 *
 * message is client-presentable; context holds diagnostic detail that is
 * logged but not sent on the wire.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::InternalError,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_ERROR_CODES_HPP
