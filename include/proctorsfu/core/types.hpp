// ProctorSFU - Exam Proctoring Media Server
// Common identifiers and enumerations

#ifndef PROCTORSFU_CORE_TYPES_HPP
#define PROCTORSFU_CORE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace proctorsfu {
namespace core {

// Signaling connection handle, assigned by the server per accepted socket
using ConnectionId = uint64_t;
using RecordingSessionId = uint64_t;

// Engine-assigned identifiers are opaque strings
using RoomId = std::string;
using UserId = std::string;
using RouterId = std::string;
using TransportId = std::string;
using ProducerId = std::string;
using ConsumerId = std::string;

constexpr ConnectionId INVALID_CONNECTION_ID = 0;
constexpr RecordingSessionId INVALID_RECORDING_SESSION_ID = 0;

/**
 * @brief Participant role within an exam room.
 */
enum class Role : uint8_t {
    Admin,
    Invigilator,
    Student
};

enum class MediaKind : uint8_t {
    Audio,
    Video
};

/**
 * @brief Application-level tag a client attaches to a producer.
 *
 * Screen shares and webcam video are recorded separately; webcam and mic
 * audio are both treated as the candidate's webcam audio.
 */
enum class MediaRole : uint8_t {
    Screen,
    Webcam,
    Mic
};

enum class TransportDirection : uint8_t {
    Send,
    Recv
};

const char* roleToString(Role role);
std::optional<Role> roleFromString(const std::string& value);

const char* mediaKindToString(MediaKind kind);
std::optional<MediaKind> mediaKindFromString(const std::string& value);

const char* mediaRoleToString(MediaRole role);
std::optional<MediaRole> mediaRoleFromString(const std::string& value);

const char* transportDirectionToString(TransportDirection direction);
std::optional<TransportDirection> transportDirectionFromString(const std::string& value);

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_TYPES_HPP
