// ProctorSFU - Exam Proctoring Media Server
// String conversions for core enumerations

#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace core {

const char* roleToString(Role role) {
    switch (role) {
        case Role::Admin: return "admin";
        case Role::Invigilator: return "invigilator";
        case Role::Student: return "student";
    }
    return "unknown";
}

std::optional<Role> roleFromString(const std::string& value) {
    if (value == "admin") return Role::Admin;
    if (value == "invigilator") return Role::Invigilator;
    if (value == "student") return Role::Student;
    return std::nullopt;
}

const char* mediaKindToString(MediaKind kind) {
    switch (kind) {
        case MediaKind::Audio: return "audio";
        case MediaKind::Video: return "video";
    }
    return "unknown";
}

std::optional<MediaKind> mediaKindFromString(const std::string& value) {
    if (value == "audio") return MediaKind::Audio;
    if (value == "video") return MediaKind::Video;
    return std::nullopt;
}

const char* mediaRoleToString(MediaRole role) {
    switch (role) {
        case MediaRole::Screen: return "screen";
        case MediaRole::Webcam: return "webcam";
        case MediaRole::Mic: return "mic";
    }
    return "unknown";
}

std::optional<MediaRole> mediaRoleFromString(const std::string& value) {
    if (value == "screen") return MediaRole::Screen;
    if (value == "webcam") return MediaRole::Webcam;
    if (value == "mic") return MediaRole::Mic;
    return std::nullopt;
}

const char* transportDirectionToString(TransportDirection direction) {
    return direction == TransportDirection::Send ? "send" : "recv";
}

std::optional<TransportDirection> transportDirectionFromString(const std::string& value) {
    if (value == "send") return TransportDirection::Send;
    if (value == "recv") return TransportDirection::Recv;
    return std::nullopt;
}

} // namespace core
} // namespace proctorsfu
