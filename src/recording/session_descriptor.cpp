// ProctorSFU - Exam Proctoring Media Server
// Session Descriptor Implementation

#include "proctorsfu/recording/session_descriptor.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace proctorsfu {
namespace recording {

std::string buildSessionDescriptor(const StreamDescription& stream) {
    const bool audio = stream.kind == core::MediaKind::Audio;
    const unsigned pt = stream.payloadType;

    std::ostringstream sdp;
    sdp << "v=0\r\n";
    sdp << "o=- 0 0 IN IP4 " << stream.address << "\r\n";
    sdp << "s=ProctorSFU recording\r\n";
    sdp << "c=IN IP4 " << stream.address << "\r\n";
    sdp << "t=0 0\r\n";
    sdp << "m=" << (audio ? "audio" : "video") << " " << stream.port << " RTP/AVP " << pt << "\r\n";
    if (audio) {
        sdp << "a=rtpmap:" << pt << " OPUS/48000/2\r\n";
        sdp << "a=fmtp:" << pt << " minptime=10;useinbandfec=1\r\n";
    } else {
        sdp << "a=rtpmap:" << pt << " VP8/90000\r\n";
    }
    sdp << "a=recvonly\r\n";
    return sdp.str();
}

std::string descriptorPathFor(const std::string& outputPath, core::MediaKind kind) {
    std::string stem = outputPath;
    size_t slash = stem.find_last_of('/');
    size_t dot = stem.find_last_of('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        stem.erase(dot);
    }
    return stem + "_" + core::mediaKindToString(kind) + ".sdp";
}

core::Result<void, core::Error> writeSessionDescriptor(
    const std::string& path,
    const std::string& content)
{
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::RecordingError,
            "Cannot write session descriptor",
            path + ": " + std::strerror(errno)));
    }
    file << content;
    file.close();
    if (file.fail()) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::RecordingError,
            "Cannot write session descriptor",
            path));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> removeSessionDescriptor(const std::string& path) {
    if (path.empty() || std::remove(path.c_str()) == 0 || errno == ENOENT) {
        return core::Result<void, core::Error>::success();
    }
    return core::Result<void, core::Error>::error(core::Error(
        core::ErrorCode::RecordingError,
        "Cannot remove session descriptor",
        path + ": " + std::strerror(errno)));
}

} // namespace recording
} // namespace proctorsfu
