// ProctorSFU - Exam Proctoring Media Server
// Session Descriptor - SDP files read by the recording encoder

#ifndef PROCTORSFU_RECORDING_SESSION_DESCRIPTOR_HPP
#define PROCTORSFU_RECORDING_SESSION_DESCRIPTOR_HPP

#include <cstdint>
#include <string>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace recording {

/**
 * @brief One RTP stream the encoder receives.
 */
struct StreamDescription {
    core::MediaKind kind = core::MediaKind::Video;
    std::string address = "127.0.0.1";
    uint16_t port = 0;
    uint8_t payloadType = 0;
};

/**
 * @brief SDP text for a single receive-only stream.
 *
 * Video is VP8/90000, audio is OPUS/48000 with in-band FEC.
 */
std::string buildSessionDescriptor(const StreamDescription& stream);

/**
 * @brief Descriptor path for one track of the recording at outputPath.
 *
 * The descriptor sits beside the output: ".../screen_recording_X_video.sdp".
 */
std::string descriptorPathFor(const std::string& outputPath, core::MediaKind kind);

/**
 * @brief Write content to path, replacing an existing file.
 * @return RecordingError on I/O failure
 */
core::Result<void, core::Error> writeSessionDescriptor(
    const std::string& path,
    const std::string& content
);

/**
 * @brief Delete a descriptor. A missing file is not an error.
 * @return RecordingError if the file exists but cannot be removed
 */
core::Result<void, core::Error> removeSessionDescriptor(const std::string& path);

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_SESSION_DESCRIPTOR_HPP
