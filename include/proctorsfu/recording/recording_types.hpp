// ProctorSFU - Exam Proctoring Media Server
// Recording enumerations and small value types

#ifndef PROCTORSFU_RECORDING_RECORDING_TYPES_HPP
#define PROCTORSFU_RECORDING_RECORDING_TYPES_HPP

#include <cstdint>
#include <string>

#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace recording {

using core::RecordingSessionId;

/**
 * @brief Which storage tree a recording goes to.
 */
enum class RecordingType : uint8_t {
    Screen,
    Webcam
};

/**
 * @brief Lifecycle of a recording session.
 *
 * Initializing -> Recording -> Cleaning -> Completed | Failed | Error.
 * A session that fails during setup goes straight to Cleaning.
 */
enum class RecordingStatus : uint8_t {
    Initializing,
    Recording,
    Cleaning,
    Completed,
    Failed,
    Error
};

/**
 * @brief Why a session was torn down. Reported to the uploader.
 */
enum class ExitReason : uint8_t {
    Disconnect,
    ProducerClosed,
    Replaced,
    EncoderExited,
    PipelineError,
    Shutdown
};

const char* recordingTypeToString(RecordingType type);
const char* recordingStatusToString(RecordingStatus status);
const char* exitReasonToString(ExitReason reason);

inline bool isFinalStatus(RecordingStatus status) {
    return status == RecordingStatus::Completed ||
           status == RecordingStatus::Failed ||
           status == RecordingStatus::Error;
}

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_RECORDING_TYPES_HPP
