// ProctorSFU - Exam Proctoring Media Server
// Recording enumeration names

#include "proctorsfu/recording/recording_types.hpp"

namespace proctorsfu {
namespace recording {

const char* recordingTypeToString(RecordingType type) {
    switch (type) {
        case RecordingType::Screen: return "screen";
        case RecordingType::Webcam: return "webcam";
    }
    return "unknown";
}

const char* recordingStatusToString(RecordingStatus status) {
    switch (status) {
        case RecordingStatus::Initializing: return "initializing";
        case RecordingStatus::Recording: return "recording";
        case RecordingStatus::Cleaning: return "cleaning";
        case RecordingStatus::Completed: return "completed";
        case RecordingStatus::Failed: return "failed";
        case RecordingStatus::Error: return "error";
    }
    return "unknown";
}

const char* exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::Disconnect: return "disconnect";
        case ExitReason::ProducerClosed: return "producer-closed";
        case ExitReason::Replaced: return "replaced";
        case ExitReason::EncoderExited: return "encoder-exited";
        case ExitReason::PipelineError: return "pipeline-error";
        case ExitReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

} // namespace recording
} // namespace proctorsfu
