// ProctorSFU - Exam Proctoring Media Server
// Recording Uploader - Hand-off of finished recordings to storage

#ifndef PROCTORSFU_RECORDING_RECORDING_UPLOADER_HPP
#define PROCTORSFU_RECORDING_RECORDING_UPLOADER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/recording/recording_types.hpp"

namespace proctorsfu {
namespace recording {

struct RecordingMetadata {
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point endedAt;
    uint64_t durationMs = 0;
    uint64_t fileSizeBytes = 0;
    ExitReason exitReason = ExitReason::ProducerClosed;
    RecordingStatus status = RecordingStatus::Completed;
};

struct UploadRequest {
    std::string filePath;
    std::optional<std::string> examId;
    std::optional<std::string> batchId;
    std::string candidateId;
    RecordingType recordingType = RecordingType::Screen;
    RecordingMetadata metadata;
};

struct UploadResult {
    std::string url;
    std::string objectKey;
};

using UploadCallback = std::function<void(core::Result<UploadResult, core::Error>)>;

/**
 * @brief Uploads a finished recording and records it with the backend.
 *
 * The callback may run on any thread.
 */
class IRecordingUploader {
public:
    virtual ~IRecordingUploader() = default;

    virtual void uploadAndSaveRecording(const UploadRequest& request, UploadCallback callback) = 0;
};

/**
 * @brief Keeps recordings where the encoder wrote them.
 *
 * Reports a file:// URL and the path relative to the base directory as
 * the object key.
 */
class LocalRecordingUploader : public IRecordingUploader {
public:
    LocalRecordingUploader(std::string basePath, std::shared_ptr<core::StructuredLogger> logger);

    void uploadAndSaveRecording(const UploadRequest& request, UploadCallback callback) override;

private:
    std::string basePath_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_RECORDING_UPLOADER_HPP
