// ProctorSFU - Exam Proctoring Media Server
// Local Recording Uploader

#include "proctorsfu/recording/recording_uploader.hpp"

#include <sys/stat.h>

namespace proctorsfu {
namespace recording {

LocalRecordingUploader::LocalRecordingUploader(
    std::string basePath,
    std::shared_ptr<core::StructuredLogger> logger)
    : basePath_(std::move(basePath))
    , logger_(std::move(logger)) {
}

void LocalRecordingUploader::uploadAndSaveRecording(
    const UploadRequest& request,
    UploadCallback callback)
{
    struct stat st;
    if (::stat(request.filePath.c_str(), &st) != 0) {
        callback(core::Result<UploadResult, core::Error>::error(core::Error(
            core::ErrorCode::RecordingError,
            "Recording file not found",
            request.filePath)));
        return;
    }

    UploadResult result;
    result.url = "file://" + request.filePath;
    result.objectKey = request.filePath;
    const std::string prefix = basePath_ + "/";
    if (result.objectKey.compare(0, prefix.size(), prefix) == 0) {
        result.objectKey.erase(0, prefix.size());
    }

    logger_->info("Recording kept at " + request.filePath + " (" +
                  std::to_string(request.metadata.durationMs) + " ms, " +
                  std::to_string(static_cast<uint64_t>(st.st_size)) + " bytes, " +
                  exitReasonToString(request.metadata.exitReason) + ")",
                  "Recording");
    callback(core::Result<UploadResult, core::Error>::success(result));
}

} // namespace recording
} // namespace proctorsfu
