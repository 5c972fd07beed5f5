// ProctorSFU - Exam Proctoring Media Server
// Recording Layout Implementation

#include "proctorsfu/recording/recording_layout.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>

namespace proctorsfu {
namespace recording {

namespace {

bool isSegmentChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

core::Result<void, core::Error> makeDirectory(const std::string& path) {
    if (::mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
        return core::Result<void, core::Error>::success();
    }
    return core::Result<void, core::Error>::error(core::Error(
        core::ErrorCode::RecordingError,
        "Cannot create recording directory",
        path + ": " + std::strerror(errno)));
}

} // anonymous namespace

std::string sanitizePathSegment(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return "unknown";
    }

    std::string result;
    result.reserve(std::min(value->size(), MAX_PATH_SEGMENT_LENGTH));
    for (char c : *value) {
        if (result.size() == MAX_PATH_SEGMENT_LENGTH) {
            break;
        }
        result.push_back(isSegmentChar(c) ? c : '_');
    }
    return result;
}

std::string formatRecordingTimestamp(std::time_t time) {
    std::tm tmBuf;
    localtime_r(&time, &tmBuf);

    char buffer[32];
    size_t length = std::strftime(buffer, sizeof(buffer), "%Y_%m_%d_%H_%M_%S", &tmBuf);
    return std::string(buffer, length);
}

RecordingLayout::RecordingLayout(std::string basePath, std::string container)
    : basePath_(std::move(basePath))
    , container_(std::move(container)) {
    while (basePath_.size() > 1 && basePath_.back() == '/') {
        basePath_.pop_back();
    }
}

std::string RecordingLayout::outputPath(
    RecordingType type,
    const RecordingOwner& owner,
    std::time_t startTime) const
{
    const std::string typeName = recordingTypeToString(type);

    std::string path = basePath_;
    path += "/" + typeName;
    path += "/" + sanitizePathSegment(owner.examId);
    path += "/" + sanitizePathSegment(owner.batchId);
    path += "/" + sanitizePathSegment(owner.candidateId);
    path += "/" + typeName + "_recording_" + formatRecordingTimestamp(startTime);
    path += "." + container_;
    return path;
}

core::Result<void, core::Error> RecordingLayout::ensureParentDirectory(const std::string& filePath) {
    size_t slash = filePath.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return core::Result<void, core::Error>::success();
    }
    const std::string directory = filePath.substr(0, slash);

    for (size_t pos = directory.find('/', 1); ; pos = directory.find('/', pos + 1)) {
        const std::string prefix = pos == std::string::npos ? directory : directory.substr(0, pos);
        auto created = makeDirectory(prefix);
        if (created.isError()) {
            return created;
        }
        if (pos == std::string::npos) {
            break;
        }
    }
    return core::Result<void, core::Error>::success();
}

} // namespace recording
} // namespace proctorsfu
