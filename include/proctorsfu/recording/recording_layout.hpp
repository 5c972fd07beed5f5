// ProctorSFU - Exam Proctoring Media Server
// Recording Layout - Output paths for recordings
//
// {base}/{screen|webcam}/{examId}/{batchId}/{candidateId}/
//     {type}_recording_{yyyy_MM_dd_HH_mm_ss}.{container}

#ifndef PROCTORSFU_RECORDING_RECORDING_LAYOUT_HPP
#define PROCTORSFU_RECORDING_RECORDING_LAYOUT_HPP

#include <ctime>
#include <optional>
#include <string>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/recording/recording_types.hpp"

namespace proctorsfu {
namespace recording {

constexpr size_t MAX_PATH_SEGMENT_LENGTH = 48;

/**
 * @brief Keep [A-Za-z0-9_-], replace anything else with '_', cap the length.
 *
 * An empty or missing value becomes "unknown".
 */
std::string sanitizePathSegment(const std::optional<std::string>& value);

/**
 * @brief Local time as yyyy_MM_dd_HH_mm_ss.
 */
std::string formatRecordingTimestamp(std::time_t time);

/**
 * @brief Correlation ids a recording is filed under.
 */
struct RecordingOwner {
    std::optional<std::string> examId;
    std::optional<std::string> batchId;
    std::optional<std::string> candidateId;
};

class RecordingLayout {
public:
    RecordingLayout(std::string basePath, std::string container = "webm");

    /**
     * @brief Output file path for a recording started at startTime.
     */
    std::string outputPath(RecordingType type, const RecordingOwner& owner,
                           std::time_t startTime) const;

    /**
     * @brief Create the parent directory of a path, including missing parents.
     * @return RecordingError when the directory cannot be created
     */
    static core::Result<void, core::Error> ensureParentDirectory(const std::string& filePath);

    const std::string& basePath() const { return basePath_; }

private:
    std::string basePath_;
    std::string container_;
};

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_RECORDING_LAYOUT_HPP
