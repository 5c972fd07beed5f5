// ProctorSFU - Exam Proctoring Media Server
// Encoder Process - Managed FFmpeg child for RTP capture
//
// Responsibilities:
// - Build the encoder command line for single and combined recordings
// - Launch the encoder through the process PAL
// - Track the child through Starting, Running, Stopping and Exited
// - Detect encoded output on stderr ("frame=" / "size=" progress lines)
// - Provide one idempotent terminate path

#ifndef PROCTORSFU_RECORDING_ENCODER_PROCESS_HPP
#define PROCTORSFU_RECORDING_ENCODER_PROCESS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/event_loop.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/core/types.hpp"
#include "proctorsfu/pal/process_pal.hpp"

namespace proctorsfu {
namespace recording {

// =============================================================================
// Command Line
// =============================================================================

struct EncoderInput {
    std::string descriptorPath;
    core::MediaKind kind = core::MediaKind::Video;
};

struct EncoderCommand {
    std::string executable;
    std::vector<std::string> arguments;
};

/**
 * @brief Stream-copy command for one or two SDP inputs.
 *
 * A single input copies its one stream. Two inputs (video first, then audio)
 * are muxed with "-map 0:v:0 -map 1:a:0".
 */
EncoderCommand buildEncoderCommand(
    const std::string& executable,
    const std::string& logLevel,
    const std::vector<EncoderInput>& inputs,
    const std::string& outputPath
);

/**
 * @brief True for encoder progress lines that prove data was written.
 */
bool isProgressLine(const std::string& line);

// =============================================================================
// Process
// =============================================================================

enum class EncoderState {
    Starting,   ///< Spawned, not yet receiving
    Running,    ///< All inputs bound
    Stopping,   ///< terminate() sent
    Exited      ///< Reaped
};

const char* encoderStateToString(EncoderState state);

struct EncoderExit {
    bool exited = false;
    int exitCode = 0;
    bool signaled = false;
    int signal = 0;
    bool dataObserved = false;
};

using EncoderExitCallback = std::function<void(const EncoderExit& exit)>;

/**
 * @brief Handle to one running encoder.
 */
class IEncoderProcess {
public:
    virtual ~IEncoderProcess() = default;

    virtual EncoderState state() const = 0;

    /**
     * @brief Starting -> Running once the caller saw the inputs bound.
     */
    virtual void markRunning() = 0;

    /**
     * @brief True once a progress line was seen on stderr.
     */
    virtual bool dataObserved() const = 0;

    /**
     * @brief Stop the encoder. Only the first call has an effect.
     * @return RecordingError if the stop signal could not be delivered
     */
    virtual core::Result<void, core::Error> terminate() = 0;
};

/**
 * @brief Starts encoder processes.
 *
 * onExit is delivered on the launcher's executor exactly once per process.
 */
class IEncoderLauncher {
public:
    virtual ~IEncoderLauncher() = default;

    /**
     * @return RecordingError when the process cannot be started
     */
    virtual core::Result<std::shared_ptr<IEncoderProcess>, core::Error> launch(
        const EncoderCommand& command,
        EncoderExitCallback onExit
    ) = 0;
};

/**
 * @brief IEncoderLauncher running FFmpeg through the process PAL.
 */
class FfmpegEncoderLauncher : public IEncoderLauncher {
public:
    FfmpegEncoderLauncher(
        std::shared_ptr<pal::IProcessPAL> processPal,
        core::IExecutor& executor,
        std::shared_ptr<core::StructuredLogger> logger,
        uint32_t stopGraceMs
    );

    core::Result<std::shared_ptr<IEncoderProcess>, core::Error> launch(
        const EncoderCommand& command,
        EncoderExitCallback onExit
    ) override;

private:
    std::shared_ptr<pal::IProcessPAL> processPal_;
    core::IExecutor& executor_;
    std::shared_ptr<core::StructuredLogger> logger_;
    uint32_t stopGraceMs_;
};

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_ENCODER_PROCESS_HPP
