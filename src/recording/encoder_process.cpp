// ProctorSFU - Exam Proctoring Media Server
// Encoder Process Implementation

#include "proctorsfu/recording/encoder_process.hpp"

#include <atomic>
#include <mutex>

namespace proctorsfu {
namespace recording {

namespace {

const std::string LOG_CATEGORY = "Encoder";

void appendInputArgs(std::vector<std::string>& args, const std::string& descriptorPath) {
    const char* inputArgs[] = {
        "-f", "sdp",
        "-fflags", "+genpts",
        "-avoid_negative_ts", "make_zero",
        "-analyzeduration", "0",
        "-probesize", "32",
        "-rtbufsize", "64M",
        "-max_delay", "500000",
    };
    args.insert(args.end(), std::begin(inputArgs), std::end(inputArgs));
    args.push_back("-i");
    args.push_back(descriptorPath);
}

// =============================================================================
// Managed Process
// =============================================================================

class ManagedEncoderProcess : public IEncoderProcess {
public:
    ManagedEncoderProcess(std::shared_ptr<pal::IProcessPAL> processPal, uint32_t stopGraceMs)
        : processPal_(std::move(processPal))
        , stopGraceMs_(stopGraceMs) {}

    EncoderState state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void markRunning() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == EncoderState::Starting) {
            state_ = EncoderState::Running;
        }
    }

    bool dataObserved() const override {
        return dataObserved_.load();
    }

    core::Result<void, core::Error> terminate() override {
        pal::ProcessHandle handle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == EncoderState::Stopping || state_ == EncoderState::Exited) {
                return core::Result<void, core::Error>::success();
            }
            state_ = EncoderState::Stopping;
            handle = handle_;
        }

        auto result = processPal_->terminate(handle, stopGraceMs_);
        if (result.isError() && result.error().code != pal::ProcessErrorCode::InvalidHandle) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::RecordingError,
                "Failed to stop encoder",
                result.error().message));
        }
        return core::Result<void, core::Error>::success();
    }

    void setHandle(pal::ProcessHandle handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        handle_ = handle;
    }

    void onLine(const std::string& line) {
        if (isProgressLine(line)) {
            dataObserved_.store(true);
        }
    }

    EncoderExit onExited(const pal::ProcessExitStatus& status) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = EncoderState::Exited;
        }
        EncoderExit exit;
        exit.exited = status.exited;
        exit.exitCode = status.exitCode;
        exit.signaled = status.signaled;
        exit.signal = status.signal;
        exit.dataObserved = dataObserved_.load();
        return exit;
    }

private:
    std::shared_ptr<pal::IProcessPAL> processPal_;
    const uint32_t stopGraceMs_;

    mutable std::mutex mutex_;
    EncoderState state_ = EncoderState::Starting;
    pal::ProcessHandle handle_ = pal::INVALID_PROCESS_HANDLE;
    std::atomic<bool> dataObserved_{false};
};

} // anonymous namespace

// =============================================================================
// Command Line
// =============================================================================

EncoderCommand buildEncoderCommand(
    const std::string& executable,
    const std::string& logLevel,
    const std::vector<EncoderInput>& inputs,
    const std::string& outputPath)
{
    EncoderCommand command;
    command.executable = executable;

    std::vector<std::string>& args = command.arguments;
    args.push_back("-protocol_whitelist");
    args.push_back("file,udp,rtp");
    args.push_back("-loglevel");
    args.push_back(logLevel);
    args.push_back("-y");

    for (const auto& input : inputs) {
        appendInputArgs(args, input.descriptorPath);
    }

    if (inputs.size() >= 2) {
        args.insert(args.end(), {"-c:v", "copy", "-c:a", "copy",
                                 "-map", "0:v:0", "-map", "1:a:0"});
    } else if (!inputs.empty() && inputs.front().kind == core::MediaKind::Audio) {
        args.insert(args.end(), {"-c:a", "copy"});
    } else {
        args.insert(args.end(), {"-c:v", "copy"});
    }

    args.push_back(outputPath);
    return command;
}

bool isProgressLine(const std::string& line) {
    return line.find("frame=") != std::string::npos ||
           line.find("size=") != std::string::npos;
}

const char* encoderStateToString(EncoderState state) {
    switch (state) {
        case EncoderState::Starting: return "starting";
        case EncoderState::Running: return "running";
        case EncoderState::Stopping: return "stopping";
        case EncoderState::Exited: return "exited";
    }
    return "unknown";
}

// =============================================================================
// FfmpegEncoderLauncher
// =============================================================================

FfmpegEncoderLauncher::FfmpegEncoderLauncher(
    std::shared_ptr<pal::IProcessPAL> processPal,
    core::IExecutor& executor,
    std::shared_ptr<core::StructuredLogger> logger,
    uint32_t stopGraceMs)
    : processPal_(std::move(processPal))
    , executor_(executor)
    , logger_(std::move(logger))
    , stopGraceMs_(stopGraceMs) {
}

core::Result<std::shared_ptr<IEncoderProcess>, core::Error> FfmpegEncoderLauncher::launch(
    const EncoderCommand& command,
    EncoderExitCallback onExit)
{
    auto process = std::make_shared<ManagedEncoderProcess>(processPal_, stopGraceMs_);

    pal::ProcessOptions options;
    options.executable = command.executable;
    options.args = command.arguments;

    std::shared_ptr<core::StructuredLogger> logger = logger_;
    core::IExecutor* executor = &executor_;

    auto spawned = processPal_->spawn(
        options,
        [process, logger](const std::string& line) {
            process->onLine(line);
            logger->debug(line, LOG_CATEGORY);
        },
        [process, executor, onExit](const pal::ProcessExitStatus& status) {
            EncoderExit exit = process->onExited(status);
            executor->post([onExit, exit]() {
                if (onExit) {
                    onExit(exit);
                }
            });
        });

    if (spawned.isError()) {
        return core::Result<std::shared_ptr<IEncoderProcess>, core::Error>::error(core::Error(
            core::ErrorCode::RecordingError,
            "Failed to start encoder",
            command.executable + ": " + spawned.error().message));
    }

    process->setHandle(spawned.value());
    logger_->debug("Encoder started, pid " + std::to_string(spawned.value().value), LOG_CATEGORY);
    return core::Result<std::shared_ptr<IEncoderProcess>, core::Error>::success(process);
}

} // namespace recording
} // namespace proctorsfu
