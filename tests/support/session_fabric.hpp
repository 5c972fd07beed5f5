// ProctorSFU - Exam Proctoring Media Server
// Test support: fully wired session fabric over fakes

#ifndef PROCTORSFU_TESTS_SUPPORT_SESSION_FABRIC_HPP
#define PROCTORSFU_TESTS_SUPPORT_SESSION_FABRIC_HPP

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/engine/media_engine_adapter.hpp"
#include "proctorsfu/recording/recording_orchestrator.hpp"
#include "proctorsfu/session/access_policy.hpp"
#include "proctorsfu/session/port_allocator.hpp"
#include "proctorsfu/session/session_registry.hpp"
#include "proctorsfu/signaling/signaling_handler.hpp"

#include "capturing_collaborators.hpp"
#include "fake_encoder_launcher.hpp"
#include "fake_media_engine.hpp"
#include "manual_executor.hpp"

namespace proctorsfu {
namespace test {

/**
 * @brief Outcome slot for a Reply<T>.
 */
template<typename T>
struct Captured {
    std::optional<core::Result<T, core::Error>> result;
    int deliveries = 0;

    bool ok() const { return result && result->isSuccess(); }
    const T& value() const { return result->value(); }
    core::ErrorCode code() const { return result->error().code; }
};

template<typename T>
signaling::Reply<T> captureInto(std::shared_ptr<Captured<T>> slot) {
    return signaling::Reply<T>([slot](core::Result<T, core::Error> result) {
        ++slot->deliveries;
        slot->result.emplace(std::move(result));
    });
}

/**
 * @brief Scratch directory removed on destruction.
 */
class TempDirectory {
public:
    TempDirectory() {
        std::string pattern = (std::filesystem::temp_directory_path() / "proctorsfu-XXXXXX").string();
        char* created = ::mkdtemp(&pattern[0]);
        path_ = created ? std::string(created) : pattern;
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

inline core::RecordingConfig fabricRecordingConfig(const std::string& basePath) {
    core::RecordingConfig config;
    config.basePath = basePath;
    config.recorderIp = "127.0.0.1";
    config.minPort = 40000;
    config.maxPort = 40100;
    config.restartWindowMs = 5000;
    return config;
}

/**
 * @brief Registry, adapter, orchestrator and handler wired over fakes.
 *
 * Everything runs on a ManualExecutor; helpers settle it after each call.
 */
class SessionFabric {
public:
    explicit SessionFabric(core::TimeoutConfig timeouts = core::TimeoutConfig(),
                           uint32_t restartWindowMs = 5000)
        : engine(std::make_shared<FakeMediaEngine>())
        , logSink(std::make_shared<CapturingLogSink>())
        , logger(makeLogger(logSink))
        , bound(std::make_shared<BoundPorts>())
        , recordingConfig(withRestartWindow(fabricRecordingConfig(scratch.path()), restartWindowMs))
        , ports(recordingConfig.minPort, recordingConfig.maxPort, probe())
        , adapter(engine, executor, core::MediaConfig(), logger)
        , launcher(executor, bound)
        , uploader(std::make_shared<MockRecordingUploader>())
        , orchestrator(registry, adapter, ports, launcher, uploader, executor,
                       recordingConfig, timeouts, logger, probe())
        , handler(registry, adapter, policy, orchestrator, notifier, logger)
    {
        adapter.start([](core::Result<void, core::Error>) {});
        executor.runPending();
    }

    session::PortProbe probe() {
        std::shared_ptr<BoundPorts> ports = bound;
        return [ports](uint16_t port) { return ports->isFree(port); };
    }

    static signaling::ClientContext client(core::ConnectionId connectionId,
                                           const std::string& userId,
                                           std::optional<core::Role> tokenRole = std::nullopt) {
        signaling::ClientContext context;
        context.connectionId = connectionId;
        context.identity.userId = userId;
        context.identity.role = tokenRole;
        return context;
    }

    std::shared_ptr<Captured<signaling::JoinRoomReply>> join(
        core::ConnectionId connectionId, core::Role role, const std::string& roomId = "batch-1",
        const std::string& userId = "") {
        signaling::JoinRoomRequest request;
        request.roomId = roomId;
        request.role = role;
        request.examId = "exam-1";
        request.batchId = roomId;
        auto slot = std::make_shared<Captured<signaling::JoinRoomReply>>();
        handler.joinRoom(client(connectionId, userId.empty() ? "user-" + std::to_string(connectionId)
                                                             : userId),
                         request, captureInto(slot));
        executor.runPending();
        return slot;
    }

    core::TransportId createTransport(core::ConnectionId connectionId,
                                      core::TransportDirection direction = core::TransportDirection::Send) {
        signaling::CreateTransportRequest request;
        request.direction = direction;
        auto slot = std::make_shared<Captured<signaling::TransportReply>>();
        handler.createTransport(client(connectionId, ""), request, captureInto(slot));
        executor.runPending();
        return slot->ok() ? slot->value().transportId : core::TransportId();
    }

    std::shared_ptr<Captured<signaling::ProduceReply>> produce(
        core::ConnectionId connectionId, const core::TransportId& transportId,
        core::MediaKind kind, core::MediaRole mediaRole, bool settle = true) {
        signaling::ProduceRequest request;
        request.transportId = transportId;
        request.kind = kind;
        request.mediaRole = mediaRole;
        request.rtpParameters = core::JsonValue::object();
        request.appData = core::JsonValue::object();
        auto slot = std::make_shared<Captured<signaling::ProduceReply>>();
        handler.produce(client(connectionId, ""), request, captureInto(slot));
        if (settle) {
            executor.runPending();
        }
        return slot;
    }

    std::shared_ptr<Captured<signaling::ConsumeReply>> consume(
        core::ConnectionId connectionId, const core::ProducerId& producerId) {
        signaling::ConsumeRequest request;
        request.producerId = producerId;
        request.rtpCapabilities = core::JsonValue::object();
        auto slot = std::make_shared<Captured<signaling::ConsumeReply>>();
        handler.consume(client(connectionId, ""), request, captureInto(slot));
        executor.runPending();
        return slot;
    }

    /**
     * @brief Join as a student and open a send transport.
     */
    core::TransportId studentWithTransport(core::ConnectionId connectionId,
                                           const std::string& roomId = "batch-1") {
        join(connectionId, core::Role::Student, roomId);
        return createTransport(connectionId);
    }

    core::ProducerId publish(core::ConnectionId connectionId, const core::TransportId& transportId,
                             core::MediaKind kind, core::MediaRole mediaRole) {
        auto slot = produce(connectionId, transportId, kind, mediaRole);
        return slot->ok() ? slot->value().producerId : core::ProducerId();
    }

    void disconnect(core::ConnectionId connectionId) {
        handler.disconnect(connectionId);
        executor.runPending();
    }

    /**
     * @brief Run every queued and due task, letting recording pipelines finish.
     */
    void settle(uint64_t ms = 0) {
        executor.runPending();
        if (ms > 0) {
            executor.advance(ms);
        }
    }

    TempDirectory scratch;
    ManualExecutor executor;
    std::shared_ptr<FakeMediaEngine> engine;
    std::shared_ptr<CapturingLogSink> logSink;
    std::shared_ptr<core::StructuredLogger> logger;
    std::shared_ptr<BoundPorts> bound;
    core::RecordingConfig recordingConfig;
    session::SessionRegistry registry;
    session::AccessPolicy policy;
    session::PortAllocator ports;
    engine::MediaEngineAdapter adapter;
    FakeEncoderLauncher launcher;
    std::shared_ptr<MockRecordingUploader> uploader;
    recording::RecordingOrchestrator orchestrator;
    CapturingNotifier notifier;
    signaling::SignalingHandler handler;

private:
    static std::shared_ptr<core::StructuredLogger> makeLogger(std::shared_ptr<CapturingLogSink> sink) {
        auto logger = std::make_shared<core::StructuredLogger>();
        logger->setLevel(core::LogLevelConfig::Debug);
        logger->addSink(sink);
        return logger;
    }

    static core::RecordingConfig withRestartWindow(core::RecordingConfig config, uint32_t windowMs) {
        config.restartWindowMs = windowMs;
        return config;
    }
};

} // namespace test
} // namespace proctorsfu

#endif // PROCTORSFU_TESTS_SUPPORT_SESSION_FABRIC_HPP
