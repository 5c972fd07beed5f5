// ProctorSFU - Exam Proctoring Media Server
// Media Engine Adapter Implementation

#include "proctorsfu/engine/media_engine_adapter.hpp"

#include <utility>

namespace proctorsfu {
namespace engine {

namespace {

const std::string LOG_CATEGORY = "Engine";

core::Error workerUnavailable() {
    return core::Error{core::ErrorCode::EngineError, "Media worker unavailable"};
}

} // anonymous namespace

const char* workerStateToString(WorkerState state) {
    switch (state) {
        case WorkerState::Idle: return "idle";
        case WorkerState::Starting: return "starting";
        case WorkerState::Running: return "running";
        case WorkerState::Restarting: return "restarting";
        case WorkerState::Failed: return "failed";
    }
    return "unknown";
}

std::vector<RouterCodec> defaultRouterCodecs() {
    std::vector<RouterCodec> codecs;

    RouterCodec opus;
    opus.kind = core::MediaKind::Audio;
    opus.mimeType = "audio/opus";
    opus.clockRate = 48000;
    opus.channels = 2;
    codecs.push_back(opus);

    RouterCodec vp8;
    vp8.kind = core::MediaKind::Video;
    vp8.mimeType = "video/VP8";
    vp8.clockRate = 90000;
    vp8.parameters = core::JsonValue::object();
    vp8.parameters.set("x-google-start-bitrate", core::JsonValue::number(1000));
    codecs.push_back(vp8);

    return codecs;
}

// =============================================================================
// Construction
// =============================================================================

MediaEngineAdapter::MediaEngineAdapter(
    std::shared_ptr<IMediaEngine> engine,
    core::IExecutor& executor,
    core::MediaConfig config,
    std::shared_ptr<core::StructuredLogger> logger)
    : engine_(std::move(engine))
    , executor_(executor)
    , config_(std::move(config))
    , logger_(std::move(logger))
    , alive_(std::make_shared<std::atomic<bool>>(true))
{
    std::shared_ptr<std::atomic<bool>> alive = alive_;
    core::IExecutor* executorPtr = &executor_;
    engine_->setWorkerDiedCallback([this, alive, executorPtr](const std::string& reason) {
        if (!alive->load()) {
            return;
        }
        executorPtr->post([this, alive, reason]() {
            if (alive->load()) {
                handleWorkerDied(reason);
            }
        });
    });
}

MediaEngineAdapter::~MediaEngineAdapter() {
    alive_->store(false);
    engine_->setWorkerDiedCallback(nullptr);

    core::TaskId restartTask = core::INVALID_TASK_ID;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        restartTask = restartTask_;
        restartTask_ = core::INVALID_TASK_ID;
    }
    if (restartTask != core::INVALID_TASK_ID) {
        executor_.cancel(restartTask);
    }
}

// =============================================================================
// Worker
// =============================================================================

void MediaEngineAdapter::start(VoidCallback callback) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == WorkerState::Running) {
            executor_.post([callback]() {
                callback(core::Result<void, core::Error>::success());
            });
            return;
        }
        if (state_ != WorkerState::Idle) {
            failLater(callback, core::Error{core::ErrorCode::EngineError,
                "Media worker is " + std::string(workerStateToString(state_))});
            return;
        }
        state_ = WorkerState::Starting;
    }
    launchWorker(false, std::move(callback));
}

WorkerState MediaEngineAdapter::workerState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void MediaEngineAdapter::launchWorker(bool isRestart, VoidCallback callback) {
    WorkerSettings settings;
    settings.logLevel = config_.workerLogLevel;
    settings.rtcMinPort = config_.rtcMinPort;
    settings.rtcMaxPort = config_.rtcMaxPort;

    std::shared_ptr<std::atomic<bool>> alive = alive_;
    engine_->createWorker(settings, onExecutor<WorkerId>(
        [this, alive, isRestart, callback](core::Result<WorkerId, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                setState(WorkerState::Failed);
                logger_->error("Failed to create media worker: " + result.error().toString(),
                               LOG_CATEGORY);
                if (callback) {
                    callback(core::Result<void, core::Error>::error(result.error()));
                }
                return;
            }

            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                workerId_ = result.value();
                state_ = WorkerState::Running;
            }
            if (isRestart) {
                logger_->logSessionEvent(core::SessionEventType::WorkerRestarted,
                                         core::LogContext{}, "worker " + result.value());
            } else {
                logger_->info("Media worker " + result.value() + " started", LOG_CATEGORY);
            }
            if (callback) {
                callback(core::Result<void, core::Error>::success());
            }
        }));
}

void MediaEngineAdapter::handleWorkerDied(const std::string& reason) {
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != WorkerState::Running) {
            return;
        }
        workerId_.clear();
        if (restartUsed_) {
            state_ = WorkerState::Failed;
        } else {
            restartUsed_ = true;
            state_ = WorkerState::Restarting;
            restart = true;
        }
    }

    logger_->logSessionEvent(core::SessionEventType::WorkerDied, core::LogContext{}, reason);
    if (!restart) {
        logger_->error("Media worker died again, not restarting", LOG_CATEGORY);
        return;
    }

    std::shared_ptr<std::atomic<bool>> alive = alive_;
    core::TaskId task = executor_.postDelayed(config_.workerRestartDelayMs, [this, alive]() {
        if (!alive->load()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            restartTask_ = core::INVALID_TASK_ID;
        }
        launchWorker(true, nullptr);
    });

    std::lock_guard<std::mutex> lock(stateMutex_);
    restartTask_ = task;
}

void MediaEngineAdapter::setState(WorkerState state) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = state;
}

// =============================================================================
// Routers
// =============================================================================

void MediaEngineAdapter::createRouter(EngineCallback<RouterId> callback) {
    if (workerState() != WorkerState::Running) {
        failLater(callback, workerUnavailable());
        return;
    }
    engine_->createRouter(defaultRouterCodecs(), onExecutor<RouterId>(std::move(callback)));
}

core::Result<core::JsonValue, core::Error> MediaEngineAdapter::routerCapabilities(
    const RouterId& routerId) const
{
    return engine_->routerRtpCapabilities(routerId);
}

void MediaEngineAdapter::closeRouter(const RouterId& routerId) {
    if (routerId.empty()) {
        return;
    }
    engine_->closeRouter(routerId);
    logger_->debug("Router " + routerId + " closed", LOG_CATEGORY);
}

// =============================================================================
// Client Transports
// =============================================================================

void MediaEngineAdapter::createTransport(
    const RouterId& routerId,
    core::TransportDirection direction,
    EngineCallback<WebRtcTransportParams> callback)
{
    WebRtcTransportOptions options;
    options.listenIp = config_.listenIp;
    options.announcedIp = config_.announcedIp;

    logger_->debug(std::string("Creating ") + core::transportDirectionToString(direction) +
                   " transport on router " + routerId, LOG_CATEGORY);
    engine_->createWebRtcTransport(routerId, options,
                                   onExecutor<WebRtcTransportParams>(std::move(callback)));
}

void MediaEngineAdapter::connectTransport(
    const TransportId& transportId,
    const core::JsonValue& dtlsParameters,
    VoidCallback callback)
{
    engine_->connectWebRtcTransport(transportId, dtlsParameters,
                                    onExecutor<void>(std::move(callback)));
}

void MediaEngineAdapter::closeTransport(const TransportId& transportId) {
    if (!transportId.empty()) {
        engine_->closeTransport(transportId);
    }
}

// =============================================================================
// Producers and Consumers
// =============================================================================

void MediaEngineAdapter::produce(
    const TransportId& transportId,
    core::MediaKind kind,
    const core::JsonValue& rtpParameters,
    const core::JsonValue& appData,
    EngineCallback<ProducerId> callback)
{
    ProduceOptions options;
    options.kind = kind;
    options.rtpParameters = rtpParameters;
    options.appData = appData;
    engine_->produce(transportId, options, onExecutor<ProducerId>(std::move(callback)));
}

void MediaEngineAdapter::consume(
    const RouterId& routerId,
    const TransportId& transportId,
    const ProducerId& producerId,
    const core::JsonValue& rtpCapabilities,
    bool paused,
    EngineCallback<ConsumerParams> callback)
{
    if (!engine_->canConsume(routerId, producerId, rtpCapabilities)) {
        failLater(callback, core::Error{core::ErrorCode::EngineError, "Cannot consume",
                                        "producer " + producerId});
        return;
    }

    ConsumeOptions options;
    options.producerId = producerId;
    options.rtpCapabilities = rtpCapabilities;
    options.paused = paused;
    engine_->consume(transportId, options, onExecutor<ConsumerParams>(std::move(callback)));
}

void MediaEngineAdapter::resumeConsumer(const ConsumerId& consumerId, VoidCallback callback) {
    engine_->resumeConsumer(consumerId, onExecutor<void>(std::move(callback)));
}

core::Result<ProducerStatus, core::Error> MediaEngineAdapter::producerStatus(
    const ProducerId& producerId) const
{
    return engine_->producerStatus(producerId);
}

void MediaEngineAdapter::closeProducer(const ProducerId& producerId) {
    if (!producerId.empty()) {
        engine_->closeProducer(producerId);
    }
}

void MediaEngineAdapter::closeConsumer(const ConsumerId& consumerId) {
    if (!consumerId.empty()) {
        engine_->closeConsumer(consumerId);
    }
}

// =============================================================================
// Recording Transports
// =============================================================================

void MediaEngineAdapter::createPlainTransport(
    const RouterId& routerId,
    EngineCallback<PlainTransportInfo> callback)
{
    PlainTransportOptions options;
    options.listenIp = "127.0.0.1";
    options.rtcpMux = true;
    options.comedia = false;

    std::shared_ptr<IMediaEngine> engine = engine_;
    engine_->createPlainTransport(routerId, options, onExecutor<PlainTransportInfo>(
        [engine, callback](core::Result<PlainTransportInfo, core::Error> result) {
            if (result.isSuccess() && result.value().localPort == 0) {
                engine->closeTransport(result.value().id);
                callback(core::Result<PlainTransportInfo, core::Error>::error(core::Error{
                    core::ErrorCode::RecordingError,
                    "Plain transport has no local tuple",
                    "transport " + result.value().id}));
                return;
            }
            callback(std::move(result));
        }));
}

void MediaEngineAdapter::connectPlainTransport(
    const TransportId& transportId,
    const std::string& ip,
    uint16_t port,
    VoidCallback callback)
{
    engine_->connectPlainTransport(transportId, ip, port, onExecutor<void>(std::move(callback)));
}

} // namespace engine
} // namespace proctorsfu
