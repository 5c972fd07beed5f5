// ProctorSFU - Exam Proctoring Media Server
// Recording Orchestrator Implementation

#include "proctorsfu/recording/recording_orchestrator.hpp"

#include <set>
#include <sys/stat.h>

#include "proctorsfu/recording/session_descriptor.hpp"

namespace proctorsfu {
namespace recording {

namespace {

const std::string LOG_CATEGORY = "Recording";

bool isWebcamVideo(const session::ProducerInfo& producer) {
    return producer.kind == core::MediaKind::Video &&
           producer.mediaRole != core::MediaRole::Screen;
}

bool isWebcamAudio(const session::ProducerInfo& producer) {
    return producer.kind == core::MediaKind::Audio &&
           (producer.mediaRole == core::MediaRole::Webcam ||
            producer.mediaRole == core::MediaRole::Mic);
}

uint64_t fileSize(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<uint64_t>(st.st_size);
}

} // anonymous namespace

std::vector<ProducerId> RecordingInfo::producerIds() const {
    std::vector<ProducerId> ids;
    ids.reserve(tracks.size());
    for (const auto& track : tracks) {
        ids.push_back(track.producerId);
    }
    return ids;
}

// =============================================================================
// Construction
// =============================================================================

RecordingOrchestrator::RecordingOrchestrator(
    session::ISessionRegistry& registry,
    engine::MediaEngineAdapter& engine,
    session::PortAllocator& ports,
    IEncoderLauncher& launcher,
    std::shared_ptr<IRecordingUploader> uploader,
    core::IExecutor& executor,
    core::RecordingConfig recordingConfig,
    core::TimeoutConfig timeouts,
    std::shared_ptr<core::StructuredLogger> logger,
    session::PortProbe portProbe)
    : registry_(registry)
    , engine_(engine)
    , ports_(ports)
    , launcher_(launcher)
    , uploader_(std::move(uploader))
    , executor_(executor)
    , recordingConfig_(std::move(recordingConfig))
    , timeouts_(timeouts)
    , logger_(std::move(logger))
    , portProbe_(std::move(portProbe))
    , layout_(recordingConfig_.basePath, recordingConfig_.container)
    , alive_(std::make_shared<std::atomic<bool>>(true)) {
}

RecordingOrchestrator::~RecordingOrchestrator() {
    alive_->store(false);
    for (auto& pair : sessions_) {
        if (pair.second.pendingTask != core::INVALID_TASK_ID) {
            executor_.cancel(pair.second.pendingTask);
        }
    }
}

// =============================================================================
// Triggers
// =============================================================================

std::optional<RecordingSessionId> RecordingOrchestrator::onProducerCreated(
    ConnectionId connectionId,
    const ProducerId& producerId)
{
    auto peer = registry_.findPeer(connectionId);
    auto producer = registry_.findProducer(producerId);
    if (!peer || !producer || peer->role != core::Role::Student) {
        return std::nullopt;
    }

    if (producer->kind == core::MediaKind::Video &&
        producer->mediaRole == core::MediaRole::Screen) {
        return startSession(RecordingType::Screen, *peer, {*producer});
    }

    // Latest webcam producers of the peer, excluding the new one
    std::optional<session::ProducerInfo> webcamVideo;
    std::optional<session::ProducerInfo> webcamAudio;
    for (const auto& other : registry_.producersOf(connectionId)) {
        if (other.id == producerId) {
            continue;
        }
        if (isWebcamVideo(other)) {
            webcamVideo = other;
        } else if (isWebcamAudio(other)) {
            webcamAudio = other;
        }
    }

    if (isWebcamVideo(*producer)) {
        if (webcamAudio && !registry_.recordingFor(connectionId, webcamAudio->id)) {
            return startSession(RecordingType::Webcam, *peer, {*producer, *webcamAudio});
        }
        return startSession(RecordingType::Webcam, *peer, {*producer});
    }

    if (!isWebcamAudio(*producer)) {
        return std::nullopt;
    }

    if (!webcamVideo) {
        logger_->debug("Webcam audio " + producerId + " waits for a webcam video producer",
                       LOG_CATEGORY);
        return std::nullopt;
    }

    auto existing = registry_.recordingFor(connectionId, webcamVideo->id);
    if (!existing) {
        return startSession(RecordingType::Webcam, *peer, {*webcamVideo, *producer});
    }

    auto it = sessions_.find(*existing);
    if (it == sessions_.end() || it->second.cleaned) {
        return startSession(RecordingType::Webcam, *peer, {*webcamVideo, *producer});
    }
    if (it->second.info.isCombined()) {
        return std::nullopt;
    }

    const uint64_t age = executor_.nowMs() - it->second.info.createdAtMs;
    if (age < recordingConfig_.restartWindowMs) {
        logger_->info("Replacing video-only recording " + std::to_string(*existing) +
                      " with a combined recording", LOG_CATEGORY);
        cleanup(*existing, ExitReason::Replaced);
        return startSession(RecordingType::Webcam, *peer, {*webcamVideo, *producer});
    }

    logger_->info("Webcam audio " + producerId + " arrived " + std::to_string(age) +
                  " ms after video; keeping video-only recording " + std::to_string(*existing),
                  LOG_CATEGORY);
    return std::nullopt;
}

void RecordingOrchestrator::onProducerClosed(const session::ProducerRemoval& removal) {
    if (removal.recordingSession) {
        cleanup(*removal.recordingSession, ExitReason::ProducerClosed);
    }
}

void RecordingOrchestrator::onPeerLeft(const session::LeaveOutcome& outcome, ExitReason reason) {
    std::set<RecordingSessionId> ids;
    for (const auto& pair : outcome.peer.recordingSessions) {
        ids.insert(pair.second);
    }
    for (const auto& pair : sessions_) {
        if (pair.second.info.owner == outcome.peer.connectionId && !pair.second.cleaned) {
            ids.insert(pair.first);
        }
    }
    for (RecordingSessionId id : ids) {
        cleanup(id, reason);
    }
}

void RecordingOrchestrator::shutdown() {
    std::vector<RecordingSessionId> ids;
    for (const auto& pair : sessions_) {
        if (!pair.second.cleaned) {
            ids.push_back(pair.first);
        }
    }
    for (RecordingSessionId id : ids) {
        cleanup(id, ExitReason::Shutdown);
    }
}

// =============================================================================
// Session Start
// =============================================================================

std::optional<RecordingSessionId> RecordingOrchestrator::startSession(
    RecordingType type,
    const session::PeerInfo& peer,
    const std::vector<session::ProducerInfo>& producers)
{
    auto room = registry_.findRoomById(peer.roomId);
    if (!room) {
        logger_->warning("Room " + peer.roomId + " vanished before recording start", LOG_CATEGORY);
        return std::nullopt;
    }

    const RecordingSessionId id = nextSessionId_++;

    Session session;
    session.info.id = id;
    session.info.type = type;
    session.info.owner = peer.connectionId;
    session.info.createdAtMs = executor_.nowMs();
    session.startedAt = std::chrono::system_clock::now();
    session.ids.examId = peer.examId;
    session.ids.batchId = peer.batchId ? peer.batchId : std::optional<std::string>(peer.roomId);
    session.ids.candidateId = peer.userId;
    session.roomId = peer.roomId;
    session.routerId = room->routerId;

    for (const auto& producer : producers) {
        RecordingTrack track;
        track.producerId = producer.id;
        track.kind = producer.kind;
        session.info.tracks.push_back(track);
    }

    session.info.outputPath = uniqueOutputPath(layout_.outputPath(
        type, session.ids, std::chrono::system_clock::to_time_t(session.startedAt)));

    Session& stored = sessions_.emplace(id, std::move(session)).first->second;

    for (const auto& producer : producers) {
        auto bound = registry_.bindRecording(peer.connectionId, producer.id, id);
        if (bound.isError()) {
            logger_->warningWithContext("Cannot index recording: " + bound.error().message,
                                        logContext(stored), LOG_CATEGORY);
        }
    }

    logger_->info("Starting " + std::string(recordingTypeToString(type)) +
                  (stored.info.isCombined() ? " combined" : "") + " recording " +
                  std::to_string(id) + " -> " + stored.info.outputPath, LOG_CATEGORY);

    createPlainTransports(id, 0);
    return id;
}

std::string RecordingOrchestrator::uniqueOutputPath(const std::string& path) const {
    // Finished recordings stay on disk and the encoder runs with -y
    auto inUse = [this](const std::string& candidate) {
        for (const auto& pair : sessions_) {
            if (pair.second.info.outputPath == candidate) {
                return true;
            }
        }
        struct stat st;
        return ::stat(candidate.c_str(), &st) == 0;
    };

    if (!inUse(path)) {
        return path;
    }

    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        dot = path.size();
    }
    for (int suffix = 2; ; ++suffix) {
        std::string candidate = path.substr(0, dot) + "_" + std::to_string(suffix) + path.substr(dot);
        if (!inUse(candidate)) {
            return candidate;
        }
    }
}

// =============================================================================
// Pipeline
// =============================================================================

void RecordingOrchestrator::createPlainTransports(RecordingSessionId id, size_t index) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }
    if (index >= session->info.tracks.size()) {
        waitForProducers(id, executor_.nowMs() + timeouts_.producerActiveMs);
        return;
    }

    auto alive = alive_;
    engine_.createPlainTransport(session->routerId,
        [this, alive, id, index](core::Result<engine::PlainTransportInfo, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                fail(id, result.error());
                return;
            }
            Session* current = liveSession(id);
            if (!current) {
                engine_.closeTransport(result.value().id);
                return;
            }
            current->info.tracks[index].plainTransportId = result.value().id;
            if (!revalidate(id)) {
                return;
            }
            createPlainTransports(id, index + 1);
        });
}

void RecordingOrchestrator::waitForProducers(RecordingSessionId id, uint64_t deadlineMs) {
    Session* session = revalidate(id);
    if (!session) {
        return;
    }
    session->pendingTask = core::INVALID_TASK_ID;

    bool allActive = true;
    for (const auto& track : session->info.tracks) {
        auto status = engine_.producerStatus(track.producerId);
        if (status.isError() || status.value() == engine::ProducerStatus::Closed) {
            fail(id, core::Error(core::ErrorCode::RecordingError,
                                 "Producer closed before recording started", track.producerId));
            return;
        }
        if (status.value() != engine::ProducerStatus::Active) {
            allActive = false;
        }
    }

    if (allActive) {
        createConsumers(id, 0);
        return;
    }
    if (executor_.nowMs() >= deadlineMs) {
        fail(id, core::Error(core::ErrorCode::RecordingError,
                             "Producer did not become active",
                             "waited " + std::to_string(timeouts_.producerActiveMs) + " ms"));
        return;
    }

    auto alive = alive_;
    session->pendingTask = executor_.postDelayed(timeouts_.producerCheckIntervalMs,
        [this, alive, id, deadlineMs]() {
            if (alive->load()) {
                waitForProducers(id, deadlineMs);
            }
        });
}

void RecordingOrchestrator::createConsumers(RecordingSessionId id, size_t index) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }
    if (index >= session->info.tracks.size()) {
        prepareEncoderInputs(id);
        return;
    }

    auto capabilities = engine_.routerCapabilities(session->routerId);
    if (capabilities.isError()) {
        fail(id, capabilities.error());
        return;
    }

    const RecordingTrack& track = session->info.tracks[index];
    auto alive = alive_;
    engine_.consume(session->routerId, track.plainTransportId, track.producerId,
                    capabilities.value(), true,
        [this, alive, id, index](core::Result<engine::ConsumerParams, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                fail(id, result.error());
                return;
            }
            Session* current = liveSession(id);
            if (!current) {
                engine_.closeConsumer(result.value().id);
                return;
            }

            RecordingTrack& target = current->info.tracks[index];
            target.consumerId = result.value().id;

            const core::JsonValue& codecs = result.value().rtpParameters["codecs"];
            if (!codecs.isArray() || codecs.items().empty()) {
                fail(id, core::Error(core::ErrorCode::RecordingError,
                                     "Recording consumer has no codec", target.consumerId));
                return;
            }
            target.payloadType = static_cast<uint8_t>(codecs.items().front()["payloadType"].getInt());

            if (!revalidate(id)) {
                return;
            }
            createConsumers(id, index + 1);
        });
}

void RecordingOrchestrator::prepareEncoderInputs(RecordingSessionId id) {
    Session* session = revalidate(id);
    if (!session) {
        return;
    }

    for (auto& track : session->info.tracks) {
        auto port = ports_.acquire();
        if (port.isError()) {
            fail(id, port.error());
            return;
        }
        track.port = port.value();
    }

    auto directory = RecordingLayout::ensureParentDirectory(session->info.outputPath);
    if (directory.isError()) {
        fail(id, directory.error());
        return;
    }

    for (auto& track : session->info.tracks) {
        track.descriptorPath = descriptorPathFor(session->info.outputPath, track.kind);

        StreamDescription stream;
        stream.kind = track.kind;
        stream.address = recordingConfig_.recorderIp;
        stream.port = track.port;
        stream.payloadType = track.payloadType;

        auto written = writeSessionDescriptor(track.descriptorPath, buildSessionDescriptor(stream));
        if (written.isError()) {
            fail(id, written.error());
            return;
        }
    }

    launchEncoder(id);
}

void RecordingOrchestrator::launchEncoder(RecordingSessionId id) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }

    std::vector<EncoderInput> inputs;
    for (const auto& track : session->info.tracks) {
        EncoderInput input;
        input.descriptorPath = track.descriptorPath;
        input.kind = track.kind;
        inputs.push_back(input);
    }

    EncoderCommand command = buildEncoderCommand(recordingConfig_.encoderPath,
                                                 recordingConfig_.encoderLogLevel,
                                                 inputs, session->info.outputPath);

    auto alive = alive_;
    auto launched = launcher_.launch(command, [this, alive, id](const EncoderExit& exit) {
        if (alive->load()) {
            onEncoderExit(id, exit);
        }
    });
    if (launched.isError()) {
        fail(id, launched.error());
        return;
    }

    session->encoder = launched.value();
    session->info.encoderStarted = true;
    awaitEncoderReady(id, executor_.nowMs() + timeouts_.encoderReadyTimeoutMs);
}

void RecordingOrchestrator::awaitEncoderReady(RecordingSessionId id, uint64_t deadlineMs) {
    Session* session = revalidate(id);
    if (!session) {
        return;
    }
    session->pendingTask = core::INVALID_TASK_ID;

    bool ready = true;
    if (portProbe_) {
        for (const auto& track : session->info.tracks) {
            // Bindable means the encoder has not opened it yet
            if (portProbe_(track.port)) {
                ready = false;
                break;
            }
        }
    }

    if (ready) {
        session->encoder->markRunning();
        connectPlainTransports(id, 0);
        return;
    }
    if (executor_.nowMs() >= deadlineMs) {
        fail(id, core::Error(core::ErrorCode::RecordingError,
                             "Encoder did not open its input ports",
                             "waited " + std::to_string(timeouts_.encoderReadyTimeoutMs) + " ms"));
        return;
    }

    auto alive = alive_;
    session->pendingTask = executor_.postDelayed(timeouts_.encoderReadyPollMs,
        [this, alive, id, deadlineMs]() {
            if (alive->load()) {
                awaitEncoderReady(id, deadlineMs);
            }
        });
}

void RecordingOrchestrator::connectPlainTransports(RecordingSessionId id, size_t index) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }

    auto alive = alive_;
    if (index >= session->info.tracks.size()) {
        if (timeouts_.transportSettleMs == 0) {
            resumeConsumers(id, 0);
            return;
        }
        session->pendingTask = executor_.postDelayed(timeouts_.transportSettleMs,
            [this, alive, id]() {
                if (!alive->load()) {
                    return;
                }
                Session* current = revalidate(id);
                if (current) {
                    current->pendingTask = core::INVALID_TASK_ID;
                    resumeConsumers(id, 0);
                }
            });
        return;
    }

    const RecordingTrack& track = session->info.tracks[index];
    engine_.connectPlainTransport(track.plainTransportId, recordingConfig_.recorderIp, track.port,
        [this, alive, id, index](core::Result<void, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                fail(id, result.error());
                return;
            }
            if (revalidate(id)) {
                connectPlainTransports(id, index + 1);
            }
        });
}

void RecordingOrchestrator::resumeConsumers(RecordingSessionId id, size_t index) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }
    if (index >= session->info.tracks.size()) {
        markRecording(id);
        return;
    }

    auto alive = alive_;
    engine_.resumeConsumer(session->info.tracks[index].consumerId,
        [this, alive, id, index](core::Result<void, core::Error> result) {
            if (!alive->load()) {
                return;
            }
            if (result.isError()) {
                fail(id, result.error());
                return;
            }
            if (revalidate(id)) {
                resumeConsumers(id, index + 1);
            }
        });
}

void RecordingOrchestrator::markRecording(RecordingSessionId id) {
    Session* session = revalidate(id);
    if (!session) {
        return;
    }
    session->info.status = RecordingStatus::Recording;
    logger_->logSessionEvent(core::SessionEventType::RecordingStarted, logContext(*session),
                             std::string(recordingTypeToString(session->info.type)) + " -> " +
                             session->info.outputPath);
}

// =============================================================================
// Validation and Failure
// =============================================================================

RecordingOrchestrator::Session* RecordingOrchestrator::liveSession(RecordingSessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.cleaned) {
        return nullptr;
    }
    return &it->second;
}

RecordingOrchestrator::Session* RecordingOrchestrator::revalidate(RecordingSessionId id) {
    Session* session = liveSession(id);
    if (!session) {
        return nullptr;
    }

    if (!registry_.findPeer(session->info.owner)) {
        logger_->debug("Recording " + std::to_string(id) + " lost its peer", LOG_CATEGORY);
        cleanup(id, ExitReason::Disconnect);
        return nullptr;
    }
    for (const auto& track : session->info.tracks) {
        if (!registry_.findProducer(track.producerId)) {
            logger_->debug("Recording " + std::to_string(id) + " lost producer " +
                           track.producerId, LOG_CATEGORY);
            cleanup(id, ExitReason::ProducerClosed);
            return nullptr;
        }
    }
    return session;
}

void RecordingOrchestrator::fail(RecordingSessionId id, const core::Error& error) {
    Session* session = liveSession(id);
    if (!session) {
        return;
    }
    core::LogContext context = logContext(*session);
    context.errorCode = core::errorCodeToString(error.code);
    logger_->errorWithContext("Recording setup failed: " + error.toString(), context, LOG_CATEGORY);
    cleanup(id, ExitReason::PipelineError);
}

// =============================================================================
// Teardown
// =============================================================================

void RecordingOrchestrator::cleanup(RecordingSessionId id, ExitReason reason) {
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.cleaned) {
        return;
    }

    Session& session = it->second;
    session.cleaned = true;
    session.info.status = RecordingStatus::Cleaning;
    session.info.exitReason = reason;
    session.endedAt = std::chrono::system_clock::now();

    if (session.pendingTask != core::INVALID_TASK_ID) {
        executor_.cancel(session.pendingTask);
        session.pendingTask = core::INVALID_TASK_ID;
    }

    for (const auto& track : session.info.tracks) {
        registry_.unbindRecording(session.info.owner, track.producerId, id);
    }

    bool teardownError = false;
    if (session.encoder && !session.encoderExited) {
        auto stopped = session.encoder->terminate();
        if (stopped.isError()) {
            teardownError = true;
            logger_->errorWithContext(stopped.error().toString(), logContext(session), LOG_CATEGORY);
        }
    }

    for (const auto& track : session.info.tracks) {
        if (!track.consumerId.empty()) {
            engine_.closeConsumer(track.consumerId);
        }
    }
    for (const auto& track : session.info.tracks) {
        if (!track.plainTransportId.empty()) {
            engine_.closeTransport(track.plainTransportId);
        }
    }
    for (const auto& track : session.info.tracks) {
        if (track.port != 0) {
            ports_.release(track.port);
        }
    }
    for (const auto& track : session.info.tracks) {
        auto removed = removeSessionDescriptor(track.descriptorPath);
        if (removed.isError()) {
            teardownError = true;
            logger_->errorWithContext(removed.error().toString(), logContext(session), LOG_CATEGORY);
        }
    }

    session.info.dataObserved = session.encoder && session.encoder->dataObserved();
    if (teardownError) {
        session.info.status = RecordingStatus::Error;
    } else if (session.info.dataObserved) {
        session.info.status = RecordingStatus::Completed;
    } else {
        session.info.status = RecordingStatus::Failed;
    }

    logger_->logSessionEvent(
        session.info.status == RecordingStatus::Completed
            ? core::SessionEventType::RecordingStopped
            : core::SessionEventType::RecordingFailed,
        logContext(session),
        std::string("reason=") + exitReasonToString(reason) +
        ", status=" + recordingStatusToString(session.info.status));

    if (!session.encoder || session.encoderExited) {
        finalize(id);
    }
}

void RecordingOrchestrator::onEncoderExit(RecordingSessionId id, const EncoderExit& exit) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }

    Session& session = it->second;
    session.encoderExited = true;

    if (!session.cleaned) {
        core::LogContext context = logContext(session);
        context.errorCode = core::errorCodeToString(core::ErrorCode::RecordingError);
        logger_->warningWithContext(
            "Encoder exited " + (exit.signaled ? "on signal " + std::to_string(exit.signal)
                                               : "with code " + std::to_string(exit.exitCode)),
            context, LOG_CATEGORY);
        cleanup(id, ExitReason::EncoderExited);
        return;
    }

    if (exit.dataObserved && session.info.status == RecordingStatus::Failed) {
        session.info.dataObserved = true;
        session.info.status = RecordingStatus::Completed;
    }
    finalize(id);
}

void RecordingOrchestrator::finalize(RecordingSessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second.finalized) {
        return;
    }
    it->second.finalized = true;

    upload(it->second);

    RecordingInfo info = it->second.info;
    sessions_.erase(it);

    if (finishedCallback_) {
        finishedCallback_(info);
    }
}

void RecordingOrchestrator::upload(const Session& session) {
    if (!uploader_ || !session.info.encoderStarted ||
        session.info.exitReason == ExitReason::Replaced) {
        return;
    }
    if (session.info.status != RecordingStatus::Completed) {
        logger_->info("Recording " + std::to_string(session.info.id) + " not uploaded, status " +
                      recordingStatusToString(session.info.status), LOG_CATEGORY);
        return;
    }

    const uint64_t size = fileSize(session.info.outputPath);
    if (size == 0) {
        logger_->info("Recording " + std::to_string(session.info.id) + " produced no output",
                      LOG_CATEGORY);
        return;
    }

    UploadRequest request;
    request.filePath = session.info.outputPath;
    request.examId = session.ids.examId;
    request.batchId = session.ids.batchId;
    request.candidateId = session.ids.candidateId.value_or("");
    request.recordingType = session.info.type;
    request.metadata.startedAt = session.startedAt;
    request.metadata.endedAt = session.endedAt;
    request.metadata.durationMs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            session.endedAt - session.startedAt).count());
    request.metadata.fileSizeBytes = size;
    request.metadata.exitReason = session.info.exitReason.value_or(ExitReason::ProducerClosed);
    request.metadata.status = session.info.status;

    std::shared_ptr<core::StructuredLogger> logger = logger_;
    const std::string path = request.filePath;
    uploader_->uploadAndSaveRecording(request,
        [logger, path](core::Result<UploadResult, core::Error> result) {
            if (result.isError()) {
                logger->error("Upload of " + path + " failed: " + result.error().toString(),
                              LOG_CATEGORY);
                return;
            }
            logger->info("Uploaded " + path + " as " + result.value().objectKey, LOG_CATEGORY);
        });
}

// =============================================================================
// Inspection
// =============================================================================

std::optional<RecordingInfo> RecordingOrchestrator::findSession(RecordingSessionId sessionId) const {
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<RecordingInfo> RecordingOrchestrator::sessions() const {
    std::vector<RecordingInfo> result;
    result.reserve(sessions_.size());
    for (const auto& pair : sessions_) {
        result.push_back(pair.second.info);
    }
    return result;
}

size_t RecordingOrchestrator::activeCount() const {
    size_t count = 0;
    for (const auto& pair : sessions_) {
        if (!pair.second.cleaned) {
            ++count;
        }
    }
    return count;
}

void RecordingOrchestrator::setFinishedCallback(RecordingFinishedCallback callback) {
    finishedCallback_ = std::move(callback);
}

core::LogContext RecordingOrchestrator::logContext(const Session& session) const {
    core::LogContext context;
    context.roomId = session.roomId;
    context.connectionId = session.info.owner;
    context.userId = session.ids.candidateId.value_or("");
    if (!session.info.tracks.empty()) {
        context.producerId = session.info.tracks.front().producerId;
    }
    context.recordingId = session.info.id;
    return context;
}

} // namespace recording
} // namespace proctorsfu
