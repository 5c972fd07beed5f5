// ProctorSFU - Exam Proctoring Media Server
// Recording Orchestrator - Automatic capture of candidate streams
//
// Responsibilities:
// - Decide when a student's producer starts a recording, including the
//   webcam video/audio combination within the restart window
// - Build the capture pipeline: plain transport, paused consumer, recorder
//   port, session descriptor, encoder process, transport connect, resume
// - Re-validate the session, peer and producers after every asynchronous step
// - Tear every session down exactly once and hand the file to the uploader

#ifndef PROCTORSFU_RECORDING_RECORDING_ORCHESTRATOR_HPP
#define PROCTORSFU_RECORDING_RECORDING_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "proctorsfu/core/config_manager.hpp"
#include "proctorsfu/core/event_loop.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/engine/media_engine_adapter.hpp"
#include "proctorsfu/recording/encoder_process.hpp"
#include "proctorsfu/recording/recording_layout.hpp"
#include "proctorsfu/recording/recording_types.hpp"
#include "proctorsfu/recording/recording_uploader.hpp"
#include "proctorsfu/session/port_allocator.hpp"
#include "proctorsfu/session/session_registry.hpp"

namespace proctorsfu {
namespace recording {

using core::ConnectionId;
using core::ProducerId;

/**
 * @brief One captured producer inside a session.
 */
struct RecordingTrack {
    ProducerId producerId;
    core::MediaKind kind = core::MediaKind::Video;
    core::TransportId plainTransportId;
    core::ConsumerId consumerId;
    uint16_t port = 0;
    std::string descriptorPath;
    uint8_t payloadType = 0;
};

/**
 * @brief Snapshot of a recording session.
 */
struct RecordingInfo {
    RecordingSessionId id = core::INVALID_RECORDING_SESSION_ID;
    RecordingType type = RecordingType::Screen;
    ConnectionId owner = core::INVALID_CONNECTION_ID;
    std::vector<RecordingTrack> tracks;
    std::string outputPath;
    RecordingStatus status = RecordingStatus::Initializing;
    std::optional<ExitReason> exitReason;
    bool encoderStarted = false;
    bool dataObserved = false;
    uint64_t createdAtMs = 0;

    bool isCombined() const { return tracks.size() > 1; }
    std::vector<ProducerId> producerIds() const;
};

/**
 * @brief Called once per session after teardown and encoder exit.
 */
using RecordingFinishedCallback = std::function<void(const RecordingInfo& info)>;

/**
 * @brief Starts, supervises and tears down recording sessions.
 *
 * ## Threading
 * Every method must be called on the executor thread. Engine, encoder and
 * timer continuations are delivered there as well.
 *
 * ## Teardown
 * cleanup() runs once per session no matter how many paths request it
 * (disconnect, producer close, replacement, encoder exit, setup failure).
 * A pipeline step that completes after its session was cleaned releases
 * whatever it just created.
 */
class RecordingOrchestrator {
public:
    RecordingOrchestrator(
        session::ISessionRegistry& registry,
        engine::MediaEngineAdapter& engine,
        session::PortAllocator& ports,
        IEncoderLauncher& launcher,
        std::shared_ptr<IRecordingUploader> uploader,
        core::IExecutor& executor,
        core::RecordingConfig recordingConfig,
        core::TimeoutConfig timeouts,
        std::shared_ptr<core::StructuredLogger> logger,
        session::PortProbe portProbe
    );
    ~RecordingOrchestrator();

    RecordingOrchestrator(const RecordingOrchestrator&) = delete;
    RecordingOrchestrator& operator=(const RecordingOrchestrator&) = delete;

    // -------------------------------------------------------------------------
    // Triggers
    // -------------------------------------------------------------------------

    /**
     * @brief Evaluate the recording rules for a newly created producer.
     *
     * Only students are recorded. Screen video starts a single-track
     * session. Webcam video is combined with an existing webcam audio
     * producer or recorded alone. Webcam audio joins the webcam video:
     * directly if the video has no session, by replacing a video-only
     * session younger than the restart window, and not at all otherwise.
     *
     * @return The session started, if any
     */
    std::optional<RecordingSessionId> onProducerCreated(
        ConnectionId connectionId,
        const ProducerId& producerId
    );

    /**
     * @brief Tear down the session that was capturing a closed producer.
     */
    void onProducerClosed(const session::ProducerRemoval& removal);

    /**
     * @brief Tear down every session of a peer that left or was replaced.
     */
    void onPeerLeft(const session::LeaveOutcome& outcome, ExitReason reason);

    /**
     * @brief Idempotent teardown of one session. Unknown ids are ignored.
     */
    void cleanup(RecordingSessionId sessionId, ExitReason reason);

    /**
     * @brief Clean every live session.
     */
    void shutdown();

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    /**
     * @brief Session snapshot, available until the session is finished.
     */
    std::optional<RecordingInfo> findSession(RecordingSessionId sessionId) const;

    std::vector<RecordingInfo> sessions() const;

    /**
     * @brief Sessions not yet torn down.
     */
    size_t activeCount() const;

    void setFinishedCallback(RecordingFinishedCallback callback);

private:
    struct Session {
        RecordingInfo info;
        RecordingOwner ids;
        core::RoomId roomId;
        core::RouterId routerId;
        std::shared_ptr<IEncoderProcess> encoder;
        bool encoderExited = false;
        bool cleaned = false;
        bool finalized = false;
        core::TaskId pendingTask = core::INVALID_TASK_ID;
        std::chrono::system_clock::time_point startedAt;
        std::chrono::system_clock::time_point endedAt;
    };

    std::optional<RecordingSessionId> startSession(
        RecordingType type,
        const session::PeerInfo& peer,
        const std::vector<session::ProducerInfo>& producers
    );

    // Pipeline steps, in order
    void createPlainTransports(RecordingSessionId id, size_t index);
    void waitForProducers(RecordingSessionId id, uint64_t deadlineMs);
    void createConsumers(RecordingSessionId id, size_t index);
    void prepareEncoderInputs(RecordingSessionId id);
    void launchEncoder(RecordingSessionId id);
    void awaitEncoderReady(RecordingSessionId id, uint64_t deadlineMs);
    void connectPlainTransports(RecordingSessionId id, size_t index);
    void resumeConsumers(RecordingSessionId id, size_t index);
    void markRecording(RecordingSessionId id);

    /**
     * @brief Session that exists and has not been cleaned, or nullptr.
     */
    Session* liveSession(RecordingSessionId id);

    /**
     * @brief Session that is still worth continuing, or nullptr.
     *
     * Cleans the session when its peer or one of its producers vanished.
     */
    Session* revalidate(RecordingSessionId id);

    void fail(RecordingSessionId id, const core::Error& error);
    void onEncoderExit(RecordingSessionId id, const EncoderExit& exit);
    void finalize(RecordingSessionId id);
    void upload(const Session& session);
    std::string uniqueOutputPath(const std::string& path) const;

    core::LogContext logContext(const Session& session) const;

    session::ISessionRegistry& registry_;
    engine::MediaEngineAdapter& engine_;
    session::PortAllocator& ports_;
    IEncoderLauncher& launcher_;
    std::shared_ptr<IRecordingUploader> uploader_;
    core::IExecutor& executor_;
    core::RecordingConfig recordingConfig_;
    core::TimeoutConfig timeouts_;
    std::shared_ptr<core::StructuredLogger> logger_;
    session::PortProbe portProbe_;
    RecordingLayout layout_;

    std::unordered_map<RecordingSessionId, Session> sessions_;
    RecordingSessionId nextSessionId_ = 1;
    RecordingFinishedCallback finishedCallback_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace recording
} // namespace proctorsfu

#endif // PROCTORSFU_RECORDING_RECORDING_ORCHESTRATOR_HPP
