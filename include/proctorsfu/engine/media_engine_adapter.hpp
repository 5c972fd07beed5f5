// ProctorSFU - Exam Proctoring Media Server
// Media Engine Adapter - Facade over the external SFU engine
//
// Responsibilities:
// - Own the single engine worker and restart it once after unexpected death
// - Create one router per room with the fixed codec set
// - Wrap transport, producer and consumer primitives with the checks the
//   session layer relies on (canConsume, plain transport tuple)
// - Deliver every engine completion on the application executor

#ifndef PROCTORSFU_ENGINE_MEDIA_ENGINE_ADAPTER_HPP
#define PROCTORSFU_ENGINE_MEDIA_ENGINE_ADAPTER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "proctorsfu/core/config_manager.hpp"
#include "proctorsfu/core/event_loop.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/engine/media_engine.hpp"

namespace proctorsfu {
namespace engine {

enum class WorkerState {
    Idle,
    Starting,
    Running,
    Restarting,
    Failed
};

const char* workerStateToString(WorkerState state);

/**
 * @brief Opus 48 kHz stereo and VP8 90 kHz.
 */
std::vector<RouterCodec> defaultRouterCodecs();

/**
 * @brief Facade used by the signaling and recording layers.
 *
 * Callbacks passed to the adapter always run on the executor given at
 * construction, never on an engine thread and never inline.
 *
 * ## Worker lifecycle
 * start() creates the worker. If the worker dies, the adapter waits
 * workerRestartDelayMs and makes one restart attempt. Router creation fails
 * with EngineError until a worker is running again; routers created before
 * the death are left to the engine. A second death, or a failed restart,
 * leaves the adapter in Failed.
 */
class MediaEngineAdapter {
public:
    MediaEngineAdapter(
        std::shared_ptr<IMediaEngine> engine,
        core::IExecutor& executor,
        core::MediaConfig config,
        std::shared_ptr<core::StructuredLogger> logger
    );
    ~MediaEngineAdapter();

    MediaEngineAdapter(const MediaEngineAdapter&) = delete;
    MediaEngineAdapter& operator=(const MediaEngineAdapter&) = delete;

    // -------------------------------------------------------------------------
    // Worker
    // -------------------------------------------------------------------------

    /**
     * @brief Create the worker. A second call while running succeeds at once.
     */
    void start(VoidCallback callback);

    WorkerState workerState() const;

    // -------------------------------------------------------------------------
    // Routers
    // -------------------------------------------------------------------------

    /**
     * @brief Create a router with defaultRouterCodecs().
     * @return EngineError when no worker is running
     */
    void createRouter(EngineCallback<RouterId> callback);

    core::Result<core::JsonValue, core::Error> routerCapabilities(const RouterId& routerId) const;

    void closeRouter(const RouterId& routerId);

    // -------------------------------------------------------------------------
    // Client Transports
    // -------------------------------------------------------------------------

    /**
     * @brief WebRTC transport on the configured listen and announced IPs.
     */
    void createTransport(
        const RouterId& routerId,
        core::TransportDirection direction,
        EngineCallback<WebRtcTransportParams> callback
    );

    void connectTransport(
        const TransportId& transportId,
        const core::JsonValue& dtlsParameters,
        VoidCallback callback
    );

    void closeTransport(const TransportId& transportId);

    // -------------------------------------------------------------------------
    // Producers and Consumers
    // -------------------------------------------------------------------------

    void produce(
        const TransportId& transportId,
        core::MediaKind kind,
        const core::JsonValue& rtpParameters,
        const core::JsonValue& appData,
        EngineCallback<ProducerId> callback
    );

    /**
     * @brief Consume a producer after checking router compatibility.
     * @return EngineError "Cannot consume" when the capabilities do not match
     */
    void consume(
        const RouterId& routerId,
        const TransportId& transportId,
        const ProducerId& producerId,
        const core::JsonValue& rtpCapabilities,
        bool paused,
        EngineCallback<ConsumerParams> callback
    );

    void resumeConsumer(const ConsumerId& consumerId, VoidCallback callback);

    core::Result<ProducerStatus, core::Error> producerStatus(const ProducerId& producerId) const;

    void closeProducer(const ProducerId& producerId);
    void closeConsumer(const ConsumerId& consumerId);

    // -------------------------------------------------------------------------
    // Recording Transports
    // -------------------------------------------------------------------------

    /**
     * @brief Loopback plain transport (rtcpMux, no comedia) on routerId.
     * @return RecordingError when the engine reports no local tuple
     */
    void createPlainTransport(const RouterId& routerId, EngineCallback<PlainTransportInfo> callback);

    void connectPlainTransport(
        const TransportId& transportId,
        const std::string& ip,
        uint16_t port,
        VoidCallback callback
    );

private:
    /**
     * @brief Wrap a callback so it runs on the executor.
     */
    template<typename T>
    EngineCallback<T> onExecutor(EngineCallback<T> callback) {
        core::IExecutor* executor = &executor_;
        return [executor, callback](core::Result<T, core::Error> result) {
            executor->post([callback, result]() {
                callback(result);
            });
        };
    }

    template<typename T>
    void failLater(EngineCallback<T>& callback, core::Error error) {
        EngineCallback<T> cb = std::move(callback);
        executor_.post([cb, error]() {
            cb(core::Result<T, core::Error>::error(error));
        });
    }

    void launchWorker(bool isRestart, VoidCallback callback);
    void handleWorkerDied(const std::string& reason);
    void setState(WorkerState state);

    std::shared_ptr<IMediaEngine> engine_;
    core::IExecutor& executor_;
    core::MediaConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex stateMutex_;
    WorkerState state_ = WorkerState::Idle;
    WorkerId workerId_;
    bool restartUsed_ = false;
    core::TaskId restartTask_ = core::INVALID_TASK_ID;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace engine
} // namespace proctorsfu

#endif // PROCTORSFU_ENGINE_MEDIA_ENGINE_ADAPTER_HPP
