// ProctorSFU - Exam Proctoring Media Server
// Media Engine Interface - Primitives of the external SFU engine
//
// The engine owns RTP, ICE and DTLS. ProctorSFU only decides when routers,
// transports, producers and consumers are created and closed. Every
// asynchronous primitive reports completion through a callback that may
// run on an engine thread.

#ifndef PROCTORSFU_ENGINE_MEDIA_ENGINE_HPP
#define PROCTORSFU_ENGINE_MEDIA_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/json_value.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace engine {

using core::ConsumerId;
using core::ProducerId;
using core::RouterId;
using core::TransportId;

using WorkerId = std::string;

// =============================================================================
// Parameter Types
// =============================================================================

struct WorkerSettings {
    std::string logLevel = "warn";
    uint16_t rtcMinPort = 10000;
    uint16_t rtcMaxPort = 59999;
};

/**
 * @brief One codec a router is able to route.
 */
struct RouterCodec {
    core::MediaKind kind = core::MediaKind::Video;
    std::string mimeType;
    uint32_t clockRate = 0;
    uint32_t channels = 0;          ///< Audio only, 0 otherwise
    core::JsonValue parameters;
};

struct WebRtcTransportOptions {
    std::string listenIp;
    std::string announcedIp;
    bool enableUdp = true;
    bool enableTcp = true;
    bool preferUdp = true;
};

/**
 * @brief What a client needs to set up its side of a WebRTC transport.
 */
struct WebRtcTransportParams {
    TransportId id;
    core::JsonValue iceParameters;
    core::JsonValue iceCandidates;
    core::JsonValue dtlsParameters;
};

/**
 * @brief Loopback RTP transport used to feed a local recorder.
 */
struct PlainTransportOptions {
    std::string listenIp = "127.0.0.1";
    bool rtcpMux = true;
    bool comedia = false;
};

struct PlainTransportInfo {
    TransportId id;
    std::string localIp;
    uint16_t localPort = 0;         ///< 0 when the engine reported no tuple
};

struct ProduceOptions {
    core::MediaKind kind = core::MediaKind::Video;
    core::JsonValue rtpParameters;
    core::JsonValue appData;
};

struct ConsumeOptions {
    ProducerId producerId;
    core::JsonValue rtpCapabilities;
    bool paused = false;
};

/**
 * @brief A created consumer as described to its receiver.
 *
 * rtpParameters carries the negotiated codecs; codecs[0].payloadType is
 * the payload type the consumer sends with.
 */
struct ConsumerParams {
    ConsumerId id;
    ProducerId producerId;
    core::MediaKind kind = core::MediaKind::Video;
    core::JsonValue rtpParameters;
};

enum class ProducerStatus {
    Active,
    Paused,
    Closed
};

template<typename T>
using EngineCallback = std::function<void(core::Result<T, core::Error>)>;

using VoidCallback = EngineCallback<void>;

using WorkerDiedCallback = std::function<void(const std::string& reason)>;

// =============================================================================
// Media Engine Interface
// =============================================================================

/**
 * @brief Primitives of the external SFU engine.
 *
 * Failures are reported as EngineError unless noted. close* calls are
 * synchronous, idempotent and ignore unknown ids.
 */
class IMediaEngine {
public:
    virtual ~IMediaEngine() = default;

    // -------------------------------------------------------------------------
    // Worker and Routers
    // -------------------------------------------------------------------------

    virtual void createWorker(const WorkerSettings& settings, EngineCallback<WorkerId> callback) = 0;

    /**
     * @brief Register the handler for unexpected worker death.
     */
    virtual void setWorkerDiedCallback(WorkerDiedCallback callback) = 0;

    virtual void createRouter(
        const std::vector<RouterCodec>& codecs,
        EngineCallback<RouterId> callback
    ) = 0;

    virtual core::Result<core::JsonValue, core::Error> routerRtpCapabilities(
        const RouterId& routerId
    ) const = 0;

    virtual void closeRouter(const RouterId& routerId) = 0;

    // -------------------------------------------------------------------------
    // Transports
    // -------------------------------------------------------------------------

    virtual void createWebRtcTransport(
        const RouterId& routerId,
        const WebRtcTransportOptions& options,
        EngineCallback<WebRtcTransportParams> callback
    ) = 0;

    virtual void connectWebRtcTransport(
        const TransportId& transportId,
        const core::JsonValue& dtlsParameters,
        VoidCallback callback
    ) = 0;

    virtual void createPlainTransport(
        const RouterId& routerId,
        const PlainTransportOptions& options,
        EngineCallback<PlainTransportInfo> callback
    ) = 0;

    /**
     * @brief Start sending RTP from a plain transport to ip:port.
     */
    virtual void connectPlainTransport(
        const TransportId& transportId,
        const std::string& ip,
        uint16_t port,
        VoidCallback callback
    ) = 0;

    virtual void closeTransport(const TransportId& transportId) = 0;

    // -------------------------------------------------------------------------
    // Producers and Consumers
    // -------------------------------------------------------------------------

    virtual void produce(
        const TransportId& transportId,
        const ProduceOptions& options,
        EngineCallback<ProducerId> callback
    ) = 0;

    virtual core::Result<ProducerStatus, core::Error> producerStatus(
        const ProducerId& producerId
    ) const = 0;

    virtual void closeProducer(const ProducerId& producerId) = 0;

    virtual bool canConsume(
        const RouterId& routerId,
        const ProducerId& producerId,
        const core::JsonValue& rtpCapabilities
    ) const = 0;

    virtual void consume(
        const TransportId& transportId,
        const ConsumeOptions& options,
        EngineCallback<ConsumerParams> callback
    ) = 0;

    virtual void resumeConsumer(const ConsumerId& consumerId, VoidCallback callback) = 0;

    virtual void closeConsumer(const ConsumerId& consumerId) = 0;
};

} // namespace engine
} // namespace proctorsfu

#endif // PROCTORSFU_ENGINE_MEDIA_ENGINE_HPP
