// ProctorSFU - Exam Proctoring Media Server
// Test support: in-memory media engine

#ifndef PROCTORSFU_TESTS_SUPPORT_FAKE_MEDIA_ENGINE_HPP
#define PROCTORSFU_TESTS_SUPPORT_FAKE_MEDIA_ENGINE_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "proctorsfu/engine/media_engine.hpp"

namespace proctorsfu {
namespace test {

/**
 * @brief IMediaEngine that completes every call synchronously.
 *
 * Records what was created and closed so tests can check for leaks.
 * Individual primitives can be made to fail through the public flags.
 */
class FakeMediaEngine : public engine::IMediaEngine {
public:
    // Failure injection
    bool failCreateWorker = false;
    bool failCreateRouter = false;
    bool failCreateTransport = false;
    bool failProduce = false;
    bool failConsume = false;
    bool failPlainTransport = false;
    bool rejectConsume = false;         ///< canConsume() returns false
    uint16_t plainLocalPort = 20000;    ///< 0 simulates a missing tuple

    // Observations
    int workersCreated = 0;
    int routersCreated = 0;
    std::vector<engine::WorkerSettings> workerSettings;
    std::set<std::string> openRouters;
    std::set<std::string> openTransports;
    std::set<std::string> openProducers;
    std::set<std::string> openConsumers;
    std::set<std::string> pausedConsumers;
    std::vector<std::string> closedRouters;
    std::vector<std::string> closedTransports;
    std::vector<std::string> closedProducers;
    std::vector<std::string> closedConsumers;
    std::map<std::string, std::pair<std::string, uint16_t>> plainConnections;
    std::vector<engine::ConsumeOptions> consumeCalls;
    std::map<std::string, core::JsonValue> producerAppData;
    std::map<std::string, engine::ProducerStatus> producerStatuses;

    void createWorker(const engine::WorkerSettings& settings,
                      engine::EngineCallback<engine::WorkerId> callback) override {
        workerSettings.push_back(settings);
        if (failCreateWorker) {
            callback(core::Result<engine::WorkerId, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "worker spawn failed")));
            return;
        }
        ++workersCreated;
        callback(core::Result<engine::WorkerId, core::Error>::success(
            "worker-" + std::to_string(workersCreated)));
    }

    void setWorkerDiedCallback(engine::WorkerDiedCallback callback) override {
        diedCallback_ = std::move(callback);
    }

    void killWorker(const std::string& reason = "killed") {
        if (diedCallback_) {
            diedCallback_(reason);
        }
    }

    void createRouter(const std::vector<engine::RouterCodec>& codecs,
                      engine::EngineCallback<core::RouterId> callback) override {
        lastCodecs = codecs;
        if (failCreateRouter) {
            callback(core::Result<core::RouterId, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "router failed")));
            return;
        }
        ++routersCreated;
        std::string id = "router-" + std::to_string(routersCreated);
        openRouters.insert(id);
        callback(core::Result<core::RouterId, core::Error>::success(id));
    }

    core::Result<core::JsonValue, core::Error> routerRtpCapabilities(
        const core::RouterId& routerId) const override {
        if (openRouters.count(routerId) == 0) {
            return core::Result<core::JsonValue, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "unknown router", routerId));
        }
        core::JsonValue caps = core::JsonValue::object();
        caps.set("router", core::JsonValue::string(routerId));
        caps.set("codecs", core::JsonValue::array());
        return core::Result<core::JsonValue, core::Error>::success(caps);
    }

    void closeRouter(const core::RouterId& routerId) override {
        openRouters.erase(routerId);
        closedRouters.push_back(routerId);
    }

    void createWebRtcTransport(const core::RouterId&,
                               const engine::WebRtcTransportOptions& options,
                               engine::EngineCallback<engine::WebRtcTransportParams> callback) override {
        lastTransportOptions = options;
        if (failCreateTransport) {
            callback(core::Result<engine::WebRtcTransportParams, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "transport failed")));
            return;
        }
        engine::WebRtcTransportParams params;
        params.id = "transport-" + std::to_string(++counter_);
        params.iceParameters = core::JsonValue::object();
        params.iceParameters.set("usernameFragment", core::JsonValue::string("ufrag"));
        params.iceCandidates = core::JsonValue::array();
        params.dtlsParameters = core::JsonValue::object();
        params.dtlsParameters.set("role", core::JsonValue::string("auto"));
        openTransports.insert(params.id);
        callback(core::Result<engine::WebRtcTransportParams, core::Error>::success(params));
    }

    void connectWebRtcTransport(const core::TransportId& transportId,
                                const core::JsonValue&,
                                engine::VoidCallback callback) override {
        if (openTransports.count(transportId) == 0) {
            callback(core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::TransportError, "unknown transport", transportId)));
            return;
        }
        connectedTransports.insert(transportId);
        callback(core::Result<void, core::Error>::success());
    }

    void createPlainTransport(const core::RouterId&,
                              const engine::PlainTransportOptions& options,
                              engine::EngineCallback<engine::PlainTransportInfo> callback) override {
        lastPlainOptions = options;
        if (failPlainTransport) {
            callback(core::Result<engine::PlainTransportInfo, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "plain transport failed")));
            return;
        }
        engine::PlainTransportInfo info;
        info.id = "plain-" + std::to_string(++counter_);
        info.localIp = options.listenIp;
        info.localPort = plainLocalPort == 0 ? 0 : static_cast<uint16_t>(plainLocalPort + counter_);
        openTransports.insert(info.id);
        callback(core::Result<engine::PlainTransportInfo, core::Error>::success(info));
    }

    void connectPlainTransport(const core::TransportId& transportId,
                               const std::string& ip,
                               uint16_t port,
                               engine::VoidCallback callback) override {
        plainConnections[transportId] = std::make_pair(ip, port);
        callback(core::Result<void, core::Error>::success());
    }

    void closeTransport(const core::TransportId& transportId) override {
        openTransports.erase(transportId);
        closedTransports.push_back(transportId);
    }

    void produce(const core::TransportId&,
                 const engine::ProduceOptions& options,
                 engine::EngineCallback<core::ProducerId> callback) override {
        if (failProduce) {
            callback(core::Result<core::ProducerId, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "produce failed")));
            return;
        }
        std::string id = "producer-" + std::to_string(++counter_);
        openProducers.insert(id);
        producerAppData[id] = options.appData;
        producerKinds_[id] = options.kind;
        callback(core::Result<core::ProducerId, core::Error>::success(id));
    }

    core::Result<engine::ProducerStatus, core::Error> producerStatus(
        const core::ProducerId& producerId) const override {
        if (openProducers.count(producerId) == 0) {
            return core::Result<engine::ProducerStatus, core::Error>::success(
                engine::ProducerStatus::Closed);
        }
        auto it = producerStatuses.find(producerId);
        return core::Result<engine::ProducerStatus, core::Error>::success(
            it == producerStatuses.end() ? engine::ProducerStatus::Active : it->second);
    }

    void closeProducer(const core::ProducerId& producerId) override {
        openProducers.erase(producerId);
        closedProducers.push_back(producerId);
    }

    bool canConsume(const core::RouterId&, const core::ProducerId& producerId,
                    const core::JsonValue&) const override {
        return !rejectConsume && openProducers.count(producerId) > 0;
    }

    void consume(const core::TransportId&,
                 const engine::ConsumeOptions& options,
                 engine::EngineCallback<engine::ConsumerParams> callback) override {
        consumeCalls.push_back(options);
        if (failConsume) {
            callback(core::Result<engine::ConsumerParams, core::Error>::error(
                core::Error(core::ErrorCode::EngineError, "consume failed")));
            return;
        }
        engine::ConsumerParams params;
        params.id = "consumer-" + std::to_string(++counter_);
        params.producerId = options.producerId;
        auto kind = producerKinds_.find(options.producerId);
        params.kind = kind == producerKinds_.end() ? core::MediaKind::Video : kind->second;

        core::JsonValue codec = core::JsonValue::object();
        codec.set("mimeType", core::JsonValue::string(
            params.kind == core::MediaKind::Audio ? "audio/opus" : "video/VP8"));
        codec.set("payloadType", core::JsonValue::number(
            params.kind == core::MediaKind::Audio ? 111 : 101));
        core::JsonValue codecs = core::JsonValue::array();
        codecs.push(codec);
        params.rtpParameters = core::JsonValue::object();
        params.rtpParameters.set("codecs", codecs);

        openConsumers.insert(params.id);
        if (options.paused) {
            pausedConsumers.insert(params.id);
        }
        callback(core::Result<engine::ConsumerParams, core::Error>::success(params));
    }

    void resumeConsumer(const core::ConsumerId& consumerId, engine::VoidCallback callback) override {
        pausedConsumers.erase(consumerId);
        callback(core::Result<void, core::Error>::success());
    }

    void closeConsumer(const core::ConsumerId& consumerId) override {
        openConsumers.erase(consumerId);
        pausedConsumers.erase(consumerId);
        closedConsumers.push_back(consumerId);
    }

    bool hasDiedCallback() const { return static_cast<bool>(diedCallback_); }

    std::vector<engine::RouterCodec> lastCodecs;
    engine::WebRtcTransportOptions lastTransportOptions;
    engine::PlainTransportOptions lastPlainOptions;
    std::set<std::string> connectedTransports;

private:
    engine::WorkerDiedCallback diedCallback_;
    std::map<std::string, core::MediaKind> producerKinds_;
    int counter_ = 0;
};

} // namespace test
} // namespace proctorsfu

#endif // PROCTORSFU_TESTS_SUPPORT_FAKE_MEDIA_ENGINE_HPP
