// ProctorSFU - Exam Proctoring Media Server
// ProctorServer Implementation
//
// Threading:
// - The network PAL runs its epoll loop on a dedicated thread
// - Socket callbacks only post work to the core EventLoop
// - Connection state, the registry, the adapter, the orchestrator and the
//   handler are touched exclusively on the EventLoop thread

#include "proctorsfu/api/proctor_server.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "proctorsfu/proctorsfu.hpp"
#include "proctorsfu/core/event_loop.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/engine/media_engine_adapter.hpp"
#include "proctorsfu/pal/linux/linux_log_pal.hpp"
#include "proctorsfu/pal/linux/linux_network_pal.hpp"
#include "proctorsfu/pal/linux/linux_process_pal.hpp"
#include "proctorsfu/protocol/websocket_frame_codec.hpp"
#include "proctorsfu/protocol/websocket_handshake.hpp"
#include "proctorsfu/recording/encoder_process.hpp"
#include "proctorsfu/recording/recording_orchestrator.hpp"
#include "proctorsfu/session/access_policy.hpp"
#include "proctorsfu/session/port_allocator.hpp"
#include "proctorsfu/session/session_registry.hpp"
#include "proctorsfu/signaling/signaling_codec.hpp"
#include "proctorsfu/signaling/signaling_dispatcher.hpp"
#include "proctorsfu/signaling/signaling_handler.hpp"

namespace proctorsfu {
namespace api {

namespace {

const std::string LOG_CATEGORY = "Server";
constexpr size_t READ_CHUNK_SIZE = 16 * 1024;

// =============================================================================
// Connection Context
// =============================================================================

struct ConnectionContext {
    enum class Phase {
        Handshake,   ///< Waiting for the HTTP upgrade request
        Open,        ///< WebSocket established, signaling active
        Closing      ///< Final bytes queued, socket closes after the write
    };

    core::ConnectionId id;
    pal::SocketHandle socket;
    Phase phase = Phase::Handshake;
    protocol::WebSocketHandshake handshake;
    protocol::WebSocketFrameCodec codec;
    core::Identity identity;

    ConnectionContext(core::ConnectionId connectionId, pal::SocketHandle handle, size_t maxMessageBytes)
        : id(connectionId)
        , socket(handle)
        , codec(maxMessageBytes) {}
};

} // anonymous namespace

// =============================================================================
// ProctorServer::Impl
// =============================================================================

class ProctorServer::Impl : public signaling::INotifier {
public:
    Impl(core::Configuration config, ServerDependencies dependencies)
        : config_(std::move(config))
        , deps_(std::move(dependencies))
        , state_(ServerState::Stopped)
        , boundPort_(0)
        , connectionCount_(0)
        , nextConnectionId_(1)
        , alive_(std::make_shared<std::atomic<bool>>(true))
    {
        if (!deps_.networkPal) {
            deps_.networkPal = std::make_shared<pal::linux::LinuxNetworkPAL>();
        }
        if (!deps_.processPal) {
            deps_.processPal = std::make_shared<pal::linux::LinuxProcessPAL>();
        }
        if (!deps_.logPal) {
            deps_.logPal = std::make_shared<pal::linux::LinuxLogPAL>();
        }

        logger_ = std::make_shared<core::StructuredLogger>();
        logger_->setLevel(config_.logging.level);
        logger_->setJsonFormat(config_.logging.json);
        logger_->addSink(std::make_shared<core::LogPalSink>(deps_.logPal));

        if (!deps_.tokenVerifier) {
            deps_.tokenVerifier = std::make_shared<core::JwtTokenVerifier>(config_.auth.jwtSecret);
        }
        if (!deps_.uploader) {
            deps_.uploader = std::make_shared<recording::LocalRecordingUploader>(
                config_.recording.basePath, logger_);
        }
    }

    ~Impl() override {
        stop();
        alive_->store(false);
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    core::Result<void, ServerError> start() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);

        if (state_ != ServerState::Stopped) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidState, "Server is already running"));
        }
        if (!deps_.mediaEngine) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidConfiguration, "A media engine is required"));
        }
        if (built_) {
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::InvalidState, "Server cannot be restarted"));
        }
        state_ = ServerState::Starting;

        auto initialized = deps_.networkPal->initialize();
        if (initialized.isError()) {
            state_ = ServerState::Stopped;
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::StartFailed,
                            "Failed to initialize network: " + initialized.error().message));
        }

        pal::ServerOptions options;
        options.reuseAddr = true;
        auto server = deps_.networkPal->createServer(config_.server.host, config_.server.port, options);
        if (server.isError()) {
            state_ = ServerState::Stopped;
            return core::Result<void, ServerError>::error(
                ServerError(ServerError::Code::BindFailed,
                            "Failed to bind to port " + std::to_string(config_.server.port) +
                            ": " + server.error().message));
        }
        serverSocket_ = server.value();
        auto localPort = deps_.networkPal->getLocalPort(serverSocket_.handle);
        boundPort_ = localPort.isSuccess() ? localPort.value() : config_.server.port;

        buildServices();
        built_ = true;
        loop_.start();

        loop_.post([this]() {
            adapter_->start([this](core::Result<void, core::Error> result) {
                if (result.isError()) {
                    logger_->error("Media worker failed to start: " + result.error().toString(),
                                   LOG_CATEGORY);
                }
            });
        });

        accepting_.store(true);
        startAccepting();
        networkThread_ = std::thread([this]() {
            deps_.networkPal->runEventLoop();
        });

        state_ = ServerState::Running;
        logger_->info("ProctorSFU " + std::string(PROCTORSFU_VERSION_STRING) + " listening on " +
                      config_.server.host + ":" + std::to_string(boundPort_), LOG_CATEGORY);
        return core::Result<void, ServerError>::success();
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (state_ != ServerState::Running) {
            return;
        }
        state_ = ServerState::Stopping;
        accepting_.store(false);

        // Tear sessions down on the loop thread and wait for it
        std::promise<void> drained;
        auto done = drained.get_future();
        loop_.post([this, &drained]() {
            closeAllConnections();
            orchestrator_->shutdown();
            drained.set_value();
        });
        done.wait();

        deps_.networkPal->closeSocket(serverSocket_.handle);
        deps_.networkPal->stopEventLoop();
        if (networkThread_.joinable()) {
            networkThread_.join();
        }
        loop_.stop();

        connectionCount_.store(0);
        state_ = ServerState::Stopped;
        logger_->info("Server stopped", LOG_CATEGORY);
        logger_->flush();
    }

    ServerState state() const {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        return state_;
    }

    uint16_t boundPort() const {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        return boundPort_;
    }

    size_t connectionCount() const {
        return connectionCount_.load();
    }

    // -------------------------------------------------------------------------
    // INotifier
    // -------------------------------------------------------------------------

    void push(core::ConnectionId connectionId,
              const std::string& event,
              const core::JsonValue& data) override {
        sendText(connectionId, signaling::encodePush(event, data));
    }

private:
    void buildServices() {
        const std::string recorderIp = config_.recording.recorderIp;
        std::shared_ptr<pal::INetworkPAL> networkPal = deps_.networkPal;
        session::PortProbe probe = [networkPal, recorderIp](uint16_t port) {
            return networkPal->probeUdpPort(recorderIp, port);
        };

        registry_ = std::make_unique<session::SessionRegistry>();
        policy_ = std::make_unique<session::AccessPolicy>(config_.roles.hierarchy);
        ports_ = std::make_unique<session::PortAllocator>(
            config_.recording.minPort, config_.recording.maxPort, probe);
        adapter_ = std::make_unique<engine::MediaEngineAdapter>(
            deps_.mediaEngine, loop_, config_.media, logger_);
        launcher_ = std::make_unique<recording::FfmpegEncoderLauncher>(
            deps_.processPal, loop_, logger_, config_.timeouts.encoderStopGraceMs);
        orchestrator_ = std::make_unique<recording::RecordingOrchestrator>(
            *registry_, *adapter_, *ports_, *launcher_, deps_.uploader, loop_,
            config_.recording, config_.timeouts, logger_, probe);
        handler_ = std::make_unique<signaling::SignalingHandler>(
            *registry_, *adapter_, *policy_, *orchestrator_, *this, logger_);
        dispatcher_ = std::make_unique<signaling::SignalingDispatcher>(
            *handler_, [this](core::ConnectionId connectionId, const std::string& text) {
                sendText(connectionId, text);
            });

        loop_.setErrorHandler([this](const std::string& message) {
            logger_->error("Unhandled exception on executor: " + message, LOG_CATEGORY);
        });
    }

    // -------------------------------------------------------------------------
    // Socket plumbing (network thread -> loop thread)
    // -------------------------------------------------------------------------

    void startAccepting() {
        auto alive = alive_;
        deps_.networkPal->asyncAccept(serverSocket_,
            [this, alive](core::Result<pal::SocketHandle, pal::NetworkError> result) {
                if (!alive->load()) {
                    return;
                }
                if (result.isError()) {
                    logger_->warning("Accept failed: " + result.error().message, LOG_CATEGORY);
                    return;
                }
                pal::SocketHandle socket = result.value();
                loop_.post([this, socket]() { onAccepted(socket); });
            });
    }

    void onAccepted(pal::SocketHandle socket) {
        if (!accepting_.load()) {
            deps_.networkPal->closeSocket(socket);
            return;
        }
        if (connections_.size() >= config_.server.maxConnections) {
            logger_->warning("Connection limit reached, rejecting socket", LOG_CATEGORY);
            deps_.networkPal->closeSocket(socket);
            return;
        }

        core::ConnectionId id = nextConnectionId_++;
        connections_.emplace(id, std::make_unique<ConnectionContext>(
            id, socket, config_.server.maxMessageBytes));
        connectionCount_.store(connections_.size());

        auto noDelay = deps_.networkPal->setSocketOption(socket, pal::SocketOption::NoDelay, 1);
        if (noDelay.isError()) {
            logger_->debug("TCP_NODELAY not set: " + noDelay.error().message, LOG_CATEGORY);
        }
        logger_->debug("Accepted connection " + std::to_string(id), LOG_CATEGORY);
        readNext(id);
    }

    void readNext(core::ConnectionId id) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        auto alive = alive_;
        deps_.networkPal->asyncRead(it->second->socket, READ_CHUNK_SIZE,
            [this, alive, id](core::Result<std::vector<uint8_t>, pal::NetworkError> result) {
                if (!alive->load()) {
                    return;
                }
                loop_.post([this, id, result]() { onRead(id, result); });
            });
    }

    void onRead(core::ConnectionId id,
                const core::Result<std::vector<uint8_t>, pal::NetworkError>& result) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        if (result.isError()) {
            if (result.error().code != pal::NetworkErrorCode::ConnectionClosed) {
                logger_->debug("Read failed on connection " + std::to_string(id) + ": " +
                               result.error().message, LOG_CATEGORY);
            }
            closeConnection(id);
            return;
        }

        const std::vector<uint8_t>& bytes = result.value();
        ConnectionContext& connection = *it->second;

        if (connection.phase == ConnectionContext::Phase::Handshake) {
            size_t consumed = 0;
            if (!processHandshake(connection, bytes, consumed)) {
                return;
            }
            if (connection.phase == ConnectionContext::Phase::Open && consumed < bytes.size()) {
                processFrames(id, bytes.data() + consumed, bytes.size() - consumed);
            }
        } else if (connection.phase == ConnectionContext::Phase::Open) {
            processFrames(id, bytes.data(), bytes.size());
        }

        auto still = connections_.find(id);
        if (still != connections_.end() && still->second->phase != ConnectionContext::Phase::Closing) {
            readNext(id);
        }
    }

    // -------------------------------------------------------------------------
    // WebSocket handshake and frames
    // -------------------------------------------------------------------------

    /**
     * @brief Returns false when the connection was rejected.
     */
    bool processHandshake(ConnectionContext& connection, const std::vector<uint8_t>& bytes,
                          size_t& consumed) {
        auto result = connection.handshake.processData(bytes.data(), bytes.size());
        if (!result.success) {
            logger_->debug("Rejected upgrade on connection " + std::to_string(connection.id) +
                           ": " + (result.error ? result.error->message : std::string()),
                           LOG_CATEGORY);
            writeAndClose(connection.id,
                          protocol::WebSocketHandshake::buildRejectResponse(400, "Bad Request"));
            return false;
        }
        consumed = result.bytesConsumed;
        if (!connection.handshake.isComplete()) {
            return true;
        }

        const protocol::UpgradeRequest& request = connection.handshake.request();
        if (!request.token) {
            rejectUnauthorized(connection, "Missing token");
            return false;
        }
        auto identity = deps_.tokenVerifier->verifyToken(*request.token);
        if (identity.isError()) {
            rejectUnauthorized(connection, identity.error().message);
            return false;
        }

        connection.identity = identity.value();
        connection.phase = ConnectionContext::Phase::Open;
        write(connection.id, protocol::WebSocketHandshake::buildAcceptResponse(request.key));

        logger_->info("WebSocket session opened for user " + connection.identity.userId +
                      " on connection " + std::to_string(connection.id), LOG_CATEGORY);
        return true;
    }

    void rejectUnauthorized(ConnectionContext& connection, const std::string& reason) {
        core::LogContext context;
        context.connectionId = connection.id;
        context.errorCode = core::errorCodeToString(core::ErrorCode::Authentication);
        logger_->warningWithContext("Authentication failed: " + reason, context, LOG_CATEGORY);
        writeAndClose(connection.id,
                      protocol::WebSocketHandshake::buildRejectResponse(401, "Unauthorized"));
    }

    void processFrames(core::ConnectionId id, const uint8_t* data, size_t length) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        auto decoded = it->second->codec.feed(data, length);
        if (decoded.isError()) {
            logger_->debug("Frame error on connection " + std::to_string(id) + ": " +
                           decoded.error().message, LOG_CATEGORY);
            writeAndClose(id, protocol::WebSocketFrameCodec::encodeClose(
                decoded.error().closeStatus(), decoded.error().message));
            return;
        }

        for (const auto& message : decoded.value()) {
            auto current = connections_.find(id);
            if (current == connections_.end() ||
                current->second->phase != ConnectionContext::Phase::Open) {
                return;
            }
            switch (message.opcode) {
                case protocol::Opcode::Text: {
                    signaling::ClientContext client{id, current->second->identity};
                    dispatcher_->dispatch(client, message.text());
                    break;
                }
                case protocol::Opcode::Ping:
                    write(id, protocol::WebSocketFrameCodec::encodePong(message.payload));
                    break;
                case protocol::Opcode::Close:
                    writeAndClose(id, protocol::WebSocketFrameCodec::encodeClose(
                        protocol::close_code::NORMAL));
                    return;
                case protocol::Opcode::Binary:
                    logger_->debug("Ignoring binary message on connection " + std::to_string(id),
                                   LOG_CATEGORY);
                    break;
                default:
                    break;
            }
        }
    }

    // -------------------------------------------------------------------------
    // Writes and teardown
    // -------------------------------------------------------------------------

    void sendText(core::ConnectionId id, const std::string& text) {
        auto it = connections_.find(id);
        if (it == connections_.end() || it->second->phase != ConnectionContext::Phase::Open) {
            return;
        }
        write(id, protocol::WebSocketFrameCodec::encodeText(text));
    }

    void write(core::ConnectionId id, std::vector<uint8_t> bytes) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        auto alive = alive_;
        deps_.networkPal->asyncWrite(it->second->socket, std::move(bytes),
            [this, alive, id](core::Result<size_t, pal::NetworkError> result) {
                if (!alive->load() || result.isSuccess()) {
                    return;
                }
                loop_.post([this, id]() { closeConnection(id); });
            });
    }

    void writeAndClose(core::ConnectionId id, std::vector<uint8_t> bytes) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        const bool wasOpen = it->second->phase == ConnectionContext::Phase::Open;
        it->second->phase = ConnectionContext::Phase::Closing;
        if (wasOpen) {
            dispatcher_->disconnect(id);
        }

        auto alive = alive_;
        deps_.networkPal->asyncWrite(it->second->socket, std::move(bytes),
            [this, alive, id](core::Result<size_t, pal::NetworkError>) {
                if (alive->load()) {
                    loop_.post([this, id]() { closeConnection(id); });
                }
            });
    }

    void closeConnection(core::ConnectionId id) {
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return;
        }
        std::unique_ptr<ConnectionContext> connection = std::move(it->second);
        connections_.erase(it);
        connectionCount_.store(connections_.size());

        deps_.networkPal->closeSocket(connection->socket);
        if (connection->phase == ConnectionContext::Phase::Open) {
            dispatcher_->disconnect(id);
        }
        logger_->debug("Closed connection " + std::to_string(id), LOG_CATEGORY);
    }

    void closeAllConnections() {
        std::vector<core::ConnectionId> ids;
        ids.reserve(connections_.size());
        for (const auto& entry : connections_) {
            ids.push_back(entry.first);
        }
        for (core::ConnectionId id : ids) {
            closeConnection(id);
        }
    }

    core::Configuration config_;
    ServerDependencies deps_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex lifecycleMutex_;
    ServerState state_;
    uint16_t boundPort_;
    std::atomic<size_t> connectionCount_;
    bool built_ = false;
    std::atomic<bool> accepting_{false};

    // Declared before the services so it is destroyed after them
    core::EventLoop loop_;

    std::unique_ptr<session::SessionRegistry> registry_;
    std::unique_ptr<session::AccessPolicy> policy_;
    std::unique_ptr<session::PortAllocator> ports_;
    std::unique_ptr<engine::MediaEngineAdapter> adapter_;
    std::unique_ptr<recording::FfmpegEncoderLauncher> launcher_;
    std::unique_ptr<recording::RecordingOrchestrator> orchestrator_;
    std::unique_ptr<signaling::SignalingHandler> handler_;
    std::unique_ptr<signaling::SignalingDispatcher> dispatcher_;

    pal::ServerSocket serverSocket_;
    std::thread networkThread_;

    // Loop thread only
    std::unordered_map<core::ConnectionId, std::unique_ptr<ConnectionContext>> connections_;
    core::ConnectionId nextConnectionId_;

    std::shared_ptr<std::atomic<bool>> alive_;
};

// =============================================================================
// ProctorServer Public Interface
// =============================================================================

ProctorServer::ProctorServer(core::Configuration config, ServerDependencies dependencies)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(dependencies))) {
}

ProctorServer::~ProctorServer() = default;

core::Result<void, ServerError> ProctorServer::start() {
    return impl_->start();
}

void ProctorServer::stop() {
    impl_->stop();
}

ServerState ProctorServer::state() const {
    return impl_->state();
}

bool ProctorServer::isRunning() const {
    return impl_->state() == ServerState::Running;
}

uint16_t ProctorServer::boundPort() const {
    return impl_->boundPort();
}

size_t ProctorServer::connectionCount() const {
    return impl_->connectionCount();
}

std::string ProctorServer::getVersion() {
    return PROCTORSFU_VERSION_STRING;
}

} // namespace api
} // namespace proctorsfu
