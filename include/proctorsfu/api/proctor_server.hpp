// ProctorSFU - Exam Proctoring Media Server
// ProctorServer Public API - Main server interface
//
// Responsibilities:
// - Assemble the session fabric, recording pipeline and signaling surface
// - Accept WebSocket clients, authenticate them at the upgrade handshake
// - Route signaling messages to the handler on a single executor thread
// - Expose start and stop lifecycle methods

#ifndef PROCTORSFU_API_PROCTOR_SERVER_HPP
#define PROCTORSFU_API_PROCTOR_SERVER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "proctorsfu/core/config_manager.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/token_verifier.hpp"
#include "proctorsfu/engine/media_engine.hpp"
#include "proctorsfu/pal/log_pal.hpp"
#include "proctorsfu/pal/network_pal.hpp"
#include "proctorsfu/pal/process_pal.hpp"
#include "proctorsfu/recording/recording_uploader.hpp"

namespace proctorsfu {
namespace api {

// =============================================================================
// Server State Enumeration
// =============================================================================

enum class ServerState {
    Stopped,    ///< Not started, or fully stopped
    Starting,   ///< Binding and launching threads
    Running,    ///< Accepting connections
    Stopping    ///< Tearing down sessions
};

inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Stopped:  return "Stopped";
        case ServerState::Starting: return "Starting";
        case ServerState::Running:  return "Running";
        case ServerState::Stopping: return "Stopping";
        default:                    return "Unknown";
    }
}

// =============================================================================
// Error Types
// =============================================================================

struct ServerError {
    enum class Code {
        InvalidConfiguration,   ///< Configuration or dependencies are invalid
        InvalidState,           ///< Operation not allowed in current state
        BindFailed,             ///< Failed to bind the listening socket
        StartFailed             ///< Failed to start a subsystem
    };

    Code code;
    std::string message;

    ServerError(Code c = Code::StartFailed, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

// =============================================================================
// Dependencies
// =============================================================================

/**
 * @brief Collaborators of the server.
 *
 * mediaEngine is required. Every other member falls back to the Linux or
 * local implementation when left empty.
 */
struct ServerDependencies {
    std::shared_ptr<engine::IMediaEngine> mediaEngine;
    std::shared_ptr<pal::INetworkPAL> networkPal;
    std::shared_ptr<pal::IProcessPAL> processPal;
    std::shared_ptr<pal::ILogPAL> logPal;
    std::shared_ptr<core::ITokenVerifier> tokenVerifier;
    std::shared_ptr<recording::IRecordingUploader> uploader;
};

// =============================================================================
// ProctorServer
// =============================================================================

/**
 * @brief The proctoring SFU server.
 *
 * ## Usage Example
 * @code
 * core::ConfigManager config;
 * config.loadFromFile("proctorsfu.json");
 * config.applyEnvironmentOverrides();
 *
 * api::ServerDependencies deps;
 * deps.mediaEngine = makeEngine();
 *
 * api::ProctorServer server(config.getConfig(), deps);
 * auto started = server.start();
 * @endcode
 *
 * ## Thread Safety
 * start() and stop() may be called from any thread. All session state is
 * owned by the internal executor thread.
 */
class ProctorServer {
public:
    ProctorServer(core::Configuration config, ServerDependencies dependencies);
    ~ProctorServer();

    ProctorServer(const ProctorServer&) = delete;
    ProctorServer& operator=(const ProctorServer&) = delete;

    /**
     * @brief Bind the listening socket and start the media worker.
     * @return InvalidState if already running, BindFailed if the port is taken
     */
    core::Result<void, ServerError> start();

    /**
     * @brief Stop recordings, disconnect every client and join the threads.
     *
     * Idempotent.
     */
    void stop();

    ServerState state() const;
    bool isRunning() const;

    /**
     * @brief Port actually bound; differs from the configured port when it was 0.
     */
    uint16_t boundPort() const;

    size_t connectionCount() const;

    static std::string getVersion();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace api
} // namespace proctorsfu

#endif // PROCTORSFU_API_PROCTOR_SERVER_HPP
