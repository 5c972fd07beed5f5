// ProctorSFU - Exam Proctoring Media Server
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON configuration files
// - Apply PROCTORSFU_* environment variable overrides for containerized deployments
// - Validate the configuration with field-level error messages
// - Provide defaults when no configuration file is given
// - Log effective configuration values during initialization

#ifndef PROCTORSFU_CORE_CONFIG_MANAGER_HPP
#define PROCTORSFU_CORE_CONFIG_MANAGER_HPP

#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/core/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace proctorsfu {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Signaling listener settings.
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    uint32_t maxConnections = 1000;
    uint32_t maxMessageBytes = 1024 * 1024;   ///< Largest accepted signaling message
};

struct AuthConfig {
    std::string jwtSecret = "supersecret";
};

/**
 * @brief Media engine worker and WebRTC transport settings.
 */
struct MediaConfig {
    std::string listenIp = "0.0.0.0";
    std::string announcedIp = "127.0.0.1";
    uint16_t rtcMinPort = 10000;
    uint16_t rtcMaxPort = 59999;
    std::string workerLogLevel = "warn";
    uint32_t workerRestartDelayMs = 2000;
};

/**
 * @brief Recording pipeline settings.
 *
 * Recorder ports are leased from [minPort, maxPort).
 */
struct RecordingConfig {
    std::string basePath = "recordings";
    std::string recorderIp = "127.0.0.1";
    uint16_t minPort = 40000;
    uint16_t maxPort = 50000;
    std::string encoderPath = "ffmpeg";
    std::string encoderLogLevel = "error";
    uint32_t restartWindowMs = 5000;
    std::string container = "webm";
};

struct TimeoutConfig {
    uint32_t producerActiveMs = 10000;
    uint32_t producerCheckIntervalMs = 1000;
    uint32_t encoderReadyTimeoutMs = 5000;
    uint32_t encoderReadyPollMs = 50;
    uint32_t transportSettleMs = 0;
    uint32_t encoderStopGraceMs = 3000;
};

using RoleHierarchy = std::map<Role, std::vector<Role>>;

/**
 * @brief admin sees invigilators, invigilators see students, students see nobody.
 */
RoleHierarchy defaultRoleHierarchy();

struct RolesConfig {
    RoleHierarchy hierarchy = defaultRoleHierarchy();
};

struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool json = false;
};

struct Configuration {
    ServerConfig server;
    AuthConfig auth;
    MediaConfig media;
    RecordingConfig recording;
    TimeoutConfig timeouts;
    RolesConfig roles;
    LoggingConfig logging;
};

// =============================================================================
// Configuration Error
// =============================================================================

struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Offending field in dotted form, if any

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads, overrides and validates the server configuration.
 *
 * Typical startup sequence:
 * @code
 * ConfigManager config;
 * config.setLogCallback([&](const std::string& m) { logger->info(m, "Config"); });
 * auto loaded = path.empty() ? config.loadDefaults() : config.loadFromFile(path);
 * config.applyEnvironmentOverrides();
 * auto valid = config.validate();
 * @endcode
 *
 * ## Thread Safety
 * Loading and overrides take an exclusive lock, reads take a shared lock.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load a JSON configuration file on top of the defaults.
     * @return FileNotFound, ParseError or ValidationError on failure
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset every section to its default.
     */
    Result<void, ConfigError> loadDefaults();

    // -------------------------------------------------------------------------
    // Environment Variable Overrides
    // -------------------------------------------------------------------------

    /**
     * @brief Apply PROCTORSFU_* variables on top of the loaded values.
     *
     * Unparseable values are skipped with a warning through the log callback.
     */
    void applyEnvironmentOverrides();

    // -------------------------------------------------------------------------
    // Validation and Access
    // -------------------------------------------------------------------------

    Result<void, ConfigError> validate() const;

    const Configuration& getConfig() const;

    /**
     * @brief Effective configuration as JSON. The JWT secret is masked.
     */
    std::string dumpConfig() const;

    void setLogCallback(ConfigLogCallback callback);

    /**
     * @brief Emit every effective value through the log callback.
     */
    void logEffectiveConfig() const;

private:
    Result<void, ConfigError> parseJson(const std::string& content);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    void log(const std::string& message) const;
    std::optional<std::string> getEnvVar(const std::string& name) const;

    Configuration config_;
    mutable std::shared_mutex configMutex_;

    ConfigLogCallback logCallback_;
    mutable std::mutex logMutex_;
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_CONFIG_MANAGER_HPP
