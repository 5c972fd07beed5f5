// ProctorSFU - Exam Proctoring Media Server
// Configuration Manager Implementation

#include "proctorsfu/core/config_manager.hpp"

#include "proctorsfu/core/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace proctorsfu {
namespace core {

RoleHierarchy defaultRoleHierarchy() {
    RoleHierarchy hierarchy;
    hierarchy[Role::Admin] = {Role::Invigilator};
    hierarchy[Role::Invigilator] = {Role::Student};
    hierarchy[Role::Student] = {};
    return hierarchy;
}

namespace {

using VoidResult = Result<void, ConfigError>;

VoidResult fieldError(const std::string& field, const std::string& message) {
    return VoidResult::error(ConfigError(ConfigError::Code::ValidationError, message, field));
}

// =============================================================================
// Section Readers
// =============================================================================

VoidResult readPort(const JsonValue& section, const std::string& key,
                    const std::string& field, uint16_t& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    int64_t value = section[key].getInt(-1);
    if (!section[key].isNumber() || value <= 0 || value > 65535) {
        return fieldError(field, field + " must be between 1 and 65535");
    }
    out = static_cast<uint16_t>(value);
    return VoidResult::success();
}

VoidResult readUInt(const JsonValue& section, const std::string& key,
                    const std::string& field, uint32_t& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    int64_t value = section[key].getInt(-1);
    if (!section[key].isNumber() || value < 0 || value > UINT32_MAX) {
        return fieldError(field, field + " must be a non-negative integer");
    }
    out = static_cast<uint32_t>(value);
    return VoidResult::success();
}

VoidResult readString(const JsonValue& section, const std::string& key,
                      const std::string& field, std::string& out) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    if (!section[key].isString()) {
        return fieldError(field, field + " must be a string");
    }
    out = section[key].getString();
    return VoidResult::success();
}

VoidResult readHierarchy(const JsonValue& hierarchyJson, RoleHierarchy& out) {
    if (!hierarchyJson.isObject()) {
        return fieldError("roles.hierarchy", "roles.hierarchy must be an object");
    }
    RoleHierarchy hierarchy;
    for (const auto& entry : hierarchyJson.members()) {
        auto viewer = roleFromString(entry.first);
        if (!viewer) {
            return fieldError("roles.hierarchy", "Unknown role: " + entry.first);
        }
        if (!entry.second.isArray()) {
            return fieldError("roles.hierarchy." + entry.first, "Role entry must be an array");
        }
        std::vector<Role> visible;
        for (const auto& item : entry.second.items()) {
            auto publisher = roleFromString(item.getString());
            if (!publisher) {
                return fieldError("roles.hierarchy." + entry.first,
                                  "Unknown role: " + item.getString());
            }
            visible.push_back(*publisher);
        }
        hierarchy[*viewer] = std::move(visible);
    }
    out = std::move(hierarchy);
    return VoidResult::success();
}

#define PROCTORSFU_CONFIG_TRY(expr) \
    do { \
        auto tryResult_ = (expr); \
        if (tryResult_.isError()) { \
            return tryResult_; \
        } \
    } while (0)

VoidResult applyJson(const JsonValue& root, Configuration& config) {
    if (root.contains("server")) {
        const JsonValue& server = root["server"];
        PROCTORSFU_CONFIG_TRY(readString(server, "host", "server.host", config.server.host));
        PROCTORSFU_CONFIG_TRY(readPort(server, "port", "server.port", config.server.port));
        PROCTORSFU_CONFIG_TRY(readUInt(server, "maxConnections", "server.maxConnections",
                                       config.server.maxConnections));
        PROCTORSFU_CONFIG_TRY(readUInt(server, "maxMessageBytes", "server.maxMessageBytes",
                                       config.server.maxMessageBytes));
    }

    if (root.contains("auth")) {
        PROCTORSFU_CONFIG_TRY(readString(root["auth"], "jwtSecret", "auth.jwtSecret",
                                         config.auth.jwtSecret));
    }

    if (root.contains("media")) {
        const JsonValue& media = root["media"];
        PROCTORSFU_CONFIG_TRY(readString(media, "listenIp", "media.listenIp", config.media.listenIp));
        PROCTORSFU_CONFIG_TRY(readString(media, "announcedIp", "media.announcedIp",
                                         config.media.announcedIp));
        PROCTORSFU_CONFIG_TRY(readPort(media, "rtcMinPort", "media.rtcMinPort", config.media.rtcMinPort));
        PROCTORSFU_CONFIG_TRY(readPort(media, "rtcMaxPort", "media.rtcMaxPort", config.media.rtcMaxPort));
        PROCTORSFU_CONFIG_TRY(readString(media, "workerLogLevel", "media.workerLogLevel",
                                         config.media.workerLogLevel));
        PROCTORSFU_CONFIG_TRY(readUInt(media, "workerRestartDelayMs", "media.workerRestartDelayMs",
                                       config.media.workerRestartDelayMs));
    }

    if (root.contains("recording")) {
        const JsonValue& rec = root["recording"];
        PROCTORSFU_CONFIG_TRY(readString(rec, "basePath", "recording.basePath", config.recording.basePath));
        PROCTORSFU_CONFIG_TRY(readString(rec, "recorderIp", "recording.recorderIp",
                                         config.recording.recorderIp));
        PROCTORSFU_CONFIG_TRY(readPort(rec, "minPort", "recording.minPort", config.recording.minPort));
        PROCTORSFU_CONFIG_TRY(readPort(rec, "maxPort", "recording.maxPort", config.recording.maxPort));
        PROCTORSFU_CONFIG_TRY(readString(rec, "encoderPath", "recording.encoderPath",
                                         config.recording.encoderPath));
        PROCTORSFU_CONFIG_TRY(readString(rec, "encoderLogLevel", "recording.encoderLogLevel",
                                         config.recording.encoderLogLevel));
        PROCTORSFU_CONFIG_TRY(readUInt(rec, "restartWindowMs", "recording.restartWindowMs",
                                       config.recording.restartWindowMs));
        PROCTORSFU_CONFIG_TRY(readString(rec, "container", "recording.container",
                                         config.recording.container));
    }

    if (root.contains("timeouts")) {
        const JsonValue& t = root["timeouts"];
        PROCTORSFU_CONFIG_TRY(readUInt(t, "producerActiveMs", "timeouts.producerActiveMs",
                                       config.timeouts.producerActiveMs));
        PROCTORSFU_CONFIG_TRY(readUInt(t, "producerCheckIntervalMs", "timeouts.producerCheckIntervalMs",
                                       config.timeouts.producerCheckIntervalMs));
        PROCTORSFU_CONFIG_TRY(readUInt(t, "encoderReadyTimeoutMs", "timeouts.encoderReadyTimeoutMs",
                                       config.timeouts.encoderReadyTimeoutMs));
        PROCTORSFU_CONFIG_TRY(readUInt(t, "encoderReadyPollMs", "timeouts.encoderReadyPollMs",
                                       config.timeouts.encoderReadyPollMs));
        PROCTORSFU_CONFIG_TRY(readUInt(t, "transportSettleMs", "timeouts.transportSettleMs",
                                       config.timeouts.transportSettleMs));
        PROCTORSFU_CONFIG_TRY(readUInt(t, "encoderStopGraceMs", "timeouts.encoderStopGraceMs",
                                       config.timeouts.encoderStopGraceMs));
    }

    if (root.contains("roles") && root["roles"].contains("hierarchy")) {
        PROCTORSFU_CONFIG_TRY(readHierarchy(root["roles"]["hierarchy"], config.roles.hierarchy));
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        if (logging.contains("level")) {
            std::string levelStr = logging["level"].getString();
            if (!isKnownLogLevel(levelStr)) {
                return fieldError("logging.level",
                    "Invalid logging.level: " + levelStr + ". Valid values: debug, info, warning, error");
            }
            config.logging.level = stringToLogLevel(levelStr);
        }
        if (logging.contains("json")) {
            config.logging.json = logging["json"].getBool(false);
        }
    }

    return VoidResult::success();
}

#undef PROCTORSFU_CONFIG_TRY

std::string hierarchyToString(const RoleHierarchy& hierarchy) {
    std::string out;
    for (const auto& entry : hierarchy) {
        if (!out.empty()) out += "; ";
        out += roleToString(entry.first);
        out += " -> [";
        for (size_t i = 0; i < entry.second.size(); ++i) {
            if (i > 0) out += ",";
            out += roleToString(entry.second[i]);
        }
        out += "]";
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// ConfigManager
// =============================================================================

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto content = readFile(filePath);
    if (content.isError()) {
        return Result<void, ConfigError>::error(content.error());
    }

    auto result = parseJson(content.value());
    if (result.isSuccess()) {
        log("Configuration loaded from " + filePath);
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    return parseJson(jsonContent);
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = Configuration{};
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> ConfigManager::parseJson(const std::string& content) {
    auto parsed = JsonValue::parse(content);
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, parsed.error().message));
    }

    const JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, "Configuration root must be an object"));
    }

    Configuration candidate;
    {
        std::shared_lock<std::shared_mutex> lock(configMutex_);
        candidate = config_;
    }
    auto applied = applyJson(root, candidate);
    if (applied.isError()) {
        return applied;
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = std::move(candidate);
    }
    return validate();
}

void ConfigManager::applyEnvironmentOverrides() {
    // Messages are emitted after the lock is released so the callback may read the config
    std::vector<std::string> messages;
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overridePort = [this, &messages](const char* name, uint16_t& target) {
        if (auto val = getEnvVar(name)) {
            try {
                int port = std::stoi(*val);
                if (port <= 0 || port > 65535) {
                    throw std::out_of_range(*val);
                }
                target = static_cast<uint16_t>(port);
                messages.push_back(std::string("Environment override: ") + name + "=" + *val);
            } catch (const std::exception&) {
                messages.push_back(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    auto overrideUInt = [this, &messages](const char* name, uint32_t& target) {
        if (auto val = getEnvVar(name)) {
            try {
                unsigned long parsed = std::stoul(*val);
                if (parsed > UINT32_MAX) {
                    throw std::out_of_range(*val);
                }
                target = static_cast<uint32_t>(parsed);
                messages.push_back(std::string("Environment override: ") + name + "=" + *val);
            } catch (const std::exception&) {
                messages.push_back(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    auto overrideString = [this, &messages](const char* name, std::string& target, bool secret) {
        if (auto val = getEnvVar(name)) {
            target = *val;
            messages.push_back(std::string("Environment override: ") + name + "=" + (secret ? "***" : *val));
        }
    };

    // Server
    overridePort("PROCTORSFU_PORT", config_.server.port);
    overrideString("PROCTORSFU_HOST", config_.server.host, false);
    overrideString("PROCTORSFU_JWT_SECRET", config_.auth.jwtSecret, true);

    // Media engine
    overrideString("PROCTORSFU_WEBRTC_LISTEN_IP", config_.media.listenIp, false);
    overrideString("PROCTORSFU_WEBRTC_ANNOUNCED_IP", config_.media.announcedIp, false);
    overridePort("PROCTORSFU_RTC_MIN_PORT", config_.media.rtcMinPort);
    overridePort("PROCTORSFU_RTC_MAX_PORT", config_.media.rtcMaxPort);

    // Recording
    overridePort("PROCTORSFU_RECORDER_MIN_PORT", config_.recording.minPort);
    overridePort("PROCTORSFU_RECORDER_MAX_PORT", config_.recording.maxPort);
    overrideString("PROCTORSFU_RECORDING_PATH", config_.recording.basePath, false);
    overrideString("PROCTORSFU_ENCODER_PATH", config_.recording.encoderPath, false);

    // Timeouts
    overrideUInt("PROCTORSFU_PRODUCER_ACTIVE_TIMEOUT_MS", config_.timeouts.producerActiveMs);
    overrideUInt("PROCTORSFU_TRANSPORT_SETTLE_MS", config_.timeouts.transportSettleMs);

    // Logging
    if (auto val = getEnvVar("PROCTORSFU_LOG_LEVEL")) {
        if (isKnownLogLevel(*val)) {
            config_.logging.level = stringToLogLevel(*val);
            messages.push_back("Environment override: PROCTORSFU_LOG_LEVEL=" + *val);
        } else {
            messages.push_back("Warning: Invalid PROCTORSFU_LOG_LEVEL value: " + *val);
        }
    }
    lock.unlock();

    for (const auto& message : messages) {
        log(message);
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    if (config_.server.port == 0) {
        return fieldError("server.port", "server.port must be between 1 and 65535");
    }
    if (config_.server.maxConnections == 0) {
        return fieldError("server.maxConnections", "server.maxConnections must be greater than 0");
    }
    if (config_.server.maxMessageBytes < 1024) {
        return fieldError("server.maxMessageBytes", "server.maxMessageBytes must be at least 1024");
    }
    if (config_.auth.jwtSecret.empty()) {
        return fieldError("auth.jwtSecret", "auth.jwtSecret must not be empty");
    }
    if (config_.media.rtcMinPort >= config_.media.rtcMaxPort) {
        return fieldError("media.rtcMinPort", "media.rtcMinPort must be less than media.rtcMaxPort");
    }
    if (config_.recording.minPort >= config_.recording.maxPort) {
        return fieldError("recording.minPort", "recording.minPort must be less than recording.maxPort");
    }
    if (config_.recording.basePath.empty()) {
        return fieldError("recording.basePath", "recording.basePath must not be empty");
    }
    if (config_.recording.encoderPath.empty()) {
        return fieldError("recording.encoderPath", "recording.encoderPath must not be empty");
    }
    if (config_.recording.restartWindowMs == 0) {
        return fieldError("recording.restartWindowMs", "recording.restartWindowMs must be greater than 0");
    }
    if (config_.timeouts.producerCheckIntervalMs == 0) {
        return fieldError("timeouts.producerCheckIntervalMs",
                          "timeouts.producerCheckIntervalMs must be greater than 0");
    }
    if (config_.timeouts.encoderReadyPollMs == 0) {
        return fieldError("timeouts.encoderReadyPollMs",
                          "timeouts.encoderReadyPollMs must be greater than 0");
    }

    return Result<void, ConfigError>::success();
}

const Configuration& ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    JsonValue server = JsonValue::object();
    server.set("host", JsonValue::string(config_.server.host))
          .set("port", JsonValue::number(config_.server.port))
          .set("maxConnections", JsonValue::number(config_.server.maxConnections))
          .set("maxMessageBytes", JsonValue::number(config_.server.maxMessageBytes));

    JsonValue media = JsonValue::object();
    media.set("listenIp", JsonValue::string(config_.media.listenIp))
         .set("announcedIp", JsonValue::string(config_.media.announcedIp))
         .set("rtcMinPort", JsonValue::number(config_.media.rtcMinPort))
         .set("rtcMaxPort", JsonValue::number(config_.media.rtcMaxPort))
         .set("workerLogLevel", JsonValue::string(config_.media.workerLogLevel))
         .set("workerRestartDelayMs", JsonValue::number(config_.media.workerRestartDelayMs));

    JsonValue recording = JsonValue::object();
    recording.set("basePath", JsonValue::string(config_.recording.basePath))
             .set("recorderIp", JsonValue::string(config_.recording.recorderIp))
             .set("minPort", JsonValue::number(config_.recording.minPort))
             .set("maxPort", JsonValue::number(config_.recording.maxPort))
             .set("encoderPath", JsonValue::string(config_.recording.encoderPath))
             .set("encoderLogLevel", JsonValue::string(config_.recording.encoderLogLevel))
             .set("restartWindowMs", JsonValue::number(config_.recording.restartWindowMs))
             .set("container", JsonValue::string(config_.recording.container));

    JsonValue timeouts = JsonValue::object();
    timeouts.set("producerActiveMs", JsonValue::number(config_.timeouts.producerActiveMs))
            .set("producerCheckIntervalMs", JsonValue::number(config_.timeouts.producerCheckIntervalMs))
            .set("encoderReadyTimeoutMs", JsonValue::number(config_.timeouts.encoderReadyTimeoutMs))
            .set("encoderReadyPollMs", JsonValue::number(config_.timeouts.encoderReadyPollMs))
            .set("transportSettleMs", JsonValue::number(config_.timeouts.transportSettleMs))
            .set("encoderStopGraceMs", JsonValue::number(config_.timeouts.encoderStopGraceMs));

    JsonValue hierarchy = JsonValue::object();
    for (const auto& entry : config_.roles.hierarchy) {
        JsonValue visible = JsonValue::array();
        for (Role role : entry.second) {
            visible.push(JsonValue::string(roleToString(role)));
        }
        hierarchy.set(roleToString(entry.first), std::move(visible));
    }

    JsonValue root = JsonValue::object();
    root.set("server", std::move(server))
        .set("auth", JsonValue::object().set("jwtSecret", JsonValue::string("***")))
        .set("media", std::move(media))
        .set("recording", std::move(recording))
        .set("timeouts", std::move(timeouts))
        .set("roles", JsonValue::object().set("hierarchy", std::move(hierarchy)))
        .set("logging", JsonValue::object()
            .set("level", JsonValue::string(logLevelToString(config_.logging.level)))
            .set("json", JsonValue::boolean(config_.logging.json)));
    return root.serialize();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                       "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                       "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(configMutex_);
        snapshot = config_;
    }
    log("Effective configuration:");
    log("  server: " + snapshot.server.host + ":" + std::to_string(snapshot.server.port) +
        ", maxConnections " + std::to_string(snapshot.server.maxConnections));
    log("  media: listen " + snapshot.media.listenIp + ", announced " + snapshot.media.announcedIp +
        ", rtc ports " + std::to_string(snapshot.media.rtcMinPort) + "-" +
        std::to_string(snapshot.media.rtcMaxPort));
    log("  recording: path " + snapshot.recording.basePath + ", encoder " +
        snapshot.recording.encoderPath + ", ports [" + std::to_string(snapshot.recording.minPort) +
        ", " + std::to_string(snapshot.recording.maxPort) + "), restart window " +
        std::to_string(snapshot.recording.restartWindowMs) + "ms");
    log("  timeouts: producerActive " + std::to_string(snapshot.timeouts.producerActiveMs) +
        "ms, encoderReady " + std::to_string(snapshot.timeouts.encoderReadyTimeoutMs) +
        "ms, transportSettle " + std::to_string(snapshot.timeouts.transportSettleMs) + "ms");
    log("  roles: " + hierarchyToString(snapshot.roles.hierarchy));
    log("  logging.level: " + logLevelToString(snapshot.logging.level));
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace core
} // namespace proctorsfu
