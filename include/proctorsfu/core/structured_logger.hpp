// ProctorSFU - Exam Proctoring Media Server
// Structured Logging Component
//
// Responsibilities:
// - Level filtering (debug, info, warning, error)
// - Plain-text or JSON records with ISO 8601 timestamps
// - Session lifecycle events with room/peer/producer context
// - Fan-out to pal::ILogSink destinations

#ifndef PROCTORSFU_CORE_STRUCTURED_LOGGER_HPP
#define PROCTORSFU_CORE_STRUCTURED_LOGGER_HPP

#include "proctorsfu/core/types.hpp"
#include "proctorsfu/pal/log_pal.hpp"
#include "proctorsfu/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proctorsfu {
namespace core {

enum class LogLevelConfig {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Parse a level name, case-insensitive. "warn" is accepted.
 * @return The level, Info for unknown names
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief True if str names a level stringToLogLevel understands.
 */
bool isKnownLogLevel(const std::string& str);

/**
 * @brief Lifecycle events of the session fabric.
 */
enum class SessionEventType {
    RoomCreated,
    RoomClosed,
    PeerJoined,
    PeerLeft,
    ProducerCreated,
    ProducerClosed,
    ConsumerCreated,
    RecordingStarted,
    RecordingStopped,
    RecordingFailed,
    WorkerDied,
    WorkerRestarted
};

std::string sessionEventTypeToString(SessionEventType eventType);

/**
 * @brief Identifiers attached to a record. Empty fields are omitted.
 */
struct LogContext {
    std::string roomId;
    ConnectionId connectionId = INVALID_CONNECTION_ID;
    std::string userId;
    std::string producerId;
    RecordingSessionId recordingId = INVALID_RECORDING_SESSION_ID;
    std::string errorCode;

    LogContext() = default;
};

/**
 * @brief Structured logger shared by all components.
 *
 * Records are formatted once and handed to every sink. JSON records carry
 * "timestamp", "level", "category", "message" and any non-empty context
 * fields in snake_case.
 *
 * ## Thread Safety
 * All methods are thread-safe. Sinks are invoked outside the internal lock.
 *
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->addSink(std::make_shared<LogPalSink>(logPal));
 *
 * LogContext ctx;
 * ctx.roomId = "exam-42";
 * ctx.connectionId = 7;
 * logger->logSessionEvent(SessionEventType::PeerJoined, ctx);
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    bool isEnabled(LogLevelConfig level) const;

    // =========================================================================
    // Basic Logging
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "ProctorSFU");
    void info(const std::string& message, const std::string& category = "ProctorSFU");
    void warning(const std::string& message, const std::string& category = "ProctorSFU");
    void error(const std::string& message, const std::string& category = "ProctorSFU");

    // =========================================================================
    // Contextual Logging
    // =========================================================================

    /**
     * @brief Log a session lifecycle event at Info level.
     *
     * RecordingFailed and WorkerDied are logged at Warning level.
     *
     * @param eventType Event that happened
     * @param context Identifiers of the affected entities
     * @param detail Optional free-form detail appended to the record
     */
    void logSessionEvent(
        SessionEventType eventType,
        const LogContext& context,
        const std::string& detail = ""
    );

    void warningWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "ProctorSFU"
    );

    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "ProctorSFU"
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);
    void flush();

private:
    void log(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    );

    void dispatch(LogLevelConfig level, const std::string& formatted, const std::string& category);

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context,
        const std::string* event
    ) const;

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    static std::string getTimestamp();
    static std::string escapeJson(const std::string& str);
    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

/**
 * @brief Sink that forwards formatted records to a platform log PAL.
 */
class LogPalSink : public pal::ILogSink {
public:
    explicit LogPalSink(std::shared_ptr<pal::ILogPAL> logPal);

    void write(
        pal::LogLevel level,
        const std::string& message,
        const std::string& category,
        const pal::LogContext& context
    ) override;

    void flush() override;

    std::string getName() const override { return "LogPalSink"; }

private:
    std::shared_ptr<pal::ILogPAL> logPal_;
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_STRUCTURED_LOGGER_HPP
