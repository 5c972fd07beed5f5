// ProctorSFU - Exam Proctoring Media Server
// Structured Logging Component Implementation

#include "proctorsfu/core/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace proctorsfu {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug: return "debug";
        case LogLevelConfig::Info: return "info";
        case LogLevelConfig::Warning: return "warning";
        case LogLevelConfig::Error: return "error";
    }
    return "info";
}

namespace {

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // anonymous namespace

LogLevelConfig stringToLogLevel(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "debug") return LogLevelConfig::Debug;
    if (lower == "warning" || lower == "warn") return LogLevelConfig::Warning;
    if (lower == "error") return LogLevelConfig::Error;
    return LogLevelConfig::Info;
}

bool isKnownLogLevel(const std::string& str) {
    std::string lower = toLower(str);
    return lower == "debug" || lower == "info" || lower == "warning" ||
           lower == "warn" || lower == "error";
}

std::string sessionEventTypeToString(SessionEventType eventType) {
    switch (eventType) {
        case SessionEventType::RoomCreated: return "room_created";
        case SessionEventType::RoomClosed: return "room_closed";
        case SessionEventType::PeerJoined: return "peer_joined";
        case SessionEventType::PeerLeft: return "peer_left";
        case SessionEventType::ProducerCreated: return "producer_created";
        case SessionEventType::ProducerClosed: return "producer_closed";
        case SessionEventType::ConsumerCreated: return "consumer_created";
        case SessionEventType::RecordingStarted: return "recording_started";
        case SessionEventType::RecordingStopped: return "recording_stopped";
        case SessionEventType::RecordingFailed: return "recording_failed";
        case SessionEventType::WorkerDied: return "worker_died";
        case SessionEventType::WorkerRestarted: return "worker_restarted";
    }
    return "unknown";
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category, nullptr);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category, nullptr);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category, nullptr);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category, nullptr);
}

void StructuredLogger::logSessionEvent(
    SessionEventType eventType,
    const LogContext& context,
    const std::string& detail)
{
    LogLevelConfig level = LogLevelConfig::Info;
    if (eventType == SessionEventType::RecordingFailed ||
        eventType == SessionEventType::WorkerDied) {
        level = LogLevelConfig::Warning;
    }
    if (!isEnabled(level)) {
        return;
    }

    const std::string category = "Session";
    const std::string event = sessionEventTypeToString(eventType);

    std::string formatted;
    if (jsonFormat_.load()) {
        formatted = formatJson(level, detail, category, &context, &event);
    } else {
        std::string message = "Event: " + event;
        if (!detail.empty()) {
            message += ", " + detail;
        }
        formatted = formatPlainText(level, message, category, &context);
    }
    dispatch(level, formatted, category);
}

void StructuredLogger::warningWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    log(LogLevelConfig::Warning, message, category, &context);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    log(LogLevelConfig::Error, message, category, &context);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void StructuredLogger::flush() {
    std::vector<std::shared_ptr<pal::ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->flush();
    }
}

void StructuredLogger::log(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    if (!isEnabled(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, context, nullptr)
        : formatPlainText(level, message, category, context);
    dispatch(level, formatted, category);
}

void StructuredLogger::dispatch(
    LogLevelConfig level,
    const std::string& formatted,
    const std::string& category)
{
    std::vector<std::shared_ptr<pal::ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    pal::LogContext palContext;
    for (auto& sink : sinks) {
        sink->write(toPalLogLevel(level), formatted, category, palContext);
    }
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context,
    const std::string* event) const
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << getTimestamp() << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJson(category) << "\"";
    if (event) {
        oss << ",\"event\":\"" << escapeJson(*event) << "\"";
    }
    if (!message.empty() || !event) {
        oss << ",\"message\":\"" << escapeJson(message) << "\"";
    }

    if (context) {
        if (!context->roomId.empty()) {
            oss << ",\"room_id\":\"" << escapeJson(context->roomId) << "\"";
        }
        if (context->connectionId != INVALID_CONNECTION_ID) {
            oss << ",\"connection_id\":" << context->connectionId;
        }
        if (!context->userId.empty()) {
            oss << ",\"user_id\":\"" << escapeJson(context->userId) << "\"";
        }
        if (!context->producerId.empty()) {
            oss << ",\"producer_id\":\"" << escapeJson(context->producerId) << "\"";
        }
        if (context->recordingId != INVALID_RECORDING_SESSION_ID) {
            oss << ",\"recording_id\":" << context->recordingId;
        }
        if (!context->errorCode.empty()) {
            oss << ",\"error_code\":\"" << escapeJson(context->errorCode) << "\"";
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->roomId.empty()) oss << ", Room: " << context->roomId;
        if (context->connectionId != INVALID_CONNECTION_ID) oss << ", Conn: " << context->connectionId;
        if (!context->userId.empty()) oss << ", User: " << context->userId;
        if (!context->producerId.empty()) oss << ", Producer: " << context->producerId;
        if (context->recordingId != INVALID_RECORDING_SESSION_ID) oss << ", Recording: " << context->recordingId;
        if (!context->errorCode.empty()) oss << ", Code: " << context->errorCode;
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    gmtime_r(&timeNow, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string StructuredLogger::escapeJson(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug: return pal::LogLevel::Debug;
        case LogLevelConfig::Info: return pal::LogLevel::Info;
        case LogLevelConfig::Warning: return pal::LogLevel::Warning;
        case LogLevelConfig::Error: return pal::LogLevel::Error;
    }
    return pal::LogLevel::Info;
}

// =============================================================================
// LogPalSink
// =============================================================================

LogPalSink::LogPalSink(std::shared_ptr<pal::ILogPAL> logPal)
    : logPal_(std::move(logPal)) {
}

void LogPalSink::write(
    pal::LogLevel level,
    const std::string& message,
    const std::string& category,
    const pal::LogContext& context)
{
    if (logPal_) {
        logPal_->log(level, message, category, context);
    }
}

void LogPalSink::flush() {
    if (logPal_) {
        logPal_->flush();
    }
}

} // namespace core
} // namespace proctorsfu
