// ProctorSFU - Exam Proctoring Media Server
// Linux Log PAL Implementation

#include "proctorsfu/pal/linux/linux_log_pal.hpp"

#if defined(__linux__)

#include <syslog.h>

#include <algorithm>
#include <cstdio>

namespace proctorsfu {
namespace pal {
namespace linux {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "INFO";
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxLogPAL::LinuxLogPAL(std::string ident, bool mirrorToStderr)
    : ident_(std::move(ident))
    , mirrorToStderr_(mirrorToStderr) {
    // openlog keeps the pointer, ident_ outlives the connection
    openlog(ident_.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
    syslogOpened_ = true;
}

LinuxLogPAL::~LinuxLogPAL() {
    flush();
    if (syslogOpened_) {
        closelog();
        syslogOpened_ = false;
    }
}

// =============================================================================
// Logging Operations
// =============================================================================

void LinuxLogPAL::log(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& context
) {
    if (level == LogLevel::Off ||
        static_cast<uint32_t>(level) < static_cast<uint32_t>(minLevel_.load())) {
        return;
    }

    logToPlatform(level, message, category);

    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->write(level, message, category, context);
    }
}

void LinuxLogPAL::logToPlatform(
    LogLevel level,
    const std::string& message,
    const std::string& category
) {
    syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());

    if (mirrorToStderr_) {
        fprintf(stderr, "[%s] [%s] %s\n", logLevelName(level), category.c_str(), message.c_str());
    }
}

int LinuxLogPAL::toSyslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
            break;
    }
    return LOG_DEBUG;
}

// =============================================================================
// Level Management
// =============================================================================

void LinuxLogPAL::setMinLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel LinuxLogPAL::getMinLevel() const {
    return minLevel_.load();
}

// =============================================================================
// Sink Management
// =============================================================================

void LinuxLogPAL::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->flush();
    }
    if (mirrorToStderr_) {
        fflush(stderr);
    }
}

void LinuxLogPAL::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void LinuxLogPAL::removeSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

size_t LinuxLogPAL::sinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
