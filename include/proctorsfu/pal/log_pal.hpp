// ProctorSFU - Exam Proctoring Media Server
// Platform Abstraction Layer - Logging Interface
//
// Abstracts the host logging facility (syslog plus stderr on Linux) and the
// sinks that receive formatted records.

#ifndef PROCTORSFU_PAL_LOG_PAL_HPP
#define PROCTORSFU_PAL_LOG_PAL_HPP

#include "proctorsfu/pal/pal_types.hpp"

#include <memory>
#include <string>

namespace proctorsfu {
namespace pal {

/**
 * @brief Destination for formatted log records.
 *
 * Sinks may be called concurrently from any thread.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log record.
     *
     * @param level Severity of the record
     * @param message Fully formatted record
     * @param category Component that produced it (e.g. "Recording")
     * @param context Source location, may be empty
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void flush() = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Platform logging facility.
 *
 * Records below the minimum level are discarded before any formatting. Every
 * registered sink receives each qualifying record.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    // =========================================================================
    // Logging Operations
    // =========================================================================

    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Set the minimum level; takes effect for subsequent calls.
     */
    virtual void setMinLevel(LogLevel level) = 0;

    virtual LogLevel getMinLevel() const = 0;

    virtual void flush() = 0;

    // =========================================================================
    // Sink Management
    // =========================================================================

    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

// =============================================================================
// Convenience Macros for Logging
// =============================================================================

/**
 * Usage:
 *   PROCTORSFU_LOG_INFO(logPal, "Server", "Listening on port " + std::to_string(port));
 */

#define PROCTORSFU_LOG_CONTEXT() \
    ::proctorsfu::pal::LogContext{__FILE__, __LINE__, __FUNCTION__}

#define PROCTORSFU_LOG(logger, level, category, message) \
    do { \
        if ((logger) != nullptr) { \
            (logger)->log((level), (message), (category), PROCTORSFU_LOG_CONTEXT()); \
        } \
    } while (0)

#define PROCTORSFU_LOG_DEBUG(logger, category, message) \
    PROCTORSFU_LOG(logger, ::proctorsfu::pal::LogLevel::Debug, category, message)

#define PROCTORSFU_LOG_INFO(logger, category, message) \
    PROCTORSFU_LOG(logger, ::proctorsfu::pal::LogLevel::Info, category, message)

#define PROCTORSFU_LOG_WARNING(logger, category, message) \
    PROCTORSFU_LOG(logger, ::proctorsfu::pal::LogLevel::Warning, category, message)

#define PROCTORSFU_LOG_ERROR(logger, category, message) \
    PROCTORSFU_LOG(logger, ::proctorsfu::pal::LogLevel::Error, category, message)

} // namespace pal
} // namespace proctorsfu

#endif // PROCTORSFU_PAL_LOG_PAL_HPP
