// ProctorSFU - Exam Proctoring Media Server
// Linux Log PAL Implementation
//
// Routes records to syslog and mirrors them on stderr.

#ifndef PROCTORSFU_PAL_LINUX_LINUX_LOG_PAL_HPP
#define PROCTORSFU_PAL_LINUX_LINUX_LOG_PAL_HPP

#include "proctorsfu/pal/log_pal.hpp"
#include "proctorsfu/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(__linux__)

namespace proctorsfu {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ILogPAL.
 *
 * - syslog(3) with the configured ident and LOG_USER facility
 * - a "[LEVEL] [category] message" line on stderr unless disabled
 * - registered sinks
 *
 * Sinks are snapshotted under the mutex and invoked without it, so a sink
 * may log or unregister itself.
 */
class LinuxLogPAL : public ILogPAL {
public:
    /**
     * @brief Open syslog with the given ident.
     * @param ident syslog identity, kept alive for the PAL's lifetime
     * @param mirrorToStderr Also print each record on stderr
     */
    explicit LinuxLogPAL(std::string ident = "proctorsfu", bool mirrorToStderr = true);

    ~LinuxLogPAL() override;

    LinuxLogPAL(const LinuxLogPAL&) = delete;
    LinuxLogPAL& operator=(const LinuxLogPAL&) = delete;
    LinuxLogPAL(LinuxLogPAL&&) = delete;
    LinuxLogPAL& operator=(LinuxLogPAL&&) = delete;

    // =========================================================================
    // ILogPAL Implementation
    // =========================================================================

    void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void setMinLevel(LogLevel level) override;
    LogLevel getMinLevel() const override;
    void flush() override;
    void addSink(std::shared_ptr<ILogSink> sink) override;
    void removeSink(std::shared_ptr<ILogSink> sink) override;

    /**
     * @brief Number of registered sinks.
     */
    size_t sinkCount() const;

private:
    void logToPlatform(
        LogLevel level,
        const std::string& message,
        const std::string& category
    );

    static int toSyslogPriority(LogLevel level);

    std::string ident_;
    bool mirrorToStderr_;
    std::atomic<LogLevel> minLevel_{LogLevel::Debug};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    bool syslogOpened_{false};
};

/**
 * @brief Name of a PAL level as printed on stderr ("INFO", "WARNING", ...).
 */
const char* logLevelName(LogLevel level);

} // namespace linux
} // namespace pal
} // namespace proctorsfu

#endif // defined(__linux__)
#endif // PROCTORSFU_PAL_LINUX_LINUX_LOG_PAL_HPP
