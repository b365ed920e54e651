/**
 * @file Logger.hpp
 * @brief Centralized logging with per-component verbosity control
 *
 * Every component owns a Logger named after itself. Output goes through a
 * single write point that prefixes a timestamp, the level tag and the
 * component, echoes to stderr and optionally appends to a shared log file.
 */

#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace relay {

struct LogConfig;

/**
 * @brief Log levels
 *
 * Level 1: Errors (operation failed)
 * Level 2: Warnings (degraded, memory alerts)
 * Level 3: Information (transfer start/end, snapshots)
 * Level 4: Detailed information (per-transfer codepaths)
 * Level 5: Basic debugging (eviction calls, sampler fallbacks)
 * Level 6: Detailed debugging (per-chunk values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* log_level_tag(LogLevel level);

/**
 * @brief Component logger with a single point of output control
 *
 * Consecutive identical messages from the same logger are collapsed into a
 * "The previous message occurred N times." line. Logging never throws.
 */
class Logger {
public:
    Logger();
    explicit Logger(const std::string& component_name);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective level
     * @param level Level of this message
     * @param message Message to output (may span several lines)
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }
    void trace(const std::string& message) const { outputMessage(LogLevel::TRACE, message); }

    /**
     * @brief Emit any pending repeat summary and flush the shared sinks
     */
    void flush() const;

    const std::string& component() const { return component_name_; }

    /**
     * @brief Effective level: facility override, else global default
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Process-wide configuration
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply a level specification
     *
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "TransferEngine=6,MemoryMonitor=3"
     * - Mixed: "4,TransferEngine=6"
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Open (append) or close the shared log file
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& path);

    /**
     * @brief Apply a LogConfig plus the MEDIA_RELAY_LOG environment override
     * @return false if the configured log file could not be opened
     */
    static bool configure(const LogConfig& config);

    static void setConsoleEcho(bool enabled);

private:
    std::string component_name_;

    mutable std::mutex state_mutex_;
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    static std::mutex sink_mutex_;
    static std::unique_ptr<std::ofstream> file_stream_;
    static bool console_echo_;

    void flushRepeatsLocked() const;

    /**
     * @brief The one place a formatted line reaches stderr and the file
     */
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace relay
