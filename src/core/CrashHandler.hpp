/**
 * @file CrashHandler.hpp
 * @brief Signal handling and crash state capture
 *
 * On a fatal signal the last memory sample, the most recent operations and a
 * backtrace are force-written to the diagnostic log before the signal is
 * re-raised with its default disposition.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "MemoryMonitor.hpp"
#include <csignal>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relay {

/**
 * @brief Crash context information
 */
struct CrashContext {
    int signal_number = 0;
    std::string signal_name;
    std::string timestamp;
    std::optional<MemorySample> memory;
    std::string status;
    std::vector<HistoryEntry> recent_operations;
    bool history_unavailable = false;   ///< History lock was held at crash time
    std::string stack_trace;
    std::map<std::string, std::string> debug_info;

    /**
     * @brief Report as diagnostic log lines
     */
    std::vector<std::string> report_lines() const;
};

/**
 * @brief Fatal signal handling that feeds the diagnostic log
 */
class CrashHandler {
public:
    explicit CrashHandler(MemoryMonitor& monitor);
    ~CrashHandler();

    CrashHandler(const CrashHandler&) = delete;
    CrashHandler& operator=(const CrashHandler&) = delete;

    /**
     * @brief Install handlers for SIGSEGV, SIGABRT, SIGFPE, SIGILL and SIGBUS
     */
    void install_handlers();

    /**
     * @brief Restore default signal handlers
     */
    void remove_handlers();

    bool handlers_installed() const { return handlers_installed_; }

    /**
     * @brief Attach a key/value pair to every crash report
     */
    void add_debug_info(const std::string& key, const std::string& value);

    /**
     * @brief Capture the current state as if signal_number had been delivered
     */
    CrashContext capture_crash_state(int signal_number) const;

    /**
     * @brief Force-write a crash report to the diagnostic log
     * @return true if the report reached the file
     */
    bool write_crash_log(const CrashContext& context) const;

    static std::string get_signal_name(int signal_number);

private:
    static CrashHandler* instance_;
    MemoryMonitor& monitor_;
    std::map<std::string, std::string> debug_info_;
    bool handlers_installed_ = false;
    Logger logger_{"CrashHandler"};

    static void signal_handler(int signal_number);
    void handle_crash(int signal_number);
    static std::string generate_stack_trace();
};

} // namespace relay
