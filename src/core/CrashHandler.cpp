/**
 * @file CrashHandler.cpp
 * @brief Implementation of signal handling and crash state capture
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CrashHandler.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#if defined(__APPLE__) || defined(__linux__)
#include <execinfo.h>
#include <unistd.h>
#endif

namespace relay {

// Static instance for signal handler
CrashHandler* CrashHandler::instance_ = nullptr;

std::vector<std::string> CrashContext::report_lines() const {
    const std::string alarm(80, '!');
    std::vector<std::string> lines = {
        alarm,
        "CRASH REPORT",
        "Time: " + timestamp,
        "Signal: " + std::to_string(signal_number) + " (" + signal_name + ")",
    };

    if (memory) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << "Memory: resident " << to_mb(memory->resident_bytes) << " MB, virtual "
            << to_mb(memory->virtual_bytes) << " MB";
        if (memory->container_bytes) {
            oss << ", container " << to_mb(*memory->container_bytes) << " MB";
        }
        lines.push_back(oss.str());
        lines.push_back("Status: " + status);
    } else {
        lines.push_back("Memory: unavailable");
    }

    if (history_unavailable) {
        lines.push_back("Recent operations: unavailable (history busy at crash time)");
    } else {
        lines.push_back("Last " + std::to_string(recent_operations.size()) + " operations before crash:");
        for (const auto& entry : recent_operations) {
            lines.push_back("  " + entry.format());
        }
    }

    for (const auto& [key, value] : debug_info) {
        lines.push_back(key + ": " + value);
    }

    if (!stack_trace.empty()) {
        lines.push_back("Stack trace:");
        std::istringstream trace(stack_trace);
        std::string frame;
        while (std::getline(trace, frame)) {
            lines.push_back("  " + frame);
        }
    }

    lines.push_back(alarm);
    return lines;
}

CrashHandler::CrashHandler(MemoryMonitor& monitor)
    : monitor_(monitor) {
    if (instance_ == nullptr) {
        instance_ = this;
    }
}

CrashHandler::~CrashHandler() {
    remove_handlers();
    if (instance_ == this) {
        instance_ = nullptr;
    }
}

void CrashHandler::install_handlers() {
    if (handlers_installed_) {
        return;
    }

    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    std::signal(SIGFPE, signal_handler);
    std::signal(SIGILL, signal_handler);
#ifndef _WIN32
    std::signal(SIGBUS, signal_handler);
#endif

    handlers_installed_ = true;
    logger_.debug("Signal handlers installed");
}

void CrashHandler::remove_handlers() {
    if (!handlers_installed_) {
        return;
    }

    std::signal(SIGSEGV, SIG_DFL);
    std::signal(SIGABRT, SIG_DFL);
    std::signal(SIGFPE, SIG_DFL);
    std::signal(SIGILL, SIG_DFL);
#ifndef _WIN32
    std::signal(SIGBUS, SIG_DFL);
#endif

    handlers_installed_ = false;
    logger_.debug("Signal handlers removed");
}

void CrashHandler::add_debug_info(const std::string& key, const std::string& value) {
    debug_info_[key] = value;
}

CrashContext CrashHandler::capture_crash_state(int signal_number) const {
    CrashContext context;
    context.signal_number = signal_number;
    context.signal_name = get_signal_name(signal_number);
    context.timestamp = DiagnosticLog::timestamp();
    context.debug_info = debug_info_;

    context.memory = monitor_.sample_memory();
    context.status = MemoryMonitor::status_label(context.memory->memory_to_check(), monitor_.thresholds());

    if (auto recent = monitor_.try_recent_history(5)) {
        context.recent_operations = std::move(*recent);
    } else {
        context.history_unavailable = true;
    }

    context.stack_trace = generate_stack_trace();
    return context;
}

bool CrashHandler::write_crash_log(const CrashContext& context) const {
    return monitor_.diagnostic_log().record_forced(context.report_lines());
}

void CrashHandler::signal_handler(int signal_number) {
    if (instance_) {
        instance_->handle_crash(signal_number);
    }

    // Re-raise the signal with default handler
    std::signal(signal_number, SIG_DFL);
    std::raise(signal_number);
}

void CrashHandler::handle_crash(int signal_number) {
    try {
        CrashContext context = capture_crash_state(signal_number);
        std::cerr << "\n*** FATAL ERROR: " << context.signal_name << " ***" << std::endl;
        if (write_crash_log(context)) {
            std::cerr << "Crash report written to: " << monitor_.diagnostic_log().path() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Crash report failed: " << e.what() << std::endl;
    }
}

std::string CrashHandler::generate_stack_trace() {
#if defined(__APPLE__) || defined(__linux__)
    void* buffer[64];
    int nptrs = backtrace(buffer, 64);
    char** strings = backtrace_symbols(buffer, nptrs);

    std::ostringstream trace;
    if (strings) {
        for (int i = 0; i < nptrs; ++i) {
            trace << strings[i] << '\n';
        }
        free(strings);
    } else {
        trace << "Failed to capture stack trace\n";
    }
    return trace.str();
#else
    return "Stack trace not available on this platform";
#endif
}

std::string CrashHandler::get_signal_name(int signal_number) {
    switch (signal_number) {
        case SIGSEGV: return "SIGSEGV (Segmentation fault)";
        case SIGABRT: return "SIGABRT (Abort)";
        case SIGFPE: return "SIGFPE (Floating point exception)";
        case SIGILL: return "SIGILL (Illegal instruction)";
#ifndef _WIN32
        case SIGBUS: return "SIGBUS (Bus error)";
#endif
        default: return "Unknown signal (" + std::to_string(signal_number) + ")";
    }
}

} // namespace relay
