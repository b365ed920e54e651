/**
 * @file DiagnosticLog.cpp
 * @brief Implementation of the gated diagnostic log
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "DiagnosticLog.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace relay {

DiagnosticLog::DiagnosticLog(std::string path, std::uint64_t record_floor_bytes)
    : path_(std::move(path)), record_floor_bytes_(record_floor_bytes) {
}

DiagnosticLog::StartState DiagnosticLog::open_session() {
    std::error_code ec;
    const bool existed = std::filesystem::exists(path_, ec);

    std::vector<std::string> banner;
    const std::string double_rule(80, '=');
    if (existed) {
        banner = {
            "",
            double_rule,
            "PROCESS RESTARTED at " + timestamp(),
            "Previous process may have been killed - check the records above",
            double_rule,
        };
    } else {
        banner = {
            double_rule,
            "MEMORY DEBUG LOG - media-relay",
            "Started: " + timestamp(),
            double_rule,
            "Records appear here only when memory is elevated or a snapshot is requested.",
            "After a crash, the last records show the state before memory ran out.",
            rule(),
        };
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!append_lines(banner)) {
            logger_.error("Failed to initialize diagnostic log " + path_);
            return StartState::Failed;
        }
    }

    if (existed) {
        logger_.warning("Found existing diagnostic log " + path_ + " - previous process may have crashed");
        return StartState::Restarted;
    }
    logger_.info("Diagnostic log initialized: " + path_);
    return StartState::Fresh;
}

bool DiagnosticLog::record(const std::vector<std::string>& lines, std::uint64_t memory_to_check) {
    if (!should_record(memory_to_check)) {
        return false;
    }
    return record_forced(lines);
}

bool DiagnosticLog::record_forced(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return append_lines(lines);
}

std::size_t DiagnosticLog::failed_writes() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return failed_writes_;
}

std::size_t DiagnosticLog::records_written() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return records_written_;
}

bool DiagnosticLog::append_lines(const std::vector<std::string>& lines) {
    try {
        std::ofstream file(path_, std::ios::app);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open for append");
        }

        const std::string stamp = "[" + timestamp() + "] ";
        for (const auto& line : lines) {
            file << stamp << line << '\n';
        }
        file.flush();
        if (!file) {
            throw std::runtime_error("write failed");
        }
        ++records_written_;
        return true;
    } catch (const std::exception& e) {
        // Transient: the record is lost, the caller carries on
        if (failed_writes_++ == 0) {
            logger_.warning("Failed to write diagnostic log " + path_ + ": " + e.what());
        } else {
            logger_.debug("Diagnostic log write failed again (" + std::to_string(failed_writes_) + "): " + e.what());
        }
        return false;
    }
}

std::string DiagnosticLog::rule() {
    return std::string(80, '-');
}

std::string DiagnosticLog::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream stamp;
    stamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return stamp.str();
}

} // namespace relay
