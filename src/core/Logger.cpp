/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging
 */

#include "Logger.hpp"
#include "media_relay.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <algorithm>

namespace relay {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

std::mutex Logger::sink_mutex_;
std::unique_ptr<std::ofstream> Logger::file_stream_;
bool Logger::console_echo_ = true;

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\n\r"));
    s.erase(s.find_last_not_of(" \t\n\r") + 1);
    return s;
}

LogLevel clamp_level(int value) {
    return static_cast<LogLevel>(std::clamp(value, 1, 6));
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?    ";
}

Logger::Logger() : last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : component_name_(component_name), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    flushRepeatsLocked();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (!shouldOutput(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    flushRepeatsLocked();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flushRepeatsLocked() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    try {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);
        char timestamp[40];
        std::snprintf(timestamp, sizeof(timestamp), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

        std::ostringstream line;
        line << "[" << timestamp << "] [" << log_level_tag(level) << "] ";
        if (!component_name_.empty()) {
            line << "[" << component_name_ << "] ";
        }
        line << message;

        std::lock_guard<std::mutex> sink_lock(sink_mutex_);
        if (console_echo_) {
            std::cerr << line.str() << '\n';
        }
        if (file_stream_ && file_stream_->is_open()) {
            *file_stream_ << line.str() << '\n';
            if (level <= LogLevel::WARNING) {
                file_stream_->flush();
            }
        }
    } catch (const std::exception&) {
        // Observability must not take down the caller
    }
}

void Logger::flush() const {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        flushRepeatsLocked();
    }

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Process-wide configuration
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = "default";
        std::string level_str = token;
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        try {
            LogLevel level = clamp_level(std::stoi(level_str));
            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

bool Logger::setLogFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> sink_lock(sink_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!path.has_value()) {
        return true;
    }

    try {
        std::filesystem::path log_path(*path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        file_stream_ = std::make_unique<std::ofstream>(*path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << *path << std::endl;
            file_stream_.reset();
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
        return false;
    }
    return true;
}

bool Logger::configure(const LogConfig& config) {
    setDefaultLevel(clamp_level(config.level));
    parseLogConfig(config.facilities);
    if (const char* env = std::getenv("MEDIA_RELAY_LOG")) {
        parseLogConfig(env);
    }
    return setLogFile(config.log_file);
}

void Logger::setConsoleEcho(bool enabled) {
    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    console_echo_ = enabled;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    return default_level_;
}

} // namespace relay
