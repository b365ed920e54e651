/**
 * @file ConfigurationManager.cpp
 * @brief JSON configuration management for media-relay
 */

#include "ConfigurationManager.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

namespace relay {

namespace {

/// Copy j[key] into target when present; type mismatches are warnings
template<typename T>
void read_value(const json& j, const char* key, T& target, const Logger& logger) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        target = j[key].get<T>();
    } catch (const json::exception& e) {
        logger.warning(std::string("Ignoring config key '") + key + "': " + e.what());
    }
}

const json& section(const json& document, const char* name) {
    static const json empty = json::object();
    auto it = document.find(name);
    if (it == document.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        logger_.error("Could not open config file: " + filename);
        return false;
    }

    try {
        json document;
        file >> document;
        if (!load_from_json(document)) {
            logger_.error("Invalid configuration in " + filename);
            return false;
        }
        logger_.detailed("Loaded configuration from " + filename);
        return true;
    } catch (const json::exception& e) {
        logger_.error("Error parsing JSON config file " + filename + ": " + e.what());
        return false;
    }
}

bool ConfigurationManager::load_from_json(const json& document) {
    if (!document.is_object()) {
        logger_.error("Configuration root must be a JSON object");
        return false;
    }

    const json& transfer = section(document, "transfer");
    read_value(transfer, "chunk_size", config_.transfer.chunk_size, logger_);
    read_value(transfer, "evict_page_cache", config_.transfer.evict_page_cache, logger_);
    read_value(transfer, "flush_before_evict", config_.transfer.flush_before_evict, logger_);
    read_value(transfer, "http_timeout_seconds", config_.transfer.http_timeout_seconds, logger_);
    read_value(transfer, "user_agent", config_.transfer.user_agent, logger_);

    const json& upload = section(document, "upload");
    read_value(upload, "parallel_enabled", config_.upload.parallel_enabled, logger_);
    read_value(upload, "workers", config_.upload.workers, logger_);
    read_value(upload, "part_size", config_.upload.part_size, logger_);

    const json& monitor = section(document, "monitor");
    MonitorConfig& m = config_.monitor;
    read_value(monitor, "history_capacity", m.history_capacity, logger_);
    read_value(monitor, "diagnostic_log_path", m.diagnostic_log_path, logger_);
    read_value(monitor, "cgroup_v2_path", m.cgroup_v2_path, logger_);
    read_value(monitor, "cgroup_v1_path", m.cgroup_v1_path, logger_);
    read_value(monitor, "proc_status_path", m.proc_status_path, logger_);
    read_value(monitor, "proc_meminfo_path", m.proc_meminfo_path, logger_);
    read_value(monitor, "install_crash_handler", m.install_crash_handler, logger_);

    long interval_seconds = static_cast<long>(m.interval.count());
    read_value(monitor, "interval_seconds", interval_seconds, logger_);
    m.interval = std::chrono::seconds(interval_seconds);

    const json& thresholds = section(monitor, "thresholds");
    read_value(thresholds, "budget_mb", m.thresholds.budget_mb, logger_);
    read_value(thresholds, "high_watermark_mb", m.thresholds.high_watermark_mb, logger_);
    read_value(thresholds, "critical_mb", m.thresholds.critical_mb, logger_);
    read_value(thresholds, "spike_mb", m.thresholds.spike_mb, logger_);
    read_value(thresholds, "record_floor_mb", m.thresholds.record_floor_mb, logger_);
    read_value(thresholds, "elevated_mb", m.thresholds.elevated_mb, logger_);
    read_value(thresholds, "normal_mb", m.thresholds.normal_mb, logger_);
    read_value(thresholds, "significant_change_mb", m.thresholds.significant_change_mb, logger_);

    const json& log = section(document, "log");
    read_value(log, "level", config_.log.level, logger_);
    read_value(log, "facilities", config_.log.facilities, logger_);
    if (log.contains("log_file")) {
        if (log["log_file"].is_string()) {
            config_.log.log_file = log["log_file"].get<std::string>();
        } else if (log["log_file"].is_null()) {
            config_.log.log_file.reset();
        } else {
            logger_.warning("Ignoring config key 'log_file': expected a string");
        }
    }

    auto problems = validate();
    for (const auto& problem : problems) {
        logger_.error(problem);
    }
    return problems.empty();
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Could not write config file: " + filename);
        return false;
    }
    file << to_json(config_).dump(2) << std::endl;
    return static_cast<bool>(file);
}

std::vector<std::string> ConfigurationManager::validate() const {
    std::vector<std::string> problems;
    const MemoryThresholds& t = config_.monitor.thresholds;

    if (config_.transfer.chunk_size == 0) {
        problems.push_back("transfer.chunk_size must be positive");
    }
    if (config_.transfer.http_timeout_seconds <= 0) {
        problems.push_back("transfer.http_timeout_seconds must be positive");
    }
    if (config_.upload.workers == 0) {
        problems.push_back("upload.workers must be positive");
    }
    if (config_.upload.part_size == 0 || config_.upload.part_size > kProtocolMaxPartSize) {
        problems.push_back("upload.part_size must be between 1 and " + std::to_string(kProtocolMaxPartSize));
    }
    if (config_.monitor.history_capacity == 0) {
        problems.push_back("monitor.history_capacity must be positive");
    }
    if (config_.monitor.interval.count() <= 0) {
        problems.push_back("monitor.interval_seconds must be positive");
    }
    if (t.high_watermark_mb <= 0 || t.critical_mb <= 0 || t.spike_mb <= 0) {
        problems.push_back("monitor.thresholds must be positive");
    }
    if (t.critical_mb <= t.high_watermark_mb) {
        problems.push_back("monitor.thresholds.critical_mb must exceed high_watermark_mb");
    }
    if (config_.log.level < 1 || config_.log.level > 6) {
        problems.push_back("log.level must be between 1 and 6");
    }
    return problems;
}

json ConfigurationManager::to_json(const RelayConfig& config) {
    const MemoryThresholds& t = config.monitor.thresholds;
    return json{
        {"transfer", {
            {"chunk_size", config.transfer.chunk_size},
            {"evict_page_cache", config.transfer.evict_page_cache},
            {"flush_before_evict", config.transfer.flush_before_evict},
            {"http_timeout_seconds", config.transfer.http_timeout_seconds},
            {"user_agent", config.transfer.user_agent}
        }},
        {"upload", {
            {"parallel_enabled", config.upload.parallel_enabled},
            {"workers", config.upload.workers},
            {"part_size", config.upload.part_size}
        }},
        {"monitor", {
            {"thresholds", {
                {"budget_mb", t.budget_mb},
                {"high_watermark_mb", t.high_watermark_mb},
                {"critical_mb", t.critical_mb},
                {"spike_mb", t.spike_mb},
                {"record_floor_mb", t.record_floor_mb},
                {"elevated_mb", t.elevated_mb},
                {"normal_mb", t.normal_mb},
                {"significant_change_mb", t.significant_change_mb}
            }},
            {"history_capacity", config.monitor.history_capacity},
            {"interval_seconds", config.monitor.interval.count()},
            {"diagnostic_log_path", config.monitor.diagnostic_log_path},
            {"cgroup_v2_path", config.monitor.cgroup_v2_path},
            {"cgroup_v1_path", config.monitor.cgroup_v1_path},
            {"proc_status_path", config.monitor.proc_status_path},
            {"proc_meminfo_path", config.monitor.proc_meminfo_path},
            {"install_crash_handler", config.monitor.install_crash_handler}
        }},
        {"log", {
            {"level", config.log.level},
            {"facilities", config.log.facilities},
            {"log_file", config.log.log_file ? json(*config.log.log_file) : json(nullptr)}
        }}
    };
}

} // namespace relay
