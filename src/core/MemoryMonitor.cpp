/**
 * @file MemoryMonitor.cpp
 * @brief Implementation of memory alerting and durable forensics
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MemoryMonitor.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace relay {

namespace {

std::string format_mb(std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << to_mb(bytes);
    return oss.str();
}

std::string format_signed_mb(std::int64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::showpos
        << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return oss.str();
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) joined += '\n';
        joined += line;
    }
    return joined;
}

} // namespace

const char* alert_level_name(AlertLevel level) {
    switch (level) {
        case AlertLevel::Normal:   return "normal";
        case AlertLevel::High:     return "high";
        case AlertLevel::Spike:    return "spike";
        case AlertLevel::Critical: return "critical";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const DiagnosticSnapshot& snapshot) {
    const MemorySample& m = snapshot.memory;

    nlohmann::json memory = {
        {"resident_mb", to_mb(m.resident_bytes)},
        {"virtual_mb", to_mb(m.virtual_bytes)},
        {"page_cache_mb", to_mb(m.page_cache_bytes())},
        {"memory_to_check_mb", to_mb(m.memory_to_check())},
        {"system_total_mb", to_mb(m.system_total_bytes)},
        {"system_available_mb", to_mb(m.system_available_bytes)},
        {"system_percent", m.system_percent_used()}
    };
    memory["container_mb"] = m.container_bytes
        ? nlohmann::json(to_mb(*m.container_bytes)) : nlohmann::json(nullptr);

    const ApplicationState& s = snapshot.state;
    nlohmann::json state = {
        {"active_sessions", s.active_sessions},
        {"queue_size", s.queue_size},
        {"active_downloads", s.active_downloads},
        {"cached_items", s.cached_items},
        {"threads", s.thread_count},
        {"open_files", s.open_files}
    };

    nlohmann::json recent = nlohmann::json::array();
    for (const auto& entry : snapshot.recent_operations) {
        recent.push_back(entry.format());
    }

    j = nlohmann::json{
        {"timestamp", snapshot.timestamp},
        {"memory", memory},
        {"application_state", state},
        {"status", snapshot.status},
        {"recent_operations", recent}
    };
}

// ============================================================================
// MemoryMonitor
// ============================================================================

MemoryMonitor::MemoryMonitor(const MonitorConfig& config)
    : MemoryMonitor(config, std::make_shared<ProcMemorySampler>(config)) {
}

MemoryMonitor::MemoryMonitor(const MonitorConfig& config, std::shared_ptr<MemorySampler> sampler)
    : config_(config)
    , sampler_(std::move(sampler))
    , diagnostic_log_(config.diagnostic_log_path, mb_to_bytes(config.thresholds.record_floor_mb))
    , history_(config.history_capacity) {
    if (!sampler_) {
        throw std::invalid_argument("MemoryMonitor requires a memory sampler");
    }
}

DiagnosticLog::StartState MemoryMonitor::initialize() {
    auto state = diagnostic_log_.open_session();

    const MemoryThresholds& t = config_.thresholds;
    std::ostringstream oss;
    oss << "Memory monitor initialized (budget " << t.budget_mb << " MB, high "
        << t.high_watermark_mb << " MB, critical " << t.critical_mb << " MB, spike "
        << t.spike_mb << " MB, durable floor " << t.record_floor_mb << " MB)";
    logger_.info(oss.str());
    return state;
}

MemorySample MemoryMonitor::sample_memory() {
    return sampler_->sample();
}

MemorySample MemoryMonitor::record_and_evaluate(const std::string& operation, const std::string& context) {
    MemorySample sample = sample_memory();
    evaluate(sample, operation, context);
    return sample;
}

AlertLevel MemoryMonitor::classify(std::uint64_t memory_to_check, std::int64_t spike_bytes,
                                   const MemoryThresholds& thresholds) {
    if (memory_to_check > mb_to_bytes(thresholds.critical_mb)) {
        return AlertLevel::Critical;
    }
    if (spike_bytes > static_cast<std::int64_t>(mb_to_bytes(thresholds.spike_mb))) {
        return AlertLevel::Spike;
    }
    if (memory_to_check > mb_to_bytes(thresholds.high_watermark_mb)) {
        return AlertLevel::High;
    }
    return AlertLevel::Normal;
}

std::string MemoryMonitor::status_label(std::uint64_t memory_to_check, const MemoryThresholds& thresholds) {
    if (memory_to_check > mb_to_bytes(thresholds.critical_mb)) return "CRITICAL";
    if (memory_to_check >= mb_to_bytes(thresholds.high_watermark_mb)) return "HIGH";
    if (memory_to_check >= mb_to_bytes(thresholds.elevated_mb)) return "ELEVATED";
    if (memory_to_check >= mb_to_bytes(thresholds.normal_mb)) return "NORMAL";
    return "LOW";
}

Evaluation MemoryMonitor::evaluate(const MemorySample& sample, const std::string& operation,
                                   const std::string& context) {
    const ApplicationState state = collect_state(sample);
    const std::vector<std::string> snapshot = describe(sample, state, operation, context);
    const MemoryThresholds& t = config_.thresholds;

    std::lock_guard<std::mutex> lock(state_mutex_);

    Evaluation result;
    result.memory_to_check = sample.memory_to_check();
    if (previous_resident_) {
        result.spike_bytes = static_cast<std::int64_t>(sample.resident_bytes)
                           - static_cast<std::int64_t>(*previous_resident_);
    }
    result.level = classify(result.memory_to_check, result.spike_bytes, t);

    // Critical is reported in addition to whatever the spike/high chain finds
    if (result.memory_to_check > mb_to_bytes(t.critical_mb)) {
        logger_.error("CRITICAL MEMORY: " + format_mb(result.memory_to_check) + " MB / "
                      + format_mb(mb_to_bytes(t.budget_mb)) + " MB budget - OOM kill likely");
        result.durable_written |= write_critical_record(sample, state, operation, context);
    }

    if (result.spike_bytes > static_cast<std::int64_t>(mb_to_bytes(t.spike_mb))) {
        logger_.warning("MEMORY SPIKE DETECTED: " + format_signed_mb(result.spike_bytes)
                        + " MB in operation '" + operation + "'\n" + join_lines(snapshot));
        log_recent_operations_locked(10);
        result.durable_written |= write_spike_record(sample, snapshot, result.spike_bytes, operation, context);
    } else if (result.memory_to_check > mb_to_bytes(t.high_watermark_mb)) {
        logger_.warning("HIGH MEMORY USAGE: " + format_mb(result.memory_to_check) + " MB (threshold "
                        + format_mb(mb_to_bytes(t.high_watermark_mb)) + " MB)\n" + join_lines(snapshot));
        result.durable_written |= write_high_record(sample, snapshot, operation, context);
    } else {
        logger_.info(join_lines(snapshot));
    }

    if (operation == labels::kPeriodic && diagnostic_log_.should_record(result.memory_to_check)) {
        std::ostringstream note;
        note << "PERIODIC CHECK: " << format_mb(result.memory_to_check) << " MB | Sessions: "
             << state.active_sessions << " | Queue: " << state.queue_size
             << " | Active downloads: " << state.active_downloads;
        result.durable_written |= diagnostic_log_.record({note.str()}, result.memory_to_check);
    }

    const auto when = sample.taken_at == std::chrono::system_clock::time_point{}
        ? std::chrono::system_clock::now() : sample.taken_at;
    history_.record(HistoryEntry(when, operation, sample.resident_bytes, context));
    previous_resident_ = sample.resident_bytes;

    return result;
}

bool MemoryMonitor::write_critical_record(const MemorySample& sample, const ApplicationState& state,
                                          const std::string& operation, const std::string& context) {
    const std::string alarm(80, '!');
    std::vector<std::string> lines = {
        alarm,
        "CRITICAL MEMORY - CRASH IMMINENT: " + format_mb(sample.memory_to_check()) + " MB / "
            + format_mb(mb_to_bytes(config_.thresholds.budget_mb)) + " MB",
    };
    for (auto& line : describe(sample, state, operation, context)) {
        lines.push_back(std::move(line));
    }
    lines.push_back("Last 5 operations before crash:");
    for (const auto& entry : history_.last(5)) {
        lines.push_back("  " + entry.format());
    }
    lines.push_back(alarm);

    return diagnostic_log_.record_forced(lines);
}

bool MemoryMonitor::write_spike_record(const MemorySample& sample, const std::vector<std::string>& snapshot,
                                       std::int64_t spike_bytes, const std::string& operation,
                                       const std::string& context) {
    std::vector<std::string> lines = {
        "MEMORY SPIKE: " + format_signed_mb(spike_bytes) + " MB",
        "Operation: " + operation + (context.empty() ? "" : " | " + context),
    };
    lines.insert(lines.end(), snapshot.begin(), snapshot.end());
    lines.push_back("Recent operations:");
    for (const auto& entry : history_.last(10)) {
        lines.push_back("  " + entry.format());
    }
    lines.push_back(DiagnosticLog::rule());

    return diagnostic_log_.record(lines, sample.memory_to_check());
}

bool MemoryMonitor::write_high_record(const MemorySample& sample, const std::vector<std::string>& snapshot,
                                      const std::string& operation, const std::string& context) {
    std::vector<std::string> lines = {
        "HIGH MEMORY: " + format_mb(sample.memory_to_check()) + " MB",
        "Operation: " + operation + (context.empty() ? "" : " | " + context),
    };
    lines.insert(lines.end(), snapshot.begin(), snapshot.end());
    lines.push_back(DiagnosticLog::rule());

    return diagnostic_log_.record(lines, sample.memory_to_check());
}

DiagnosticSnapshot MemoryMonitor::get_diagnostic_snapshot() {
    DiagnosticSnapshot snapshot;
    snapshot.timestamp = DiagnosticLog::timestamp();
    snapshot.memory = sample_memory();
    snapshot.state = collect_state(snapshot.memory);
    snapshot.status = status_label(snapshot.memory.memory_to_check(), config_.thresholds);
    snapshot.recent_operations = recent_history(10);

    std::vector<std::string> lines = {"DIAGNOSTIC SNAPSHOT REQUESTED", "Status: " + snapshot.status};
    for (auto& line : describe(snapshot.memory, snapshot.state, "diagnostic_request", "")) {
        lines.push_back(std::move(line));
    }
    lines.push_back("Recent operations:");
    for (const auto& entry : snapshot.recent_operations) {
        lines.push_back("  " + entry.format());
    }
    lines.push_back(DiagnosticLog::rule());

    if (!diagnostic_log_.record_forced(lines)) {
        logger_.debug("Diagnostic snapshot was not persisted");
    }
    return snapshot;
}

// ============================================================================
// Named operations
// ============================================================================

void MemoryMonitor::track_download(std::uint64_t size_bytes, const std::string& owner) {
    record_and_evaluate(labels::kDownloadStart, "Owner " + owner + " | File size: " + format_mb(size_bytes) + " MB");
}

void MemoryMonitor::track_upload(std::uint64_t size_bytes, const std::string& owner) {
    record_and_evaluate(labels::kUploadStart, "Owner " + owner + " | File size: " + format_mb(size_bytes) + " MB");
}

void MemoryMonitor::track_session_created(const std::string& owner) {
    record_and_evaluate(labels::kSessionCreate, "Session for " + owner);
}

void MemoryMonitor::track_session_closed(const std::string& owner) {
    record_and_evaluate(labels::kSessionDestroy, "Session for " + owner);
}

// ============================================================================
// State and history
// ============================================================================

void MemoryMonitor::register_reporter(Subsystem subsystem, std::weak_ptr<const StateReporter> reporter) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    reporters_[subsystem] = std::move(reporter);
}

ApplicationState MemoryMonitor::collect_state(const MemorySample& sample) const {
    ApplicationState state;
    state.thread_count = sample.thread_count;
    state.open_files = sample.open_files;

    std::lock_guard<std::mutex> lock(reporters_mutex_);
    for (const auto& [subsystem, weak] : reporters_) {
        auto reporter = weak.lock();
        if (!reporter) continue;

        SubsystemState reported;
        try {
            reported = reporter->report_state();
        } catch (const std::exception& e) {
            logger_.debug(std::string("State reporter failed: ") + e.what());
            continue;
        }

        switch (subsystem) {
            case Subsystem::Sessions:
                state.active_sessions = reported.active;
                break;
            case Subsystem::DownloadQueue:
                state.queue_size = reported.count;
                state.active_downloads = reported.active;
                break;
            case Subsystem::Cache:
                state.cached_items = reported.count;
                break;
        }
    }
    return state;
}

std::vector<HistoryEntry> MemoryMonitor::recent_history(std::size_t n) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_.last(n);
}

std::optional<std::vector<HistoryEntry>> MemoryMonitor::try_recent_history(std::size_t n) const {
    std::unique_lock<std::mutex> lock(state_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }
    return history_.last(n);
}

void MemoryMonitor::log_recent_operations(std::size_t n) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    log_recent_operations_locked(n);
}

void MemoryMonitor::log_recent_operations_locked(std::size_t n) const {
    const auto entries = history_.last(n);
    if (entries.empty()) {
        logger_.info("No operations recorded yet");
        return;
    }

    std::string message = "Last " + std::to_string(entries.size()) + " operations:";
    for (const auto& entry : entries) {
        message += "\n  " + entry.format();
    }
    logger_.info(message);
}

std::optional<std::uint64_t> MemoryMonitor::previous_resident() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return previous_resident_;
}

std::vector<std::string> MemoryMonitor::describe(const MemorySample& sample, const ApplicationState& state,
                                                 const std::string& operation, const std::string& context) const {
    std::vector<std::string> lines;
    lines.push_back("MEMORY SNAPSHOT | Operation: " + operation);
    lines.push_back("  RAM usage: " + format_mb(sample.resident_bytes) + " MB (virtual: "
                    + format_mb(sample.virtual_bytes) + " MB)");
    if (sample.container_bytes) {
        lines.push_back("  Container total: " + format_mb(*sample.container_bytes) + " MB (process "
                        + format_mb(sample.resident_bytes) + " MB + page cache "
                        + format_mb(sample.page_cache_bytes()) + " MB)");
    }

    std::ostringstream system;
    system << "  System: " << std::fixed << std::setprecision(1) << sample.system_percent_used()
           << "% used (" << format_mb(sample.system_available_bytes) << " MB available)";
    lines.push_back(system.str());

    lines.push_back("  Sessions: " + std::to_string(state.active_sessions)
                    + " | Queue: " + std::to_string(state.queue_size)
                    + " | Active downloads: " + std::to_string(state.active_downloads)
                    + " | Cached: " + std::to_string(state.cached_items));
    lines.push_back("  Threads: " + std::to_string(state.thread_count)
                    + " | Open files: " + std::to_string(state.open_files));
    if (!context.empty()) {
        lines.push_back("  Context: " + context);
    }
    return lines;
}

std::uint64_t MemoryMonitor::mb_to_bytes(double mb) {
    if (mb <= 0.0) return 0;
    return static_cast<std::uint64_t>(mb * 1024.0 * 1024.0);
}

// ============================================================================
// OperationScope
// ============================================================================

OperationScope::OperationScope(MemoryMonitor& monitor, std::string operation, std::string context)
    : monitor_(monitor)
    , operation_(std::move(operation))
    , context_(std::move(context))
    , start_(monitor_.sample_memory())
    , uncaught_at_entry_(std::uncaught_exceptions()) {
    logger_.info("START " + operation_ + " | Memory: " + format_mb(start_.resident_bytes) + " MB"
                 + (context_.empty() ? "" : " | " + context_));
}

OperationScope::~OperationScope() {
    try {
        const MemorySample end = monitor_.sample_memory();
        const std::int64_t delta = static_cast<std::int64_t>(end.resident_bytes)
                                 - static_cast<std::int64_t>(start_.resident_bytes);

        if (std::uncaught_exceptions() > uncaught_at_entry_) {
            logger_.error("ERROR in " + operation_ + " | Memory at error: " + format_mb(end.resident_bytes)
                          + " MB (" + format_signed_mb(delta) + " MB since start)");
            return;
        }

        const std::string summary = "COMPLETE " + operation_ + " | " + format_mb(start_.resident_bytes)
            + " MB -> " + format_mb(end.resident_bytes) + " MB (" + format_signed_mb(delta) + " MB)";

        const double delta_mb = std::fabs(static_cast<double>(delta)) / (1024.0 * 1024.0);
        if (delta_mb > monitor_.thresholds().significant_change_mb) {
            logger_.warning(summary);
            monitor_.record_and_evaluate(operation_, "After completion (changed " + format_signed_mb(delta) + " MB)");
        } else {
            logger_.info(summary);
        }
    } catch (const std::exception& e) {
        logger_.debug("Memory accounting for " + operation_ + " failed: " + e.what());
    }
}

} // namespace relay
