/**
 * @file MemoryMonitor.hpp
 * @brief Memory alerting, operation history and durable forensics
 *
 * Evaluates memory samples against spike and absolute thresholds, keeps a
 * bounded history of recent operations and writes a durable diagnostic log
 * while memory is elevated, so the window before an OOM kill survives it.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "DiagnosticLog.hpp"
#include "HistoryRing.hpp"
#include "Logger.hpp"
#include "MemorySampler.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay {

/// Operation labels recorded by the transfer engine, sessions and the loop
namespace labels {
inline constexpr const char* kDownloadStart = "download_start";
inline constexpr const char* kUploadStart = "upload_start";
inline constexpr const char* kSessionCreate = "session_create";
inline constexpr const char* kSessionDestroy = "session_destroy";
inline constexpr const char* kPeriodic = "periodic";
inline constexpr const char* kCrash = "crash";
}

/**
 * @brief Classification of one sample, in precedence order
 */
enum class AlertLevel {
    Normal,
    High,
    Spike,
    Critical
};

const char* alert_level_name(AlertLevel level);

/**
 * @brief Outcome of MemoryMonitor::evaluate
 */
struct Evaluation {
    AlertLevel level = AlertLevel::Normal;
    std::uint64_t memory_to_check = 0;
    std::int64_t spike_bytes = 0;       ///< resident_now - resident_previous
    bool durable_written = false;
};

// ============================================================================
// Sibling subsystem reporting
// ============================================================================

enum class Subsystem {
    Sessions,
    DownloadQueue,
    Cache
};

/**
 * @brief Small fixed record a subsystem reports about itself
 */
struct SubsystemState {
    std::size_t count = 0;   ///< Sessions / queued items / cached items
    std::size_t active = 0;  ///< Active sessions / in-flight transfers
};

/**
 * @brief Implemented by subsystems whose size matters for OOM diagnosis
 */
class StateReporter {
public:
    virtual ~StateReporter() = default;

    virtual SubsystemState report_state() const = 0;
};

/**
 * @brief Aggregated application state; absent reporters contribute zeros
 */
struct ApplicationState {
    std::size_t active_sessions = 0;
    std::size_t queue_size = 0;
    std::size_t active_downloads = 0;
    std::size_t cached_items = 0;
    std::size_t thread_count = 0;
    std::size_t open_files = 0;
};

/**
 * @brief Result of an explicit diagnostic request
 */
struct DiagnosticSnapshot {
    std::string timestamp;
    MemorySample memory;
    ApplicationState state;
    std::string status;
    std::vector<HistoryEntry> recent_operations;
};

void to_json(nlohmann::json& j, const DiagnosticSnapshot& snapshot);

// ============================================================================
// MemoryMonitor
// ============================================================================

/**
 * @brief Process-scoped alerting and mitigation engine
 *
 * One instance is constructed explicitly at startup and passed by reference
 * to the components that record operations. History and the previous
 * resident figure are only mutated inside evaluate(), which holds a single
 * lock from reading the previous value to appending the new entry.
 */
class MemoryMonitor {
public:
    explicit MemoryMonitor(const MonitorConfig& config);
    MemoryMonitor(const MonitorConfig& config, std::shared_ptr<MemorySampler> sampler);

    MemoryMonitor(const MemoryMonitor&) = delete;
    MemoryMonitor& operator=(const MemoryMonitor&) = delete;

    /**
     * @brief Start the diagnostic log session (header or restart marker)
     */
    DiagnosticLog::StartState initialize();

    MemorySample sample_memory();

    /**
     * @brief Sample, evaluate and record one named operation
     * @param operation Label such as labels::kDownloadStart
     * @param context Free text stored with the history entry
     */
    MemorySample record_and_evaluate(const std::string& operation, const std::string& context);

    /**
     * @brief Classify a sample, emit alerts, write the durable log, record history
     */
    Evaluation evaluate(const MemorySample& sample, const std::string& operation, const std::string& context);

    /**
     * @brief Pure classification: Critical, then Spike, then High, else Normal
     */
    static AlertLevel classify(std::uint64_t memory_to_check, std::int64_t spike_bytes,
                               const MemoryThresholds& thresholds);

    /**
     * @brief Human-readable status for memory_to_check
     */
    static std::string status_label(std::uint64_t memory_to_check, const MemoryThresholds& thresholds);

    /**
     * @brief Current memory, state, status and last 10 operations
     *
     * Always writes the snapshot to the diagnostic log.
     */
    DiagnosticSnapshot get_diagnostic_snapshot();

    // Named operations
    void track_download(std::uint64_t size_bytes, const std::string& owner);
    void track_upload(std::uint64_t size_bytes, const std::string& owner);
    void track_session_created(const std::string& owner);
    void track_session_closed(const std::string& owner);

    void register_reporter(Subsystem subsystem, std::weak_ptr<const StateReporter> reporter);
    ApplicationState collect_state(const MemorySample& sample) const;

    std::vector<HistoryEntry> recent_history(std::size_t n) const;

    /**
     * @brief Non-blocking variant for signal context; nullopt if the lock is held
     */
    std::optional<std::vector<HistoryEntry>> try_recent_history(std::size_t n) const;
    void log_recent_operations(std::size_t n = HistoryRing::kDefaultCapacity) const;

    std::optional<std::uint64_t> previous_resident() const;

    const MonitorConfig& config() const { return config_; }
    const MemoryThresholds& thresholds() const { return config_.thresholds; }
    DiagnosticLog& diagnostic_log() { return diagnostic_log_; }

    /**
     * @brief Multi-line snapshot description shared by logs and the durable file
     */
    std::vector<std::string> describe(const MemorySample& sample, const ApplicationState& state,
                                      const std::string& operation, const std::string& context) const;

    static std::uint64_t mb_to_bytes(double mb);

private:
    MonitorConfig config_;
    std::shared_ptr<MemorySampler> sampler_;
    DiagnosticLog diagnostic_log_;
    Logger logger_{"MemoryMonitor"};

    mutable std::mutex state_mutex_;
    HistoryRing history_;
    std::optional<std::uint64_t> previous_resident_;

    mutable std::mutex reporters_mutex_;
    std::map<Subsystem, std::weak_ptr<const StateReporter>> reporters_;

    bool write_critical_record(const MemorySample& sample, const ApplicationState& state,
                               const std::string& operation, const std::string& context);
    bool write_spike_record(const MemorySample& sample, const std::vector<std::string>& snapshot,
                            std::int64_t spike_bytes, const std::string& operation,
                            const std::string& context);
    bool write_high_record(const MemorySample& sample, const std::vector<std::string>& snapshot,
                           const std::string& operation, const std::string& context);
    void log_recent_operations_locked(std::size_t n) const;
};

/**
 * @brief RAII memory accounting for one operation
 *
 * Logs memory at entry and exit. A change larger than the significant-change
 * threshold is a warning and is recorded through record_and_evaluate. An
 * exception leaving the scope is logged with the memory at the time.
 */
class OperationScope {
public:
    OperationScope(MemoryMonitor& monitor, std::string operation, std::string context = "");
    ~OperationScope();

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

    std::uint64_t resident_at_start() const { return start_.resident_bytes; }

private:
    MemoryMonitor& monitor_;
    std::string operation_;
    std::string context_;
    MemorySample start_;
    int uncaught_at_entry_;
    Logger logger_{"OperationScope"};
};

} // namespace relay
