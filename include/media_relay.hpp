#pragma once

/**
 * @file media_relay.hpp
 * @brief Main header for media-relay
 *
 * Low-memory streaming transfer of large media objects between a remote peer
 * and local storage, with page-cache eviction and container-aware memory
 * monitoring for diagnosing out-of-memory kills.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>
#include <optional>

namespace relay {

inline constexpr const char* kVersion = "1.3.0";

// ============================================================================
// Size helpers
// ============================================================================

constexpr std::uint64_t kib(std::uint64_t n) { return n * 1024ull; }
constexpr std::uint64_t mib(std::uint64_t n) { return n * 1024ull * 1024ull; }

inline double to_mb(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

/// Largest part the remote protocol negotiates; also the default chunk size
inline constexpr std::size_t kProtocolMaxPartSize = 512 * 1024;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Chunked transfer settings
 */
struct TransferConfig {
    std::size_t chunk_size = kProtocolMaxPartSize;  ///< Bytes per chunk and per eviction window
    bool evict_page_cache = true;                   ///< Issue page-cache drop hints
    bool flush_before_evict = true;                 ///< Write back dirty pages before dropping them
    long http_timeout_seconds = 60;                 ///< Per-request timeout for HTTP collaborators
    std::string user_agent = "media-relay/1.3";
};

/**
 * @brief Upload path selection and parallel pool sizing
 */
struct UploadConfig {
    bool parallel_enabled = true;                   ///< Use the pooled uploader when available
    unsigned workers = 4;                           ///< Concurrent part uploads (one buffer each)
    std::size_t part_size = kProtocolMaxPartSize;   ///< Part size for the pooled uploader
};

/**
 * @brief Memory thresholds, all in MB, fixed for the process lifetime
 *
 * Defaults are sized for a 512 MB container. The critical mark sits at about
 * 93% of the budget; the record floor sits below the high watermark so the
 * durable log captures the run-up to an OOM kill.
 */
struct MemoryThresholds {
    double budget_mb = 512.0;
    double high_watermark_mb = 400.0;
    double critical_mb = 480.0;
    double spike_mb = 50.0;
    double record_floor_mb = 350.0;
    double elevated_mb = 300.0;    ///< Status label boundary only
    double normal_mb = 200.0;      ///< Status label boundary only
    double significant_change_mb = 10.0;  ///< Operation scope warning delta
};

/**
 * @brief Memory monitor settings
 */
struct MonitorConfig {
    MemoryThresholds thresholds;
    std::size_t history_capacity = 20;
    std::chrono::seconds interval{300};
    std::string diagnostic_log_path = "memory_debug.log";
    std::string cgroup_v2_path = "/sys/fs/cgroup/memory.current";
    std::string cgroup_v1_path = "/sys/fs/cgroup/memory/memory.usage_in_bytes";
    std::string proc_status_path = "/proc/self/status";
    std::string proc_meminfo_path = "/proc/meminfo";
    bool install_crash_handler = true;
};

/**
 * @brief Logging settings
 */
struct LogConfig {
    int level = 3;                          ///< 1=ERROR ... 6=TRACE
    std::string facilities;                 ///< e.g. "TransferEngine=5,MemoryMonitor=4"
    std::optional<std::string> log_file;    ///< Appended to when set
};

/**
 * @brief Complete application configuration
 */
struct RelayConfig {
    TransferConfig transfer;
    UploadConfig upload;
    MonitorConfig monitor;
    LogConfig log;
};

} // namespace relay
