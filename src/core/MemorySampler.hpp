/**
 * @file MemorySampler.hpp
 * @brief Process, system and container memory sampling
 *
 * Reads resident and virtual size from /proc/self/status, system totals from
 * sysinfo and /proc/meminfo, and container usage (which includes page cache)
 * from the cgroup v2 file with a cgroup v1 fallback.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "Logger.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay {

/**
 * @brief Point-in-time memory figures, immutable once taken
 */
struct MemorySample {
    std::chrono::system_clock::time_point taken_at{};
    std::uint64_t resident_bytes = 0;
    std::uint64_t virtual_bytes = 0;
    std::optional<std::uint64_t> container_bytes;   ///< cgroup usage incl. page cache
    std::uint64_t system_total_bytes = 0;
    std::uint64_t system_available_bytes = 0;
    std::size_t thread_count = 0;
    std::size_t open_files = 0;

    /**
     * @brief The figure every threshold decision uses
     *
     * Container memory when the cgroup interface was readable, resident
     * memory otherwise. Nothing else in the code base computes this.
     */
    std::uint64_t memory_to_check() const {
        return container_bytes.value_or(resident_bytes);
    }

    /**
     * @brief Container memory not explained by the process, floored at 0
     */
    std::uint64_t page_cache_bytes() const {
        if (!container_bytes || *container_bytes < resident_bytes) {
            return 0;
        }
        return *container_bytes - resident_bytes;
    }

    double system_percent_used() const {
        if (system_total_bytes == 0) return 0.0;
        std::uint64_t used = system_total_bytes > system_available_bytes
            ? system_total_bytes - system_available_bytes : 0;
        return 100.0 * static_cast<double>(used) / static_cast<double>(system_total_bytes);
    }
};

/**
 * @brief Source of memory samples
 */
class MemorySampler {
public:
    virtual ~MemorySampler() = default;

    virtual MemorySample sample() = 0;
};

/**
 * @brief Linux sampler backed by procfs, sysinfo and the cgroup filesystem
 *
 * Every read is optional: a missing or unparsable file leaves the field at
 * its default and is logged at DEBUG level.
 */
class ProcMemorySampler : public MemorySampler {
public:
    ProcMemorySampler();
    explicit ProcMemorySampler(const MonitorConfig& config);

    MemorySample sample() override;

    /**
     * @brief Container usage from cgroup v2, then cgroup v1
     * @return Bytes in use, or nullopt outside a memory cgroup
     */
    std::optional<std::uint64_t> read_container_bytes() const;

private:
    std::string cgroup_v2_path_;
    std::string cgroup_v1_path_;
    std::string proc_status_path_;
    std::string proc_meminfo_path_;
    Logger logger_{"MemorySampler"};

    void read_process_status(MemorySample& sample) const;
    void read_system_memory(MemorySample& sample) const;
    std::size_t count_open_files() const;

    static std::optional<std::uint64_t> read_counter_file(const std::string& path);
};

} // namespace relay
