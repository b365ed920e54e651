/**
 * @file PeriodicMonitor.hpp
 * @brief Background memory sampling loop with automatic heap reclaim
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "MemoryMonitor.hpp"
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace relay {

/**
 * @brief Returns freed heap memory to the operating system
 */
class MemoryReclaimer {
public:
    virtual ~MemoryReclaimer() = default;

    /**
     * @return true if any memory was released
     */
    virtual bool reclaim() = 0;
};

/**
 * @brief glibc malloc_trim(0); a no-op elsewhere
 */
class MallocTrimReclaimer : public MemoryReclaimer {
public:
    bool reclaim() override;
};

struct ReclaimResult {
    std::uint64_t before_bytes = 0;
    std::uint64_t after_bytes = 0;
    bool released = false;

    std::int64_t freed_bytes() const {
        return static_cast<std::int64_t>(before_bytes) - static_cast<std::int64_t>(after_bytes);
    }
};

/**
 * @brief Samples memory on a fixed interval even when no transfer runs
 *
 * Each iteration evaluates a sample under the "periodic" label and, when
 * memory_to_check exceeds the high watermark, forces a reclaim pass. This is
 * the only place a reclaim is forced. Errors are logged per iteration and
 * the loop carries on.
 */
class PeriodicMonitor {
public:
    PeriodicMonitor(MemoryMonitor& monitor, std::chrono::seconds interval);
    PeriodicMonitor(MemoryMonitor& monitor, std::chrono::seconds interval,
                    std::shared_ptr<MemoryReclaimer> reclaimer);
    ~PeriodicMonitor();

    PeriodicMonitor(const PeriodicMonitor&) = delete;
    PeriodicMonitor& operator=(const PeriodicMonitor&) = delete;

    /**
     * @brief Start the background thread; the first sample is taken after one interval
     */
    void start();

    /**
     * @brief Wake and join the background thread
     */
    void stop();

    bool running() const { return running_.load(); }

    /**
     * @brief One loop iteration, run on the calling thread
     */
    Evaluation run_once();

    std::optional<ReclaimResult> last_reclaim() const;
    std::size_t iterations() const { return iterations_.load(); }
    std::size_t failed_iterations() const { return failures_.load(); }
    std::chrono::seconds interval() const { return interval_; }

private:
    MemoryMonitor& monitor_;
    std::chrono::seconds interval_;
    std::shared_ptr<MemoryReclaimer> reclaimer_;
    Logger logger_{"PeriodicMonitor"};

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> iterations_{0};
    std::atomic<std::size_t> failures_{0};
    std::optional<ReclaimResult> last_reclaim_;

    void run_loop();
    ReclaimResult reclaim(std::uint64_t before_bytes);
};

/**
 * @brief Construct and start a periodic monitor
 * @param monitor Monitor to evaluate samples with
 * @param interval_seconds Sampling interval, must be positive
 */
std::unique_ptr<PeriodicMonitor> start_periodic_monitor(MemoryMonitor& monitor, long interval_seconds);

} // namespace relay
