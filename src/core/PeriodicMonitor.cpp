/**
 * @file PeriodicMonitor.cpp
 * @brief Implementation of the periodic memory loop
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PeriodicMonitor.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace relay {

namespace {

std::string mb_text(double mb) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << mb;
    return oss.str();
}

} // namespace

bool MallocTrimReclaimer::reclaim() {
#if defined(__GLIBC__)
    return malloc_trim(0) == 1;
#else
    return false;
#endif
}

PeriodicMonitor::PeriodicMonitor(MemoryMonitor& monitor, std::chrono::seconds interval)
    : PeriodicMonitor(monitor, interval, std::make_shared<MallocTrimReclaimer>()) {
}

PeriodicMonitor::PeriodicMonitor(MemoryMonitor& monitor, std::chrono::seconds interval,
                                 std::shared_ptr<MemoryReclaimer> reclaimer)
    : monitor_(monitor)
    , interval_(interval)
    , reclaimer_(std::move(reclaimer)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Monitor interval must be positive");
    }
    if (!reclaimer_) {
        throw std::invalid_argument("PeriodicMonitor requires a memory reclaimer");
    }
}

PeriodicMonitor::~PeriodicMonitor() {
    stop();
}

void PeriodicMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        logger_.warning("Periodic monitor already running");
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&PeriodicMonitor::run_loop, this);
    logger_.info("Started periodic memory monitoring (every " + std::to_string(interval_.count()) + "s)");
}

void PeriodicMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(thread_);
    }
    wake_.notify_all();
    worker.join();
    running_ = false;
    logger_.info("Periodic memory monitoring stopped after " + std::to_string(iterations_.load()) + " iterations");
}

std::optional<ReclaimResult> PeriodicMonitor::last_reclaim() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_reclaim_;
}

void PeriodicMonitor::run_loop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
        }

        try {
            run_once();
        } catch (const std::exception& e) {
            ++failures_;
            logger_.error(std::string("Error in memory monitor: ") + e.what());
        }
    }
}

Evaluation PeriodicMonitor::run_once() {
    const MemorySample sample = monitor_.sample_memory();
    const Evaluation evaluation = monitor_.evaluate(
        sample, labels::kPeriodic, "Interval " + std::to_string(interval_.count()) + "s");
    ++iterations_;

    const std::uint64_t high = MemoryMonitor::mb_to_bytes(monitor_.thresholds().high_watermark_mb);
    if (evaluation.memory_to_check > high) {
        ReclaimResult result = reclaim(evaluation.memory_to_check);
        std::lock_guard<std::mutex> lock(mutex_);
        last_reclaim_ = result;
    }
    return evaluation;
}

ReclaimResult PeriodicMonitor::reclaim(std::uint64_t before_bytes) {
    logger_.warning("Auto reclaim triggered at " + mb_text(to_mb(before_bytes)) + " MB");

    ReclaimResult result;
    result.before_bytes = before_bytes;
    result.released = reclaimer_->reclaim();
    result.after_bytes = monitor_.sample_memory().memory_to_check();

    const double freed_mb = static_cast<double>(result.freed_bytes()) / (1024.0 * 1024.0);
    logger_.info("Reclaim freed " + mb_text(freed_mb) + " MB");

    const bool persisted = monitor_.diagnostic_log().record({
        "AUTO RECLAIM triggered at " + mb_text(to_mb(before_bytes)) + " MB",
        "Reclaim freed " + mb_text(freed_mb) + " MB (now " + mb_text(to_mb(result.after_bytes)) + " MB)",
    }, before_bytes);
    if (!persisted) {
        logger_.debug("Reclaim record not written to the diagnostic log");
    }

    return result;
}

std::unique_ptr<PeriodicMonitor> start_periodic_monitor(MemoryMonitor& monitor, long interval_seconds) {
    auto periodic = std::make_unique<PeriodicMonitor>(monitor, std::chrono::seconds(interval_seconds));
    periodic->start();
    return periodic;
}

} // namespace relay
