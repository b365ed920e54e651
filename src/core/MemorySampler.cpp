/**
 * @file MemorySampler.cpp
 * @brief Implementation of process, system and container memory sampling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MemorySampler.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef __linux__
#include <sys/sysinfo.h>
#endif

namespace relay {

namespace {

/// Parse the "<value> kB" tail of a /proc status or meminfo line
std::optional<std::uint64_t> parse_kb_field(const std::string& line, std::size_t prefix_length) {
    std::istringstream iss(line.substr(prefix_length));
    std::uint64_t kb = 0;
    if (!(iss >> kb)) {
        return std::nullopt;
    }
    return kb * 1024ull;
}

} // namespace

ProcMemorySampler::ProcMemorySampler() : ProcMemorySampler(MonitorConfig{}) {
}

ProcMemorySampler::ProcMemorySampler(const MonitorConfig& config)
    : cgroup_v2_path_(config.cgroup_v2_path)
    , cgroup_v1_path_(config.cgroup_v1_path)
    , proc_status_path_(config.proc_status_path)
    , proc_meminfo_path_(config.proc_meminfo_path) {
}

MemorySample ProcMemorySampler::sample() {
    MemorySample sample;
    sample.taken_at = std::chrono::system_clock::now();

    read_process_status(sample);
    read_system_memory(sample);
    sample.container_bytes = read_container_bytes();
    sample.open_files = count_open_files();

    return sample;
}

std::optional<std::uint64_t> ProcMemorySampler::read_container_bytes() const {
    if (auto v2 = read_counter_file(cgroup_v2_path_)) {
        return v2;
    }
    if (auto v1 = read_counter_file(cgroup_v1_path_)) {
        return v1;
    }
    logger_.trace("No cgroup memory interface readable, using resident memory");
    return std::nullopt;
}

void ProcMemorySampler::read_process_status(MemorySample& sample) const {
    std::ifstream status_file(proc_status_path_);
    if (!status_file.is_open()) {
        logger_.debug("Cannot open " + proc_status_path_);
        return;
    }

    std::string line;
    while (std::getline(status_file, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            if (auto bytes = parse_kb_field(line, 6)) sample.resident_bytes = *bytes;
        } else if (line.rfind("VmSize:", 0) == 0) {
            if (auto bytes = parse_kb_field(line, 7)) sample.virtual_bytes = *bytes;
        } else if (line.rfind("Threads:", 0) == 0) {
            std::istringstream iss(line.substr(8));
            iss >> sample.thread_count;
        }
    }
}

void ProcMemorySampler::read_system_memory(MemorySample& sample) const {
    std::ifstream meminfo(proc_meminfo_path_);
    if (meminfo.is_open()) {
        std::string line;
        while (std::getline(meminfo, line)) {
            // Format: "MemAvailable:  123456789 kB"
            if (line.rfind("MemTotal:", 0) == 0) {
                if (auto bytes = parse_kb_field(line, 9)) sample.system_total_bytes = *bytes;
            } else if (line.rfind("MemAvailable:", 0) == 0) {
                if (auto bytes = parse_kb_field(line, 13)) sample.system_available_bytes = *bytes;
            }
        }
    }

#ifdef __linux__
    if (sample.system_total_bytes == 0 || sample.system_available_bytes == 0) {
        struct sysinfo info;
        if (sysinfo(&info) == 0) {
            if (sample.system_total_bytes == 0) {
                sample.system_total_bytes = static_cast<std::uint64_t>(info.totalram) * info.mem_unit;
            }
            if (sample.system_available_bytes == 0) {
                // Rough approximation when MemAvailable is missing
                sample.system_available_bytes =
                    static_cast<std::uint64_t>(info.freeram + info.bufferram) * info.mem_unit;
            }
        } else {
            logger_.debug("sysinfo() failed, system totals unavailable");
        }
    }
#endif
}

std::size_t ProcMemorySampler::count_open_files() const {
    std::error_code ec;
    std::size_t count = 0;
    for (std::filesystem::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
        ++count;
    }
    if (ec) {
        logger_.trace("Cannot enumerate /proc/self/fd: " + ec.message());
        return 0;
    }
    return count;
}

std::optional<std::uint64_t> ProcMemorySampler::read_counter_file(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    if (!(file >> value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace relay
