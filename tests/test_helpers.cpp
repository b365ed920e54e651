/**
 * @file test_helpers.cpp
 * @brief Fakes and fixtures shared by the media-relay unit tests
 */

#include "test_helpers.hpp"
#include "core/Logger.hpp"
#include "core/MemoryMonitor.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace relay::testing {

namespace {

/// Keep test output readable: logs go nowhere unless a test opens a file
class QuietLogEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        Logger::setConsoleEcho(false);
        Logger::setDefaultLevel(LogLevel::TRACE);
    }
};

[[maybe_unused]] ::testing::Environment* const quiet_logs =
    ::testing::AddGlobalTestEnvironment(new QuietLogEnvironment);

std::uint64_t mb(double value) {
    return MemoryMonitor::mb_to_bytes(value);
}

} // namespace

// ============================================================================
// Files
// ============================================================================

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path()
          / ("media_relay_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++)
             + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::vector<std::uint8_t> pattern_bytes(std::size_t n, std::uint8_t seed) {
    std::vector<std::uint8_t> data(n);
    std::uint32_t state = seed;
    for (std::size_t i = 0; i < n; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<std::uint8_t>(state >> 16);
    }
    return data;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot create " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot create " + path.string());
    }
    file << text;
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

MonitorConfig monitor_config_in(const std::filesystem::path& dir) {
    MonitorConfig config;
    config.diagnostic_log_path = (dir / "memory_debug.log").string();
    config.cgroup_v2_path = (dir / "no_cgroup_v2").string();
    config.cgroup_v1_path = (dir / "no_cgroup_v1").string();
    config.install_crash_handler = false;
    return config;
}

// ============================================================================
// FakeMemorySampler
// ============================================================================

MemorySample FakeMemorySampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    if (failures_pending_ > 0) {
        --failures_pending_;
        throw std::runtime_error("status file unreadable");
    }

    MemorySample s;
    s.taken_at = std::chrono::system_clock::now();
    if (!queued_.empty()) {
        s.resident_bytes = queued_.front();
        queued_.erase(queued_.begin());
    } else {
        s.resident_bytes = resident_;
    }
    s.virtual_bytes = s.resident_bytes * 2;
    s.container_bytes = container_;
    s.system_total_bytes = mb(4096);
    s.system_available_bytes = mb(2048);
    s.thread_count = 3;
    s.open_files = 8;
    return s;
}

void FakeMemorySampler::set_resident_mb(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    resident_ = mb(value);
}

void FakeMemorySampler::set_container_mb(std::optional<double> value) {
    std::lock_guard<std::mutex> lock(mutex_);
    container_ = value ? std::optional<std::uint64_t>(mb(*value)) : std::nullopt;
}

void FakeMemorySampler::push_resident_mb(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queued_.push_back(mb(value));
}

std::size_t FakeMemorySampler::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

void FakeMemorySampler::fail_next(std::size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_pending_ = n;
}

// ============================================================================
// RecordingCacheAdvisor
// ============================================================================

bool RecordingCacheAdvisor::evict(int, std::uint64_t offset, std::uint64_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.emplace_back(offset, length);
    return accept_;
}

std::vector<std::pair<std::uint64_t, std::uint64_t>> RecordingCacheAdvisor::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

std::uint64_t RecordingCacheAdvisor::total_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& call : calls_) {
        total += call.second;
    }
    return total;
}

// ============================================================================
// MemoryChunkSource
// ============================================================================

MemoryChunkSource::MemoryChunkSource(std::vector<std::uint8_t> payload, std::string name, bool has_payload)
    : payload_(std::move(payload))
    , name_(std::move(name))
    , has_payload_(has_payload)
    , reported_size_(payload_.size()) {
}

bool MemoryChunkSource::next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) {
    max_request_ = std::max(max_request_, max_bytes);
    if (fail_at_ && chunks_ == *fail_at_) {
        throw std::runtime_error("peer connection reset");
    }

    buffer.clear();
    if (offset_ >= payload_.size()) {
        return false;
    }
    const std::size_t n = std::min(max_bytes, payload_.size() - offset_);
    buffer.assign(payload_.begin() + static_cast<std::ptrdiff_t>(offset_),
                  payload_.begin() + static_cast<std::ptrdiff_t>(offset_ + n));
    offset_ += n;
    ++chunks_;
    return true;
}

// ============================================================================
// RecordingPartSink
// ============================================================================

void RecordingPartSink::begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    name_ = name;
    total_size_ = total_size;
    part_size_ = part_size;
    parts_.clear();
    begun_ = true;
    finished_ = false;
}

void RecordingPartSink::send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_on_ && *fail_on_ == index) {
        throw std::runtime_error("part " + std::to_string(index) + " rejected");
    }
    parts_[index] = {offset, std::vector<std::uint8_t>(data, data + n)};
}

UploadHandle RecordingPartSink::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;

    UploadHandle handle;
    handle.name = name_;
    handle.parts = parts_.size();
    for (const auto& [index, part] : parts_) {
        handle.size += part.second.size();
    }
    handle.location = "memory://" + name_;
    return handle;
}

std::vector<std::uint8_t> RecordingPartSink::assembled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint8_t> data(total_size_);
    for (const auto& [index, part] : parts_) {
        std::copy(part.second.begin(), part.second.end(), data.begin() + static_cast<std::ptrdiff_t>(part.first));
    }
    return data;
}

std::map<std::size_t, std::size_t> RecordingPartSink::part_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::size_t, std::size_t> sizes;
    for (const auto& [index, part] : parts_) {
        sizes[index] = part.second.size();
    }
    return sizes;
}

std::string RecordingPartSink::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

std::size_t RecordingPartSink::part_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return part_size_;
}

bool RecordingPartSink::begun() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return begun_;
}

bool RecordingPartSink::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

// ============================================================================
// RecordingParallelUploader
// ============================================================================

UploadHandle RecordingParallelUploader::upload_file(const std::filesystem::path& path, std::uint64_t size,
                                                    const ProgressCallback& progress) {
    ++calls_;
    last_path_ = path;
    if (progress && size > 0) {
        progress(size, size);
    }

    UploadHandle handle;
    handle.name = path.filename().string();
    handle.size = size;
    handle.parts = 1;
    handle.location = "parallel://" + handle.name;
    return handle;
}

} // namespace relay::testing
