/**
 * @file test_helpers.hpp
 * @brief Fakes and fixtures shared by the media-relay unit tests
 */

#pragma once

#include "media_relay.hpp"
#include "core/CacheAdvisor.hpp"
#include "core/MemorySampler.hpp"
#include "core/TransferInterfaces.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relay::testing {

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/// Deterministic, non-repeating-per-chunk content
std::vector<std::uint8_t> pattern_bytes(std::size_t n, std::uint8_t seed = 7);

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);
void write_text(const std::filesystem::path& path, const std::string& text);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
std::string read_text(const std::filesystem::path& path);

/// Monitor configuration whose files all live under dir and whose cgroup paths do not exist
MonitorConfig monitor_config_in(const std::filesystem::path& dir);

/**
 * @brief Memory sampler returning whatever the test sets
 */
class FakeMemorySampler : public MemorySampler {
public:
    MemorySample sample() override;

    void set_resident_mb(double mb);
    void set_container_mb(std::optional<double> mb);

    /// Samples queued here are returned first, in order
    void push_resident_mb(double mb);

    std::size_t calls() const;

    /// The next n samples throw std::runtime_error
    void fail_next(std::size_t n = 1);

private:
    mutable std::mutex mutex_;
    std::uint64_t resident_ = 0;
    std::size_t failures_pending_ = 0;
    std::optional<std::uint64_t> container_;
    std::vector<std::uint64_t> queued_;
    std::size_t calls_ = 0;
};

/**
 * @brief Cache advisor that records each eviction request
 */
class RecordingCacheAdvisor : public CacheAdvisor {
public:
    explicit RecordingCacheAdvisor(bool accept = true) : accept_(accept) {}

    bool evict(int fd, std::uint64_t offset, std::uint64_t length) override;
    bool supported() const override { return true; }

    std::vector<std::pair<std::uint64_t, std::uint64_t>> calls() const;
    std::uint64_t total_length() const;

private:
    bool accept_;
    mutable std::mutex mutex_;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> calls_;
};

/**
 * @brief Chunk source over an in-memory payload
 */
class MemoryChunkSource : public ChunkSource {
public:
    explicit MemoryChunkSource(std::vector<std::uint8_t> payload, std::string name = "memory.bin",
                               bool has_payload = true);

    bool has_payload() const override { return has_payload_; }
    std::uint64_t total_size() const override { return reported_size_; }
    std::string name() const override { return name_; }
    bool next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) override;

    /// Throw std::runtime_error when asked for chunk number n (0-based)
    void fail_at_chunk(std::size_t n) { fail_at_ = n; }
    void report_size(std::uint64_t size) { reported_size_ = size; }

    std::size_t chunks_served() const { return chunks_; }
    std::size_t max_request() const { return max_request_; }

private:
    std::vector<std::uint8_t> payload_;
    std::string name_;
    bool has_payload_;
    std::uint64_t reported_size_;
    std::size_t offset_ = 0;
    std::size_t chunks_ = 0;
    std::size_t max_request_ = 0;
    std::optional<std::size_t> fail_at_;
};

/**
 * @brief Part sink that assembles parts in memory
 */
class RecordingPartSink : public PartSink {
public:
    void begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) override;
    void send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) override;
    UploadHandle finish() override;

    /// Throw std::runtime_error from send_part for this index
    void fail_on_part(std::size_t index) { fail_on_ = index; }

    std::vector<std::uint8_t> assembled() const;
    std::map<std::size_t, std::size_t> part_sizes() const;
    std::string name() const;
    std::size_t part_size() const;
    bool begun() const;
    bool finished() const;

private:
    mutable std::mutex mutex_;
    std::string name_;
    std::uint64_t total_size_ = 0;
    std::size_t part_size_ = 0;
    std::map<std::size_t, std::pair<std::uint64_t, std::vector<std::uint8_t>>> parts_;
    std::optional<std::size_t> fail_on_;
    bool begun_ = false;
    bool finished_ = false;
};

/**
 * @brief Parallel uploader that records its calls and reports one progress step
 */
class RecordingParallelUploader : public ParallelUploader {
public:
    UploadHandle upload_file(const std::filesystem::path& path, std::uint64_t size,
                             const ProgressCallback& progress) override;

    std::size_t calls() const { return calls_; }
    const std::filesystem::path& last_path() const { return last_path_; }

private:
    std::size_t calls_ = 0;
    std::filesystem::path last_path_;
};

} // namespace relay::testing
