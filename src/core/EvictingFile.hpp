/**
 * @file EvictingFile.hpp
 * @brief File handle that drops transferred ranges from the page cache
 *
 * In a memory-limited container the page cache of a file being written
 * counts against the container budget. EvictingFile keeps an eviction cursor
 * and, every chunk_size bytes, asks the kernel to drop the range between the
 * cursor and the current position. Closing evicts any remaining tail.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "CacheAdvisor.hpp"
#include "Logger.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace relay {

/**
 * @brief Owning POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

    /**
     * @brief Close and report failure as std::system_error
     */
    void close_checked(const std::string& what);

private:
    int fd_ = -1;
};

/**
 * @brief pread until n bytes or end of file; throws std::system_error
 * @return Bytes read, less than n only at end of file
 */
std::size_t read_fully_at(int fd, std::uint8_t* buffer, std::size_t n, std::uint64_t offset);

/**
 * @brief Sequential file handle with an eviction cursor
 *
 * Invariant: evicted_offset() <= bytes_transferred(); after close() the two
 * are equal. Eviction failures are logged at DEBUG and never surface.
 */
class EvictingFile {
public:
    enum class Mode {
        Write,
        Read
    };

    /**
     * @brief Create or truncate path and take an exclusive lock on it
     * @throws std::system_error on open or lock failure
     */
    static EvictingFile open_for_write(const std::filesystem::path& path, std::size_t chunk_size,
                                       std::shared_ptr<CacheAdvisor> advisor);

    /**
     * @throws std::system_error on open failure
     */
    static EvictingFile open_for_read(const std::filesystem::path& path, std::size_t chunk_size,
                                      std::shared_ptr<CacheAdvisor> advisor);

    ~EvictingFile();

    EvictingFile(EvictingFile&& other) noexcept;
    EvictingFile& operator=(EvictingFile&&) = delete;
    EvictingFile(const EvictingFile&) = delete;
    EvictingFile& operator=(const EvictingFile&) = delete;

    /**
     * @brief Write all n bytes at the current position
     * @throws std::system_error on write failure
     */
    void write(const std::uint8_t* data, std::size_t n);

    /**
     * @brief Read up to max_bytes from the current position
     * @return Bytes read, 0 at end of file
     */
    std::size_t read(std::uint8_t* buffer, std::size_t max_bytes);

    /**
     * @brief Evict the unevicted tail and release the descriptor; idempotent
     * @throws std::system_error if closing a written file fails
     */
    void close();

    bool is_open() const { return static_cast<bool>(fd_); }
    Mode mode() const { return mode_; }
    const std::filesystem::path& path() const { return path_; }
    int native_handle() const { return fd_.get(); }

    std::uint64_t bytes_transferred() const { return bytes_transferred_; }
    std::uint64_t evicted_offset() const { return evicted_offset_; }
    std::size_t chunk_size() const { return chunk_size_; }
    std::size_t eviction_calls() const { return eviction_calls_; }
    std::size_t failed_evictions() const { return failed_evictions_; }

private:
    EvictingFile(FileDescriptor fd, std::filesystem::path path, Mode mode, std::size_t chunk_size,
                 std::shared_ptr<CacheAdvisor> advisor);

    FileDescriptor fd_;
    std::filesystem::path path_;
    Mode mode_;
    std::size_t chunk_size_;
    std::shared_ptr<CacheAdvisor> advisor_;
    std::uint64_t bytes_transferred_ = 0;
    std::uint64_t evicted_offset_ = 0;
    std::size_t eviction_calls_ = 0;
    std::size_t failed_evictions_ = 0;
    Logger logger_{"EvictingFile"};

    void advance(std::size_t n);
    void evict_pending();
};

} // namespace relay
