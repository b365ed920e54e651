/**
 * @file EvictingFile.cpp
 * @brief Implementation of the cache-evicting file handle
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "EvictingFile.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace relay {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

// ============================================================================
// FileDescriptor
// ============================================================================

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

void FileDescriptor::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

void FileDescriptor::close_checked(const std::string& what) {
    int fd = release();
    if (fd >= 0 && ::close(fd) != 0) {
        throw_errno("close " + what);
    }
}

std::size_t read_fully_at(int fd, std::uint8_t* buffer, std::size_t n, std::uint64_t offset) {
    std::size_t done = 0;
    while (done < n) {
        ssize_t r = ::pread(fd, buffer + done, n - done, static_cast<off_t>(offset + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw_errno("pread at offset " + std::to_string(offset + done));
        }
        if (r == 0) break; // EOF
        done += static_cast<std::size_t>(r);
    }
    return done;
}

// ============================================================================
// EvictingFile
// ============================================================================

EvictingFile EvictingFile::open_for_write(const std::filesystem::path& path, std::size_t chunk_size,
                                          std::shared_ptr<CacheAdvisor> advisor) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd) {
        throw_errno("open " + path.string());
    }
    if (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        throw_errno("lock " + path.string());
    }

    return EvictingFile(std::move(fd), path, Mode::Write, chunk_size, std::move(advisor));
}

EvictingFile EvictingFile::open_for_read(const std::filesystem::path& path, std::size_t chunk_size,
                                         std::shared_ptr<CacheAdvisor> advisor) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        throw_errno("open " + path.string());
    }

    return EvictingFile(std::move(fd), path, Mode::Read, chunk_size, std::move(advisor));
}

EvictingFile::EvictingFile(FileDescriptor fd, std::filesystem::path path, Mode mode, std::size_t chunk_size,
                           std::shared_ptr<CacheAdvisor> advisor)
    : fd_(std::move(fd))
    , path_(std::move(path))
    , mode_(mode)
    , chunk_size_(chunk_size)
    , advisor_(advisor ? std::move(advisor) : std::make_shared<NullCacheAdvisor>()) {
}

EvictingFile::EvictingFile(EvictingFile&& other) noexcept
    : fd_(std::move(other.fd_))
    , path_(std::move(other.path_))
    , mode_(other.mode_)
    , chunk_size_(other.chunk_size_)
    , advisor_(std::move(other.advisor_))
    , bytes_transferred_(other.bytes_transferred_)
    , evicted_offset_(other.evicted_offset_)
    , eviction_calls_(other.eviction_calls_)
    , failed_evictions_(other.failed_evictions_)
    , logger_("EvictingFile") {
}

EvictingFile::~EvictingFile() {
    if (!is_open()) {
        return;
    }
    try {
        close();
    } catch (const std::system_error& e) {
        logger_.error(std::string("Closing ") + path_.string() + " failed: " + e.what());
    }
}

void EvictingFile::write(const std::uint8_t* data, std::size_t n) {
    if (!is_open()) {
        throw std::logic_error("write on closed file " + path_.string());
    }

    std::size_t done = 0;
    while (done < n) {
        ssize_t w = ::write(fd_.get(), data + done, n - done);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw_errno("write " + path_.string());
        }
        done += static_cast<std::size_t>(w);
    }
    advance(n);
}

std::size_t EvictingFile::read(std::uint8_t* buffer, std::size_t max_bytes) {
    if (!is_open()) {
        throw std::logic_error("read on closed file " + path_.string());
    }

    for (;;) {
        ssize_t r = ::read(fd_.get(), buffer, max_bytes);
        if (r < 0) {
            if (errno == EINTR) continue;
            throw_errno("read " + path_.string());
        }
        advance(static_cast<std::size_t>(r));
        return static_cast<std::size_t>(r);
    }
}

void EvictingFile::close() {
    if (!is_open()) {
        return;
    }
    evict_pending();
    logger_.trace(path_.string() + ": " + std::to_string(eviction_calls_) + " evictions, "
                  + std::to_string(failed_evictions_) + " failed");

    if (mode_ == Mode::Write) {
        fd_.close_checked(path_.string());
    } else {
        fd_.reset();
    }
}

void EvictingFile::advance(std::size_t n) {
    bytes_transferred_ += n;
    if (bytes_transferred_ - evicted_offset_ >= chunk_size_) {
        evict_pending();
    }
}

void EvictingFile::evict_pending() {
    const std::uint64_t length = bytes_transferred_ - evicted_offset_;
    if (length == 0) {
        return;
    }

    ++eviction_calls_;
    if (!advisor_->evict(fd_.get(), evicted_offset_, length)) {
        ++failed_evictions_;
        logger_.debug("Cache eviction skipped for " + path_.string() + " at offset "
                      + std::to_string(evicted_offset_));
    }
    // The cursor moves even when the hint is rejected
    evicted_offset_ = bytes_transferred_;
}

} // namespace relay
