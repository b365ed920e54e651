/**
 * @file CacheAdvisor.cpp
 * @brief Implementation of page-cache drop hints
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CacheAdvisor.hpp"
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace relay {

PosixCacheAdvisor::PosixCacheAdvisor(bool flush_before_evict)
    : flush_before_evict_(flush_before_evict) {
}

bool PosixCacheAdvisor::supported() const {
#if defined(POSIX_FADV_DONTNEED)
    return true;
#else
    return false;
#endif
}

bool PosixCacheAdvisor::evict(int fd, std::uint64_t offset, std::uint64_t length) {
#if defined(POSIX_FADV_DONTNEED)
    if (fd < 0) {
        return false;
    }
    if (flush_before_evict_ && !flush_range(fd, offset, length)) {
        return false;
    }

    // posix_fadvise reports failure through its return value, not errno
    int rc = posix_fadvise(fd, static_cast<off_t>(offset), static_cast<off_t>(length), POSIX_FADV_DONTNEED);
    if (rc != 0) {
        logger_.debug("posix_fadvise failed at offset " + std::to_string(offset) + ": " + std::strerror(rc));
        return false;
    }
    logger_.trace("Dropped " + std::to_string(length) + " cached bytes at offset " + std::to_string(offset));
    return true;
#else
    (void)fd;
    (void)offset;
    (void)length;
    return false;
#endif
}

bool PosixCacheAdvisor::flush_range(int fd, std::uint64_t offset, std::uint64_t length) const {
#if defined(__linux__)
    const unsigned flags = SYNC_FILE_RANGE_WAIT_BEFORE | SYNC_FILE_RANGE_WRITE | SYNC_FILE_RANGE_WAIT_AFTER;
    if (sync_file_range(fd, static_cast<off64_t>(offset), static_cast<off64_t>(length), flags) != 0) {
        // Read-only descriptors and some filesystems reject this
        if (errno != EBADF && errno != EINVAL) {
            logger_.debug(std::string("sync_file_range failed: ") + std::strerror(errno));
            return false;
        }
    }
    return true;
#else
    (void)offset;
    (void)length;
    if (fdatasync(fd) != 0 && errno != EBADF && errno != EINVAL) {
        logger_.debug(std::string("fdatasync failed: ") + std::strerror(errno));
        return false;
    }
    return true;
#endif
}

std::shared_ptr<CacheAdvisor> make_cache_advisor(const TransferConfig& config) {
    if (config.evict_page_cache) {
        auto advisor = std::make_shared<PosixCacheAdvisor>(config.flush_before_evict);
        if (advisor->supported()) {
            return advisor;
        }
        Logger("CacheAdvisor").info("Page-cache eviction not supported on this platform");
    }
    return std::make_shared<NullCacheAdvisor>();
}

} // namespace relay
