/**
 * @file CacheAdvisor.hpp
 * @brief Page-cache drop hints for already-transferred file ranges
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <memory>

namespace relay {

/**
 * @brief Advisory page-cache eviction
 *
 * Eviction is a hint. A false return never stops a transfer.
 */
class CacheAdvisor {
public:
    virtual ~CacheAdvisor() = default;

    /**
     * @brief Ask the kernel to drop cached pages of [offset, offset + length)
     * @return true if the hint was accepted
     */
    virtual bool evict(int fd, std::uint64_t offset, std::uint64_t length) = 0;

    /**
     * @brief false when the platform offers no eviction primitive
     */
    virtual bool supported() const = 0;
};

/**
 * @brief posix_fadvise(POSIX_FADV_DONTNEED), optionally preceded by writeback
 *
 * Dirty pages are not dropped by the kernel, so written ranges are flushed
 * first (sync_file_range on Linux, fdatasync elsewhere).
 */
class PosixCacheAdvisor : public CacheAdvisor {
public:
    explicit PosixCacheAdvisor(bool flush_before_evict = true);

    bool evict(int fd, std::uint64_t offset, std::uint64_t length) override;
    bool supported() const override;

private:
    bool flush_before_evict_;
    Logger logger_{"CacheAdvisor"};

    bool flush_range(int fd, std::uint64_t offset, std::uint64_t length) const;
};

/**
 * @brief Degraded no-op advisor
 */
class NullCacheAdvisor : public CacheAdvisor {
public:
    bool evict(int, std::uint64_t, std::uint64_t) override { return false; }
    bool supported() const override { return false; }
};

/**
 * @brief PosixCacheAdvisor when eviction is enabled and available, NullCacheAdvisor otherwise
 */
std::shared_ptr<CacheAdvisor> make_cache_advisor(const TransferConfig& config);

} // namespace relay
