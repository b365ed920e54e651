/**
 * @file PooledPartUploader.hpp
 * @brief Bounded worker pool that uploads file parts concurrently
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "CacheAdvisor.hpp"
#include "Logger.hpp"
#include "TransferInterfaces.hpp"
#include <memory>

namespace relay {

/**
 * @brief Parallel uploader with one part buffer per worker
 *
 * Workers claim part indices from a shared counter and read their part with
 * pread, so peak memory is workers * part_size regardless of file size.
 * Progress is aggregated under a lock and reported in increasing order. The
 * first failing part stops the remaining workers and is rethrown.
 */
class PooledPartUploader : public ParallelUploader {
public:
    PooledPartUploader(std::shared_ptr<PartSink> sink,
                       unsigned workers = 4,
                       std::size_t part_size = kProtocolMaxPartSize,
                       std::shared_ptr<CacheAdvisor> advisor = nullptr);

    UploadHandle upload_file(const std::filesystem::path& path, std::uint64_t size,
                             const ProgressCallback& progress) override;

    unsigned workers() const { return workers_; }
    std::size_t part_size() const { return part_size_; }

private:
    std::shared_ptr<PartSink> sink_;
    unsigned workers_;
    std::size_t part_size_;
    std::shared_ptr<CacheAdvisor> advisor_;
    Logger logger_{"PooledPartUploader"};
};

} // namespace relay
