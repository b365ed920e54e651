/**
 * @file PooledPartUploader.cpp
 * @brief Implementation of the pooled part uploader
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PooledPartUploader.hpp"
#include "EvictingFile.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace relay {

PooledPartUploader::PooledPartUploader(std::shared_ptr<PartSink> sink, unsigned workers,
                                       std::size_t part_size, std::shared_ptr<CacheAdvisor> advisor)
    : sink_(std::move(sink))
    , workers_(workers)
    , part_size_(part_size)
    , advisor_(advisor ? std::move(advisor) : std::make_shared<NullCacheAdvisor>()) {
    if (!sink_) {
        throw std::invalid_argument("PooledPartUploader requires a part sink");
    }
    if (workers_ == 0) {
        throw std::invalid_argument("Worker count must be positive");
    }
    if (part_size_ == 0 || part_size_ > kProtocolMaxPartSize) {
        throw std::invalid_argument("Part size must be between 1 and " + std::to_string(kProtocolMaxPartSize));
    }
}

UploadHandle PooledPartUploader::upload_file(const std::filesystem::path& path, std::uint64_t size,
                                             const ProgressCallback& progress) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        throw std::system_error(errno, std::generic_category(), "open " + path.string());
    }

    const std::size_t part_count = static_cast<std::size_t>((size + part_size_ - 1) / part_size_);
    const unsigned pool_size = static_cast<unsigned>(
        std::max<std::size_t>(1, std::min<std::size_t>(workers_, part_count)));

    logger_.detailed("Uploading " + path.string() + " as " + std::to_string(part_count) + " parts on "
                     + std::to_string(pool_size) + " workers");
    sink_->begin(path.filename().string(), size, part_size_);

    std::atomic<std::size_t> next_part{0};
    std::atomic<bool> cancelled{false};
    std::mutex progress_mutex;
    std::uint64_t bytes_done = 0;
    std::exception_ptr first_error;

    auto worker = [&]() {
        std::vector<std::uint8_t> buffer(part_size_);
        while (!cancelled.load()) {
            const std::size_t index = next_part.fetch_add(1);
            if (index >= part_count) {
                break;
            }
            try {
                const std::uint64_t offset = static_cast<std::uint64_t>(index) * part_size_;
                const std::size_t expected = static_cast<std::size_t>(
                    std::min<std::uint64_t>(part_size_, size - offset));

                const std::size_t got = read_fully_at(fd.get(), buffer.data(), expected, offset);
                if (got != expected) {
                    throw std::runtime_error(path.string() + " shrank during upload");
                }
                sink_->send_part(index, offset, buffer.data(), got);
                if (!advisor_->evict(fd.get(), offset, got)) {
                    logger_.trace("Cache eviction skipped for part " + std::to_string(index));
                }

                std::lock_guard<std::mutex> lock(progress_mutex);
                bytes_done += got;
                if (progress && size > 0) {
                    progress(bytes_done, size);
                }
            } catch (...) {
                // Rethrown on the calling thread after the pool drains
                std::lock_guard<std::mutex> lock(progress_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                cancelled = true;
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(pool_size);
    for (unsigned i = 0; i < pool_size; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return sink_->finish();
}

} // namespace relay
