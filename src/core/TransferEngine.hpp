/**
 * @file TransferEngine.hpp
 * @brief Low-memory chunked download and upload of large media objects
 *
 * Bytes move one chunk at a time: at most one chunk buffer is alive per
 * transfer and every chunk_size bytes the already-written range is dropped
 * from the page cache, so a multi-gigabyte transfer stays within a few
 * megabytes of container memory.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "CacheAdvisor.hpp"
#include "Logger.hpp"
#include "MemoryMonitor.hpp"
#include "TransferInterfaces.hpp"
#include <atomic>
#include <filesystem>
#include <memory>

namespace relay {

/**
 * @brief Progress of one transfer call; never shared or persisted
 */
struct TransferProgress {
    enum class Direction {
        Download,
        Upload
    };

    Direction direction = Direction::Download;
    std::uint64_t total_bytes = 0;   ///< 0 when unknown
    std::uint64_t bytes_moved = 0;
    ProgressCallback callback;

    /**
     * @brief Account for n bytes and notify when the total is known
     */
    void advance(std::uint64_t n);
};

/**
 * @brief Counts in-flight transfers for the memory monitor
 */
class ActiveTransfers : public StateReporter {
public:
    SubsystemState report_state() const override;

    void begin() { ++active_; }
    void end() { --active_; }
    std::size_t active() const { return active_.load(); }

private:
    std::atomic<std::size_t> active_{0};
};

/**
 * @brief Chunked transfer engine with in-flight page-cache eviction
 */
class TransferEngine {
public:
    /**
     * @param monitor Memory monitor notified before and after each transfer
     * @param sink Destination of sequential uploads; may be null for download-only use
     * @param capability Parallel uploader, chosen once here
     * @param config Chunk and eviction settings
     * @param advisor Cache eviction primitive; null selects one from config
     */
    TransferEngine(MemoryMonitor& monitor,
                   std::shared_ptr<PartSink> sink,
                   UploaderCapability capability,
                   TransferConfig config = {},
                   std::shared_ptr<CacheAdvisor> advisor = nullptr);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief Stream a remote object into destination, one chunk at a time
     * @return destination on success
     * @throws TransferInputError for a non-positive chunk size or a source without payload
     * @throws std::system_error on file-system failure; source exceptions propagate unchanged
     *
     * A failed download leaves the partial file in place.
     */
    std::filesystem::path download(ChunkSource& source,
                                   const std::filesystem::path& destination,
                                   std::size_t chunk_size = kProtocolMaxPartSize,
                                   ProgressCallback progress = {});

    /**
     * @brief Upload a local file through the parallel uploader or chunk by chunk
     * @throws TransferInputError if the path is missing or not a regular file
     */
    UploadHandle upload(const std::filesystem::path& source_path,
                        std::size_t chunk_size = kProtocolMaxPartSize,
                        ProgressCallback progress = {});

    bool parallel_available() const { return capability_.available(); }
    std::shared_ptr<const StateReporter> state_reporter() const { return active_; }
    const CacheAdvisor& cache_advisor() const { return *advisor_; }

private:
    MemoryMonitor& monitor_;
    std::shared_ptr<PartSink> sink_;
    UploaderCapability capability_;
    TransferConfig config_;
    std::shared_ptr<CacheAdvisor> advisor_;
    std::shared_ptr<ActiveTransfers> active_;
    Logger logger_{"TransferEngine"};

    UploadHandle stream_upload(const std::filesystem::path& path, std::uint64_t size,
                               std::size_t part_size, const ProgressCallback& progress);
    void drop_file_cache(const std::filesystem::path& path, std::uint64_t size);
};

} // namespace relay
