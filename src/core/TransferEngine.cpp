/**
 * @file TransferEngine.cpp
 * @brief Implementation of the chunked transfer engine
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TransferEngine.hpp"
#include "EvictingFile.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace relay {

namespace {

/// Keeps the in-flight count right on every exit path
class ActiveTransferGuard {
public:
    explicit ActiveTransferGuard(ActiveTransfers& transfers) : transfers_(transfers) { transfers_.begin(); }
    ~ActiveTransferGuard() { transfers_.end(); }

    ActiveTransferGuard(const ActiveTransferGuard&) = delete;
    ActiveTransferGuard& operator=(const ActiveTransferGuard&) = delete;

private:
    ActiveTransfers& transfers_;
};

} // namespace

void TransferProgress::advance(std::uint64_t n) {
    bytes_moved += n;
    if (callback && total_bytes > 0) {
        callback(bytes_moved, total_bytes);
    }
}

SubsystemState ActiveTransfers::report_state() const {
    SubsystemState state;
    state.count = active_.load();
    state.active = state.count;
    return state;
}

TransferEngine::TransferEngine(MemoryMonitor& monitor,
                               std::shared_ptr<PartSink> sink,
                               UploaderCapability capability,
                               TransferConfig config,
                               std::shared_ptr<CacheAdvisor> advisor)
    : monitor_(monitor)
    , sink_(std::move(sink))
    , capability_(std::move(capability))
    , config_(std::move(config))
    , advisor_(advisor ? std::move(advisor) : make_cache_advisor(config_))
    , active_(std::make_shared<ActiveTransfers>()) {
    monitor_.register_reporter(Subsystem::DownloadQueue, active_);

    if (capability_.available()) {
        logger_.detailed("Parallel uploader available");
    } else {
        logger_.detailed("Parallel uploader unavailable (" + capability_.reason() + "), uploads stream sequentially");
    }
}

std::filesystem::path TransferEngine::download(ChunkSource& source,
                                               const std::filesystem::path& destination,
                                               std::size_t chunk_size,
                                               ProgressCallback progress) {
    if (chunk_size == 0) {
        throw TransferInputError("Chunk size must be positive");
    }
    if (!source.has_payload()) {
        throw TransferInputError("Source '" + source.name() + "' has no media payload");
    }
    if (auto local = source.local_path(); local && is_same_file(*local, destination)) {
        throw TransferInputError("Destination " + destination.string() + " is the source file");
    }

    const std::uint64_t total = source.total_size();
    logger_.info("Streaming download starting: " + destination.string() + " (" + std::to_string(total)
                 + " bytes, " + std::to_string(chunk_size) + "-byte chunks)");

    monitor_.track_download(total, source.name());
    ActiveTransferGuard in_flight(*active_);
    OperationScope scope(monitor_, "download", destination.filename().string());

    try {
        EvictingFile file = EvictingFile::open_for_write(destination, chunk_size, advisor_);

        TransferProgress state;
        state.direction = TransferProgress::Direction::Download;
        state.total_bytes = total;
        state.callback = std::move(progress);

        std::vector<std::uint8_t> buffer;
        buffer.reserve(chunk_size);
        while (source.next_chunk(buffer, chunk_size)) {
            if (buffer.empty()) {
                continue;
            }
            file.write(buffer.data(), buffer.size());
            logger_.trace("Wrote chunk of " + std::to_string(buffer.size()) + " bytes at "
                          + std::to_string(state.bytes_moved));
            state.advance(buffer.size());
        }

        file.close();
        if (total > 0 && state.bytes_moved != total) {
            throw std::runtime_error("Source ended after " + std::to_string(state.bytes_moved) + " of "
                                     + std::to_string(total) + " bytes");
        }
        logger_.info("Streaming download complete: " + destination.string() + " ("
                     + std::to_string(state.bytes_moved) + " bytes, "
                     + std::to_string(file.eviction_calls()) + " cache evictions)");
    } catch (const std::exception& e) {
        logger_.error("Streaming download failed for " + destination.string() + ": " + e.what());
        throw;
    }

    return destination;
}

UploadHandle TransferEngine::upload(const std::filesystem::path& source_path,
                                    std::size_t chunk_size,
                                    ProgressCallback progress) {
    if (source_path.empty()) {
        throw TransferInputError("Upload path is empty");
    }
    std::error_code ec;
    const auto status = std::filesystem::status(source_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw TransferInputError("File not found: " + source_path.string());
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw TransferInputError("Not a regular file: " + source_path.string());
    }
    if (chunk_size == 0) {
        throw TransferInputError("Chunk size must be positive");
    }
    if (!capability_.available() && !sink_) {
        throw TransferInputError("No upload destination configured");
    }
    if (sink_) {
        auto target = sink_->local_target(source_path.filename().string());
        if (target && is_same_file(*target, source_path)) {
            throw TransferInputError("Upload target " + target->string() + " is the source file");
        }
    }

    const std::uint64_t size = std::filesystem::file_size(source_path);
    const std::string name = source_path.filename().string();

    monitor_.track_upload(size, name);
    ActiveTransferGuard in_flight(*active_);
    OperationScope scope(monitor_, "upload", name);

    try {
        UploadHandle handle;
        if (capability_.available()) {
            logger_.info("Parallel upload starting: " + source_path.string() + " (" + std::to_string(size) + " bytes)");
            handle = capability_.uploader().upload_file(source_path, size, progress);
        } else {
            const std::size_t part_size = std::min(chunk_size, kProtocolMaxPartSize);
            logger_.info("Streaming upload starting: " + source_path.string() + " (" + std::to_string(size)
                         + " bytes, " + std::to_string(part_size) + "-byte parts)");
            handle = stream_upload(source_path, size, part_size, progress);
        }

        drop_file_cache(source_path, size);
        logger_.info("Upload complete: " + source_path.string() + " (" + std::to_string(handle.parts) + " parts)");
        return handle;
    } catch (const std::exception& e) {
        logger_.error("Upload failed for " + source_path.string() + ": " + e.what());
        throw;
    }
}

UploadHandle TransferEngine::stream_upload(const std::filesystem::path& path, std::uint64_t size,
                                           std::size_t part_size, const ProgressCallback& progress) {
    EvictingFile file = EvictingFile::open_for_read(path, part_size, advisor_);

    TransferProgress state;
    state.direction = TransferProgress::Direction::Upload;
    state.total_bytes = size;
    state.callback = progress;

    sink_->begin(path.filename().string(), size, part_size);

    std::vector<std::uint8_t> buffer(part_size);
    std::size_t index = 0;
    for (;;) {
        const std::uint64_t offset = file.bytes_transferred();
        std::size_t filled = 0;
        // Fill whole parts; only the last part may be short
        while (filled < part_size) {
            std::size_t n = file.read(buffer.data() + filled, part_size - filled);
            if (n == 0) break;
            filled += n;
        }
        if (filled == 0) break;

        sink_->send_part(index++, offset, buffer.data(), filled);
        state.advance(filled);
        if (filled < part_size) break;
    }

    file.close();
    return sink_->finish();
}

void TransferEngine::drop_file_cache(const std::filesystem::path& path, std::uint64_t size) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        logger_.debug("Cannot reopen " + path.string() + " to drop its cache");
        return;
    }
    if (!advisor_->evict(fd.get(), 0, size)) {
        logger_.debug("Final cache drop skipped for " + path.string());
    }
}

} // namespace relay
