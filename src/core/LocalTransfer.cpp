/**
 * @file LocalTransfer.cpp
 * @brief Implementation of the file-backed source and sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "LocalTransfer.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace relay {

// ============================================================================
// FileChunkSource
// ============================================================================

FileChunkSource::FileChunkSource(std::filesystem::path path, std::shared_ptr<CacheAdvisor> advisor,
                                 std::size_t chunk_size)
    : path_(std::move(path)) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return;
    }
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        size_ = 0;
    }
    file_.emplace(EvictingFile::open_for_read(path_, chunk_size, std::move(advisor)));
}

bool FileChunkSource::next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) {
    if (!file_ || !file_->is_open()) {
        return false;
    }

    buffer.resize(max_bytes);
    std::size_t filled = 0;
    while (filled < max_bytes) {
        std::size_t n = file_->read(buffer.data() + filled, max_bytes - filled);
        if (n == 0) break;
        filled += n;
    }
    buffer.resize(filled);

    if (filled == 0) {
        file_->close();
        return false;
    }
    return true;
}

// ============================================================================
// DirectoryPartSink
// ============================================================================

DirectoryPartSink::DirectoryPartSink(std::filesystem::path directory, std::shared_ptr<CacheAdvisor> advisor)
    : directory_(std::move(directory))
    , advisor_(advisor ? std::move(advisor) : std::make_shared<NullCacheAdvisor>()) {
}

void DirectoryPartSink::begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid upload name '" + name + "'");
    }

    if (!protected_source_.empty() && is_same_file(directory_ / name, protected_source_)) {
        throw TransferInputError("Upload target " + (directory_ / name).string() + " is the source file");
    }

    std::filesystem::create_directories(directory_);
    target_ = directory_ / name;
    name_ = name;
    total_size_ = total_size;
    parts_ = 0;
    bytes_ = 0;

    fd_.reset(::open(target_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd_) {
        throw std::system_error(errno, std::generic_category(), "open " + target_.string());
    }
    if (::ftruncate(fd_.get(), static_cast<off_t>(total_size)) != 0) {
        const int saved_errno = errno;
        fd_.reset();
        throw std::system_error(saved_errno, std::generic_category(), "ftruncate " + target_.string());
    }
    logger_.detailed("Receiving " + name + " (" + std::to_string(total_size) + " bytes, "
                     + std::to_string(part_size) + "-byte parts) into " + target_.string());
}

void DirectoryPartSink::send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) {
    if (!fd_) {
        throw std::logic_error("send_part before begin");
    }

    std::size_t done = 0;
    while (done < n) {
        ssize_t w = ::pwrite(fd_.get(), data + done, n - done, static_cast<off_t>(offset + done));
        if (w < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(),
                                    "pwrite part " + std::to_string(index) + " of " + target_.string());
        }
        done += static_cast<std::size_t>(w);
    }

    if (!advisor_->evict(fd_.get(), offset, n)) {
        logger_.trace("Cache eviction skipped for part " + std::to_string(index));
    }
    ++parts_;
    bytes_ += n;
}

UploadHandle DirectoryPartSink::finish() {
    if (!fd_) {
        throw std::logic_error("finish before begin");
    }
    if (::fdatasync(fd_.get()) != 0) {
        throw std::system_error(errno, std::generic_category(), "fdatasync " + target_.string());
    }
    fd_.close_checked(target_.string());

    UploadHandle handle;
    handle.name = name_;
    handle.size = bytes_.load();
    handle.parts = parts_.load();
    handle.location = target_.string();
    logger_.detailed("Stored " + handle.name + " (" + std::to_string(handle.parts) + " parts)");
    return handle;
}

} // namespace relay
