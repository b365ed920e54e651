/**
 * @file LocalTransfer.hpp
 * @brief File-backed chunk source and part sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "EvictingFile.hpp"
#include "Logger.hpp"
#include "TransferInterfaces.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>

namespace relay {

/**
 * @brief Reads a local file as a chunk source, evicting what it has read
 */
class FileChunkSource : public ChunkSource {
public:
    explicit FileChunkSource(std::filesystem::path path,
                             std::shared_ptr<CacheAdvisor> advisor = nullptr,
                             std::size_t chunk_size = kProtocolMaxPartSize);

    bool has_payload() const override { return file_.has_value(); }
    std::uint64_t total_size() const override { return size_; }
    std::string name() const override { return path_.filename().string(); }
    bool next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) override;
    std::optional<std::filesystem::path> local_path() const override { return path_; }

private:
    std::filesystem::path path_;
    std::optional<EvictingFile> file_;
    std::uint64_t size_ = 0;
};

/**
 * @brief Writes uploaded parts into a file under a directory
 *
 * Parts are written with pwrite at their offsets, so send_part is safe to
 * call from several uploader threads at once.
 */
class DirectoryPartSink : public PartSink {
public:
    explicit DirectoryPartSink(std::filesystem::path directory,
                               std::shared_ptr<CacheAdvisor> advisor = nullptr);

    void begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) override;
    void send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) override;
    UploadHandle finish() override;
    std::optional<std::filesystem::path> local_target(const std::string& name) const override {
        return directory_ / name;
    }

    /**
     * @brief Refuse to begin an upload whose target is this file
     */
    void protect_source(std::filesystem::path source) { protected_source_ = std::move(source); }

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    std::shared_ptr<CacheAdvisor> advisor_;
    std::filesystem::path target_;
    std::filesystem::path protected_source_;
    std::string name_;
    std::uint64_t total_size_ = 0;
    FileDescriptor fd_;
    std::atomic<std::size_t> parts_{0};
    std::atomic<std::uint64_t> bytes_{0};
    Logger logger_{"DirectoryPartSink"};
};

} // namespace relay
