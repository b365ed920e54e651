/**
 * @file TransferInterfaces.hpp
 * @brief Collaborator interfaces of the chunked transfer engine
 *
 * The engine never talks to a network protocol directly. Remote objects are
 * read through a ChunkSource and written through a PartSink or a
 * ParallelUploader.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace relay {

/**
 * @brief Invalid transfer input, raised before any resource is acquired
 */
class TransferInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Progress notification (bytes done, bytes total)
 *
 * Called synchronously; the transfer does not continue until it returns.
 */
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief true when both paths exist and name the same inode
 */
inline bool is_same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    const bool same = std::filesystem::equivalent(a, b, ec);
    return !ec && same;
}

/**
 * @brief Forward-only producer of the bytes of one remote object
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /// false when the referenced object carries no downloadable payload
    virtual bool has_payload() const = 0;

    /// Total size in bytes, 0 when unknown
    virtual std::uint64_t total_size() const = 0;

    /// Name for logs and history
    virtual std::string name() const = 0;

    /**
     * @brief Replace buffer contents with the next chunk of at most max_bytes
     * @return false when the object is exhausted
     */
    virtual bool next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) = 0;

    /// Backing local file, if any
    virtual std::optional<std::filesystem::path> local_path() const { return std::nullopt; }
};

/**
 * @brief Opaque reference to an uploaded object
 */
struct UploadHandle {
    std::string name;
    std::uint64_t size = 0;
    std::size_t parts = 0;
    std::string location;   ///< Sink-specific identifier (path, URL)
};

/**
 * @brief Consumer of uploaded parts
 *
 * send_part may be called concurrently from several threads with distinct
 * part indices; begin and finish are called once each from one thread.
 */
class PartSink {
public:
    virtual ~PartSink() = default;

    virtual void begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) = 0;
    virtual void send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) = 0;
    virtual UploadHandle finish() = 0;

    /// Local file an upload named name would be written to, if any
    virtual std::optional<std::filesystem::path> local_target(const std::string& name) const {
        (void)name;
        return std::nullopt;
    }
};

/**
 * @brief Whole-file uploader that may run several parts concurrently
 */
class ParallelUploader {
public:
    virtual ~ParallelUploader() = default;

    virtual UploadHandle upload_file(const std::filesystem::path& path, std::uint64_t size,
                                     const ProgressCallback& progress) = 0;
};

/**
 * @brief Whether a parallel uploader exists, decided once at engine construction
 */
class UploaderCapability {
public:
    static UploaderCapability Available(std::shared_ptr<ParallelUploader> uploader) {
        if (!uploader) {
            return Unavailable("no uploader supplied");
        }
        return UploaderCapability(std::move(uploader), {});
    }

    static UploaderCapability Unavailable(std::string reason) {
        return UploaderCapability(nullptr, std::move(reason));
    }

    bool available() const { return uploader_ != nullptr; }
    ParallelUploader& uploader() const { return *uploader_; }
    const std::string& reason() const { return reason_; }

private:
    UploaderCapability(std::shared_ptr<ParallelUploader> uploader, std::string reason)
        : uploader_(std::move(uploader)), reason_(std::move(reason)) {}

    std::shared_ptr<ParallelUploader> uploader_;
    std::string reason_;
};

} // namespace relay
