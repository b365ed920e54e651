/**
 * @file HttpTransfer.hpp
 * @brief HTTP chunk source and part sink built on libcurl
 *
 * The source pulls one Range request per chunk, so no more than one chunk is
 * ever buffered. The sink sends one PUT per part with a Content-Range header
 * and uses its own easy handle per request, so it can be shared by the
 * pooled uploader's workers.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "media_relay.hpp"
#include "Logger.hpp"
#include "TransferInterfaces.hpp"
#include <atomic>
#include <string>

namespace relay {

/**
 * @brief One-time curl_global_init for the process
 */
void ensure_curl_initialized();

/**
 * @brief Downloads a URL in Range-requested chunks
 */
class HttpChunkSource : public ChunkSource {
public:
    HttpChunkSource(std::string url, const TransferConfig& config);

    bool has_payload() const override { return has_payload_; }
    std::uint64_t total_size() const override { return total_size_; }
    std::string name() const override;
    bool next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) override;

    long last_response_code() const { return last_response_code_; }

private:
    std::string url_;
    TransferConfig config_;
    bool has_payload_ = false;
    std::uint64_t total_size_ = 0;
    std::uint64_t offset_ = 0;
    bool exhausted_ = false;
    long last_response_code_ = 0;
    Logger logger_{"HttpChunkSource"};

    void fetch_headers();
};

/**
 * @brief Uploads parts to base_url/name with HTTP PUT
 */
class HttpPartSink : public PartSink {
public:
    HttpPartSink(std::string base_url, const TransferConfig& config);

    void begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) override;
    void send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) override;
    UploadHandle finish() override;

private:
    std::string base_url_;
    TransferConfig config_;
    std::string target_url_;
    std::string name_;
    std::uint64_t total_size_ = 0;
    std::atomic<std::size_t> parts_{0};
    Logger logger_{"HttpPartSink"};
};

} // namespace relay
