/**
 * @file HttpTransfer.cpp
 * @brief Implementation of the libcurl chunk source and part sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HttpTransfer.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace relay {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct ChunkSink {
    std::vector<std::uint8_t>* buffer;
    std::size_t limit;
    bool overflowed = false;
};

// Callback for curl to append a response body into the chunk buffer
size_t write_chunk_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<ChunkSink*>(userp);
    const size_t bytes = size * nmemb;
    if (sink->buffer->size() + bytes > sink->limit) {
        sink->overflowed = true;
        return 0;  // abort the transfer
    }
    const auto* data = static_cast<const std::uint8_t*>(contents);
    sink->buffer->insert(sink->buffer->end(), data, data + bytes);
    return bytes;
}

size_t discard_callback(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

CurlHandle make_handle(const std::string& url, const TransferConfig& config) {
    ensure_curl_initialized();
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize curl");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config.http_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    return curl;
}

} // namespace

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

// ============================================================================
// HttpChunkSource
// ============================================================================

HttpChunkSource::HttpChunkSource(std::string url, const TransferConfig& config)
    : url_(std::move(url)), config_(config) {
    fetch_headers();
}

std::string HttpChunkSource::name() const {
    auto slash = url_.find_last_of('/');
    std::string tail = slash == std::string::npos ? url_ : url_.substr(slash + 1);
    auto query = tail.find('?');
    if (query != std::string::npos) {
        tail.erase(query);
    }
    return tail.empty() ? url_ : tail;
}

void HttpChunkSource::fetch_headers() {
    CurlHandle curl = make_handle(url_, config_);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &last_response_code_);

    if (res != CURLE_OK) {
        logger_.warning("HEAD " + url_ + " failed: " + curl_easy_strerror(res));
        return;
    }
    if (last_response_code_ < 200 || last_response_code_ >= 300) {
        logger_.warning("HEAD " + url_ + " returned HTTP " + std::to_string(last_response_code_));
        return;
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length > 0) {
        total_size_ = static_cast<std::uint64_t>(length);
    }
    has_payload_ = true;
    logger_.debug("HEAD " + url_ + ": " + std::to_string(total_size_) + " bytes");
}

bool HttpChunkSource::next_chunk(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) {
    buffer.clear();
    if (exhausted_ || max_bytes == 0) {
        return false;
    }
    if (total_size_ > 0 && offset_ >= total_size_) {
        exhausted_ = true;
        return false;
    }

    const std::string range = std::to_string(offset_) + "-" + std::to_string(offset_ + max_bytes - 1);
    ChunkSink sink{&buffer, max_bytes};

    CurlHandle curl = make_handle(url_, config_);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_chunk_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &last_response_code_);

    if (last_response_code_ == 416) {
        exhausted_ = true;
        buffer.clear();
        return false;
    }
    if (sink.overflowed) {
        throw std::runtime_error(url_ + " ignored the Range request (HTTP " + std::to_string(last_response_code_) + ")");
    }
    if (res != CURLE_OK) {
        throw std::runtime_error("GET " + url_ + " [" + range + "] failed: " + curl_easy_strerror(res));
    }
    if (last_response_code_ != 206 && !(last_response_code_ == 200 && offset_ == 0)) {
        throw std::runtime_error("GET " + url_ + " [" + range + "] returned HTTP " + std::to_string(last_response_code_));
    }

    offset_ += buffer.size();
    // A full 200 body or a short 206 part is the last one
    if (last_response_code_ == 200 || buffer.size() < max_bytes) {
        exhausted_ = true;
    }
    return !buffer.empty();
}

// ============================================================================
// HttpPartSink
// ============================================================================

HttpPartSink::HttpPartSink(std::string base_url, const TransferConfig& config)
    : base_url_(std::move(base_url)), config_(config) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

void HttpPartSink::begin(const std::string& name, std::uint64_t total_size, std::size_t part_size) {
    name_ = name;
    total_size_ = total_size;
    target_url_ = base_url_ + "/" + name;
    parts_ = 0;
    logger_.detailed("Uploading " + name + " to " + target_url_ + " in " + std::to_string(part_size) + "-byte parts");
}

void HttpPartSink::send_part(std::size_t index, std::uint64_t offset, const std::uint8_t* data, std::size_t n) {
    if (target_url_.empty()) {
        throw std::logic_error("send_part before begin");
    }

    const std::string content_range = "Content-Range: bytes " + std::to_string(offset) + "-"
        + std::to_string(offset + n - 1) + "/" + std::to_string(total_size_);
    HeaderList headers(curl_slist_append(nullptr, content_range.c_str()), &curl_slist_free_all);
    if (!headers) {
        throw std::runtime_error("Failed to build request headers");
    }
    curl_slist* extended = curl_slist_append(headers.get(), "Content-Type: application/octet-stream");
    if (!extended) {
        throw std::runtime_error("Failed to build request headers");
    }
    headers.release();
    headers.reset(extended);

    CurlHandle curl = make_handle(target_url_, config_);
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(n));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode res = curl_easy_perform(curl.get());
    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (res != CURLE_OK) {
        throw std::runtime_error("PUT part " + std::to_string(index) + " failed: " + curl_easy_strerror(res));
    }
    if (response_code < 200 || response_code >= 300) {
        throw std::runtime_error("PUT part " + std::to_string(index) + " returned HTTP " + std::to_string(response_code));
    }
    ++parts_;
    logger_.trace("Part " + std::to_string(index) + " accepted (" + std::to_string(n) + " bytes)");
}

UploadHandle HttpPartSink::finish() {
    UploadHandle handle;
    handle.name = name_;
    handle.size = total_size_;
    handle.parts = parts_.load();
    handle.location = target_url_;
    return handle;
}

} // namespace relay
