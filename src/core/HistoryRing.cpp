/**
 * @file HistoryRing.cpp
 * @brief Implementation of the bounded operation history
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HistoryRing.hpp"
#include "media_relay.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace relay {

std::string HistoryEntry::format() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::put_time(&tm, "%H:%M:%S") << "] "
        << (operation.empty() ? "General" : operation) << " - "
        << std::fixed << std::setprecision(1) << to_mb(resident_bytes) << " MB - "
        << (context.empty() ? "N/A" : context);
    return oss.str();
}

HistoryRing::HistoryRing(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("History capacity must be positive");
    }
    slots_.resize(capacity);
}

void HistoryRing::record(HistoryEntry entry) {
    const std::size_t cap = slots_.size();
    if (size_ < cap) {
        slots_[(head_ + size_) % cap] = std::move(entry);
        ++size_;
    } else {
        slots_[head_] = std::move(entry);
        head_ = (head_ + 1) % cap;
    }
}

std::vector<HistoryEntry> HistoryRing::last(std::size_t n) const {
    const std::size_t count = std::min(n, size_);
    const std::size_t cap = slots_.size();

    std::vector<HistoryEntry> result;
    result.reserve(count);
    for (std::size_t i = size_ - count; i < size_; ++i) {
        result.push_back(slots_[(head_ + i) % cap]);
    }
    return result;
}

void HistoryRing::clear() {
    std::fill(slots_.begin(), slots_.end(), HistoryEntry{});
    head_ = 0;
    size_ = 0;
}

} // namespace relay
