/**
 * @file HistoryRing.hpp
 * @brief Fixed-capacity log of recent memory-relevant operations
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace relay {

/**
 * @brief Compact snapshot of one operation, never mutated after creation
 */
struct HistoryEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string operation;
    std::uint64_t resident_bytes = 0;
    std::string context;

    HistoryEntry() = default;
    HistoryEntry(std::chrono::system_clock::time_point when, std::string op,
                 std::uint64_t resident, std::string ctx)
        : timestamp(when), operation(std::move(op)), resident_bytes(resident), context(std::move(ctx)) {}

    /**
     * @brief "[HH:MM:SS] operation - 123.4 MB - context"
     */
    std::string format() const;
};

/**
 * @brief Ring buffer of HistoryEntry with automatic eviction of the oldest
 *
 * Storage is allocated once at construction. Iteration order is insertion
 * order, oldest first. Not synchronized; the owner serializes access.
 */
class HistoryRing {
public:
    static constexpr std::size_t kDefaultCapacity = 20;

    explicit HistoryRing(std::size_t capacity = kDefaultCapacity);

    /**
     * @brief Append an entry, dropping the oldest one when full
     */
    void record(HistoryEntry entry);

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

    /**
     * @brief All entries, oldest first
     */
    std::vector<HistoryEntry> entries() const { return last(size_); }

    /**
     * @brief The most recent n entries (or fewer), oldest first
     */
    std::vector<HistoryEntry> last(std::size_t n) const;

    void clear();

private:
    std::vector<HistoryEntry> slots_;
    std::size_t head_ = 0;  ///< Index of the oldest entry
    std::size_t size_ = 0;
};

} // namespace relay
