/**
 * @file test_history_ring.cpp
 * @brief Bounded operation history
 */

#include "core/HistoryRing.hpp"
#include <gtest/gtest.h>

using namespace relay;

namespace {

HistoryEntry entry(int i) {
    return HistoryEntry(std::chrono::system_clock::now(), "op" + std::to_string(i),
                        static_cast<std::uint64_t>(i) * 1024 * 1024, "ctx " + std::to_string(i));
}

} // namespace

TEST(HistoryRingTest, KeepsTheLastTwentyOldestFirst) {
    HistoryRing ring;
    for (int i = 1; i <= 25; ++i) {
        ring.record(entry(i));
    }

    ASSERT_EQ(ring.size(), HistoryRing::kDefaultCapacity);
    auto entries = ring.entries();
    ASSERT_EQ(entries.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(entries[static_cast<std::size_t>(i)].operation, "op" + std::to_string(i + 6));
    }
}

TEST(HistoryRingTest, LastReturnsMostRecentInInsertionOrder) {
    HistoryRing ring(5);
    for (int i = 1; i <= 7; ++i) {
        ring.record(entry(i));
    }

    auto recent = ring.last(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].operation, "op5");
    EXPECT_EQ(recent[1].operation, "op6");
    EXPECT_EQ(recent[2].operation, "op7");

    EXPECT_EQ(ring.last(50).size(), 5u);
    EXPECT_TRUE(ring.last(0).empty());
}

TEST(HistoryRingTest, PartiallyFilledRing) {
    HistoryRing ring(4);
    EXPECT_TRUE(ring.empty());
    ring.record(entry(1));
    ring.record(entry(2));

    auto entries = ring.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.front().operation, "op1");
    EXPECT_EQ(entries.back().operation, "op2");
}

TEST(HistoryRingTest, ClearEmptiesTheRing) {
    HistoryRing ring(3);
    for (int i = 0; i < 5; ++i) {
        ring.record(entry(i));
    }
    ring.clear();
    EXPECT_TRUE(ring.empty());
    EXPECT_TRUE(ring.entries().empty());

    ring.record(entry(9));
    ASSERT_EQ(ring.entries().size(), 1u);
    EXPECT_EQ(ring.entries().front().operation, "op9");
}

TEST(HistoryRingTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(HistoryRing(0), std::invalid_argument);
}

TEST(HistoryEntryTest, FormatShowsOperationMemoryAndContext) {
    HistoryEntry e(std::chrono::system_clock::now(), "download_start", 150ull * 1024 * 1024, "Owner alice");
    const std::string text = e.format();
    EXPECT_NE(text.find("download_start - 150.0 MB - Owner alice"), std::string::npos) << text;
    EXPECT_EQ(text.front(), '[');
}

TEST(HistoryEntryTest, FormatFillsBlanks) {
    HistoryEntry e(std::chrono::system_clock::now(), "", 0, "");
    const std::string text = e.format();
    EXPECT_NE(text.find("General - 0.0 MB - N/A"), std::string::npos) << text;
}
