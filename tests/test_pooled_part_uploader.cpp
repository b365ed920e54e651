/**
 * @file test_pooled_part_uploader.cpp
 * @brief Worker pool upload: ordering, progress and failure propagation
 */

#include "test_helpers.hpp"
#include "core/PooledPartUploader.hpp"
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>

using namespace relay;
using namespace relay::testing;

namespace {

constexpr std::size_t kPart = 64 * 1024;

} // namespace

TEST(PooledPartUploaderTest, UploadsEveryPartOnce) {
    TempDir dir;
    const auto payload = pattern_bytes(10 * kPart + 17);
    write_file(dir / "clip.mov", payload);
    auto sink = std::make_shared<RecordingPartSink>();
    auto advisor = std::make_shared<RecordingCacheAdvisor>();
    PooledPartUploader uploader(sink, 4, kPart, advisor);

    std::mutex calls_mutex;
    std::vector<std::uint64_t> reported;
    UploadHandle handle = uploader.upload_file(dir / "clip.mov", payload.size(),
        [&](std::uint64_t done, std::uint64_t total) {
            std::lock_guard<std::mutex> lock(calls_mutex);
            EXPECT_EQ(total, payload.size());
            reported.push_back(done);
        });

    EXPECT_EQ(handle.parts, 11u);
    EXPECT_EQ(handle.size, payload.size());
    EXPECT_EQ(sink->name(), "clip.mov");
    EXPECT_EQ(sink->part_size(), kPart);
    EXPECT_EQ(sink->assembled(), payload);
    EXPECT_EQ(sink->part_sizes().at(10), 17u);

    ASSERT_EQ(reported.size(), 11u);
    for (std::size_t i = 1; i < reported.size(); ++i) {
        EXPECT_GT(reported[i], reported[i - 1]);
    }
    EXPECT_EQ(reported.back(), payload.size());
    EXPECT_EQ(advisor->total_length(), payload.size());
}

TEST(PooledPartUploaderTest, SinglePartFileUsesOneWorker) {
    TempDir dir;
    const auto payload = pattern_bytes(100);
    write_file(dir / "tiny.bin", payload);
    auto sink = std::make_shared<RecordingPartSink>();
    PooledPartUploader uploader(sink, 8, kPart);

    UploadHandle handle = uploader.upload_file(dir / "tiny.bin", payload.size(), {});
    EXPECT_EQ(handle.parts, 1u);
    EXPECT_EQ(sink->assembled(), payload);
}

TEST(PooledPartUploaderTest, EmptyFileFinishesWithoutParts) {
    TempDir dir;
    write_file(dir / "empty.bin", {});
    auto sink = std::make_shared<RecordingPartSink>();
    PooledPartUploader uploader(sink, 4, kPart);

    UploadHandle handle = uploader.upload_file(dir / "empty.bin", 0, {});
    EXPECT_EQ(handle.parts, 0u);
    EXPECT_TRUE(sink->finished());
}

TEST(PooledPartUploaderTest, FirstFailureIsRethrownAndStopsTheUpload) {
    TempDir dir;
    write_file(dir / "clip.mov", pattern_bytes(20 * kPart));
    auto sink = std::make_shared<RecordingPartSink>();
    sink->fail_on_part(3);
    PooledPartUploader uploader(sink, 4, kPart);

    try {
        uploader.upload_file(dir / "clip.mov", 20 * kPart, {});
        FAIL() << "expected the part failure to propagate";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "part 3 rejected");
    }
    EXPECT_FALSE(sink->finished());
    EXPECT_EQ(sink->part_sizes().count(3), 0u);
}

TEST(PooledPartUploaderTest, FileShorterThanDeclaredSizeFails) {
    TempDir dir;
    write_file(dir / "short.bin", pattern_bytes(kPart));
    auto sink = std::make_shared<RecordingPartSink>();
    PooledPartUploader uploader(sink, 2, kPart);

    EXPECT_THROW(uploader.upload_file(dir / "short.bin", 3 * kPart, {}), std::runtime_error);
    EXPECT_FALSE(sink->finished());
}

TEST(PooledPartUploaderTest, MissingFileIsSystemError) {
    TempDir dir;
    PooledPartUploader uploader(std::make_shared<RecordingPartSink>(), 2, kPart);
    EXPECT_THROW(uploader.upload_file(dir / "missing.bin", 10, {}), std::system_error);
}

TEST(PooledPartUploaderTest, ConstructorValidatesArguments) {
    auto sink = std::make_shared<RecordingPartSink>();
    EXPECT_THROW(PooledPartUploader(nullptr, 4, kPart), std::invalid_argument);
    EXPECT_THROW(PooledPartUploader(sink, 0, kPart), std::invalid_argument);
    EXPECT_THROW(PooledPartUploader(sink, 4, 0), std::invalid_argument);
    EXPECT_THROW(PooledPartUploader(sink, 4, kProtocolMaxPartSize + 1), std::invalid_argument);
    EXPECT_NO_THROW(PooledPartUploader(sink, 4, kProtocolMaxPartSize));
}

TEST(UploaderCapabilityTest, NullUploaderIsUnavailable) {
    auto capability = UploaderCapability::Available(nullptr);
    EXPECT_FALSE(capability.available());
    EXPECT_FALSE(capability.reason().empty());

    auto unavailable = UploaderCapability::Unavailable("library missing");
    EXPECT_FALSE(unavailable.available());
    EXPECT_EQ(unavailable.reason(), "library missing");
}
