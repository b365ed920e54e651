/**
 * @file test_memory_monitor.cpp
 * @brief Alert classification, durable records and operation accounting
 */

#include "test_helpers.hpp"
#include "core/MemoryMonitor.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>

using namespace relay;
using namespace relay::testing;

namespace {

std::uint64_t mb(double value) {
    return MemoryMonitor::mb_to_bytes(value);
}

class MemoryMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = monitor_config_in(dir_.path());
        sampler_ = std::make_shared<FakeMemorySampler>();
        sampler_->set_resident_mb(100);
    }

    std::unique_ptr<MemoryMonitor> make_monitor() {
        return std::make_unique<MemoryMonitor>(config_, sampler_);
    }

    std::string log_text() const {
        return read_text(config_.diagnostic_log_path);
    }

    bool log_exists() const {
        return std::filesystem::exists(config_.diagnostic_log_path);
    }

    TempDir dir_;
    MonitorConfig config_;
    std::shared_ptr<FakeMemorySampler> sampler_;
};

class FixedReporter : public StateReporter {
public:
    explicit FixedReporter(SubsystemState state) : state_(state) {}
    SubsystemState report_state() const override { return state_; }

private:
    SubsystemState state_;
};

} // namespace

TEST(MemoryClassificationTest, PrecedenceIsCriticalSpikeHigh) {
    MemoryThresholds t;
    const auto spike = static_cast<std::int64_t>(mb(60));

    EXPECT_EQ(MemoryMonitor::classify(mb(500), spike, t), AlertLevel::Critical);
    EXPECT_EQ(MemoryMonitor::classify(mb(420), spike, t), AlertLevel::Spike);
    EXPECT_EQ(MemoryMonitor::classify(mb(420), 0, t), AlertLevel::High);
    EXPECT_EQ(MemoryMonitor::classify(mb(160), spike, t), AlertLevel::Spike);
    EXPECT_EQ(MemoryMonitor::classify(mb(100), 0, t), AlertLevel::Normal);
}

TEST(MemoryClassificationTest, ThresholdsAreStrict) {
    MemoryThresholds t;
    EXPECT_EQ(MemoryMonitor::classify(mb(400), 0, t), AlertLevel::Normal);
    EXPECT_EQ(MemoryMonitor::classify(mb(480), 0, t), AlertLevel::High);
    EXPECT_EQ(MemoryMonitor::classify(mb(100), static_cast<std::int64_t>(mb(50)), t), AlertLevel::Normal);
    EXPECT_EQ(MemoryMonitor::classify(mb(100), -static_cast<std::int64_t>(mb(200)), t), AlertLevel::Normal);
}

TEST(MemoryClassificationTest, StatusLabels) {
    MemoryThresholds t;
    EXPECT_EQ(MemoryMonitor::status_label(mb(100), t), "LOW");
    EXPECT_EQ(MemoryMonitor::status_label(mb(200), t), "NORMAL");
    EXPECT_EQ(MemoryMonitor::status_label(mb(300), t), "ELEVATED");
    EXPECT_EQ(MemoryMonitor::status_label(mb(400), t), "HIGH");
    EXPECT_EQ(MemoryMonitor::status_label(mb(480), t), "HIGH");
    EXPECT_EQ(MemoryMonitor::status_label(mb(481), t), "CRITICAL");
}

TEST_F(MemoryMonitorTest, NullSamplerIsRejected) {
    EXPECT_THROW(MemoryMonitor(config_, nullptr), std::invalid_argument);
}

TEST_F(MemoryMonitorTest, FirstSampleNeverSpikes) {
    auto monitor = make_monitor();
    sampler_->set_resident_mb(300);

    auto result = monitor->evaluate(sampler_->sample(), "op", "");
    EXPECT_EQ(result.spike_bytes, 0);
    EXPECT_EQ(result.level, AlertLevel::Normal);
    EXPECT_EQ(monitor->previous_resident(), mb(300));
}

TEST_F(MemoryMonitorTest, JumpOfSixtyMegabytesIsASpike) {
    auto monitor = make_monitor();
    sampler_->push_resident_mb(100);
    sampler_->push_resident_mb(160);

    auto first = monitor->evaluate(sampler_->sample(), "download_start", "first");
    auto second = monitor->evaluate(sampler_->sample(), "download_start", "second");

    EXPECT_EQ(first.level, AlertLevel::Normal);
    EXPECT_EQ(second.level, AlertLevel::Spike);
    EXPECT_EQ(second.spike_bytes, static_cast<std::int64_t>(mb(60)));
    // Below the record floor, so only the process log sees it
    EXPECT_FALSE(second.durable_written);
    EXPECT_FALSE(log_exists());
}

TEST_F(MemoryMonitorTest, SpikeAboveFloorIsRecordedWithRecentOperations) {
    auto monitor = make_monitor();
    sampler_->push_resident_mb(320);
    sampler_->push_resident_mb(390);

    monitor->evaluate(sampler_->sample(), "session_create", "alice");
    auto result = monitor->evaluate(sampler_->sample(), "download_start", "big.mkv");

    EXPECT_EQ(result.level, AlertLevel::Spike);
    EXPECT_TRUE(result.durable_written);
    const std::string text = log_text();
    EXPECT_NE(text.find("MEMORY SPIKE: +70.0 MB"), std::string::npos) << text;
    EXPECT_NE(text.find("Recent operations:"), std::string::npos);
    EXPECT_NE(text.find("session_create - 320.0 MB - alice"), std::string::npos);
}

TEST_F(MemoryMonitorTest, HighMemoryWithoutContainerIsDurableButNotCritical) {
    auto monitor = make_monitor();
    sampler_->set_resident_mb(420);

    auto result = monitor->evaluate(sampler_->sample(), "upload_start", "");

    EXPECT_EQ(result.level, AlertLevel::High);
    EXPECT_EQ(result.memory_to_check, mb(420));
    EXPECT_TRUE(result.durable_written);
    const std::string text = log_text();
    EXPECT_NE(text.find("HIGH MEMORY: 420.0 MB"), std::string::npos) << text;
    EXPECT_EQ(text.find("CRITICAL"), std::string::npos) << text;
}

TEST_F(MemoryMonitorTest, ContainerFigureDrivesTheDecision) {
    auto monitor = make_monitor();
    sampler_->set_resident_mb(100);
    sampler_->set_container_mb(420);

    auto result = monitor->evaluate(sampler_->sample(), "download_start", "");

    EXPECT_EQ(result.level, AlertLevel::High);
    EXPECT_EQ(result.memory_to_check, mb(420));
    const std::string text = log_text();
    EXPECT_NE(text.find("Container total: 420.0 MB"), std::string::npos) << text;
    EXPECT_NE(text.find("page cache 320.0 MB"), std::string::npos) << text;
}

TEST_F(MemoryMonitorTest, CriticalIsAlwaysWritten) {
    config_.thresholds.record_floor_mb = 1000;
    auto monitor = make_monitor();
    monitor->evaluate(sampler_->sample(), "session_create", "bob");
    sampler_->set_resident_mb(500);

    auto result = monitor->evaluate(sampler_->sample(), "download_start", "");

    EXPECT_EQ(result.level, AlertLevel::Critical);
    EXPECT_TRUE(result.durable_written);
    const std::string text = log_text();
    EXPECT_NE(text.find(std::string(80, '!')), std::string::npos);
    EXPECT_NE(text.find("CRITICAL MEMORY - CRASH IMMINENT: 500.0 MB / 512.0 MB"), std::string::npos) << text;
    EXPECT_NE(text.find("Last 5 operations before crash:"), std::string::npos);
    EXPECT_NE(text.find("session_create - 100.0 MB - bob"), std::string::npos);
    // The jump from 100 MB is a spike, but spike records are gated by the floor
    EXPECT_EQ(text.find("MEMORY SPIKE"), std::string::npos);
}

TEST_F(MemoryMonitorTest, NormalMemoryWritesNothing) {
    auto monitor = make_monitor();
    sampler_->set_resident_mb(300);

    auto result = monitor->evaluate(sampler_->sample(), labels::kPeriodic, "");
    EXPECT_FALSE(result.durable_written);
    EXPECT_FALSE(log_exists());
}

TEST_F(MemoryMonitorTest, PeriodicCheckAboveFloorLeavesANote) {
    auto monitor = make_monitor();
    sampler_->set_resident_mb(360);

    auto result = monitor->evaluate(sampler_->sample(), labels::kPeriodic, "Interval 300s");
    EXPECT_EQ(result.level, AlertLevel::Normal);
    EXPECT_TRUE(result.durable_written);
    EXPECT_NE(log_text().find("PERIODIC CHECK: 360.0 MB | Sessions: 0"), std::string::npos);
}

TEST_F(MemoryMonitorTest, EveryEvaluationIsRecordedInHistory) {
    auto monitor = make_monitor();
    for (int i = 0; i < 25; ++i) {
        monitor->record_and_evaluate("op" + std::to_string(i), "");
    }

    auto history = monitor->recent_history(100);
    ASSERT_EQ(history.size(), config_.history_capacity);
    EXPECT_EQ(history.front().operation, "op5");
    EXPECT_EQ(history.back().operation, "op24");

    auto peeked = monitor->try_recent_history(3);
    ASSERT_TRUE(peeked.has_value());
    EXPECT_EQ(peeked->size(), 3u);
}

TEST_F(MemoryMonitorTest, NamedOperationsUseTheirLabels) {
    auto monitor = make_monitor();
    monitor->track_download(mib(10), "bob");
    monitor->track_upload(mib(2), "carol");
    monitor->track_session_created("dave");
    monitor->track_session_closed("dave");

    auto history = monitor->recent_history(4);
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].operation, labels::kDownloadStart);
    EXPECT_EQ(history[0].context, "Owner bob | File size: 10.0 MB");
    EXPECT_EQ(history[1].operation, labels::kUploadStart);
    EXPECT_EQ(history[2].operation, labels::kSessionCreate);
    EXPECT_EQ(history[3].operation, labels::kSessionDestroy);
}

TEST_F(MemoryMonitorTest, ReportersFeedApplicationState) {
    auto monitor = make_monitor();
    auto sessions = std::make_shared<FixedReporter>(SubsystemState{5, 3});
    auto queue = std::make_shared<FixedReporter>(SubsystemState{7, 2});
    monitor->register_reporter(Subsystem::Sessions, sessions);
    monitor->register_reporter(Subsystem::DownloadQueue, queue);
    {
        auto cache = std::make_shared<FixedReporter>(SubsystemState{11, 0});
        monitor->register_reporter(Subsystem::Cache, cache);
    }

    ApplicationState state = monitor->collect_state(sampler_->sample());
    EXPECT_EQ(state.active_sessions, 3u);
    EXPECT_EQ(state.queue_size, 7u);
    EXPECT_EQ(state.active_downloads, 2u);
    EXPECT_EQ(state.cached_items, 0u);
    EXPECT_EQ(state.thread_count, 3u);
    EXPECT_EQ(state.open_files, 8u);
}

TEST_F(MemoryMonitorTest, SnapshotIsForcedAndSerializable) {
    auto monitor = make_monitor();
    monitor->track_session_created("erin");
    sampler_->set_resident_mb(250);

    DiagnosticSnapshot snapshot = monitor->get_diagnostic_snapshot();
    EXPECT_EQ(snapshot.status, "NORMAL");
    ASSERT_EQ(snapshot.recent_operations.size(), 1u);

    nlohmann::json j = snapshot;
    EXPECT_EQ(j["status"], "NORMAL");
    EXPECT_DOUBLE_EQ(j["memory"]["resident_mb"].get<double>(), 250.0);
    EXPECT_TRUE(j["memory"]["container_mb"].is_null());
    EXPECT_EQ(j["application_state"]["threads"], 3);
    ASSERT_EQ(j["recent_operations"].size(), 1u);

    // Forced even though 250 MB is below the record floor
    EXPECT_NE(log_text().find("DIAGNOSTIC SNAPSHOT REQUESTED"), std::string::npos);
}

TEST_F(MemoryMonitorTest, OperationScopeRecordsSignificantGrowth) {
    auto monitor = make_monitor();
    sampler_->push_resident_mb(100);
    sampler_->push_resident_mb(130);
    sampler_->set_resident_mb(130);
    {
        OperationScope scope(*monitor, "download", "movie.mkv");
        EXPECT_EQ(scope.resident_at_start(), mb(100));
    }

    auto history = monitor->recent_history(5);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].operation, "download");
    EXPECT_EQ(history[0].context, "After completion (changed +30.0 MB)");
}

TEST_F(MemoryMonitorTest, OperationScopeIgnoresSmallChanges) {
    auto monitor = make_monitor();
    sampler_->push_resident_mb(100);
    sampler_->push_resident_mb(105);
    {
        OperationScope scope(*monitor, "upload");
    }
    EXPECT_TRUE(monitor->recent_history(5).empty());
}

TEST_F(MemoryMonitorTest, OperationScopeLetsExceptionsThrough) {
    auto monitor = make_monitor();
    sampler_->push_resident_mb(100);
    sampler_->push_resident_mb(200);

    EXPECT_THROW({
        OperationScope scope(*monitor, "download");
        throw std::runtime_error("peer went away");
    }, std::runtime_error);

    // The failure path logs only; nothing is evaluated
    EXPECT_TRUE(monitor->recent_history(5).empty());
}

TEST_F(MemoryMonitorTest, DescribeListsStateAndContext) {
    auto monitor = make_monitor();
    MemorySample s = sampler_->sample();
    ApplicationState state;
    state.active_sessions = 2;

    auto lines = monitor->describe(s, state, "download_start", "Owner frank");
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "MEMORY SNAPSHOT | Operation: download_start");
    EXPECT_EQ(lines.back(), "  Context: Owner frank");
}
