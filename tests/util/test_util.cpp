// VINDEX - Util Module Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include <vindex/util/logging.h>
#include <vindex/util/time.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace vindex {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Trace);

        captured_.clear();
        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            captured_.push_back(entry);
        });
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::vector<LogEntry> captured_;
    std::shared_ptr<CallbackSink> sink_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("fatal"), LogLevel::Fatal);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    auto extra = std::make_shared<CallbackSink>([](const LogEntry&) {});
    Logger::Instance().AddSink(extra);
    EXPECT_EQ(Logger::Instance().SinkCount(), 2u);
    Logger::Instance().RemoveSink(extra);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::LEDGER) << "block " << 7 << " committed";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_EQ(captured_[0].category, "ledger");
    EXPECT_EQ(captured_[0].message, "block 7 committed");
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacroFormats) {
    LogWarnF(LogCategory::STAKING, "%s has %d positions", "alice", 3);

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Warn);
    EXPECT_EQ(captured_[0].message, "alice has 3 positions");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);

    LOG_DEBUG(LogCategory::DEFAULT) << "hidden";
    LOG_INFO(LogCategory::DEFAULT) << "hidden";
    LOG_ERROR(LogCategory::DEFAULT) << "shown";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "shown");
}

TEST_F(LoggingTest, MessagesBelowLevelAreNotFormatted) {
    Logger::Instance().SetLevel(LogLevel::Error);

    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };
    LOG_DEBUG(LogCategory::DEFAULT) << count();

    EXPECT_EQ(evaluations, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::MEMPOOL);

    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled("mempool"));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled("swap"));

    LOG_INFO(LogCategory::SWAP) << "filtered";
    LOG_INFO(LogCategory::MEMPOOL) << "kept";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].category, "mempool");
}

TEST_F(LoggingTest, SinkLevel) {
    sink_->SetLevel(LogLevel::Error);
    EXPECT_EQ(sink_->GetLevel(), LogLevel::Error);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Info;
    entry.category = "ledger";
    entry.message = "hello";
    entry.timestampMs = 1704067200123;

    EXPECT_EQ(FormatLogEntry(entry), "2024-01-01T00:00:00.123Z [INFO ] [ledger] hello");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogEntry(entry), "2024-01-01T00:00:00.123Z [INFO ] hello");
}

TEST_F(LoggingTest, FileSinkAppends) {
    const std::string path = "/tmp/vindex_logging_test.log";
    std::remove(path.c_str());
    {
        auto fileSink = std::make_shared<FileSink>(path, true);
        ASSERT_TRUE(fileSink->IsOpen());
        EXPECT_EQ(fileSink->GetPath(), path);
        Logger::Instance().AddSink(fileSink);
        LOG_INFO(LogCategory::CONFIG) << "written to file";
        Logger::Instance().RemoveSink(fileSink);
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_NE(line.find("[config] written to file"), std::string::npos);
    std::remove(path.c_str());
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTimeMillis) {
    int64_t millis = GetTimeMillis();
    EXPECT_GT(millis, 1704067200000);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    SetMockTimeMillis(1000000);
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTimeMillis(), 1000000);

    AdvanceMockTime(Milliseconds{2500});
    EXPECT_EQ(GetMockTimeMillis(), 1002500);
    EXPECT_EQ(GetTimeMillis(), 1002500);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTimeMillis(), 1002500);
}

TEST_F(TimeTest, EnableMockTimeFreezesClock) {
    EnableMockTime();
    int64_t first = GetTimeMillis();
    EXPECT_GT(first, 0);
    EXPECT_EQ(GetTimeMillis(), first);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601Millis(1704067200123), "2024-01-01T00:00:00.123Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDurationMillis(0), "0s");
    EXPECT_EQ(FormatDurationMillis(1500), "1.500s");
    EXPECT_EQ(FormatDurationMillis(MILLIS_PER_DAY + 2 * MILLIS_PER_HOUR +
                                   3 * MILLIS_PER_MINUTE + 4500),
              "1d 2h 3m 4.500s");
    EXPECT_EQ(FormatDurationMillis(7 * MILLIS_PER_DAY), "7d");
}

TEST_F(TimeTest, TimerFollowsSteadyClock) {
    Timer timer;
    EXPECT_GE(timer.ElapsedMillis(), 0);
    timer.Reset();
    EXPECT_GE(timer.ElapsedMillis(), 0);
}

} // namespace
} // namespace util
} // namespace vindex
