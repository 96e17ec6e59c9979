// MATEICO - Logging Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include <gtest/gtest.h>

#include "mateico/util/logging.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <unistd.h>

namespace mateico {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Trace);
        logger.EnableAllCategories();

        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        logger.AddSink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Level Tests
// ============================================================================

TEST(LogLevelTest, ToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("verbose"), LogLevel::Info);
}

// ============================================================================
// Logger Tests
// ============================================================================

TEST_F(LoggingTest, SinksReceiveEntries) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);

    Logger::Instance().Log(LogLevel::Info, LogCategory::STAKING, "pool created", "src/a.cpp", 7);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::STAKING);
    EXPECT_EQ(entries_[0].message, "pool created");
    EXPECT_EQ(entries_[0].file, "src/a.cpp");
    EXPECT_EQ(entries_[0].line, 7);

    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    Logger::Instance().Log(LogLevel::Info, LogCategory::STAKING, "dropped");
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, GlobalLevelFilters) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::TOKEN));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Error, LogCategory::TOKEN));
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Off, LogCategory::TOKEN));

    LOG_INFO(LogCategory::TOKEN) << "hidden";
    LOG_WARN(LogCategory::TOKEN) << "shown " << 42;
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown 42");
}

TEST_F(LoggingTest, SinkLevelFilters) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DB) << "below sink level";
    LOG_ERROR(LogCategory::DB) << "at sink level";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Error);
}

TEST_F(LoggingTest, CategoryFilter) {
    Logger& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::VESTING);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VESTING));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::STAKING));

    LOG_INFO(LogCategory::STAKING) << "filtered";
    LOG_INFO(LogCategory::VESTING) << "kept";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, LogCategory::VESTING);

    logger.DisableCategory(LogCategory::VESTING);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VESTING));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::STAKING));
}

TEST_F(LoggingTest, PrintfStyle) {
    LogInfoF(LogCategory::STAKING, "pool %d reserve %s", 3, "0.1");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "pool 3 reserve 0.1");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_logging.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, FileSinkAppends) {
    char filename[] = "/tmp/mateico_log_test_XXXXXX";
    int fd = mkstemp(filename);
    ASSERT_GE(fd, 0);
    close(fd);

    {
        auto file = std::make_shared<FileSink>(filename, LogLevel::Info);
        ASSERT_TRUE(file->IsOpen());
        EXPECT_EQ(file->GetPath(), filename);
        Logger::Instance().AddSink(file);

        LOG_DEBUG(LogCategory::DB) << "too detailed";
        LOG_INFO(LogCategory::DB) << "snapshot saved";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(file);
    }

    std::ifstream in(filename);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::remove(filename);

    EXPECT_NE(content.find("[INFO] [db] snapshot saved"), std::string::npos);
    EXPECT_EQ(content.find("too detailed"), std::string::npos);
    EXPECT_NE(content.find("test_logging.cpp:"), std::string::npos);
}

TEST(FileSinkTest, OpenFailure) {
    FileSink sink;
    EXPECT_FALSE(sink.IsOpen());
    EXPECT_FALSE(sink.Open("/nonexistent/dir/mateico.log"));
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST(LoggingUtilTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/staking.cpp"), "staking.cpp");
    EXPECT_EQ(GetBasename("C:\\src\\vesting.cpp"), "vesting.cpp");
    EXPECT_EQ(GetBasename("token.cpp"), "token.cpp");
}

TEST(LoggingUtilTest, FormatLogTimestamp) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    std::string text = FormatLogTimestamp(tp);
    // Local time zone, so only the shape and milliseconds are fixed
    ASSERT_EQ(text.size(), 23u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text.substr(19), ".123");
}

} // namespace test
} // namespace util
} // namespace mateico
