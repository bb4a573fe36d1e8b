/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for SinkFactory

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/sinks/sink_factory.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace usaxs::logging;
using usaxs::config::LogSinkConfig;

class SinkFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ =
            std::filesystem::temp_directory_path() / "usaxs_sink_factory_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    LogSinkConfig makeConfig(const std::string& type,
                             const std::string& file = "") {
        LogSinkConfig config;
        config.name = type;
        config.type = type;
        config.level = "info";
        if (!file.empty()) {
            config.filePath = (test_dir_ / file).string();
        }
        return config;
    }

    std::filesystem::path test_dir_;
};

// ============================================================================
// Console Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateConsoleSink) {
    auto sink = SinkFactory::createSink(makeConfig("console"));

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::info);
}

TEST_F(SinkFactoryTest, StdoutIsConsoleAlias) {
    EXPECT_NE(SinkFactory::createSink(makeConfig("stdout")), nullptr);
}

TEST_F(SinkFactoryTest, ConsoleSinkWithoutColor) {
    auto sink = SinkFactory::createConsoleSink(spdlog::level::warn, "[%l] %v",
                                               false);

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
}

TEST_F(SinkFactoryTest, LevelNamesAreParsed) {
    auto config = makeConfig("console");

    config.level = "debug";
    EXPECT_EQ(SinkFactory::createSink(config)->level(), spdlog::level::debug);

    config.level = "err";
    EXPECT_EQ(SinkFactory::createSink(config)->level(), spdlog::level::err);
}

// ============================================================================
// File Sink Tests
// ============================================================================

TEST_F(SinkFactoryTest, CreateFileSinkWritesMessages) {
    auto config = makeConfig("file", "basic.log");
    config.pattern = "%v";

    auto sink = SinkFactory::createSink(config);
    ASSERT_NE(sink, nullptr);

    spdlog::logger logger("sink_test", sink);
    logger.info("gain index 3 selected");
    logger.debug("filtered out");
    logger.flush();

    std::ifstream file(config.filePath);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_THAT(content.str(), ::testing::HasSubstr("gain index 3 selected"));
    EXPECT_THAT(content.str(), ::testing::Not(::testing::HasSubstr("filtered")));
}

TEST_F(SinkFactoryTest, BasicFileIsFileAlias) {
    auto config = makeConfig("basic_file", "alias.log");

    EXPECT_NE(SinkFactory::createSink(config), nullptr);
    EXPECT_TRUE(std::filesystem::exists(config.filePath));
}

TEST_F(SinkFactoryTest, FileSinkCreatesParentDirectories) {
    auto config = makeConfig("file", "nested/deeper/scan.log");

    EXPECT_NE(SinkFactory::createSink(config), nullptr);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "nested" / "deeper"));
}

TEST_F(SinkFactoryTest, CreateRotatingFileSink) {
    auto config = makeConfig("rotating_file", "rotating.log");
    config.maxFileSize = 1024;
    config.maxFiles = 2;

    EXPECT_NE(SinkFactory::createSink(config), nullptr);
    EXPECT_TRUE(std::filesystem::exists(config.filePath));
}

TEST_F(SinkFactoryTest, CreateDailyFileSink) {
    auto config = makeConfig("daily_file", "daily.log");
    config.rotationHour = 2;
    config.rotationMinute = 30;

    EXPECT_NE(SinkFactory::createSink(config), nullptr);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST_F(SinkFactoryTest, UnknownTypeReturnsNull) {
    EXPECT_EQ(SinkFactory::createSink(makeConfig("syslog")), nullptr);
}

TEST_F(SinkFactoryTest, UnopenableFileReturnsNull) {
    auto blocker = test_dir_ / "blocker";
    std::ofstream(blocker) << "not a directory";

    LogSinkConfig config = makeConfig("file");
    config.filePath = (blocker / "scan.log").string();

    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}
