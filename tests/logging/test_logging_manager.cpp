/*
 * test_logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for LoggingManager

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/core/logging_manager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace usaxs::logging;
using usaxs::config::LoggingConfig;
using usaxs::config::LogSinkConfig;
using ::testing::Contains;
using ::testing::Not;

class LoggingManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ =
            std::filesystem::temp_directory_path() / "usaxs_logging_test";
        std::filesystem::create_directories(testDir_);

        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
    }

    void TearDown() override {
        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
        std::filesystem::remove_all(testDir_);
    }

    LoggingConfig createTestConfig() {
        LoggingConfig config;
        config.consoleLevel = "warn";
        config.enableFile = true;
        config.logDir = testDir_.string();
        config.logFilename = "test";
        config.fileLevel = "debug";
        config.pattern = "[%l] [%n] %v";
        return config;
    }

    std::string readLog(const std::string& name) {
        std::ifstream file(testDir_ / name);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path testDir_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LoggingManagerTest, SingletonInstance) {
    auto& instance1 = LoggingManager::getInstance();
    auto& instance2 = LoggingManager::getInstance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggingManagerTest, InitializeWithDefaultConfig) {
    auto& manager = LoggingManager::getInstance();

    EXPECT_FALSE(manager.isInitialized());
    manager.initialize(LoggingConfig{});

    EXPECT_TRUE(manager.isInitialized());
    EXPECT_THAT(manager.listSinks(), Contains("console"));
    EXPECT_THAT(manager.listSinks(), Not(Contains("file")));
    EXPECT_EQ(spdlog::default_logger()->name(), "usaxs");
}

TEST_F(LoggingManagerTest, InitializeWithFileSink) {
    auto& manager = LoggingManager::getInstance();

    manager.initialize(createTestConfig());

    EXPECT_THAT(manager.listSinks(), Contains("file"));
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "test.log"));
}

TEST_F(LoggingManagerTest, ShutdownClearsState) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());

    manager.shutdown();

    EXPECT_FALSE(manager.isInitialized());
    EXPECT_TRUE(manager.listSinks().empty());
}

TEST_F(LoggingManagerTest, ReinitializeReplacesSinks) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());

    LoggingConfig consoleOnly;
    manager.initialize(consoleOnly);

    EXPECT_THAT(manager.listSinks(), Not(Contains("file")));
    EXPECT_FALSE(manager.getConfig().enableFile);
}

// ============================================================================
// Loggers
// ============================================================================

TEST_F(LoggingManagerTest, NamedLoggerIsShared) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());

    auto first = manager.getLogger("autoscale");
    auto second = manager.getLogger("autoscale");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "autoscale");
    EXPECT_EQ(first->sinks().size(), 2u);
}

TEST_F(LoggingManagerTest, MessagesReachFileSink) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());

    manager.getLogger("scan")->info("point 7 counted");
    spdlog::debug("default logger message");
    manager.flush();

    auto content = readLog("test.log");
    EXPECT_THAT(content, ::testing::HasSubstr("[info] [scan] point 7 counted"));
    EXPECT_THAT(content, ::testing::HasSubstr("[usaxs] default logger message"));
}

TEST_F(LoggingManagerTest, GlobalLevelFiltersMessages) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());
    auto logger = manager.getLogger("scan");

    manager.setGlobalLevel(spdlog::level::err);
    logger->info("hidden message");
    logger->error("visible message");
    manager.flush();

    auto content = readLog("test.log");
    EXPECT_THAT(content, Not(::testing::HasSubstr("hidden message")));
    EXPECT_THAT(content, ::testing::HasSubstr("visible message"));
}

// ============================================================================
// Sinks
// ============================================================================

TEST_F(LoggingManagerTest, AddAndRemoveSink) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});
    auto logger = manager.getLogger("background");

    LogSinkConfig extra;
    extra.name = "extra";
    extra.type = "file";
    extra.level = "info";
    extra.filePath = (testDir_ / "extra.log").string();

    EXPECT_TRUE(manager.addSink(extra));
    EXPECT_FALSE(manager.addSink(extra));
    EXPECT_THAT(manager.listSinks(), Contains("extra"));
    EXPECT_EQ(logger->sinks().size(), 2u);

    EXPECT_TRUE(manager.removeSink("extra"));
    EXPECT_FALSE(manager.removeSink("extra"));
    EXPECT_EQ(logger->sinks().size(), 1u);
}

TEST_F(LoggingManagerTest, UnknownSinkTypeIsNotAdded) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});

    LogSinkConfig bogus;
    bogus.name = "bogus";
    bogus.type = "carrier_pigeon";
    bogus.level = "info";

    EXPECT_FALSE(manager.addSink(bogus));
}

TEST_F(LoggingManagerTest, AdditionalSinksFromConfig) {
    auto& manager = LoggingManager::getInstance();
    auto config = createTestConfig();
    LogSinkConfig audit;
    audit.name = "audit";
    audit.type = "file";
    audit.level = "warn";
    audit.filePath = (testDir_ / "audit.log").string();
    config.additionalSinks.push_back(audit);

    manager.initialize(config);

    EXPECT_THAT(manager.listSinks(), Contains("audit"));
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "audit.log"));
}

// ============================================================================
// Level names
// ============================================================================

TEST_F(LoggingManagerTest, LevelFromString) {
    EXPECT_EQ(LoggingManager::levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(LoggingManager::levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingManager::levelFromString("fatal"),
              spdlog::level::critical);
    EXPECT_EQ(LoggingManager::levelFromString("err"), spdlog::level::err);
}

TEST_F(LoggingManagerTest, LevelToString) {
    EXPECT_EQ(LoggingManager::levelToString(spdlog::level::info), "info");
    EXPECT_EQ(LoggingManager::levelToString(spdlog::level::warn), "warning");
}
