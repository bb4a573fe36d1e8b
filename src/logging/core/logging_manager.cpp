/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <filesystem>

#include <spdlog/async.h>

namespace usaxs::logging {

namespace {

constexpr const char* DEFAULT_LOGGER = "usaxs";

}  // namespace

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const config::LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        dropLoggers();
        sinks_.clear();
    }

    config_ = config;

    if (config_.asyncMode) {
        spdlog::init_thread_pool(config_.asyncQueueSize,
                                 config_.asyncThreadCount);
    }

    createConfiguredSinks();
    setupDefaultLogger();

    initialized_ = true;
    spdlog::debug("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::createConfiguredSinks() {
    if (config_.enableConsole) {
        sinks_["console"] = SinkFactory::createConsoleSink(
            levelFromString(config_.consoleLevel), config_.pattern,
            config_.consoleColor);
    }

    if (config_.enableFile) {
        auto path = (std::filesystem::path(config_.logDir) /
                     (config_.logFilename + ".log"))
                        .string();
        config::LogSinkConfig file;
        file.name = "file";
        file.type = config_.useDailyRotation ? "daily_file" : "rotating_file";
        file.level = config_.fileLevel;
        file.pattern = config_.pattern;
        file.filePath = path;
        file.maxFileSize = config_.maxFileSize;
        file.maxFiles = config_.maxFiles;
        file.rotationHour = config_.rotationHour;
        file.rotationMinute = config_.rotationMinute;
        if (auto sink = SinkFactory::createSink(file)) {
            sinks_["file"] = sink;
        }
    }

    for (const auto& sinkConfig : config_.additionalSinks) {
        if (sinks_.contains(sinkConfig.name)) {
            spdlog::warn("Sink '{}' already exists", sinkConfig.name);
            continue;
        }
        if (auto sink = SinkFactory::createSink(sinkConfig)) {
            sinks_[sinkConfig.name] = sink;
        }
    }
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    dropLoggers();
    sinks_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::makeLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinkList;
    for (const auto& [sinkName, sink] : sinks_) {
        sinkList.push_back(sink);
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config_.asyncMode) {
        logger = std::make_shared<spdlog::async_logger>(
            name, sinkList.begin(), sinkList.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinkList.begin(),
                                                  sinkList.end());
    }
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    loggers_[name] = logger;
    return logger;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    auto logger = makeLogger(name);
    spdlog::register_logger(logger);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    for (const auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::info("Global log level set to {}",
                 spdlog::level::to_string_view(level));
}

auto LoggingManager::addSink(const config::LogSinkConfig& config) -> bool {
    std::unique_lock lock(mutex_);

    if (sinks_.contains(config.name)) {
        spdlog::warn("Sink '{}' already exists", config.name);
        return false;
    }

    auto sink = SinkFactory::createSink(config);
    if (!sink) {
        return false;
    }

    sinks_[config.name] = sink;
    for (const auto& [name, logger] : loggers_) {
        logger->sinks().push_back(sink);
    }

    spdlog::info("Sink '{}' added", config.name);
    return true;
}

auto LoggingManager::removeSink(const std::string& name) -> bool {
    std::unique_lock lock(mutex_);

    auto it = sinks_.find(name);
    if (it == sinks_.end()) {
        return false;
    }

    auto sink = it->second;
    sinks_.erase(it);
    for (const auto& [loggerName, logger] : loggers_) {
        auto& sinks = logger->sinks();
        std::erase(sinks, sink);
    }

    spdlog::info("Sink '{}' removed", name);
    return true;
}

auto LoggingManager::listSinks() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, sink] : sinks_) {
        names.push_back(name);
    }
    return names;
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

auto LoggingManager::getConfig() const -> config::LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::setupDefaultLogger() {
    auto logger = makeLogger(DEFAULT_LOGGER);
    spdlog::set_default_logger(logger);
}

void LoggingManager::dropLoggers() {
    for (const auto& [name, logger] : loggers_) {
        if (name != DEFAULT_LOGGER) {
            spdlog::drop(name);
        }
    }
    loggers_.clear();
}

auto LoggingManager::levelFromString(const std::string& level)
    -> spdlog::level::level_enum {
    if (level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "fatal") {
        return spdlog::level::critical;
    }
    return spdlog::level::from_str(level);
}

auto LoggingManager::levelToString(spdlog::level::level_enum level)
    -> std::string {
    auto name = spdlog::level::to_string_view(level);
    return std::string(name.data(), name.size());
}

}  // namespace usaxs::logging
