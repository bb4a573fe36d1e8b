/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central Logging Manager - installs the configured sinks and
hands out named loggers sharing them

**************************************************/

#ifndef USAXS_LOGGING_LOGGING_MANAGER_HPP
#define USAXS_LOGGING_LOGGING_MANAGER_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"
#include "logging/sinks/sink_factory.hpp"

namespace usaxs::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Provides:
 * - Console and file sinks built from LoggingConfig via SinkFactory
 * - A default logger, used by the free spdlog:: functions
 * - Named loggers sharing the same sinks
 * - Runtime level changes
 */
class LoggingManager {
public:
    /**
     * @brief Get singleton instance
     */
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration. Calling it again
     * replaces the sinks and loggers.
     */
    void initialize(const config::LoggingConfig& config);

    /**
     * @brief Flush and drop every logger
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set log level for all loggers
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    /**
     * @brief Add a sink to every existing and future logger
     * @return false if the name is taken or the sink cannot be created
     */
    auto addSink(const config::LogSinkConfig& config) -> bool;

    /**
     * @brief Remove a sink by name
     */
    auto removeSink(const std::string& name) -> bool;

    [[nodiscard]] auto listSinks() const -> std::vector<std::string>;

    /**
     * @brief Flush all loggers
     */
    void flush();

    [[nodiscard]] auto getConfig() const -> config::LoggingConfig;

    [[nodiscard]] static auto levelFromString(const std::string& level)
        -> spdlog::level::level_enum;

    [[nodiscard]] static auto levelToString(spdlog::level::level_enum level)
        -> std::string;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    auto makeLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;
    void createConfiguredSinks();
    void setupDefaultLogger();
    void dropLoggers();

    mutable std::shared_mutex mutex_;
    config::LoggingConfig config_;
    bool initialized_{false};

    std::map<std::string, spdlog::sink_ptr> sinks_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}  // namespace usaxs::logging

#endif  // USAXS_LOGGING_LOGGING_MANAGER_HPP
