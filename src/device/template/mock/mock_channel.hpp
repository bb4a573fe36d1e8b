/*
 * mock_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Mock Channel, Scaler, Positioner and Shutter for testing

*************************************************/

#pragma once

#include "../channel.hpp"
#include "../counting_device.hpp"
#include "../positioner.hpp"
#include "../shutter.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @brief In-memory channel. Writes are logged and may be made to fail.
 */
class MockChannel : public usaxs::device::Channel {
public:
    using WriteHook = std::function<void(const usaxs::device::ChannelValue&)>;

    explicit MockChannel(std::string name,
                         usaxs::device::ChannelValue value = 0.0,
                         std::vector<std::string> enumStrings = {});
    ~MockChannel() override = default;

    auto read() -> std::optional<usaxs::device::ChannelValue> override;
    auto write(const usaxs::device::ChannelValue& value,
               std::chrono::milliseconds timeout) -> bool override;
    auto enumStrings() -> std::vector<std::string> override;

    // Simulation controls
    void set(usaxs::device::ChannelValue value);
    void setEnumStrings(std::vector<std::string> labels);
    void setOnWrite(WriteHook hook);
    void setFailWrites(bool fail);
    void setFailReads(bool fail);
    auto getWrites() const -> std::vector<usaxs::device::ChannelValue>;
    void clearWrites();

private:
    mutable std::mutex mutex_;
    usaxs::device::ChannelValue value_;
    std::vector<std::string> enumStrings_;
    std::vector<usaxs::device::ChannelValue> writes_;
    WriteHook onWrite_;
    bool failWrites_{false};
    bool failReads_{false};
};

/**
 * @brief Scaler whose counts are produced by trigger hooks.
 * elapsedTime() reports the configured preset time.
 */
class MockScaler : public usaxs::device::CountingDevice {
public:
    using TriggerHook = std::function<void(double presetTime)>;

    explicit MockScaler(std::string name = "scaler0");
    ~MockScaler() override = default;

    auto getConfiguration()
        -> std::optional<usaxs::device::CounterConfiguration> override;
    auto configure(const usaxs::device::CounterConfiguration& config)
        -> bool override;
    auto triggerAndWait(std::chrono::milliseconds timeout) -> bool override;
    auto elapsedTime() -> double override;

    // Simulation controls
    void addTriggerHook(TriggerHook hook);
    void setFailTriggers(bool fail);
    void setFailConfigure(bool fail);
    void setFailConfigurationRead(bool fail);
    auto getTriggerCount() const -> int;
    auto getConfigureHistory() const
        -> std::vector<usaxs::device::CounterConfiguration>;
    auto current() const -> usaxs::device::CounterConfiguration;

private:
    mutable std::mutex mutex_;
    usaxs::device::CounterConfiguration config_;
    std::vector<usaxs::device::CounterConfiguration> history_;
    std::vector<TriggerHook> hooks_;
    int triggers_{0};
    bool failTriggers_{false};
    bool failConfigure_{false};
    bool failConfigurationRead_{false};
};

/**
 * @brief Motor that reaches every requested position at once.
 */
class MockPositioner : public usaxs::device::Positioner {
public:
    explicit MockPositioner(std::string name = "ar");
    ~MockPositioner() override = default;

    auto moveTo(double position, std::chrono::milliseconds timeout)
        -> bool override;
    auto getPosition() -> std::optional<double> override;

    void setFailMoves(bool fail);
    auto getMoves() const -> std::vector<double>;

private:
    mutable std::mutex mutex_;
    double position_{0.0};
    std::vector<double> moves_;
    bool failMoves_{false};
};

/**
 * @brief Shutter that changes state at once. Every requested state is
 * logged, including failed requests.
 */
class MockShutter : public usaxs::device::Shutter {
public:
    explicit MockShutter(std::string name = "usaxs_shutter");
    ~MockShutter() override = default;

    auto moveTo(usaxs::device::ShutterState state,
                std::chrono::milliseconds timeout) -> bool override;
    auto getState() -> std::optional<usaxs::device::ShutterState> override;

    void setFailMoves(bool fail);
    auto getRequests() const -> std::vector<usaxs::device::ShutterState>;

private:
    mutable std::mutex mutex_;
    usaxs::device::ShutterState state_{usaxs::device::ShutterState::Closed};
    std::vector<usaxs::device::ShutterState> requests_;
    bool failMoves_{false};
};
