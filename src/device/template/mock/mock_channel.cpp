/*
 * mock_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_channel.hpp"

using usaxs::device::ChannelValue;
using usaxs::device::CounterConfiguration;
using usaxs::device::ShutterState;

MockChannel::MockChannel(std::string name, ChannelValue value,
                         std::vector<std::string> enumStrings)
    : Channel(std::move(name)),
      value_(std::move(value)),
      enumStrings_(std::move(enumStrings)) {}

auto MockChannel::read() -> std::optional<ChannelValue> {
    std::lock_guard lock(mutex_);
    if (failReads_) {
        return std::nullopt;
    }
    return value_;
}

auto MockChannel::write(const ChannelValue& value,
                        std::chrono::milliseconds /*timeout*/) -> bool {
    WriteHook hook;
    {
        std::lock_guard lock(mutex_);
        writes_.push_back(value);
        if (failWrites_) {
            return false;
        }
        value_ = value;
        hook = onWrite_;
    }
    // Hooks may touch other channels, so run them unlocked
    if (hook) {
        hook(value);
    }
    return true;
}

auto MockChannel::enumStrings() -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return enumStrings_;
}

void MockChannel::set(ChannelValue value) {
    std::lock_guard lock(mutex_);
    value_ = std::move(value);
}

void MockChannel::setEnumStrings(std::vector<std::string> labels) {
    std::lock_guard lock(mutex_);
    enumStrings_ = std::move(labels);
}

void MockChannel::setOnWrite(WriteHook hook) {
    std::lock_guard lock(mutex_);
    onWrite_ = std::move(hook);
}

void MockChannel::setFailWrites(bool fail) {
    std::lock_guard lock(mutex_);
    failWrites_ = fail;
}

void MockChannel::setFailReads(bool fail) {
    std::lock_guard lock(mutex_);
    failReads_ = fail;
}

auto MockChannel::getWrites() const -> std::vector<ChannelValue> {
    std::lock_guard lock(mutex_);
    return writes_;
}

void MockChannel::clearWrites() {
    std::lock_guard lock(mutex_);
    writes_.clear();
}

MockScaler::MockScaler(std::string name) : CountingDevice(std::move(name)) {}

auto MockScaler::getConfiguration() -> std::optional<CounterConfiguration> {
    std::lock_guard lock(mutex_);
    if (failConfigurationRead_) {
        return std::nullopt;
    }
    return config_;
}

auto MockScaler::configure(const CounterConfiguration& config) -> bool {
    std::lock_guard lock(mutex_);
    history_.push_back(config);
    if (failConfigure_) {
        return false;
    }
    config_ = config;
    return true;
}

auto MockScaler::triggerAndWait(std::chrono::milliseconds /*timeout*/)
    -> bool {
    std::vector<TriggerHook> hooks;
    double presetTime = 0.0;
    {
        std::lock_guard lock(mutex_);
        ++triggers_;
        if (failTriggers_) {
            return false;
        }
        hooks = hooks_;
        presetTime = config_.presetTime;
    }
    for (const auto& hook : hooks) {
        hook(presetTime);
    }
    return true;
}

auto MockScaler::elapsedTime() -> double {
    std::lock_guard lock(mutex_);
    return config_.presetTime;
}

void MockScaler::addTriggerHook(TriggerHook hook) {
    std::lock_guard lock(mutex_);
    hooks_.push_back(std::move(hook));
}

void MockScaler::setFailTriggers(bool fail) {
    std::lock_guard lock(mutex_);
    failTriggers_ = fail;
}

void MockScaler::setFailConfigure(bool fail) {
    std::lock_guard lock(mutex_);
    failConfigure_ = fail;
}

void MockScaler::setFailConfigurationRead(bool fail) {
    std::lock_guard lock(mutex_);
    failConfigurationRead_ = fail;
}

auto MockScaler::getTriggerCount() const -> int {
    std::lock_guard lock(mutex_);
    return triggers_;
}

auto MockScaler::getConfigureHistory() const
    -> std::vector<CounterConfiguration> {
    std::lock_guard lock(mutex_);
    return history_;
}

auto MockScaler::current() const -> CounterConfiguration {
    std::lock_guard lock(mutex_);
    return config_;
}

MockPositioner::MockPositioner(std::string name)
    : Positioner(std::move(name)) {}

auto MockPositioner::moveTo(double position,
                            std::chrono::milliseconds /*timeout*/) -> bool {
    std::lock_guard lock(mutex_);
    if (failMoves_) {
        return false;
    }
    position_ = position;
    moves_.push_back(position);
    return true;
}

auto MockPositioner::getPosition() -> std::optional<double> {
    std::lock_guard lock(mutex_);
    return position_;
}

void MockPositioner::setFailMoves(bool fail) {
    std::lock_guard lock(mutex_);
    failMoves_ = fail;
}

auto MockPositioner::getMoves() const -> std::vector<double> {
    std::lock_guard lock(mutex_);
    return moves_;
}

MockShutter::MockShutter(std::string name) : Shutter(std::move(name)) {}

auto MockShutter::moveTo(ShutterState state,
                         std::chrono::milliseconds /*timeout*/) -> bool {
    std::lock_guard lock(mutex_);
    requests_.push_back(state);
    if (failMoves_) {
        return false;
    }
    state_ = state;
    return true;
}

auto MockShutter::getState() -> std::optional<ShutterState> {
    std::lock_guard lock(mutex_);
    return state_;
}

void MockShutter::setFailMoves(bool fail) {
    std::lock_guard lock(mutex_);
    failMoves_ = fail;
}

auto MockShutter::getRequests() const -> std::vector<ShutterState> {
    std::lock_guard lock(mutex_);
    return requests_;
}
