/*
 * counter_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "counter_guard.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace usaxs::device {

namespace {

auto readConfiguration(CountingDevice& counter) -> CounterConfiguration {
    auto config = counter.getConfiguration();
    if (!config) {
        THROW_HARDWARE_ERROR("Cannot read configuration of " +
                             counter.getName());
    }
    return *config;
}

}  // namespace

CounterStateGuard::CounterStateGuard(CountingDevice& counter)
    : counter_(counter), original_(readConfiguration(counter)) {}

CounterStateGuard::~CounterStateGuard() {
    if (!restored_ && !restore()) {
        spdlog::error("{}: failed to restore preset time {} s, delay {} s, "
                      "mode {}",
                      counter_.getName(), original_.presetTime,
                      original_.delay, countModeToString(original_.mode));
    }
}

auto CounterStateGuard::restore() -> bool {
    if (restored_) {
        return true;
    }
    restored_ = true;
    return counter_.configure(original_);
}

}  // namespace usaxs::device
