/*
 * counter_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef USAXS_DEVICE_AMPLIFIER_COUNTER_GUARD_HPP
#define USAXS_DEVICE_AMPLIFIER_COUNTER_GUARD_HPP

#include "device/template/counting_device.hpp"

namespace usaxs::device {

/**
 * @class CounterStateGuard
 * @brief Restores a counting device's preset time, delay and count mode.
 *
 * The configuration is captured on construction. restore() puts it back and
 * is called explicitly on the normal path; the destructor restores on every
 * other path and only logs a failure.
 */
class CounterStateGuard {
public:
    /**
     * @throw HardwareError if the configuration cannot be read.
     */
    explicit CounterStateGuard(CountingDevice& counter);
    ~CounterStateGuard();

    CounterStateGuard(const CounterStateGuard&) = delete;
    CounterStateGuard& operator=(const CounterStateGuard&) = delete;

    [[nodiscard]] auto getOriginal() const -> const CounterConfiguration& {
        return original_;
    }

    /**
     * @brief Put the original configuration back. Only the first call
     * writes to the device.
     */
    auto restore() -> bool;

private:
    CountingDevice& counter_;
    CounterConfiguration original_;
    bool restored_{false};
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_COUNTER_GUARD_HPP
