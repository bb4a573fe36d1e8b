/*
 * counting_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Scaler (counting device) shared by several detector channels

*************************************************/

#ifndef USAXS_DEVICE_TEMPLATE_COUNTING_DEVICE_HPP
#define USAXS_DEVICE_TEMPLATE_COUNTING_DEVICE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <string_view>

namespace usaxs::device {

enum class CountMode { OneShot, AutoCount };

[[nodiscard]] inline std::string_view countModeToString(CountMode mode) {
    switch (mode) {
        case CountMode::OneShot: return "OneShot";
        case CountMode::AutoCount: return "AutoCount";
    }
    return "OneShot";
}

/**
 * @brief Counting parameters of a scaler.
 */
struct CounterConfiguration {
    double presetTime{1.0};  ///< Count time in seconds
    double delay{0.0};       ///< Extra delay before counting starts
    CountMode mode{CountMode::AutoCount};

    bool operator==(const CounterConfiguration&) const = default;
};

/**
 * @brief Counting hardware shared by several detector bundles.
 *
 * Only one operation may be in flight on a device. Callers that issue a
 * sequence of operations hold getOperationMutex() for its duration.
 */
class CountingDevice {
public:
    explicit CountingDevice(std::string name) : name_(std::move(name)) {}
    virtual ~CountingDevice() = default;

    CountingDevice(const CountingDevice&) = delete;
    CountingDevice& operator=(const CountingDevice&) = delete;

    const std::string& getName() const { return name_; }

    virtual auto getConfiguration() -> std::optional<CounterConfiguration> = 0;
    virtual auto configure(const CounterConfiguration& config) -> bool = 0;

    /**
     * @brief Start one count and wait for it to finish.
     * @return false if the count failed or did not finish within timeout.
     */
    virtual auto triggerAndWait(std::chrono::milliseconds timeout) -> bool = 0;

    /**
     * @brief Duration of the last count in seconds.
     */
    virtual auto elapsedTime() -> double = 0;

    auto getOperationMutex() -> std::mutex& { return operationMutex_; }

protected:
    std::string name_;

private:
    std::mutex operationMutex_;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_TEMPLATE_COUNTING_DEVICE_HPP
