/*
 * shutter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-14

Description: Beam shutter opened for autoscale and closed for dark current
measurements

**************************************************/

#ifndef USAXS_DEVICE_TEMPLATE_SHUTTER_HPP
#define USAXS_DEVICE_TEMPLATE_SHUTTER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace usaxs::device {

enum class ShutterState { Open, Closed };

class Shutter {
public:
    explicit Shutter(std::string name) : name_(std::move(name)) {}
    virtual ~Shutter() = default;

    const std::string& getName() const { return name_; }

    /**
     * @brief Move the shutter and wait until it reports the new state.
     * @return false if the move failed or timed out
     */
    virtual auto moveTo(ShutterState state, std::chrono::milliseconds timeout)
        -> bool = 0;
    virtual auto getState() -> std::optional<ShutterState> = 0;

protected:
    std::string name_;
};

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_TEMPLATE_SHUTTER_HPP
