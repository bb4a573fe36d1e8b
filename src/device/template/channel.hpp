/*
 * channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-9

Description: Process-variable style channel used for gain selection,
gain readback, detector counts and background storage

*************************************************/

#ifndef USAXS_DEVICE_TEMPLATE_CHANNEL_HPP
#define USAXS_DEVICE_TEMPLATE_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace usaxs::device {

using ChannelValue = std::variant<double, std::int64_t, std::string>;

/**
 * @brief A single named hardware value.
 *
 * Reads return std::nullopt when the value cannot be obtained. Writes block
 * until the hardware acknowledges the value or the timeout expires and
 * report whether the write completed.
 */
class Channel {
public:
    explicit Channel(std::string name) : name_(std::move(name)) {}
    virtual ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    const std::string& getName() const { return name_; }

    virtual auto read() -> std::optional<ChannelValue> = 0;
    virtual auto write(const ChannelValue& value,
                       std::chrono::milliseconds timeout) -> bool = 0;

    /**
     * @brief Labels of an enumerated channel; empty for scalar channels.
     */
    virtual auto enumStrings() -> std::vector<std::string> { return {}; }

    /**
     * @brief Read the value as a number. Enumerated values read as their
     * index; strings are parsed.
     */
    auto readNumber() -> std::optional<double>;

protected:
    std::string name_;
};

/**
 * @brief Convert a channel value to a number if it holds one.
 */
auto toNumber(const ChannelValue& value) -> std::optional<double>;

/**
 * @brief Human readable rendering of a channel value.
 */
auto toString(const ChannelValue& value) -> std::string;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_TEMPLATE_CHANNEL_HPP
