/*
 * channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "channel.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace usaxs::device {

auto Channel::readNumber() -> std::optional<double> {
    auto value = read();
    if (!value) {
        return std::nullopt;
    }
    if (const auto* label = std::get_if<std::string>(&*value)) {
        auto labels = enumStrings();
        auto it = std::find(labels.begin(), labels.end(), *label);
        if (it != labels.end()) {
            return static_cast<double>(std::distance(labels.begin(), it));
        }
    }
    return toNumber(*value);
}

auto toNumber(const ChannelValue& value) -> std::optional<double> {
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    const auto& text = std::get<std::string>(value);
    try {
        std::size_t used = 0;
        double number = std::stod(text, &used);
        if (used == 0) {
            return std::nullopt;
        }
        return number;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto toString(const ChannelValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "'" + v + "'";
            } else {
                return std::format("{}", v);
            }
        },
        value);
}

}  // namespace usaxs::device
