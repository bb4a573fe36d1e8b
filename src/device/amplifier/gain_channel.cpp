/*
 * gain_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gain_channel.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace usaxs::device {

namespace {

constexpr const char* UNDEFINED_LABEL = "UNDEF";
constexpr double MAGNITUDE_TOLERANCE = 1e-9;

auto replaceAll(std::string text, const std::string& from,
                const std::string& to) -> std::string {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

auto parseMagnitude(const std::string& label) -> std::optional<double> {
    auto head = label.substr(0, label.find(' '));
    try {
        std::size_t used = 0;
        double magnitude = std::stod(head, &used);
        if (used != head.size()) {
            return std::nullopt;
        }
        return magnitude;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto labelSuffix(const std::string& label) -> std::string {
    auto space = label.find(' ');
    return space == std::string::npos ? std::string{} : label.substr(space);
}

}  // namespace

auto formatGainLabel(double magnitude) -> std::string {
    // 1e+06 -> 1e6, 1e-03 is kept as is
    auto text = std::format("{:.0e}", magnitude);
    text = replaceAll(text, "+", "");
    return replaceAll(text, "e0", "e");
}

GainChannel::GainChannel(std::shared_ptr<Channel> rangeSelect,
                         RangeWriteForm writeForm)
    : rangeSelect_(std::move(rangeSelect)), writeForm_(writeForm) {
    if (!rangeSelect_) {
        THROW_INVALID_BUNDLE("Gain channel needs a range selection channel");
    }
}

void GainChannel::reset() {
    rangesKnown_ = false;
    labels_.clear();
    magnitudes_.clear();
    suffix_.clear();
}

void GainChannel::ensureRangesKnown() {
    if (rangesKnown_) {
        return;
    }

    std::vector<std::string> labels;
    for (auto& label : rangeSelect_->enumStrings()) {
        if (label != UNDEFINED_LABEL) {
            labels.push_back(std::move(label));
        }
    }
    if (labels.empty()) {
        THROW_CONFIGURATION_ERROR("Channel " + rangeSelect_->getName() +
                                  " reports no gain ranges");
    }

    std::vector<double> magnitudes;
    magnitudes.reserve(labels.size());
    auto suffix = labelSuffix(labels.front());
    for (std::size_t i = 0; i < labels.size(); ++i) {
        auto magnitude = parseMagnitude(labels[i]);
        if (!magnitude) {
            THROW_CONFIGURATION_ERROR(std::format(
                "{}[{}] = '{}', expected a leading gain magnitude",
                rangeSelect_->getName(), i, labels[i]));
        }
        if (labelSuffix(labels[i]) != suffix) {
            THROW_CONFIGURATION_ERROR(std::format(
                "{}[{}] = '{}', expected ending '{}'",
                rangeSelect_->getName(), i, labels[i], suffix));
        }
        magnitudes.push_back(*magnitude);
    }

    labels_ = std::move(labels);
    magnitudes_ = std::move(magnitudes);
    suffix_ = std::move(suffix);
    rangesKnown_ = true;
    spdlog::debug("{}: {} gain ranges with suffix '{}'",
                  rangeSelect_->getName(), labels_.size(), suffix_);
}

auto GainChannel::findMagnitude(double magnitude) const
    -> std::optional<std::uint32_t> {
    for (std::size_t i = 0; i < magnitudes_.size(); ++i) {
        double scale = std::max(std::abs(magnitudes_[i]), 1.0);
        if (std::abs(magnitudes_[i] - magnitude) <= MAGNITUDE_TOLERANCE * scale) {
            return static_cast<std::uint32_t>(i);
        }
    }
    return std::nullopt;
}

auto GainChannel::resolve(const GainTarget& target) -> std::uint32_t {
    ensureRangesKnown();
    const auto count = labels_.size();

    if (const auto* label = std::get_if<std::string>(&target)) {
        auto it = std::find(labels_.begin(), labels_.end(), *label);
        if (it == labels_.end()) {
            rejectTarget("'" + *label + "'");
        }
        return static_cast<std::uint32_t>(std::distance(labels_.begin(), it));
    }

    if (const auto* index = std::get_if<std::uint32_t>(&target)) {
        if (*index >= count) {
            rejectTarget(std::to_string(*index));
        }
        return *index;
    }

    double value = std::get<double>(target);
    if (value > static_cast<double>(count)) {
        // A magnitude, not an index
        auto canonical = formatGainLabel(value) + suffix_;
        auto it = std::find(labels_.begin(), labels_.end(), canonical);
        if (it != labels_.end()) {
            return static_cast<std::uint32_t>(
                std::distance(labels_.begin(), it));
        }
    } else if (value >= 0 && std::floor(value) == value &&
               value < static_cast<double>(count)) {
        return static_cast<std::uint32_t>(value);
    }
    if (auto index = findMagnitude(value)) {
        return *index;
    }
    rejectTarget(std::format("{}", value));
}

auto GainChannel::setGain(const GainTarget& target,
                          std::chrono::milliseconds timeout) -> bool {
    auto index = resolve(target);
    ChannelValue value = writeForm_ == RangeWriteForm::Index
                             ? ChannelValue{static_cast<std::int64_t>(index)}
                             : ChannelValue{labels_[index]};
    spdlog::debug("{}: set gain range {} ({})", rangeSelect_->getName(),
                  index, labels_[index]);
    return rangeSelect_->write(value, timeout);
}

auto GainChannel::getRangeCount() -> std::size_t {
    ensureRangesKnown();
    return labels_.size();
}

auto GainChannel::getLabels() -> const std::vector<std::string>& {
    ensureRangesKnown();
    return labels_;
}

auto GainChannel::getMagnitudes() -> const std::vector<double>& {
    ensureRangesKnown();
    return magnitudes_;
}

auto GainChannel::getSuffix() -> const std::string& {
    ensureRangesKnown();
    return suffix_;
}

auto GainChannel::getAcceptableValues() -> std::vector<std::string> {
    ensureRangesKnown();
    std::vector<std::string> values;
    values.reserve(labels_.size() * 3);
    for (const auto& label : labels_) {
        values.push_back("'" + label + "'");
    }
    for (double magnitude : magnitudes_) {
        values.push_back(std::format("{}", magnitude));
    }
    for (std::size_t i = 0; i < labels_.size(); ++i) {
        values.push_back(std::to_string(i));
    }
    return values;
}

void GainChannel::rejectTarget(const std::string& rendered) {
    std::string accepted;
    for (const auto& value : getAcceptableValues()) {
        if (!accepted.empty()) {
            accepted += ", ";
        }
        accepted += value;
    }
    THROW_INVALID_GAIN("could not set gain to " + rendered +
                       ", must be one of these: " + accepted);
}

}  // namespace usaxs::device
