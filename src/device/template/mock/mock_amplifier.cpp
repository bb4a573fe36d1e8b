/*
 * mock_amplifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_amplifier.hpp"

#include <algorithm>
#include <cmath>

using usaxs::device::AutorangeMode;
using usaxs::device::autorangeModeToString;
using usaxs::device::BackgroundSlot;
using usaxs::device::BundleChannels;
using usaxs::device::BundlePtr;
using usaxs::device::ChannelValue;
using usaxs::device::DetectorControlBundle;
using usaxs::device::RangeWriteForm;

MockAutorangeAmplifier::MockAutorangeAmplifier(
    std::string nickname, std::shared_ptr<MockScaler> scaler,
    double photocurrent, std::vector<std::string> labels)
    : nickname_(std::move(nickname)),
      scaler_(std::move(scaler)),
      labels_(std::move(labels)),
      photocurrent_(photocurrent) {
    for (const auto& label : labels_) {
        magnitudes_.push_back(std::stod(label));
    }

    signal_ = std::make_shared<MockChannel>(nickname_ + "_signal", 0.0);
    readback_ = std::make_shared<MockChannel>(
        nickname_ + "_gain", ChannelValue{std::int64_t{0}}, labels_);
    rangeSelect_ = std::make_shared<MockChannel>(
        nickname_ + "_reqrange", ChannelValue{std::int64_t{0}}, labels_);
    mode_ = std::make_shared<MockChannel>(
        nickname_ + "_mode",
        ChannelValue{std::string(autorangeModeToString(AutorangeMode::Manual))},
        std::vector<std::string>{"automatic", "auto+background", "manual"});
    for (std::size_t i = 0; i < labels_.size(); ++i) {
        auto suffix = nickname_ + "_bkg" + std::to_string(i);
        slots_.push_back(BackgroundSlot{
            std::make_shared<MockChannel>(suffix),
            std::make_shared<MockChannel>(suffix + "_err")});
    }

    rangeSelect_->setOnWrite(
        [this](const ChannelValue& value) { onRangeWrite(value); });
    scaler_->addTriggerHook(
        [this](double presetTime) { onTrigger(presetTime); });
}

auto MockAutorangeAmplifier::defaultLabels() -> std::vector<std::string> {
    return {"1e4 V/A", "1e5 V/A", "1e6 V/A", "1e7 V/A", "1e8 V/A"};
}

auto MockAutorangeAmplifier::makeBundle(RangeWriteForm writeForm,
                                        double settlingTime,
                                        double maxCountRate) -> BundlePtr {
    BundleChannels channels;
    channels.signal = signal_;
    channels.gainReadback = readback_;
    channels.rangeSelect = rangeSelect_;
    channels.mode = mode_;
    channels.backgroundSlots = slots_;
    return std::make_shared<DetectorControlBundle>(
        nickname_, scaler_, std::move(channels), writeForm, settlingTime,
        maxCountRate);
}

void MockAutorangeAmplifier::setPhotocurrent(double amperes) {
    std::lock_guard lock(mutex_);
    photocurrent_ = amperes;
}

void MockAutorangeAmplifier::setDarkRate(double base, double perRange) {
    std::lock_guard lock(mutex_);
    darkBase_ = base;
    darkPerRange_ = perRange;
}

void MockAutorangeAmplifier::setGainIndex(std::uint32_t index) {
    {
        std::lock_guard lock(mutex_);
        index_ = std::min<std::uint32_t>(
            index, static_cast<std::uint32_t>(magnitudes_.size() - 1));
    }
    publishGain();
}

auto MockAutorangeAmplifier::getGainIndex() const -> std::uint32_t {
    std::lock_guard lock(mutex_);
    return index_;
}

auto MockAutorangeAmplifier::autorangeEnabled() const -> bool {
    auto value = mode_->read();
    if (!value) {
        return false;
    }
    if (const auto* text = std::get_if<std::string>(&*value)) {
        return *text != autorangeModeToString(AutorangeMode::Manual);
    }
    return false;
}

void MockAutorangeAmplifier::publishGain() {
    readback_->set(ChannelValue{static_cast<std::int64_t>(getGainIndex())});
}

void MockAutorangeAmplifier::onRangeWrite(const ChannelValue& value) {
    std::optional<std::uint32_t> index;
    if (const auto* label = std::get_if<std::string>(&value)) {
        auto it = std::find(labels_.begin(), labels_.end(), *label);
        if (it != labels_.end()) {
            index = static_cast<std::uint32_t>(it - labels_.begin());
        }
    } else if (auto number = usaxs::device::toNumber(value)) {
        if (*number >= 0 && *number < static_cast<double>(labels_.size())) {
            index = static_cast<std::uint32_t>(*number);
        }
    }
    if (index) {
        setGainIndex(*index);
    }
}

void MockAutorangeAmplifier::onTrigger(double presetTime) {
    bool autorange = autorangeEnabled();
    double rate = 0.0;
    {
        std::lock_guard lock(mutex_);
        double signal = photocurrent_ * magnitudes_[index_] * VFC_GAIN;
        double dark = darkBase_ + darkPerRange_ * index_;
        rate = std::min(signal + dark, FULL_SCALE_RATE);
        if (autorange) {
            if (rate >= UPPER_RATE && index_ > 0) {
                --index_;
            } else if (rate < LOWER_RATE && index_ + 1 < magnitudes_.size()) {
                ++index_;
            }
        }
    }
    signal_->set(ChannelValue{std::round(rate * presetTime)});
    publishGain();
}
