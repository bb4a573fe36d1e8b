/*
 * control_bundle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "control_bundle.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace usaxs::device {

namespace {

auto requireChannels(const std::string& nickname,
                     const std::shared_ptr<CountingDevice>& counter,
                     BundleChannels channels) -> BundleChannels {
    if (!counter) {
        THROW_INVALID_BUNDLE("Bundle '" + nickname + "' has no counting device");
    }
    if (!channels.signal) {
        THROW_INVALID_BUNDLE("Bundle '" + nickname + "' has no signal channel");
    }
    if (!channels.gainReadback) {
        THROW_INVALID_BUNDLE("Bundle '" + nickname +
                             "' has no gain readback channel");
    }
    if (!channels.rangeSelect) {
        THROW_INVALID_BUNDLE("Bundle '" + nickname +
                             "' has no range selection channel");
    }
    return channels;
}

}  // namespace

DetectorControlBundle::DetectorControlBundle(
    std::string nickname, std::shared_ptr<CountingDevice> counter,
    BundleChannels channels, RangeWriteForm writeForm, double settlingTime,
    double maxCountRate)
    : nickname_(std::move(nickname)),
      counter_(std::move(counter)),
      channels_(requireChannels(nickname_, counter_, std::move(channels))),
      gain_(channels_.rangeSelect, writeForm),
      settlingTime_(settlingTime),
      maxCountRate_(maxCountRate) {}

auto DetectorControlBundle::setMode(AutorangeMode mode,
                                    std::chrono::milliseconds timeout) -> bool {
    if (!channels_.mode) {
        return true;
    }
    return channels_.mode->write(
        ChannelValue{std::string(autorangeModeToString(mode))}, timeout);
}

auto DetectorControlBundle::readGainIndex() -> std::optional<std::uint32_t> {
    auto value = channels_.gainReadback->readNumber();
    if (!value) {
        return std::nullopt;
    }
    try {
        return gain_.resolve(GainTarget{std::in_place_type<double>, *value});
    } catch (const InvalidGainError& e) {
        spdlog::warn("{}: unexpected gain readback {}: {}", nickname_, *value,
                     e.what());
        return std::nullopt;
    }
}

auto DetectorControlBundle::readCounts() -> std::optional<double> {
    return channels_.signal->readNumber();
}

void DetectorControlBundle::setBackground(std::size_t range,
                                          const BackgroundSample& sample) {
    if (backgrounds_.size() <= range) {
        backgrounds_.resize(range + 1);
    }
    backgrounds_[range] = sample;
}

auto DetectorControlBundle::getBackground(std::size_t range) const
    -> std::optional<BackgroundSample> {
    if (range >= backgrounds_.size()) {
        return std::nullopt;
    }
    return backgrounds_[range];
}

auto DetectorControlBundle::storeBackground(std::size_t range,
                                            const BackgroundSample& sample,
                                            std::chrono::milliseconds timeout)
    -> bool {
    if (range >= channels_.backgroundSlots.size()) {
        return true;
    }
    const auto& slot = channels_.backgroundSlots[range];
    bool ok = true;
    if (slot.background) {
        ok = slot.background->write(ChannelValue{sample.mean}, timeout) && ok;
    }
    if (slot.backgroundError) {
        ok = slot.backgroundError->write(ChannelValue{sample.deviation},
                                         timeout) &&
             ok;
    }
    return ok;
}

}  // namespace usaxs::device
