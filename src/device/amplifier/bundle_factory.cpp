/*
 * bundle_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "bundle_factory.hpp"

#include <set>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace usaxs::device {

auto BundleFactory::requireChannel(const std::string& nickname,
                                   const std::string& role,
                                   const std::string& name)
    -> std::shared_ptr<Channel> {
    if (name.empty()) {
        THROW_CONFIGURATION_ERROR("Detector '" + nickname + "' has no " +
                                  role + " channel");
    }
    auto channel = registry_.findChannel(name);
    if (!channel) {
        THROW_CONFIGURATION_ERROR("Detector '" + nickname + "': " + role +
                                  " channel '" + name + "' not found");
    }
    return channel;
}

auto BundleFactory::optionalChannel(const std::string& nickname,
                                    const std::string& role,
                                    const std::string& name)
    -> std::shared_ptr<Channel> {
    if (name.empty()) {
        return nullptr;
    }
    return requireChannel(nickname, role, name);
}

auto BundleFactory::create(const config::DetectorBundleConfig& config)
    -> BundlePtr {
    const auto& nickname = config.nickname;
    if (nickname.empty()) {
        THROW_CONFIGURATION_ERROR("Detector entry without a nickname");
    }
    if (config.counter.empty()) {
        THROW_CONFIGURATION_ERROR("Detector '" + nickname +
                                  "' has no counting device");
    }
    auto counter = registry_.findCounter(config.counter);
    if (!counter) {
        THROW_CONFIGURATION_ERROR("Detector '" + nickname +
                                  "': counting device '" + config.counter +
                                  "' not found");
    }

    BundleChannels channels;
    channels.signal = requireChannel(nickname, "signal", config.signal);
    channels.gainReadback =
        requireChannel(nickname, "gain readback", config.gainReadback);
    channels.rangeSelect =
        requireChannel(nickname, "range selection", config.rangeSelect);
    channels.mode = optionalChannel(nickname, "mode", config.mode);
    for (std::size_t i = 0; i < config.backgroundSlots.size(); ++i) {
        const auto& slot = config.backgroundSlots[i];
        auto range = std::to_string(i);
        channels.backgroundSlots.push_back(BackgroundSlot{
            optionalChannel(nickname, "background " + range, slot.background),
            optionalChannel(nickname, "background error " + range,
                            slot.backgroundError)});
    }

    spdlog::debug("Detector '{}' on {}: gain {} / {}", nickname,
                  config.counter, config.gainReadback, config.rangeSelect);
    return std::make_shared<DetectorControlBundle>(
        nickname, std::move(counter), std::move(channels),
        parseRangeWriteForm(config.writeForm), config.settlingTime,
        config.maxCountRate);
}

auto BundleFactory::createAll(const config::AmplifierConfig& config)
    -> std::vector<BundlePtr> {
    std::vector<BundlePtr> bundles;
    std::set<std::string> nicknames;
    for (const auto& detector : config.detectors) {
        if (!nicknames.insert(detector.nickname).second) {
            THROW_CONFIGURATION_ERROR("Detector '" + detector.nickname +
                                      "' configured twice");
        }
        bundles.push_back(create(detector));
    }
    spdlog::info("Configured {} detector bundle(s)", bundles.size());
    return bundles;
}

auto parseRangeWriteForm(const std::string& text) -> RangeWriteForm {
    if (text == "index") {
        return RangeWriteForm::Index;
    }
    if (text == "label") {
        return RangeWriteForm::Label;
    }
    THROW_CONFIGURATION_ERROR("Unknown range write form '" + text +
                              "', expected 'index' or 'label'");
}

auto makeAutoscaleOptions(const config::AmplifierConfig& config)
    -> AutoscaleOptions {
    AutoscaleOptions options;
    options.countTime = config.autoscaleCountTime;
    options.maxIterations = config.maxIterations;
    options.counterDelay = config.autoscaleCounterDelay;
    options.minimumSettlingTime = config.minimumSettlingTime;
    options.writeTimeout = std::chrono::milliseconds(config.writeTimeoutMs);
    options.triggerMargin = std::chrono::milliseconds(config.triggerMarginMs);
    options.liveMode = config.liveMode;
    options.parallelGroups = config.parallelGroups;
    return options;
}

auto makeBackgroundOptions(const config::AmplifierConfig& config)
    -> BackgroundOptions {
    BackgroundOptions options;
    options.countTime = config.backgroundCountTime;
    options.numReadings = config.backgroundReadings;
    options.readingInterval = config.readingInterval;
    options.minimumSettlingTime = config.minimumSettlingTime;
    options.writeTimeout = std::chrono::milliseconds(config.writeTimeoutMs);
    options.triggerMargin = std::chrono::milliseconds(config.triggerMarginMs);
    return options;
}

}  // namespace usaxs::device
