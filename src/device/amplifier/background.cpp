/*
 * background.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "background.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "counter_guard.hpp"
#include "exception/exception.hpp"

namespace usaxs::device {

namespace {

auto summarize(const std::vector<double>& readings) -> BackgroundSample {
    BackgroundSample sample;
    sample.readings = static_cast<std::uint32_t>(readings.size());
    if (readings.empty()) {
        return sample;
    }
    double n = static_cast<double>(readings.size());
    sample.mean = std::accumulate(readings.begin(), readings.end(), 0.0) / n;
    double sumSquares = 0.0;
    for (double value : readings) {
        sumSquares += (value - sample.mean) * (value - sample.mean);
    }
    sample.deviation = std::sqrt(sumSquares / n);
    return sample;
}

}  // namespace

BackgroundCalibrator::BackgroundCalibrator(BackgroundOptions options)
    : options_(options) {
    if (!(options_.countTime > 0)) {
        THROW_INVALID_ARGUMENT("Background count time must be positive");
    }
    if (options_.numReadings == 0) {
        THROW_INVALID_ARGUMENT("Background needs at least one reading");
    }
}

auto BackgroundCalibrator::calibrate(const ResourceGroup& group,
                                     std::stop_token stopToken)
    -> BackgroundTable {
    if (group.bundles.empty()) {
        return {};
    }
    if (!group.counter) {
        THROW_INVALID_BUNDLE("Resource group has no counting device");
    }

    std::scoped_lock lock(group.counter->getOperationMutex());
    CounterStateGuard guard(*group.counter);
    auto table = sweep(group, guard.getOriginal().mode, stopToken);
    if (!guard.restore()) {
        THROW_HARDWARE_ERROR("Cannot restore configuration of " +
                             group.counter->getName());
    }
    return table;
}

auto BackgroundCalibrator::sweep(const ResourceGroup& group, CountMode mode,
                                 const std::stop_token& stopToken)
    -> BackgroundTable {
    auto& counter = *group.counter;
    CounterConfiguration config{options_.countTime, 0.0, mode};
    if (!counter.configure(config)) {
        THROW_HARDWARE_ERROR("Cannot configure " + counter.getName() +
                             " for background");
    }

    BackgroundTable table;
    std::size_t maxRanges = 0;
    for (const auto& bundle : group.bundles) {
        if (!bundle->setMode(AutorangeMode::Manual, options_.writeTimeout)) {
            THROW_HARDWARE_ERROR(bundle->getNickname() +
                                 ": cannot switch to manual gain");
        }
        auto ranges = bundle->getGainChannel().getRangeCount();
        table[bundle->getNickname()].resize(ranges);
        maxRanges = std::max(maxRanges, ranges);
    }

    spdlog::info("{}: measuring background of {} bundle(s), {} range(s)",
                 counter.getName(), group.bundles.size(), maxRanges);

    for (auto range = static_cast<std::uint32_t>(maxRanges); range-- > 0;) {
        checkpoint(stopToken, "background range " + std::to_string(range));
        auto samples = sampleRange(group, range, stopToken);
        for (std::size_t i = 0; i < group.bundles.size(); ++i) {
            const auto& bundle = group.bundles[i];
            if (range >= bundle->getGainChannel().getRangeCount()) {
                continue;
            }
            const auto& sample = samples[i];
            bundle->setBackground(range, sample);
            if (!bundle->storeBackground(range, sample,
                                         options_.writeTimeout)) {
                THROW_HARDWARE_ERROR(bundle->getNickname() +
                                     ": cannot store background of range " +
                                     std::to_string(range));
            }
            table[bundle->getNickname()][range] = sample;
            spdlog::debug("{} range {}: background {:.6g} +/- {:.3g}",
                          bundle->getNickname(), range, sample.mean,
                          sample.deviation);
        }
    }
    return table;
}

auto BackgroundCalibrator::sampleRange(const ResourceGroup& group,
                                       std::uint32_t range,
                                       const std::stop_token& stopToken)
    -> std::vector<BackgroundSample> {
    double settle = options_.minimumSettlingTime;
    for (const auto& bundle : group.bundles) {
        if (range >= bundle->getGainChannel().getRangeCount()) {
            continue;
        }
        checkpoint(stopToken, bundle->getNickname() + " gain change");
        if (!bundle->getGainChannel().setGain(range, options_.writeTimeout)) {
            THROW_HARDWARE_ERROR(bundle->getNickname() +
                                 ": cannot select gain range " +
                                 std::to_string(range));
        }
        settle = std::max(settle, bundle->getSettlingTime());
    }
    sleepSeconds(settle);

    auto& counter = *group.counter;
    auto timeout = triggerTimeout(options_.countTime, options_.triggerMargin);
    std::vector<std::vector<double>> readings(group.bundles.size());
    for (std::uint32_t m = 0; m < options_.numReadings; ++m) {
        sleepSeconds(options_.readingInterval);
        if (!counter.triggerAndWait(timeout)) {
            THROW_DEVICE_TIMEOUT(counter.getName() +
                                 ": background count did not complete");
        }
        for (std::size_t i = 0; i < group.bundles.size(); ++i) {
            auto counts = group.bundles[i]->readCounts();
            if (!counts) {
                THROW_HARDWARE_ERROR(group.bundles[i]->getNickname() +
                                     ": cannot read signal");
            }
            readings[i].push_back(*counts / options_.countTime);
        }
    }

    std::vector<BackgroundSample> samples;
    samples.reserve(readings.size());
    for (const auto& values : readings) {
        samples.push_back(summarize(values));
    }
    return samples;
}

auto BackgroundCalibrator::calibrateAll(
    const std::vector<BundlePtr>& bundles, std::stop_token stopToken,
    const std::shared_ptr<Shutter>& shutter) -> BackgroundTable {
    moveShutter(shutter, ShutterState::Closed, options_.writeTimeout);
    BackgroundTable table;
    for (const auto& group : groupByCounter(bundles)) {
        auto measured = calibrate(group, stopToken);
        for (auto& [nickname, samples] : measured) {
            table[nickname] = std::move(samples);
        }
    }
    return table;
}

auto measureBackground(const std::vector<BundlePtr>& bundles,
                       double countTime, std::uint32_t numReadings,
                       std::stop_token stopToken,
                       const std::shared_ptr<Shutter>& shutter)
    -> BackgroundTable {
    BackgroundOptions options;
    options.countTime = countTime;
    options.numReadings = numReadings;
    return BackgroundCalibrator(options).calibrateAll(
        bundles, std::move(stopToken), shutter);
}

}  // namespace usaxs::device
