/*
 * step_scan.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "step_scan.hpp"

#include <chrono>
#include <iterator>
#include <mutex>

#include <spdlog/spdlog.h>

#include "device/amplifier/counter_guard.hpp"
#include "exception/exception.hpp"
#include "tools/ustep.hpp"

namespace usaxs::task {

using device::CounterConfiguration;
using device::CounterStateGuard;
using device::CountMode;

namespace {

void restoreCounters(
    const std::vector<device::ResourceGroup>& groups,
    std::vector<std::unique_ptr<CounterStateGuard>>& guards) {
    for (std::size_t i = 0; i < guards.size(); ++i) {
        std::scoped_lock lock(groups[i].counter->getOperationMutex());
        if (!guards[i]->restore()) {
            spdlog::error("{}: cannot restore counter configuration",
                          groups[i].counter->getName());
        }
    }
}

}  // namespace

StepScanDriver::StepScanDriver(std::shared_ptr<device::Positioner> positioner,
                               std::vector<device::BundlePtr> bundles,
                               device::GainCache& cache,
                               config::StepScanConfig scan,
                               device::AutoscaleOptions autoscale)
    : positioner_(std::move(positioner)),
      bundles_(std::move(bundles)),
      cache_(cache),
      scan_(std::move(scan)),
      autoscale_(autoscale) {
    if (!positioner_) {
        THROW_INVALID_BUNDLE("Step scan needs a positioner");
    }
}

auto StepScanDriver::countTimeFor(std::size_t index, std::size_t numPoints,
                                  double baseTime, bool dynamic) -> double {
    if (!dynamic || numPoints == 0) {
        return baseTime;
    }
    double fraction =
        static_cast<double>(index) / static_cast<double>(numPoints);
    if (fraction < 0.33) {
        return baseTime / 3;
    }
    if (fraction < 0.66) {
        return baseTime;
    }
    return baseTime * 2;
}

auto StepScanDriver::countGroup(const device::ResourceGroup& group,
                                double countTime)
    -> std::vector<DetectorReading> {
    auto& counter = *group.counter;
    std::scoped_lock lock(counter.getOperationMutex());

    if (!counter.configure(
            CounterConfiguration{countTime, 0.0, CountMode::OneShot})) {
        THROW_HARDWARE_ERROR("Cannot set preset time of " + counter.getName());
    }
    auto timeout = device::triggerTimeout(
        countTime, std::chrono::milliseconds(scan_.triggerMarginMs));
    if (!counter.triggerAndWait(timeout)) {
        THROW_DEVICE_TIMEOUT(counter.getName() + ": count did not complete");
    }
    double elapsed = counter.elapsedTime();
    if (!(elapsed > 0)) {
        elapsed = countTime;
    }

    std::vector<DetectorReading> readings;
    for (const auto& bundle : group.bundles) {
        DetectorReading reading;
        reading.nickname = bundle->getNickname();
        auto counts = bundle->readCounts();
        if (!counts) {
            THROW_HARDWARE_ERROR(bundle->getNickname() +
                                 ": cannot read signal");
        }
        reading.counts = *counts;
        reading.rate = *counts / elapsed;
        reading.gainIndex = bundle->readGainIndex();
        if (reading.gainIndex) {
            reading.background = bundle->getBackground(*reading.gainIndex);
        }
        reading.correctedRate = reading.rate;
        if (scan_.subtractBackground && reading.background) {
            reading.correctedRate -= reading.background->mean;
        }
        readings.push_back(std::move(reading));
    }
    return readings;
}

void StepScanDriver::returnToStart(const std::optional<double>& start) {
    if (!start) {
        return;
    }
    if (!positioner_->moveTo(*start,
                             std::chrono::milliseconds(scan_.moveTimeoutMs))) {
        spdlog::error("{}: cannot return to {}", positioner_->getName(),
                      *start);
    }
}

auto StepScanDriver::run(std::stop_token stopToken) -> ScanResult {
    scan_.validate();
    tools::StepSeries series(scan_.start, scan_.reference, scan_.finish,
                             scan_.numPoints, scan_.exponent, scan_.minStep);
    auto groups = device::groupByCounter(bundles_);

    ScanResult result;
    result.factor = series.getFactor();
    result.sign = series.getSign();
    result.points.reserve(series.size());

    spdlog::info("{} scan: {} points from {} to {}, factor {:.6g}",
                 positioner_->getName(), series.size(), scan_.start,
                 scan_.finish, result.factor);

    std::optional<double> start;
    if (scan_.returnToStart) {
        start = positioner_->getPosition();
    }

    std::vector<std::unique_ptr<CounterStateGuard>> guards;
    for (const auto& group : groups) {
        std::scoped_lock lock(group.counter->getOperationMutex());
        guards.push_back(std::make_unique<CounterStateGuard>(*group.counter));
    }

    device::AutoscaleCoordinator coordinator(cache_, autoscale_);
    auto moveTimeout = std::chrono::milliseconds(scan_.moveTimeoutMs);

    try {
        std::size_t index = 0;
        for (double position : series) {
            device::checkpoint(stopToken,
                               "scan point " + std::to_string(index));
            if (!positioner_->moveTo(position, moveTimeout)) {
                THROW_HARDWARE_ERROR(positioner_->getName() +
                                     ": cannot move to " +
                                     std::to_string(position));
            }

            if (scan_.autoscalePerPoint) {
                for (auto& outcome :
                     coordinator.autoscaleAll(bundles_, stopToken)) {
                    if (!outcome.converged) {
                        result.autoscaleFailures.push_back(std::move(outcome));
                    }
                }
            }

            ScanPoint point;
            point.index = index;
            point.position = position;
            point.countTime = countTimeFor(index, series.size(),
                                           scan_.countTime,
                                           scan_.useDynamicTime);
            for (const auto& group : groups) {
                auto readings = countGroup(group, point.countTime);
                point.readings.insert(point.readings.end(),
                                      std::make_move_iterator(readings.begin()),
                                      std::make_move_iterator(readings.end()));
            }

            spdlog::debug("point {}/{} at {:.6f}", index + 1, series.size(),
                          position);
            if (callback_) {
                callback_(point);
            }
            result.points.push_back(std::move(point));
            ++index;
        }
    } catch (...) {
        restoreCounters(groups, guards);
        returnToStart(start);
        throw;
    }

    restoreCounters(groups, guards);
    returnToStart(start);
    spdlog::info("{} scan complete: {} points", positioner_->getName(),
                 result.points.size());
    return result;
}

}  // namespace usaxs::task
