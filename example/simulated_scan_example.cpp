/*
 * simulated_scan_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-12

Description: Amplifier Autoscale, Background and Step Scan Usage Example

This example wires three simulated detectors (two on one scaler, one on a
second scaler) from a configuration document, measures their backgrounds,
autoscales them and runs a short step scan.

*************************************************/

#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "config/config_file.hpp"
#include "device/amplifier/autoscale.hpp"
#include "device/amplifier/background.hpp"
#include "device/amplifier/bundle_factory.hpp"
#include "device/template/mock/mock_amplifier.hpp"
#include "device/template/mock/mock_registry.hpp"
#include "exception/exception.hpp"
#include "logging/core/logging_manager.hpp"
#include "task/step_scan.hpp"
#include "tools/ustep.hpp"

using namespace usaxs;

namespace {

auto detector(const std::string& nickname, const std::string& counter)
    -> config::DetectorBundleConfig {
    config::DetectorBundleConfig cfg;
    cfg.nickname = nickname;
    cfg.counter = counter;
    cfg.signal = nickname + "_signal";
    cfg.gainReadback = nickname + "_gain";
    cfg.rangeSelect = nickname + "_reqrange";
    cfg.mode = nickname + "_mode";
    cfg.settlingTime = 0.0;
    for (int i = 0; i < 5; ++i) {
        auto slot = nickname + "_bkg" + std::to_string(i);
        cfg.backgroundSlots.push_back({slot, slot + "_err"});
    }
    return cfg;
}

/**
 * @brief Print the first points of a step series
 */
void stepSeriesExample() {
    std::cout << "\n=== Step Series Example ===\n";
    auto series = tools::generateStepSeries(8.7474, 8.746588, 7.9, 200, 1.0,
                                            0.000025);
    std::cout << "factor " << series.getFactor() << ", direction "
              << series.getSign() << "\n";
    int shown = 0;
    for (double position : series) {
        if (shown++ == 8) {
            break;
        }
        std::cout << "  " << position << "\n";
    }
}

void amplifierExample() {
    std::cout << "\n=== Amplifier Autoscale Example ===\n";

    auto scaler0 = std::make_shared<MockScaler>("scaler0");
    auto scaler1 = std::make_shared<MockScaler>("scaler1");
    MockAutorangeAmplifier upd("UPD", scaler0, 1e-7);
    MockAutorangeAmplifier i0("I0", scaler0, 2e-6);
    MockAutorangeAmplifier trd("TRD", scaler1, 5e-8);
    upd.setDarkRate(20.0, 5.0);
    i0.setDarkRate(10.0, 2.0);

    MockDeviceRegistry registry;
    registry.add(std::shared_ptr<device::CountingDevice>(scaler0));
    registry.add(std::shared_ptr<device::CountingDevice>(scaler1));
    registry.add(upd);
    registry.add(i0);
    registry.add(trd);
    auto positioner = std::make_shared<MockPositioner>("ar");
    auto shutter = std::make_shared<MockShutter>("usaxs_shutter");

    config::UsaxsConfig cfg;
    cfg.amplifier.readingInterval = 0.0;
    cfg.amplifier.detectors = {detector("UPD", "scaler0"),
                               detector("I0", "scaler0"),
                               detector("TRD", "scaler1")};
    cfg.scan.numPoints = 20;
    cfg.scan.countTime = 0.1;
    cfg = config::UsaxsConfig::fromDocument(cfg.toDocument());

    device::BundleFactory factory(registry);
    auto bundles = factory.createAll(cfg.amplifier);

    device::BackgroundCalibrator calibrator(
        device::makeBackgroundOptions(cfg.amplifier));
    auto table = calibrator.calibrateAll(bundles, {}, shutter);
    for (const auto& [nickname, samples] : table) {
        std::cout << nickname << " background:";
        for (const auto& sample : samples) {
            std::cout << " " << (sample ? sample->mean : 0.0);
        }
        std::cout << "\n";
    }

    device::GainCache cache;
    device::AutoscaleCoordinator coordinator(
        cache, device::makeAutoscaleOptions(cfg.amplifier));
    for (const auto& outcome :
         coordinator.autoscaleAll(bundles, {}, shutter)) {
        std::cout << outcome.counter << ": "
                  << (outcome.converged ? "converged" : "not converged")
                  << " after " << outcome.iterations << " iteration(s) "
                  << device::describeConvergence(outcome.convergence) << "\n";
    }

    task::StepScanDriver driver(positioner, bundles, cache, cfg.scan,
                                device::makeAutoscaleOptions(cfg.amplifier));
    driver.setPointCallback([](const task::ScanPoint& point) {
        std::cout << "  " << point.index << " @ " << point.position;
        for (const auto& reading : point.readings) {
            std::cout << "  " << reading.nickname << "="
                      << reading.correctedRate;
        }
        std::cout << "\n";
    });
    auto result = driver.run();
    std::cout << "Scanned " << result.points.size() << " points\n";
}

}  // namespace

int main() {
    config::LoggingConfig logging;
    logging.consoleLevel = "info";
    logging::LoggingManager::getInstance().initialize(logging);

    try {
        stepSeriesExample();
        amplifierExample();
    } catch (const atom::error::Exception& e) {
        spdlog::error("Example failed: {}", e.what());
        return 1;
    }

    logging::LoggingManager::getInstance().shutdown();
    return 0;
}
