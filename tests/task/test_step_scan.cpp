/*
 * test_step_scan.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-12

Description: Tests for the step scan driver

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config/core/exception.hpp"
#include "device/template/mock/mock_amplifier.hpp"
#include "exception/exception.hpp"
#include "task/step_scan.hpp"
#include "tools/ustep.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

using namespace usaxs;
using namespace usaxs::device;
using namespace usaxs::task;

namespace {

// Records whether the operation mutex was held by someone at each configure
class LockCheckingScaler : public MockScaler {
public:
    using MockScaler::MockScaler;

    auto configure(const CounterConfiguration& config) -> bool override {
        auto& mutex = getOperationMutex();
        bool free = std::async(std::launch::async, [&mutex] {
                        if (!mutex.try_lock()) {
                            return false;
                        }
                        mutex.unlock();
                        return true;
                    }).get();
        {
            std::lock_guard lock(recordMutex_);
            lockedAtConfigure_.push_back(!free);
        }
        return MockScaler::configure(config);
    }

    auto lockedAtConfigure() const -> std::vector<bool> {
        std::lock_guard lock(recordMutex_);
        return lockedAtConfigure_;
    }

private:
    mutable std::mutex recordMutex_;
    std::vector<bool> lockedAtConfigure_;
};

}  // namespace

class StepScanTest : public ::testing::Test {
protected:
    void SetUp() override {
        scaler0_ = std::make_shared<MockScaler>("scaler0");
        scaler1_ = std::make_shared<MockScaler>("scaler1");
        positioner_ = std::make_shared<MockPositioner>("ar");
        // Range 0 (1e4 V/A): 1e-7 A gives 100 counts/s, plus 20 dark
        upd_ = std::make_unique<MockAutorangeAmplifier>("UPD", scaler0_, 1e-7);
        upd_->setDarkRate(20.0);
        i0_ = std::make_unique<MockAutorangeAmplifier>("I0", scaler0_, 1e-6);
        trd_ = std::make_unique<MockAutorangeAmplifier>("TRD", scaler1_, 1e-8);

        scan_.start = 1.0;
        scan_.reference = 0.999;
        scan_.finish = 0.0;
        scan_.numPoints = 10;
        scan_.exponent = 1.0;
        scan_.minStep = 0.001;
        scan_.countTime = 0.1;

        autoscale_.minimumSettlingTime = 0.0;
        autoscale_.counterDelay = 0.0;

        ASSERT_TRUE(positioner_->moveTo(5.0, std::chrono::milliseconds(100)));
    }

    auto makeDriver(std::vector<BundlePtr> bundles) -> StepScanDriver {
        return StepScanDriver(positioner_, std::move(bundles), cache_, scan_,
                              autoscale_);
    }

    std::shared_ptr<MockScaler> scaler0_;
    std::shared_ptr<MockScaler> scaler1_;
    std::shared_ptr<MockPositioner> positioner_;
    std::unique_ptr<MockAutorangeAmplifier> upd_;
    std::unique_ptr<MockAutorangeAmplifier> i0_;
    std::unique_ptr<MockAutorangeAmplifier> trd_;
    config::StepScanConfig scan_;
    AutoscaleOptions autoscale_;
    GainCache cache_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(StepScanTest, RequiresPositioner) {
    EXPECT_THROW(StepScanDriver driver(nullptr, {}, cache_, scan_),
                 InvalidBundleError);
}

TEST_F(StepScanTest, InvalidSettingsAreRejected) {
    scan_.numPoints = 1;
    auto driver = makeDriver({upd_->makeBundle()});

    EXPECT_THROW(static_cast<void>(driver.run()),
                 config::InvalidConfigException);
    EXPECT_EQ(scaler0_->getTriggerCount(), 0);
}

// ============================================================================
// Points
// ============================================================================

TEST_F(StepScanTest, VisitsEverySeriesPosition) {
    auto driver = makeDriver({upd_->makeBundle()});
    tools::StepSeries series(scan_.start, scan_.reference, scan_.finish,
                             scan_.numPoints, scan_.exponent, scan_.minStep);
    auto expected = series.toVector();

    auto result = driver.run();

    EXPECT_DOUBLE_EQ(result.factor, series.getFactor());
    EXPECT_EQ(result.sign, -1);
    ASSERT_EQ(result.points.size(), 10u);
    for (std::size_t i = 0; i < result.points.size(); ++i) {
        EXPECT_EQ(result.points[i].index, i);
        EXPECT_DOUBLE_EQ(result.points[i].position, expected[i]);
    }
    EXPECT_EQ(scaler0_->getTriggerCount(), 10);
}

TEST_F(StepScanTest, ReturnsToStartPosition) {
    auto driver = makeDriver({upd_->makeBundle()});

    static_cast<void>(driver.run());

    auto moves = positioner_->getMoves();
    // Initial move, ten points, return
    ASSERT_EQ(moves.size(), 12u);
    EXPECT_DOUBLE_EQ(moves[1], 1.0);
    EXPECT_DOUBLE_EQ(moves[10], 0.0);
    EXPECT_DOUBLE_EQ(moves.back(), 5.0);
}

TEST_F(StepScanTest, StaysAtFinishWithoutReturn) {
    scan_.returnToStart = false;
    auto driver = makeDriver({upd_->makeBundle()});

    static_cast<void>(driver.run());

    EXPECT_EQ(positioner_->getMoves().size(), 11u);
    EXPECT_DOUBLE_EQ(*positioner_->getPosition(), 0.0);
}

TEST_F(StepScanTest, InvokesCallbackPerPoint) {
    auto driver = makeDriver({upd_->makeBundle()});
    std::vector<std::size_t> seen;
    driver.setPointCallback(
        [&seen](const ScanPoint& point) { seen.push_back(point.index); });

    static_cast<void>(driver.run());

    EXPECT_THAT(seen, ::testing::ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8, 9));
}

// ============================================================================
// Readings
// ============================================================================

TEST_F(StepScanTest, SubtractsBackgroundOfCurrentRange) {
    auto bundle = upd_->makeBundle();
    bundle->setBackground(0, BackgroundSample{20.0, 1.0});
    auto driver = makeDriver({bundle});

    auto result = driver.run();

    const auto& reading = result.points.front().readings.at(0);
    EXPECT_EQ(reading.nickname, "UPD");
    EXPECT_DOUBLE_EQ(reading.counts, 12.0);
    EXPECT_NEAR(reading.rate, 120.0, 1e-9);
    ASSERT_TRUE(reading.gainIndex.has_value());
    EXPECT_EQ(*reading.gainIndex, 0u);
    ASSERT_TRUE(reading.background.has_value());
    EXPECT_NEAR(reading.correctedRate, 100.0, 1e-9);
}

TEST_F(StepScanTest, BackgroundSubtractionCanBeDisabled) {
    scan_.subtractBackground = false;
    auto bundle = upd_->makeBundle();
    bundle->setBackground(0, BackgroundSample{20.0, 1.0});
    auto driver = makeDriver({bundle});

    auto result = driver.run();

    const auto& reading = result.points.front().readings.at(0);
    EXPECT_DOUBLE_EQ(reading.correctedRate, reading.rate);
}

TEST_F(StepScanTest, MissingBackgroundLeavesRateUncorrected) {
    auto driver = makeDriver({upd_->makeBundle()});

    auto result = driver.run();

    const auto& reading = result.points.front().readings.at(0);
    EXPECT_FALSE(reading.background.has_value());
    EXPECT_DOUBLE_EQ(reading.correctedRate, reading.rate);
}

TEST_F(StepScanTest, ReadingsFollowCounterGroups) {
    auto driver = makeDriver(
        {upd_->makeBundle(), trd_->makeBundle(), i0_->makeBundle()});

    auto result = driver.run();

    const auto& readings = result.points.front().readings;
    ASSERT_EQ(readings.size(), 3u);
    EXPECT_EQ(readings[0].nickname, "UPD");
    EXPECT_EQ(readings[1].nickname, "I0");
    EXPECT_EQ(readings[2].nickname, "TRD");
    EXPECT_DOUBLE_EQ(readings[1].counts, 100.0);
    EXPECT_EQ(scaler0_->getTriggerCount(), 10);
    EXPECT_EQ(scaler1_->getTriggerCount(), 10);
}

// ============================================================================
// Count time
// ============================================================================

TEST_F(StepScanTest, CountTimeByThirds) {
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(0, 10, 0.3, true), 0.1);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(3, 10, 0.3, true), 0.1);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(4, 10, 0.3, true), 0.3);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(6, 10, 0.3, true), 0.3);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(7, 10, 0.3, true), 0.6);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(9, 10, 0.3, true), 0.6);
}

TEST_F(StepScanTest, FixedCountTimeWhenNotDynamic) {
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(0, 10, 0.3, false), 0.3);
    EXPECT_DOUBLE_EQ(StepScanDriver::countTimeFor(9, 10, 0.3, false), 0.3);
}

TEST_F(StepScanTest, DynamicTimeScalesCounts) {
    scan_.countTime = 0.3;
    scan_.useDynamicTime = true;
    auto driver = makeDriver({upd_->makeBundle()});

    auto result = driver.run();

    EXPECT_DOUBLE_EQ(result.points[0].countTime, 0.1);
    EXPECT_DOUBLE_EQ(result.points[5].countTime, 0.3);
    EXPECT_DOUBLE_EQ(result.points[9].countTime, 0.6);
    EXPECT_DOUBLE_EQ(result.points[0].readings[0].counts, 12.0);
    EXPECT_DOUBLE_EQ(result.points[9].readings[0].counts, 72.0);
    EXPECT_NEAR(result.points[9].readings[0].rate, 120.0, 1e-9);
}

// ============================================================================
// Autoscale
// ============================================================================

TEST_F(StepScanTest, AutoscalesBeforeEachPoint) {
    scan_.autoscalePerPoint = true;
    auto driver = makeDriver({upd_->makeBundle()});
    upd_->setDarkRate(0.0);

    auto result = driver.run();

    EXPECT_TRUE(result.autoscaleFailures.empty());
    for (const auto& point : result.points) {
        ASSERT_TRUE(point.readings[0].gainIndex.has_value());
        EXPECT_EQ(*point.readings[0].gainIndex, 2u);
    }
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(StepScanTest, RecordsAutoscaleFailures) {
    scan_.autoscalePerPoint = true;
    autoscale_.liveMode = false;
    autoscale_.maxIterations = 2;
    upd_->setPhotocurrent(1e-3);
    auto driver = makeDriver({upd_->makeBundle()});

    auto result = driver.run();

    EXPECT_EQ(result.points.size(), 10u);
    ASSERT_EQ(result.autoscaleFailures.size(), 10u);
    EXPECT_EQ(result.autoscaleFailures[0].counter, "scaler0");
}

// ============================================================================
// Counter state
// ============================================================================

TEST_F(StepScanTest, RestoresCounterConfiguration) {
    CounterConfiguration original{2.5, 0.0, CountMode::AutoCount};
    ASSERT_TRUE(scaler0_->configure(original));
    auto driver = makeDriver({upd_->makeBundle()});

    static_cast<void>(driver.run());

    EXPECT_EQ(scaler0_->current(), original);
    EXPECT_EQ(scaler0_->getConfigureHistory().back(), original);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(StepScanTest, MoveFailureIsHardwareError) {
    positioner_->setFailMoves(true);
    auto driver = makeDriver({upd_->makeBundle()});

    EXPECT_THROW(static_cast<void>(driver.run()), HardwareError);
    EXPECT_EQ(scaler0_->getTriggerCount(), 0);
}

TEST_F(StepScanTest, CountTimeoutReturnsToStartAndRestores) {
    CounterConfiguration original{2.5, 0.0, CountMode::AutoCount};
    ASSERT_TRUE(scaler0_->configure(original));
    scaler0_->setFailTriggers(true);
    auto driver = makeDriver({upd_->makeBundle()});

    EXPECT_THROW(static_cast<void>(driver.run()), DeviceTimeoutError);
    EXPECT_DOUBLE_EQ(*positioner_->getPosition(), 5.0);
    EXPECT_EQ(scaler0_->current(), original);
}

TEST_F(StepScanTest, FailedScanRestoresCounterUnderLock) {
    auto scaler = std::make_shared<LockCheckingScaler>("scaler2");
    CounterConfiguration original{2.5, 0.0, CountMode::AutoCount};
    ASSERT_TRUE(scaler->configure(original));
    MockAutorangeAmplifier upd("UPD", scaler, 1e-7);
    scaler->setFailTriggers(true);
    auto driver = makeDriver({upd.makeBundle()});

    EXPECT_THROW(static_cast<void>(driver.run()), DeviceTimeoutError);

    EXPECT_EQ(scaler->current(), original);
    EXPECT_EQ(scaler->getConfigureHistory().back(), original);
    auto locked = scaler->lockedAtConfigure();
    // Setup call, count, restore
    ASSERT_EQ(locked.size(), 3u);
    EXPECT_FALSE(locked[0]);
    EXPECT_TRUE(locked[1]);
    EXPECT_TRUE(locked[2]);
}

TEST_F(StepScanTest, UnreadableSignalIsHardwareError) {
    upd_->signal()->setFailReads(true);
    auto driver = makeDriver({upd_->makeBundle()});

    EXPECT_THROW(static_cast<void>(driver.run()), HardwareError);
    EXPECT_DOUBLE_EQ(*positioner_->getPosition(), 5.0);
}

TEST_F(StepScanTest, StopRequestCancelsScan) {
    std::stop_source source;
    auto driver = makeDriver({upd_->makeBundle()});
    driver.setPointCallback([&source](const ScanPoint& point) {
        if (point.index == 1) {
            source.request_stop();
        }
    });

    EXPECT_THROW(static_cast<void>(driver.run(source.get_token())),
                 OperationCancelled);
    EXPECT_EQ(scaler0_->getTriggerCount(), 2);
    EXPECT_DOUBLE_EQ(*positioner_->getPosition(), 5.0);
}
