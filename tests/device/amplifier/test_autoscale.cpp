/*
 * test_autoscale.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-12

Description: Tests for amplifier autoscale convergence

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "atom/error/exception.hpp"
#include "device/amplifier/autoscale.hpp"
#include "device/template/mock/mock_amplifier.hpp"
#include "exception/exception.hpp"

#include <memory>
#include <stdexcept>
#include <stop_token>

using namespace usaxs;
using namespace usaxs::device;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

// Signal channel whose connection dropped
class DisconnectedChannel : public Channel {
public:
    using Channel::Channel;

    auto read() -> std::optional<ChannelValue> override {
        throw std::runtime_error("CA disconnected");
    }
    auto write(const ChannelValue& /*value*/,
               std::chrono::milliseconds /*timeout*/) -> bool override {
        return false;
    }
};

}  // namespace

class AutoscaleTest : public ::testing::Test {
protected:
    void SetUp() override {
        scaler0_ = std::make_shared<MockScaler>("scaler0");
        scaler1_ = std::make_shared<MockScaler>("scaler1");
        // 1e-7 A reaches 1e4 counts/s on range 2 (1e6 V/A)
        upd_ = std::make_unique<MockAutorangeAmplifier>("UPD", scaler0_, 1e-7);
        // 1e-6 A reaches 1e4 counts/s on range 1 (1e5 V/A)
        i0_ = std::make_unique<MockAutorangeAmplifier>("I0", scaler0_, 1e-6);
        trd_ = std::make_unique<MockAutorangeAmplifier>("TRD", scaler1_, 1e-8);

        options_.minimumSettlingTime = 0.0;
        options_.counterDelay = 0.0;
    }

    std::shared_ptr<MockScaler> scaler0_;
    std::shared_ptr<MockScaler> scaler1_;
    std::unique_ptr<MockAutorangeAmplifier> upd_;
    std::unique_ptr<MockAutorangeAmplifier> i0_;
    std::unique_ptr<MockAutorangeAmplifier> trd_;
    AutoscaleOptions options_;
    GainCache cache_;
};

TEST_F(AutoscaleTest, RejectsInvalidOptions) {
    AutoscaleOptions zeroTime = options_;
    zeroTime.countTime = 0.0;
    EXPECT_THROW(AutoscaleCoordinator coordinator(cache_, zeroTime),
                 atom::error::InvalidArgument);

    AutoscaleOptions noIterations = options_;
    noIterations.maxIterations = 0;
    EXPECT_THROW(AutoscaleCoordinator coordinator(cache_, noIterations),
                 atom::error::InvalidArgument);
}

TEST_F(AutoscaleTest, ConvergesWhenGainSettles) {
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_TRUE(outcome.converged);
    // Range 0 -> 1 -> 2, then one count at a stable gain
    EXPECT_EQ(outcome.iterations, 3u);
    EXPECT_EQ(outcome.counter, "scaler0");
    EXPECT_EQ(upd_->getGainIndex(), 2u);
    ASSERT_EQ(outcome.convergence.size(), 1u);
    EXPECT_TRUE(outcome.convergence[0].converged());
    EXPECT_NEAR(outcome.convergence[0].observedRate, 1e4, 1e-6);
}

TEST_F(AutoscaleTest, LeavesAmplifierInManualMode) {
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    static_cast<void>(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}));

    EXPECT_EQ(upd_->mode()->read(), ChannelValue{std::string("manual")});
}

TEST_F(AutoscaleTest, StoresSettledGainInCache) {
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    static_cast<void>(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}));

    EXPECT_EQ(cache_.lookup("scaler0", "UPD_gain"), 2u);
}

TEST_F(AutoscaleTest, CachedGainShortensNextAutoscale) {
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);
    static_cast<void>(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}));

    upd_->setGainIndex(0);
    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 1u);
    EXPECT_EQ(upd_->getGainIndex(), 2u);
}

TEST_F(AutoscaleTest, OutOfRangeCacheEntryIsIgnored) {
    auto bundle = upd_->makeBundle();
    cache_.store("scaler0", "UPD_gain", 17);
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 3u);
}

TEST_F(AutoscaleTest, SharedCounterWaitsForEveryBundle) {
    auto upd = upd_->makeBundle();
    auto i0 = i0_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {upd, i0}});

    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 3u);
    EXPECT_EQ(upd_->getGainIndex(), 2u);
    EXPECT_EQ(i0_->getGainIndex(), 1u);
    EXPECT_EQ(scaler0_->getTriggerCount(), 3);
}

TEST_F(AutoscaleTest, ConfiguresAndRestoresCounter) {
    CounterConfiguration original{1.0, 0.0, CountMode::AutoCount};
    ASSERT_TRUE(scaler0_->configure(original));
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    static_cast<void>(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}));

    auto history = scaler0_->getConfigureHistory();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_DOUBLE_EQ(history[1].presetTime, options_.countTime);
    EXPECT_EQ(history[1].mode, CountMode::OneShot);
    EXPECT_EQ(scaler0_->current(), original);
}

TEST_F(AutoscaleTest, SaturationNeverConvergesInLiveMode) {
    upd_->setPhotocurrent(1e-3);
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    try {
        static_cast<void>(
            coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}));
        FAIL() << "Expected AutoscaleError";
    } catch (const AutoscaleError& e) {
        ASSERT_EQ(e.getLastConvergence().size(), 1u);
        EXPECT_TRUE(e.getLastConvergence()[0].gainStable);
        EXPECT_FALSE(e.getLastConvergence()[0].notSaturated);
        EXPECT_THAT(e.what(), HasSubstr("did not converge"));
    }
    EXPECT_EQ(scaler0_->getTriggerCount(),
              static_cast<int>(options_.maxIterations));
}

TEST_F(AutoscaleTest, SaturationOnlyWarnsWhenNotLive) {
    upd_->setPhotocurrent(1e-3);
    options_.liveMode = false;
    options_.maxIterations = 4;
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_FALSE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 4u);
    EXPECT_EQ(scaler0_->getTriggerCount(), 4);
}

TEST_F(AutoscaleTest, HigherLimitToleratesFullScale) {
    upd_->setPhotocurrent(1e-3);
    auto bundle = upd_->makeBundle(RangeWriteForm::Index, 0.0, 2e6);
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 1u);
}

TEST_F(AutoscaleTest, FailedCountsDoNotConverge) {
    options_.liveMode = false;
    options_.maxIterations = 3;
    scaler0_->setFailTriggers(true);
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {bundle}});

    EXPECT_FALSE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 3u);
}

TEST_F(AutoscaleTest, UnconfigurableCounterIsHardwareError) {
    scaler0_->setFailConfigure(true);
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    EXPECT_THROW(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}}),
                 HardwareError);
}

TEST_F(AutoscaleTest, StopRequestCancels) {
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);
    std::stop_source source;
    source.request_stop();

    EXPECT_THROW(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}},
                                       source.get_token()),
                 OperationCancelled);
    EXPECT_EQ(scaler0_->getTriggerCount(), 0);
}

TEST_F(AutoscaleTest, StopDuringModeChangeSkipsCachedGain) {
    cache_.store("scaler0", "UPD_gain", 2);
    auto bundle = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);
    std::stop_source source;
    upd_->mode()->setOnWrite([&source](const ChannelValue& value) {
        if (value == ChannelValue{std::string("automatic")}) {
            source.request_stop();
        }
    });

    EXPECT_THROW(coordinator.autoscale(ResourceGroup{scaler0_, {bundle}},
                                       source.get_token()),
                 OperationCancelled);
    EXPECT_TRUE(upd_->rangeSelect()->getWrites().empty());
    EXPECT_EQ(upd_->getGainIndex(), 0u);
    EXPECT_EQ(scaler0_->getTriggerCount(), 0);
}

TEST_F(AutoscaleTest, EmptyGroupIsConverged) {
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcome = coordinator.autoscale(ResourceGroup{scaler0_, {}});

    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 0u);
}

// ============================================================================
// autoscaleAll
// ============================================================================

TEST_F(AutoscaleTest, AutoscaleAllRunsEveryGroup) {
    auto upd = upd_->makeBundle();
    auto trd = trd_->makeBundle();
    auto i0 = i0_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd, trd, i0});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].counter, "scaler0");
    EXPECT_EQ(outcomes[1].counter, "scaler1");
    EXPECT_TRUE(outcomes[0].converged);
    EXPECT_TRUE(outcomes[1].converged);
    // 1e-8 A reaches 1e4 counts/s on range 3 (1e7 V/A)
    EXPECT_EQ(trd_->getGainIndex(), 3u);
}

TEST_F(AutoscaleTest, AutoscaleAllIsolatesFailingGroup) {
    upd_->setPhotocurrent(1e-3);
    auto upd = upd_->makeBundle();
    auto trd = trd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd, trd});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_FALSE(outcomes[0].converged);
    EXPECT_THAT(outcomes[0].error, HasSubstr("did not converge"));
    EXPECT_EQ(outcomes[0].convergence.size(), 1u);
    EXPECT_TRUE(outcomes[1].converged);
    EXPECT_TRUE(outcomes[1].error.empty());
}

TEST_F(AutoscaleTest, AutoscaleAllReportsHardwareFailure) {
    scaler1_->setFailConfigure(true);
    auto upd = upd_->makeBundle();
    auto trd = trd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd, trd});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].converged);
    EXPECT_FALSE(outcomes[1].converged);
    EXPECT_FALSE(outcomes[1].error.empty());
}

TEST_F(AutoscaleTest, AutoscaleAllIsolatesUnexpectedErrors) {
    BundleChannels channels;
    channels.signal = std::make_shared<DisconnectedChannel>("UPD_signal");
    channels.gainReadback = upd_->readback();
    channels.rangeSelect = upd_->rangeSelect();
    channels.mode = upd_->mode();
    auto upd = std::make_shared<DetectorControlBundle>("UPD", scaler0_,
                                                       std::move(channels));
    auto trd = trd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd, trd});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].counter, "scaler0");
    EXPECT_FALSE(outcomes[0].converged);
    EXPECT_THAT(outcomes[0].error, HasSubstr("CA disconnected"));
    EXPECT_TRUE(outcomes[1].converged);
    EXPECT_GT(scaler1_->getTriggerCount(), 0);
}

TEST_F(AutoscaleTest, AutoscaleAllOpensShutterFirst) {
    auto shutter = std::make_shared<MockShutter>();
    auto upd = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd}, {}, shutter);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].converged);
    EXPECT_THAT(shutter->getRequests(), ElementsAre(ShutterState::Open));
    EXPECT_EQ(shutter->getState(), ShutterState::Open);
}

TEST_F(AutoscaleTest, ShutterThatWillNotOpenStopsAutoscale) {
    auto shutter = std::make_shared<MockShutter>();
    shutter->setFailMoves(true);
    auto upd = upd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    EXPECT_THROW(coordinator.autoscaleAll({upd}, {}, shutter), HardwareError);
    EXPECT_EQ(scaler0_->getTriggerCount(), 0);
}

TEST_F(AutoscaleTest, ParallelGroupsGiveSameResult) {
    options_.parallelGroups = true;
    auto upd = upd_->makeBundle();
    auto trd = trd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);

    auto outcomes = coordinator.autoscaleAll({upd, trd});

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].counter, "scaler0");
    EXPECT_EQ(outcomes[1].counter, "scaler1");
    EXPECT_TRUE(outcomes[0].converged);
    EXPECT_TRUE(outcomes[1].converged);
    EXPECT_EQ(cache_.size(), 2u);
}

TEST_F(AutoscaleTest, AutoscaleAllPropagatesCancellation) {
    options_.parallelGroups = true;
    auto upd = upd_->makeBundle();
    auto trd = trd_->makeBundle();
    AutoscaleCoordinator coordinator(cache_, options_);
    std::stop_source source;
    source.request_stop();

    EXPECT_THROW(coordinator.autoscaleAll({upd, trd}, source.get_token()),
                 OperationCancelled);
}

TEST_F(AutoscaleTest, FreeFunctionReportsConvergence) {
    auto bundle = upd_->makeBundle();

    EXPECT_TRUE(autoscale(ResourceGroup{scaler0_, {bundle}}, cache_));
}

TEST(DescribeConvergenceTest, ListsEveryBundle) {
    std::vector<BundleConvergence> convergence{
        {"UPD", true, false, 2u, 1e6}, {"I0", false, true, std::nullopt, 10}};

    auto text = describeConvergence(convergence);

    EXPECT_THAT(text, HasSubstr("UPD: gain=2"));
    EXPECT_THAT(text, HasSubstr("I0: gain=?"));
}
