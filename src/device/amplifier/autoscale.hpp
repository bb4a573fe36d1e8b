/*
 * autoscale.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Iterative convergence of amplifier gains across detector
channels that share a counting device

**************************************************/

#ifndef USAXS_DEVICE_AMPLIFIER_AUTOSCALE_HPP
#define USAXS_DEVICE_AMPLIFIER_AUTOSCALE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "gain_cache.hpp"
#include "grouping.hpp"
#include "types.hpp"

namespace usaxs::device {

struct AutoscaleOptions {
    double countTime{0.05};            ///< Preset time of each iteration (s)
    std::uint32_t maxIterations{9};
    double counterDelay{0.02};         ///< Delay before each count (s)
    double minimumSettlingTime{0.01};  ///< Lower bound of the settle wait (s)
    std::chrono::milliseconds writeTimeout{5000};
    std::chrono::milliseconds triggerMargin{2000};
    bool liveMode{true};        ///< Raise AutoscaleError when not converged
    bool parallelGroups{false};  ///< autoscaleAll runs groups concurrently
};

/**
 * @brief Result of autoscaling one resource group.
 */
struct AutoscaleOutcome {
    std::string counter;
    bool converged{false};
    std::uint32_t iterations{0};
    std::vector<BundleConvergence> convergence;  ///< Last iteration
    std::string error;  ///< Set by autoscaleAll when the group failed
};

/**
 * @class AutoscaleCoordinator
 * @brief Lets the amplifiers' autorange programs settle on a gain, counting
 * repeatedly until every gain is unchanged between two counts and no
 * channel is saturated.
 *
 * Known good gains are seeded from and written back to a GainCache shared
 * with later scans.
 */
class AutoscaleCoordinator {
public:
    /**
     * @throw atom::error::InvalidArgument if countTime is not positive or
     * maxIterations is zero.
     */
    explicit AutoscaleCoordinator(GainCache& cache,
                                  AutoscaleOptions options = {});

    [[nodiscard]] auto getOptions() const -> const AutoscaleOptions& {
        return options_;
    }

    /**
     * @brief Autoscale the bundles of one counting device.
     * @throw AutoscaleError if not converged and liveMode is set.
     * @throw HardwareError if the counter cannot be configured.
     * @throw OperationCancelled if a stop is requested.
     */
    auto autoscale(const ResourceGroup& group, std::stop_token stopToken = {})
        -> AutoscaleOutcome;

    /**
     * @brief Open the shutter, if given, and autoscale every group. Failures
     * of one group are logged and reported in its outcome; cancellation
     * propagates.
     * @throw HardwareError if the shutter does not open.
     */
    auto autoscaleAll(const std::vector<BundlePtr>& bundles,
                      std::stop_token stopToken = {},
                      const std::shared_ptr<Shutter>& shutter = nullptr)
        -> std::vector<AutoscaleOutcome>;

private:
    auto converge(const ResourceGroup& group, const std::stop_token& stopToken)
        -> AutoscaleOutcome;
    void seedFromCache(const ResourceGroup& group, const std::string& counter,
                       const std::stop_token& stopToken);
    auto readGain(DetectorControlBundle& bundle, const std::string& counter)
        -> std::optional<std::uint32_t>;
    auto isolated(const ResourceGroup& group, std::stop_token stopToken)
        -> AutoscaleOutcome;

    GainCache& cache_;
    AutoscaleOptions options_;
};

/**
 * @brief Autoscale one group with default options apart from the count time
 * and the iteration limit.
 * @return true if the group converged.
 */
auto autoscale(const ResourceGroup& group, GainCache& cache,
               double countTime = 0.05, std::uint32_t maxIterations = 9,
               std::stop_token stopToken = {}) -> bool;

}  // namespace usaxs::device

#endif  // USAXS_DEVICE_AMPLIFIER_AUTOSCALE_HPP
