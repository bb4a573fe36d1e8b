/*
 * autoscale.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "autoscale.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "counter_guard.hpp"
#include "exception/exception.hpp"

namespace usaxs::device {

AutoscaleCoordinator::AutoscaleCoordinator(GainCache& cache,
                                           AutoscaleOptions options)
    : cache_(cache), options_(options) {
    if (!(options_.countTime > 0)) {
        THROW_INVALID_ARGUMENT("Autoscale count time must be positive");
    }
    if (options_.maxIterations == 0) {
        THROW_INVALID_ARGUMENT("Autoscale needs at least one iteration");
    }
}

auto AutoscaleCoordinator::readGain(DetectorControlBundle& bundle,
                                    const std::string& counter)
    -> std::optional<std::uint32_t> {
    auto gain = bundle.readGainIndex();
    if (gain) {
        cache_.store(counter, bundle.getGainIdentity(), *gain);
    }
    return gain;
}

void AutoscaleCoordinator::seedFromCache(const ResourceGroup& group,
                                         const std::string& counter,
                                         const std::stop_token& stopToken) {
    for (const auto& bundle : group.bundles) {
        auto known = cache_.lookup(counter, bundle->getGainIdentity());
        if (!known) {
            continue;
        }
        if (*known >= bundle->getGainChannel().getRangeCount()) {
            spdlog::warn("{}: cached gain {} out of range, ignored",
                         bundle->getNickname(), *known);
            continue;
        }
        checkpoint(stopToken, bundle->getNickname() + " cached gain");
        if (!bundle->getGainChannel().setGain(*known,
                                              options_.writeTimeout)) {
            spdlog::warn("{}: cannot restore cached gain {}",
                         bundle->getNickname(), *known);
        }
    }
}

auto AutoscaleCoordinator::autoscale(const ResourceGroup& group,
                                     std::stop_token stopToken)
    -> AutoscaleOutcome {
    if (group.bundles.empty()) {
        return AutoscaleOutcome{group.counter ? group.counter->getName() : "",
                                true, 0, {}, {}};
    }
    if (!group.counter) {
        THROW_INVALID_BUNDLE("Resource group has no counting device");
    }

    AutoscaleOutcome outcome;
    {
        std::scoped_lock lock(group.counter->getOperationMutex());
        CounterStateGuard guard(*group.counter);
        outcome = converge(group, stopToken);
        if (!guard.restore()) {
            spdlog::error("{}: cannot restore counter configuration",
                          group.counter->getName());
        }
    }

    if (!outcome.converged) {
        auto message = group.bundles.front()->getNickname() +
                       ": autoscale did not converge after " +
                       std::to_string(outcome.iterations) + " iteration(s) " +
                       describeConvergence(outcome.convergence);
        if (options_.liveMode) {
            THROW_AUTOSCALE_ERROR(outcome.convergence, message);
        }
        spdlog::warn("{}", message);
    }
    return outcome;
}

auto AutoscaleCoordinator::converge(const ResourceGroup& group,
                                    const std::stop_token& stopToken)
    -> AutoscaleOutcome {
    auto& counter = *group.counter;
    const auto& name = counter.getName();

    CounterConfiguration config{options_.countTime, options_.counterDelay,
                                CountMode::OneShot};
    if (!counter.configure(config)) {
        THROW_HARDWARE_ERROR("Cannot configure " + name + " for autoscale");
    }

    double settle = options_.minimumSettlingTime;
    for (const auto& bundle : group.bundles) {
        checkpoint(stopToken, bundle->getNickname() + " gain change");
        if (!bundle->setMode(AutorangeMode::Automatic,
                             options_.writeTimeout)) {
            THROW_HARDWARE_ERROR(bundle->getNickname() +
                                 ": cannot enable automatic gain");
        }
        settle = std::max(settle, bundle->getSettlingTime());
    }
    seedFromCache(group, name, stopToken);

    std::unordered_map<std::string, std::optional<std::uint32_t>> previous;
    for (const auto& bundle : group.bundles) {
        previous[bundle->getNickname()] = readGain(*bundle, name);
    }
    sleepSeconds(settle);

    AutoscaleOutcome outcome;
    outcome.counter = name;
    auto timeout = triggerTimeout(options_.countTime, options_.triggerMargin);

    for (std::uint32_t iteration = 1; iteration <= options_.maxIterations;
         ++iteration) {
        checkpoint(stopToken, "autoscale iteration " +
                                  std::to_string(iteration));
        outcome.iterations = iteration;
        outcome.convergence.clear();

        bool counted = counter.triggerAndWait(timeout);
        if (!counted) {
            spdlog::warn("{}: count {} did not complete", name, iteration);
        }
        double elapsed = counted ? counter.elapsedTime() : 0.0;

        bool all = counted;
        for (const auto& bundle : group.bundles) {
            BundleConvergence state;
            state.nickname = bundle->getNickname();
            state.gainIndex = readGain(*bundle, name);
            auto& last = previous[state.nickname];
            state.gainStable = state.gainIndex.has_value() &&
                               state.gainIndex == last;
            last = state.gainIndex;

            auto counts = bundle->readCounts();
            if (counted && counts && elapsed > 0) {
                state.observedRate = *counts / elapsed;
                state.notSaturated =
                    state.observedRate <= bundle->getMaxCountRate();
            }
            all = all && state.converged();
            outcome.convergence.push_back(std::move(state));
        }
        spdlog::debug("{}: iteration {} {}", name, iteration,
                      describeConvergence(outcome.convergence));

        if (all) {
            outcome.converged = true;
            for (const auto& bundle : group.bundles) {
                if (!bundle->setMode(AutorangeMode::Manual,
                                     options_.writeTimeout)) {
                    spdlog::warn("{}: cannot switch to manual gain",
                                 bundle->getNickname());
                }
            }
            spdlog::info("{}: autoscale converged in {} iteration(s)", name,
                         iteration);
            break;
        }
    }
    return outcome;
}

auto AutoscaleCoordinator::isolated(const ResourceGroup& group,
                                    std::stop_token stopToken)
    -> AutoscaleOutcome {
    const auto& nickname = group.bundles.front()->getNickname();
    try {
        return autoscale(group, std::move(stopToken));
    } catch (const OperationCancelled&) {
        throw;
    } catch (const AutoscaleError& e) {
        spdlog::warn("{}: {} - will continue despite warning", nickname,
                     e.what());
        return AutoscaleOutcome{group.counter->getName(), false, 0,
                                e.getLastConvergence(), e.what()};
    } catch (const HardwareError& e) {
        spdlog::error("{}: {} - will continue anyway", nickname, e.what());
        return AutoscaleOutcome{group.counter->getName(), false, 0, {},
                                e.what()};
    } catch (const InvalidGainError& e) {
        spdlog::error("{}: {} - will continue anyway", nickname, e.what());
        return AutoscaleOutcome{group.counter->getName(), false, 0, {},
                                e.what()};
    } catch (const ConfigurationError& e) {
        spdlog::error("{}: {} - will continue anyway", nickname, e.what());
        return AutoscaleOutcome{group.counter->getName(), false, 0, {},
                                e.what()};
    } catch (const std::exception& e) {
        spdlog::error("{}: unexpected error {} - will continue anyway",
                      nickname, e.what());
        return AutoscaleOutcome{group.counter->getName(), false, 0, {},
                                e.what()};
    }
}

auto AutoscaleCoordinator::autoscaleAll(
    const std::vector<BundlePtr>& bundles, std::stop_token stopToken,
    const std::shared_ptr<Shutter>& shutter) -> std::vector<AutoscaleOutcome> {
    moveShutter(shutter, ShutterState::Open, options_.writeTimeout);
    auto groups = groupByCounter(bundles);
    std::vector<AutoscaleOutcome> outcomes;
    outcomes.reserve(groups.size());

    if (!options_.parallelGroups || groups.size() < 2) {
        for (const auto& group : groups) {
            outcomes.push_back(isolated(group, stopToken));
        }
        return outcomes;
    }

    std::vector<std::future<AutoscaleOutcome>> pending;
    pending.reserve(groups.size());
    for (const auto& group : groups) {
        pending.push_back(std::async(std::launch::async,
                                     [this, &group, stopToken] {
                                         return isolated(group, stopToken);
                                     }));
    }
    // Every future is drained before a cancellation is rethrown.
    std::exception_ptr cancelled;
    for (auto& future : pending) {
        try {
            outcomes.push_back(future.get());
        } catch (const OperationCancelled&) {
            if (!cancelled) {
                cancelled = std::current_exception();
            }
        }
    }
    if (cancelled) {
        std::rethrow_exception(cancelled);
    }
    return outcomes;
}

auto autoscale(const ResourceGroup& group, GainCache& cache, double countTime,
               std::uint32_t maxIterations, std::stop_token stopToken)
    -> bool {
    AutoscaleOptions options;
    options.countTime = countTime;
    options.maxIterations = maxIterations;
    AutoscaleCoordinator coordinator(cache, options);
    return coordinator.autoscale(group, std::move(stopToken)).converged;
}

}  // namespace usaxs::device
