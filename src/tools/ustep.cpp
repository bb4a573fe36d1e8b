/*
 * ustep.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "ustep.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "exception/exception.hpp"

namespace usaxs::tools {

auto StepSeries::Iterator::operator*() const -> double {
    // The computed last point only approximates finish.
    if (index_ + 1 == series_->size()) {
        return series_->spec_.finish;
    }
    return position_;
}

auto StepSeries::Iterator::operator++() -> Iterator& {
    position_ = series_->positionAfter(position_, series_->factor_);
    ++index_;
    return *this;
}

auto StepSeries::Iterator::operator++(int) -> Iterator {
    Iterator previous = *this;
    ++(*this);
    return previous;
}

StepSeries::StepSeries(const StepSeriesSpec& spec)
    : spec_(spec),
      sign_(spec.start < spec.finish ? 1 : -1),
      factor_(0.0) {
    validate(spec_);
    factor_ = solveFactor();
    spdlog::debug("Step series factor={} for {} points from {} to {}",
                  factor_, spec_.numPoints, spec_.start, spec_.finish);
}

StepSeries::StepSeries(double start, double reference, double finish,
                       std::size_t numPoints, double exponent, double minStep)
    : StepSeries(StepSeriesSpec{start, reference, finish, numPoints, exponent,
                                minStep}) {}

void StepSeries::validate(const StepSeriesSpec& spec) {
    if (spec.numPoints < 2) {
        THROW_INVALID_ARGUMENT("Step series needs at least 2 points, got " +
                               std::to_string(spec.numPoints));
    }
    if (!std::isfinite(spec.start) || !std::isfinite(spec.reference) ||
        !std::isfinite(spec.finish) || !std::isfinite(spec.exponent) ||
        !std::isfinite(spec.minStep)) {
        THROW_INVALID_ARGUMENT("Step series parameters must be finite");
    }
}

auto StepSeries::begin() const -> Iterator {
    return Iterator(this, 0, spec_.start);
}

auto StepSeries::end() const -> Iterator {
    return Iterator(this, spec_.numPoints, spec_.finish);
}

auto StepSeries::stepSize(double x, double k) const -> double {
    double distance = std::abs(x - spec_.reference);
    if (distance > STEP_LIMIT) {
        return STEP_LIMIT;
    }
    return k * std::pow(distance, spec_.exponent) + spec_.minStep;
}

auto StepSeries::toVector() const -> std::vector<double> {
    std::vector<double> positions;
    positions.reserve(spec_.numPoints);
    for (double position : *this) {
        positions.push_back(position);
    }
    return positions;
}

auto StepSeries::spanDifference(double k) const -> double {
    double x = spec_.start;
    for (std::size_t i = 1; i < spec_.numPoints; ++i) {
        x = positionAfter(x, k);
    }
    return std::abs(x - spec_.start) - std::abs(spec_.finish - spec_.start);
}

auto StepSeries::solveFactor() const -> double {
    const double spanTarget = std::abs(spec_.finish - spec_.start);
    const double spanPrecision = std::abs(spec_.minStep) * PRECISION_FRACTION;

    double factor = spanTarget / static_cast<double>(spec_.numPoints - 1);
    double diff = spanDifference(factor);
    if (std::abs(diff) <= spanPrecision) {
        return factor;
    }

    // f[0] keeps the factor with diff < 0, f[1] the one with diff > 0
    std::array<double, 2> f{factor, factor};
    std::array<double, 2> d{diff, diff};

    for (int i = 0; i < MAX_EXPANSION_ITERATIONS; ++i) {
        if (d[0] * d[1] < 0) {
            break;
        }
        factor *= diff < 0 ? 2.0 : 0.5;
        diff = spanDifference(factor);
        if (std::abs(diff) <= spanPrecision) {
            return factor;
        }
        std::size_t key = diff > d[1] ? 1 : 0;
        f[key] = factor;
        d[key] = diff;
        spdlog::trace("expand: diff={} key={} factor={}", diff, key, factor);
    }

    if (!(d[0] * d[1] < 0)) {
        THROW_NUMERIC_DIVERGENCE(
            "Could not bracket the step factor: start=" +
            std::to_string(spec_.start) +
            " finish=" + std::to_string(spec_.finish) +
            " points=" + std::to_string(spec_.numPoints) +
            " minStep=" + std::to_string(spec_.minStep));
    }

    for (int i = 0; i < MAX_REFINEMENT_ITERATIONS; ++i) {
        if ((d[1] - d[0]) > spanTarget) {
            factor = (f[0] + f[1]) / 2;
        } else {
            factor = f[0] - d[0] * (f[1] - f[0]) / (d[1] - d[0]);
        }
        diff = spanDifference(factor);
        if (std::abs(diff) <= spanPrecision) {
            if (!std::isfinite(factor) || factor < 0) {
                THROW_NUMERIC_DIVERGENCE("Step factor is not a finite "
                                         "non-negative number: " +
                                         std::to_string(factor));
            }
            return factor;
        }
        std::size_t key = diff < 0 ? 0 : 1;
        f[key] = factor;
        d[key] = diff;
        spdlog::trace("squeeze: diff={} key={} factor={}", diff, key, factor);
    }

    double best = std::abs(d[0]) < std::abs(d[1]) ? f[0] : f[1];
    spdlog::warn(
        "Step factor not refined to {} after {} iterations, using {} "
        "(span error {})",
        spanPrecision, MAX_REFINEMENT_ITERATIONS, best,
        std::min(std::abs(d[0]), std::abs(d[1])));
    if (!std::isfinite(best) || best < 0) {
        THROW_NUMERIC_DIVERGENCE("Step factor is not a finite non-negative "
                                 "number: " +
                                 std::to_string(best));
    }
    return best;
}

auto generateStepSeries(double start, double reference, double finish,
                        std::size_t numPoints, double exponent, double minStep)
    -> StepSeries {
    return StepSeries(start, reference, finish, numPoints, exponent, minStep);
}

}  // namespace usaxs::tools
