/*
 * ustep.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-8

Description: Non-uniform step series for USAXS scans

**************************************************/

#ifndef USAXS_TOOLS_USTEP_HPP
#define USAXS_TOOLS_USTEP_HPP

#include <cstddef>
#include <iterator>
#include <vector>

namespace usaxs::tools {

/**
 * @brief Parameters of a non-uniform step series.
 */
struct StepSeriesSpec {
    double start;      ///< First position of the series
    double reference;  ///< Position where steps are smallest (center)
    double finish;     ///< Last position of the series
    std::size_t numPoints;  ///< Number of positions, at least 2
    double exponent;   ///< Exponent applied to the distance from reference
    double minStep;    ///< Smallest allowed step size
};

/**
 * @brief Series of positions for a Bonse-Hart step scan.
 *
 * The step from position x is
 *
 *     step(x) = k * |x - reference|^exponent + minStep
 *
 * where the factor k is solved at construction so that numPoints positions
 * starting at start end at finish. The series is computed on demand and may
 * be iterated any number of times; the last position is always exactly
 * finish.
 *
 * @see https://www.jemian.org/SAS/ustep.pdf
 */
class StepSeries {
public:
    static constexpr int MAX_EXPANSION_ITERATIONS = 100;
    static constexpr int MAX_REFINEMENT_ITERATIONS = 100;
    static constexpr double STEP_LIMIT = 1e100;
    static constexpr double PRECISION_FRACTION = 0.2;

    /**
     * @brief Forward iterator computing positions on the fly.
     */
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = const double*;
        using reference = double;

        Iterator() = default;

        auto operator*() const -> double;
        auto operator++() -> Iterator&;
        auto operator++(int) -> Iterator;
        bool operator==(const Iterator& other) const {
            return index_ == other.index_;
        }
        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }

    private:
        friend class StepSeries;
        Iterator(const StepSeries* series, std::size_t index, double position)
            : series_(series), index_(index), position_(position) {}

        const StepSeries* series_{nullptr};
        std::size_t index_{0};
        double position_{0.0};
    };

    /**
     * @brief Solve the step factor for the given parameters.
     * @throw atom::error::InvalidArgument if numPoints < 2 or a parameter is
     * not finite.
     * @throw NumericDivergenceError if no factor can be bracketed.
     */
    explicit StepSeries(const StepSeriesSpec& spec);

    StepSeries(double start, double reference, double finish,
               std::size_t numPoints, double exponent, double minStep);

    [[nodiscard]] auto begin() const -> Iterator;
    [[nodiscard]] auto end() const -> Iterator;

    [[nodiscard]] auto size() const -> std::size_t { return spec_.numPoints; }
    [[nodiscard]] auto getFactor() const -> double { return factor_; }
    [[nodiscard]] auto getSign() const -> int { return sign_; }
    [[nodiscard]] auto getSpec() const -> const StepSeriesSpec& {
        return spec_;
    }

    /**
     * @brief Step size taken from position x with factor k.
     */
    [[nodiscard]] auto stepSize(double x, double k) const -> double;

    /**
     * @brief All positions of the series.
     */
    [[nodiscard]] auto toVector() const -> std::vector<double>;

private:
    static void validate(const StepSeriesSpec& spec);
    auto solveFactor() const -> double;
    auto spanDifference(double k) const -> double;
    auto positionAfter(double x, double k) const -> double {
        return x + sign_ * stepSize(x, k);
    }

    StepSeriesSpec spec_;
    int sign_;
    double factor_;
};

/**
 * @brief Generate the step series used by a USAXS scan.
 */
[[nodiscard]] auto generateStepSeries(double start, double reference,
                                      double finish, std::size_t numPoints,
                                      double exponent, double minStep)
    -> StepSeries;

}  // namespace usaxs::tools

#endif  // USAXS_TOOLS_USTEP_HPP
