#pragma once
/**
 * @file  stats.hpp
 * @brief Descriptive statistics, least-squares line fit and Hurst exponent.
 *
 * Module:  src/stats/
 *
 * Responsibility
 * --------------
 * Small numerical kernels shared by the filters and the statistical
 * collaborators:
 *
 *   mean(x), population_stddev(x)       (divisor n)
 *   fit_line(x, y)  → y ≈ intercept + slope · x
 *   HurstEstimator  → H from the scaling of lagged differences
 *
 * Design Constraints
 * ------------------
 *   • All fallible operations return std::optional (no exceptions).
 *   • All public functions are noexcept.
 *   • Inputs are read through std::span; nothing is copied unless needed.
 */

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "pairsel/constants.hpp"

namespace pairsel::stats {

// ── Descriptive statistics ────────────────────────────────────────────────────

/**
 * @brief Arithmetic mean.
 * @return std::nullopt for an empty input.
 */
[[nodiscard]] std::optional<double>
mean(std::span<const double> values) noexcept;

/**
 * @brief Population standard deviation (divisor n, not n − 1).
 * @return std::nullopt for an empty input.
 */
[[nodiscard]] std::optional<double>
population_stddev(std::span<const double> values) noexcept;

// ── LinearFit ─────────────────────────────────────────────────────────────────

/// Ordinary least-squares line y = intercept + slope · x.
struct LinearFit {
    double slope{0.0};
    double intercept{0.0};
};

/**
 * @brief Least-squares fit of a straight line through (x[i], y[i]).
 *
 * @return std::nullopt if the sizes differ, fewer than two points are given,
 *         x has no spread, or any input is non-finite.
 */
[[nodiscard]] std::optional<LinearFit>
fit_line(std::span<const double> x, std::span<const double> y) noexcept;

// ── HurstEstimator ────────────────────────────────────────────────────────────

/**
 * @brief Hurst exponent of a series from lagged-difference scaling.
 *
 * Algorithm:
 *   1. For each lag τ ∈ [2, max_lags):
 *        t(τ) = √( σ(s[τ:] − s[:−τ]) )      σ = population std
 *   2. Fit log t(τ) = c + m · log τ by least squares.
 *   3. H = 2 · m.
 *
 * Interpretation: H < 0.5 mean reverting, H ≈ 0.5 random walk,
 * H > 0.5 trending.
 *
 * The estimate is invariant under s → a·s + b for a ≠ 0: scaling shifts
 * every log t(τ) by the same constant, leaving the slope unchanged.
 *
 * Non-finite values are gaps on the time axis: s[t] − s[t−τ] is skipped
 * when either end is non-finite, and every other difference keeps its lag.
 */
class HurstEstimator {
public:
    explicit HurstEstimator(std::size_t max_lags = constants::DEFAULT_HURST_MAX_LAGS) noexcept
        : max_lags_(max_lags) {}

    /**
     * @return H, or std::nullopt if max_lags < 4 (fewer than two lags), the
     *         series has no more than max_lags finite values, or some lag
     *         has no usable difference or zero deviation (log undefined).
     */
    [[nodiscard]] std::optional<double>
    estimate(std::span<const double> series) const noexcept;

    [[nodiscard]] std::size_t max_lags() const noexcept { return max_lags_; }

private:
    std::size_t max_lags_;
};

} // namespace pairsel::stats
