#pragma once

#include <cstddef>
#include <limits>

/// @file include/pairsel/constants.hpp
/// @brief Default thresholds and numerical constants for pairs selection.

namespace pairsel::constants {

// ─── Clustering ───────────────────────────────────────────────────────────────

/// Label assigned to points that belong to no dense cluster.
static constexpr int NOISE_LABEL = -1;

/// OPTICS neighbourhood size (the point itself included).
static constexpr std::size_t DEFAULT_MIN_SAMPLES = 5;

/// OPTICS steepness threshold for xi cluster extraction.
static constexpr double DEFAULT_XI = 0.05;

/// OPTICS neighbourhood radius. Unbounded by default.
static constexpr double DEFAULT_MAX_EPS = std::numeric_limits<double>::infinity();

// ─── Dimensionality Reduction ─────────────────────────────────────────────────

/// Number of principal components kept as features per asset.
/// Values above ~15 make density clustering unreliable.
static constexpr std::size_t DEFAULT_NUM_FEATURES = 10;

// ─── Selection Criteria ───────────────────────────────────────────────────────

/// Maximum cointegration p-value (inclusive).
static constexpr double DEFAULT_PVALUE_THRESHOLD = 0.01;

/// Hurst exponent must be strictly below this value (0.5 = random walk).
static constexpr double DEFAULT_HURST_THRESHOLD = 0.5;

/// Exclusive upper bound of the lag range used by the Hurst estimator.
static constexpr std::size_t DEFAULT_HURST_MAX_LAGS = 100;

/// Half-life bounds in observations, both exclusive.
static constexpr double DEFAULT_HALF_LIFE_MIN = 1.0;
static constexpr double DEFAULT_HALF_LIFE_MAX = 365.0;

/// Required spread mean crossings per year (roughly monthly).
static constexpr double DEFAULT_MIN_CROSSOVERS_PER_YEAR = 12.0;

/// Trailing window, in calendar years, used for the OU evaluation.
static constexpr int DEFAULT_TEST_WINDOW_YEARS = 2;

// ─── Statistical Tests ────────────────────────────────────────────────────────

/// Minimum paired observations for an Engle-Granger test.
static constexpr std::size_t MIN_COINTEGRATION_OBSERVATIONS = 30;

/// Mean length of a Gregorian year in days.
static constexpr double DAYS_PER_YEAR = 365.25;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Below this a standard deviation is treated as zero.
static constexpr double FLAT_STDDEV_THRESHOLD = 1e-12;

/// Below this a regression denominator is treated as singular.
static constexpr double SINGULARITY_EPSILON = 1e-14;

}  // namespace pairsel::constants
