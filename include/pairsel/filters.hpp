#pragma once

/// @file include/pairsel/filters.hpp
/// @brief The three-stage statistical filter cascade over candidate pairs.
///
/// # Module: Selection Filters
///
/// ## Responsibility
/// Narrow the candidate list to pairs whose spread is tradeable:
///
///   CointegrationFilter  : p-value ≤ threshold             (inclusive)
///   HurstFilter          : H(spread) < threshold           (strict)
///   MeanReversionFilter  : min < half-life < max           (strict both)
///                          then crossover_pass == true
///
/// Each filter returns an outcome struct holding every record it evaluated
/// plus the retained subset, so intermediate counts stay reportable.
///
/// ## Collaborators
/// The cointegration test and the OU estimation are injected as callables.
/// A collaborator must return exactly one record per input pair, in input
/// order. A different record count raises `InvalidInput`.
///
/// ## Guarantees
/// - Retained lists preserve input order
/// - Retained count ≤ input count at every stage
///
/// ## Errors
/// - `NoCandidates` — the filter received an empty pair list
/// - `InvalidInput` — collaborator contract violated, or a pair references
///                    an asset missing from the price panel

#include "pairsel/types.hpp"
#include "pairsel/constants.hpp"
#include "pairsel/stats.hpp"

#include <functional>
#include <span>
#include <vector>

namespace pairsel::filters {

// ─── Collaborator Seams ───────────────────────────────────────────────────────

/// (prices, candidates) → one CointegrationResult per candidate.
using CointegrationTestFn = std::function<std::vector<CointegrationResult>(
    const PricePanel&, std::span<const AssetPair>)>;

/// (spreads, pairs, test window in years, min crossings per year)
///   → one OUFitResult per pair.
using OUEstimateFn = std::function<std::vector<OUFitResult>(
    const SpreadTable&, std::span<const AssetPair>, int, double)>;

// ─── CointegrationFilter ──────────────────────────────────────────────────────

struct CointegrationOutcome {
    std::vector<CointegrationResult> results;  ///< One per candidate
    std::vector<CointegrationResult> passing;  ///< pvalue ≤ threshold
};

class CointegrationFilter {
public:
    explicit CointegrationFilter(CointegrationTestFn test);

    [[nodiscard]] CointegrationOutcome
    filter(const PricePanel& prices,
           std::span<const AssetPair> candidates,
           double pvalue_threshold = constants::DEFAULT_PVALUE_THRESHOLD) const;

private:
    CointegrationTestFn test_;
};

// ─── HurstFilter ──────────────────────────────────────────────────────────────

/// Exponent computed for one cointegrated pair.
struct HurstReading {
    AssetPair pair;
    std::optional<double> exponent;  ///< nullopt: undefined, pair rejected
};

struct HurstOutcome {
    SpreadTable spreads;                ///< Columns of the passing pairs only
    std::vector<AssetPair> passing;     ///< H < threshold, input order
    std::vector<HurstReading> readings; ///< One per input record
};

class HurstFilter {
public:
    explicit HurstFilter(std::size_t max_lags = constants::DEFAULT_HURST_MAX_LAGS) noexcept
        : estimator_(max_lags) {}

    [[nodiscard]] HurstOutcome
    filter(const PricePanel& prices,
           std::span<const CointegrationResult> cointegrated,
           double hurst_threshold = constants::DEFAULT_HURST_THRESHOLD) const;

    /// price[first] − hedge_ratio · price[second] over the full price index.
    ///
    /// # Errors
    /// `InvalidInput` if either asset is not a column of `prices`.
    [[nodiscard]] static Vector build_spread(const PricePanel& prices,
                                             const CointegrationResult& record);

private:
    stats::HurstEstimator estimator_;
};

// ─── MeanReversionFilter ──────────────────────────────────────────────────────

/// Exclusive half-life bounds, in observations.
struct HalfLifeBounds {
    double min = constants::DEFAULT_HALF_LIFE_MIN;
    double max = constants::DEFAULT_HALF_LIFE_MAX;
};

struct MeanReversionOutcome {
    std::vector<OUFitResult> fits;          ///< One per input pair
    std::vector<AssetPair> half_life_pass;  ///< min < half-life < max
    std::vector<AssetPair> final_pairs;     ///< ... and crossover_pass
};

class MeanReversionFilter {
public:
    explicit MeanReversionFilter(OUEstimateFn estimate,
                                 HalfLifeBounds bounds = HalfLifeBounds{},
                                 int test_window_years = constants::DEFAULT_TEST_WINDOW_YEARS);

    [[nodiscard]] MeanReversionOutcome
    filter(const SpreadTable& spreads,
           std::span<const AssetPair> pairs,
           double min_crossovers_per_year = constants::DEFAULT_MIN_CROSSOVERS_PER_YEAR) const;

    [[nodiscard]] const HalfLifeBounds& bounds() const noexcept { return bounds_; }
    [[nodiscard]] int test_window_years() const noexcept { return window_years_; }

private:
    OUEstimateFn estimate_;
    HalfLifeBounds bounds_;
    int window_years_;
};

}  // namespace pairsel::filters
