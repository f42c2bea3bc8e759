#pragma once

/// @file include/pairsel/stat_arb.hpp
/// @brief Default statistical collaborators: Engle-Granger cointegration
///        and Ornstein-Uhlenbeck mean-reversion estimation.
///
/// # Module: Statistical Arbitrage Tests
///
/// ## Responsibility
/// Supply the two per-pair collaborators the selection filters call through
/// `filters::CointegrationTestFn` and `filters::OUEstimateFn`:
///
///   EngleGrangerTester         — p-value + hedge ratio per candidate
///   OrnsteinUhlenbeckEstimator — θ, half-life, mean crossings per spread
///
/// and the kernels behind them (ADF regression, MacKinnon p-values).
///
/// ## Engle-Granger Two-Step
///   1. OLS  y_t = α + β·x_t + u_t        (β is the hedge ratio)
///   2. ADF on û without deterministic terms:
///        Δû_t = γ·û_{t−1} + Σ_{i=1..p} φ_i·Δû_{t−i} + ε_t
///      p chosen by minimum AIC over 0..maxlag,
///      maxlag = ⌈12·(n/100)^¼⌉ capped at n/2 − 1
///   3. p-value of t(γ) from the MacKinnon (1994) response surface for a
///      regression with constant and N = 2 variables
///
/// ## Ornstein-Uhlenbeck by AR(1)
///   x_t = a + b·x_{t−1} + ε_t  →  θ = −ln b,  half-life = ln 2 / θ
///   Defined only for 0 < b < 1; otherwise θ = NaN and half-life = +inf.
///
/// ## Error Handling
/// Kernels are noexcept and return std::optional. The collaborators throw
/// `PipelineError{InvalidInput}` only when asked about an asset or spread
/// column that the panel does not hold.

#include "pairsel/types.hpp"
#include "pairsel/constants.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <vector>

namespace pairsel::stat_arb {

// ─── ADF ──────────────────────────────────────────────────────────────────────

/// Augmented Dickey-Fuller regression output.
struct AdfResult {
    double statistic;      ///< t-value of the lagged level coefficient γ
    std::size_t used_lag;  ///< Lagged differences in the final regression
    std::size_t nobs;      ///< Observations in the final regression
};

/// ADF unit-root regression with no constant and no trend.
class AdfTest {
public:
    /// Default upper lag bound for a series of `nobs` points.
    [[nodiscard]] static std::size_t default_maxlag(std::size_t nobs) noexcept;

    /// Run the test with AIC lag selection over 0..maxlag.
    ///
    /// `maxlag` defaults to `default_maxlag(series.size())`.
    ///
    /// @return nullopt if the series is too short for even one lag-0
    ///         regression, contains a non-finite value, or the final
    ///         regression is singular or fits perfectly.
    [[nodiscard]] static std::optional<AdfResult>
    run(std::span<const double> series,
        std::optional<std::size_t> maxlag = std::nullopt) noexcept;
};

/// MacKinnon (1994) approximate asymptotic p-value of a unit-root or
/// cointegration t-statistic, regression with constant.
///
/// `n_vars` is the number of variables in the cointegrating relation:
/// 1 for a plain ADF test, 2 for an Engle-Granger pair.
///
/// @return nullopt for a NaN statistic or an unsupported `n_vars`.
[[nodiscard]] std::optional<double>
mackinnon_pvalue(double statistic, int n_vars) noexcept;

// ─── Engle-Granger ────────────────────────────────────────────────────────────

/// Which regression direction a pair is reported in.
enum class Orientation {
    AsGiven,       ///< Regress `first` on `second`
    LowestPValue,  ///< Test both directions, keep the smaller p-value
};

struct EngleGrangerConfig {
    Orientation orientation = Orientation::AsGiven;

    /// Pairwise-complete observations needed to run the test.
    std::size_t min_observations = constants::MIN_COINTEGRATION_OBSERVATIONS;
};

/// One directional Engle-Granger test.
struct EngleGrangerResult {
    double statistic{std::numeric_limits<double>::quiet_NaN()};
    double pvalue{1.0};
    double hedge_ratio{std::numeric_limits<double>::quiet_NaN()};
    double intercept{std::numeric_limits<double>::quiet_NaN()};
    std::size_t nobs{0};
};

/// Cointegration collaborator: Engle-Granger over a price panel.
class EngleGrangerTester {
public:
    explicit EngleGrangerTester(EngleGrangerConfig config = EngleGrangerConfig{});

    /// Test y = α + β·x for cointegration.
    ///
    /// Observations where either series is non-finite are dropped. Too few
    /// observations or a constant `x` leaves the default result (p-value 1,
    /// NaN hedge ratio). Perfectly collinear series give statistic −inf and
    /// p-value 0.
    [[nodiscard]] EngleGrangerResult test(std::span<const double> y,
                                          std::span<const double> x) const noexcept;

    /// One record per candidate, in candidate order.
    ///
    /// # Errors
    /// `InvalidInput` if a candidate names an asset missing from `prices`.
    [[nodiscard]] std::vector<CointegrationResult>
    operator()(const PricePanel& prices, std::span<const AssetPair> candidates) const;

    [[nodiscard]] const EngleGrangerConfig& config() const noexcept { return config_; }

private:
    EngleGrangerConfig config_;
};

// ─── Ornstein-Uhlenbeck ───────────────────────────────────────────────────────

/// AR(1) reading of a spread.
struct OuParameters {
    double ar_coefficient;  ///< b in x_t = a + b·x_{t−1}
    double theta;           ///< −ln b, NaN unless 0 < b < 1
    double half_life;       ///< ln 2 / θ, +inf unless 0 < b < 1
    double mean;            ///< a / (1 − b), NaN unless 0 < b < 1
};

struct OuEstimatorConfig {
    /// Observations needed inside the test window for the crossing check.
    std::size_t min_window_observations = 3;
};

/// Mean-reversion collaborator: OU fit and mean-crossing count per spread.
class OrnsteinUhlenbeckEstimator {
public:
    explicit OrnsteinUhlenbeckEstimator(OuEstimatorConfig config = OuEstimatorConfig{});

    /// Fit x_t = a + b·x_{t−1} by least squares.
    ///
    /// A step (x_{t−1}, x_t) with a non-finite end is skipped; the remaining
    /// steps keep their one-period spacing.
    ///
    /// @return nullopt for fewer than three points, fewer than two usable
    ///         steps, or a constant series.
    [[nodiscard]] static std::optional<OuParameters>
    fit(std::span<const double> series) noexcept;

    /// Strict sign changes of (x − mean(x)); a zero deviation keeps the
    /// previous sign.
    [[nodiscard]] static std::size_t
    count_mean_crossings(std::span<const double> series) noexcept;

    /// `last − years` in calendar years (Feb 29 maps to Feb 28). The test
    /// window holds the dates strictly after this cutoff.
    [[nodiscard]] static TimePoint window_cutoff(TimePoint last, int years) noexcept;

    /// One record per pair, in pair order.
    ///
    /// Everything is evaluated inside the trailing test window. The AR(1)
    /// fit runs on the window's own time axis, skipping steps that touch a
    /// missing value; crossings and the window span use the finite values. Crossings must reach
    /// `min_crossovers_per_year × window span in years`; a window with fewer
    /// than `min_window_observations` values fails the check.
    ///
    /// # Errors
    /// `InvalidInput` if a pair has no "(first, second)" column in `spreads`.
    [[nodiscard]] std::vector<OUFitResult>
    operator()(const SpreadTable& spreads,
               std::span<const AssetPair> pairs,
               int window_years,
               double min_crossovers_per_year) const;

private:
    OuEstimatorConfig config_;
};

}  // namespace pairsel::stat_arb
