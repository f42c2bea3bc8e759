#pragma once

/// @file include/pairsel/pipeline.hpp
/// @brief Typed pipeline states and the PairsSelector driver.
///
/// # Module: Pipeline Orchestrator
///
/// ## Responsibility
/// Sequence the selection stages and keep every intermediate artifact
/// available for reporting:
///
///   Raw ─compute_returns→ ReturnsComputed ─reduce_dimensions→ FeaturesReduced
///       ─cluster_assets→ Clustered ─generate_candidates→ CandidatesGenerated
///       ─filter_cointegration→ CointegrationFiltered ─filter_hurst→
///       HurstFiltered ─filter_mean_reversion→ Finalized
///
/// ## State Machine
/// `PipelineState<S>` is an immutable value. Each transition is a free
/// function taking exactly its predecessor state, so a stage cannot be run
/// out of order: the call does not compile. Artifact accessors are
/// constrained with `requires (S >= ...)` and only exist from the state that
/// produced the artifact onward. Artifacts are held by
/// `shared_ptr<const T>`, so successor states share rather than copy them.
///
/// ## Usage
/// ```cpp
/// PairsSelector selector;
/// auto prices = core::PriceLoader::load_csv("prices.csv");
/// if (prices) {
///     const auto final_state = selector.run(*prices);
///     fmt::print("{}", summarize(final_state).to_string());
/// }
/// ```
///
/// ## Errors
/// Every transition propagates the `PipelineError` of the stage it runs.

#include "pairsel/candidates.hpp"
#include "pairsel/clustering.hpp"
#include "pairsel/filters.hpp"
#include "pairsel/reduction.hpp"
#include "pairsel/stat_arb.hpp"
#include "pairsel/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pairsel::pipeline {

// ─── Stage ────────────────────────────────────────────────────────────────────

enum class Stage : int {
    Raw = 0,
    ReturnsComputed,
    FeaturesReduced,
    Clustered,
    CandidatesGenerated,
    CointegrationFiltered,
    HurstFiltered,
    Finalized,
};

namespace detail {

/// Everything produced so far; later pointers stay null in earlier states.
struct Artifacts {
    std::shared_ptr<const PricePanel> prices;
    std::shared_ptr<const ReturnPanel> returns;
    std::shared_ptr<const reduction::PcaResult> pca;
    std::shared_ptr<const FeatureTable> features;
    std::shared_ptr<const cluster::OpticsResult> optics;
    std::shared_ptr<const ClusterAssignment> clusters;
    std::shared_ptr<const std::vector<AssetPair>> candidates;
    std::shared_ptr<const filters::CointegrationOutcome> cointegration;
    std::shared_ptr<const filters::HurstOutcome> hurst;
    std::shared_ptr<const filters::MeanReversionOutcome> mean_reversion;
};

struct StateAccess;

}  // namespace detail

// ─── PipelineState ────────────────────────────────────────────────────────────

template <Stage S>
class PipelineState {
public:
    static constexpr Stage stage = S;

    [[nodiscard]] const PricePanel& prices() const noexcept { return *artifacts_.prices; }

    [[nodiscard]] const ReturnPanel& returns() const noexcept
        requires (S >= Stage::ReturnsComputed) { return *artifacts_.returns; }

    [[nodiscard]] const reduction::PcaResult& pca() const noexcept
        requires (S >= Stage::FeaturesReduced) { return *artifacts_.pca; }

    [[nodiscard]] const FeatureTable& features() const noexcept
        requires (S >= Stage::FeaturesReduced) { return *artifacts_.features; }

    [[nodiscard]] const cluster::OpticsResult& optics() const noexcept
        requires (S >= Stage::Clustered) { return *artifacts_.optics; }

    [[nodiscard]] const ClusterAssignment& clusters() const noexcept
        requires (S >= Stage::Clustered) { return *artifacts_.clusters; }

    [[nodiscard]] const std::vector<AssetPair>& candidates() const noexcept
        requires (S >= Stage::CandidatesGenerated) { return *artifacts_.candidates; }

    [[nodiscard]] const filters::CointegrationOutcome& cointegration() const noexcept
        requires (S >= Stage::CointegrationFiltered) { return *artifacts_.cointegration; }

    [[nodiscard]] const filters::HurstOutcome& hurst() const noexcept
        requires (S >= Stage::HurstFiltered) { return *artifacts_.hurst; }

    [[nodiscard]] const SpreadTable& spreads() const noexcept
        requires (S >= Stage::HurstFiltered) { return artifacts_.hurst->spreads; }

    [[nodiscard]] const filters::MeanReversionOutcome& mean_reversion() const noexcept
        requires (S >= Stage::Finalized) { return *artifacts_.mean_reversion; }

    [[nodiscard]] const std::vector<AssetPair>& final_pairs() const noexcept
        requires (S >= Stage::Finalized) { return artifacts_.mean_reversion->final_pairs; }

private:
    explicit PipelineState(detail::Artifacts artifacts)
        : artifacts_(std::move(artifacts)) {}

    friend struct detail::StateAccess;

    detail::Artifacts artifacts_;
};

using RawState          = PipelineState<Stage::Raw>;
using ReturnsState      = PipelineState<Stage::ReturnsComputed>;
using FeaturesState     = PipelineState<Stage::FeaturesReduced>;
using ClusteredState    = PipelineState<Stage::Clustered>;
using CandidatesState   = PipelineState<Stage::CandidatesGenerated>;
using CointegratedState = PipelineState<Stage::CointegrationFiltered>;
using HurstState        = PipelineState<Stage::HurstFiltered>;
using FinalState        = PipelineState<Stage::Finalized>;

namespace detail {

/// Builds states and reads their artifacts on behalf of the transitions.
struct StateAccess {
    template <Stage S>
    [[nodiscard]] static PipelineState<S> make(Artifacts artifacts) {
        return PipelineState<S>(std::move(artifacts));
    }

    template <Stage S>
    [[nodiscard]] static const Artifacts& artifacts(const PipelineState<S>& state) noexcept {
        return state.artifacts_;
    }
};

}  // namespace detail

// ─── Transitions ──────────────────────────────────────────────────────────────

/// Wrap a validated price panel. Throws `InvalidInput` for a malformed panel.
[[nodiscard]] RawState make_state(PricePanel prices);

[[nodiscard]] ReturnsState compute_returns(const RawState& state);

/// Throws `InvalidInput` when the returns have no complete observation,
/// naming the assets with fewer than two prices.

[[nodiscard]] FeaturesState reduce_dimensions(const ReturnsState& state,
                                              std::size_t num_features);

[[nodiscard]] ClusteredState cluster_assets(const FeaturesState& state,
                                            const cluster::OpticsConfig& config);

[[nodiscard]] CandidatesState generate_candidates(const ClusteredState& state);

[[nodiscard]] CointegratedState filter_cointegration(const CandidatesState& state,
                                                     const filters::CointegrationFilter& filter,
                                                     double pvalue_threshold);

[[nodiscard]] HurstState filter_hurst(const CointegratedState& state,
                                      const filters::HurstFilter& filter,
                                      double hurst_threshold);

[[nodiscard]] FinalState filter_mean_reversion(const HurstState& state,
                                               const filters::MeanReversionFilter& filter,
                                               double min_crossovers_per_year);

// ─── SelectionSummary ─────────────────────────────────────────────────────────

/// Artifact counts at each stage of a finished run.
struct SelectionSummary {
    std::size_t assets{0};
    std::size_t clusters{0};
    std::size_t candidates{0};
    std::size_t cointegrated{0};
    std::size_t hurst_passing{0};
    std::size_t half_life_passing{0};
    std::size_t final_pairs{0};

    /// Two-column report table, one line per count.
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] SelectionSummary summarize(const FinalState& state);

// ─── SelectorConfig ───────────────────────────────────────────────────────────

struct SelectorConfig {
    /// PCA components kept per asset.
    std::size_t num_features = constants::DEFAULT_NUM_FEATURES;

    cluster::OpticsConfig optics{};

    double pvalue_threshold = constants::DEFAULT_PVALUE_THRESHOLD;
    double hurst_threshold = constants::DEFAULT_HURST_THRESHOLD;
    std::size_t hurst_max_lags = constants::DEFAULT_HURST_MAX_LAGS;
    filters::HalfLifeBounds half_life{};
    double min_crossovers_per_year = constants::DEFAULT_MIN_CROSSOVERS_PER_YEAR;

    /// Trailing window, in calendar years, handed to the OU estimator.
    int test_window_years = constants::DEFAULT_TEST_WINDOW_YEARS;

    /// If true, emit one diagnostic line per stage to stderr.
    bool verbose = false;
};

// ─── PairsSelector ────────────────────────────────────────────────────────────

/// Runs the full chain from prices to the final pair list.
class PairsSelector {
public:
    explicit PairsSelector(
        SelectorConfig config = SelectorConfig{},
        filters::CointegrationTestFn cointegration_test = stat_arb::EngleGrangerTester{},
        filters::OUEstimateFn ou_estimator = stat_arb::OrnsteinUhlenbeckEstimator{});

    /// # Errors
    /// Propagates the first `PipelineError` raised by any stage.
    [[nodiscard]] FinalState run(PricePanel prices) const;

    [[nodiscard]] const SelectorConfig& config() const noexcept { return config_; }

private:
    SelectorConfig config_;
    filters::CointegrationTestFn cointegration_test_;
    filters::OUEstimateFn ou_estimator_;
};

}  // namespace pairsel::pipeline
