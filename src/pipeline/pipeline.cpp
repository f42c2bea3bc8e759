/// @file src/pipeline/pipeline.cpp
/// @brief Pipeline transitions, selection summary and PairsSelector.

#include "pairsel/pipeline.hpp"
#include "pairsel/errors.hpp"
#include "pairsel/preprocess.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace pairsel::pipeline {

namespace {

using detail::Artifacts;
using detail::StateAccess;

/// Why a computed return panel came out without observations.
[[nodiscard]] std::string describe_empty_returns(const PricePanel& prices) {
    std::vector<std::string> unpriced;
    for (Eigen::Index j = 0; j < prices.values.cols(); ++j) {
        if (prices.values.col(j).array().isFinite().count() < 2) {
            unpriced.push_back(prices.columns[static_cast<std::size_t>(j)]);
        }
    }
    if (!unpriced.empty()) {
        return fmt::format("no complete return observation: fewer than two prices for {}",
                           fmt::join(unpriced, ", "));
    }
    return "no complete return observation: no date has a return for every asset";
}

template <Stage S>
[[nodiscard]] Artifacts artifacts_of(const PipelineState<S>& state) {
    return StateAccess::artifacts(state);
}

}  // anonymous namespace

// ─── Transitions ──────────────────────────────────────────────────────────────

RawState make_state(PricePanel prices) {
    if (auto problem = preprocess::ReturnPreprocessor::validate(prices)) {
        throw PipelineError(ErrorKind::InvalidInput, *problem);
    }
    Artifacts a;
    a.prices = std::make_shared<const PricePanel>(std::move(prices));
    return StateAccess::make<Stage::Raw>(std::move(a));
}

ReturnsState compute_returns(const RawState& state) {
    auto a = artifacts_of(state);
    a.returns = std::make_shared<const ReturnPanel>(
        preprocess::ReturnPreprocessor::compute(*a.prices));
    return StateAccess::make<Stage::ReturnsComputed>(std::move(a));
}

FeaturesState reduce_dimensions(const ReturnsState& state, std::size_t num_features) {
    auto a = artifacts_of(state);
    if (a.returns->rows() == 0) {
        throw PipelineError(ErrorKind::InvalidInput, describe_empty_returns(*a.prices));
    }
    reduction::PcaResult pca;
    auto features = reduction::DimensionalityReducer::reduce(*a.returns, num_features, pca);
    a.pca = std::make_shared<const reduction::PcaResult>(std::move(pca));
    a.features = std::make_shared<const FeatureTable>(std::move(features));
    return StateAccess::make<Stage::FeaturesReduced>(std::move(a));
}

ClusteredState cluster_assets(const FeaturesState& state, const cluster::OpticsConfig& config) {
    auto a = artifacts_of(state);
    cluster::OpticsResult details;
    auto assignment = cluster::ClusteringEngine(config).cluster(*a.features, details);
    a.optics = std::make_shared<const cluster::OpticsResult>(std::move(details));
    a.clusters = std::make_shared<const ClusterAssignment>(std::move(assignment));
    return StateAccess::make<Stage::Clustered>(std::move(a));
}

CandidatesState generate_candidates(const ClusteredState& state) {
    auto a = artifacts_of(state);
    a.candidates = std::make_shared<const std::vector<AssetPair>>(
        candidates::PairCandidateGenerator::generate(*a.clusters));
    return StateAccess::make<Stage::CandidatesGenerated>(std::move(a));
}

CointegratedState filter_cointegration(const CandidatesState& state,
                                       const filters::CointegrationFilter& filter,
                                       double pvalue_threshold) {
    auto a = artifacts_of(state);
    a.cointegration = std::make_shared<const filters::CointegrationOutcome>(
        filter.filter(*a.prices, *a.candidates, pvalue_threshold));
    return StateAccess::make<Stage::CointegrationFiltered>(std::move(a));
}

HurstState filter_hurst(const CointegratedState& state,
                        const filters::HurstFilter& filter,
                        double hurst_threshold) {
    auto a = artifacts_of(state);
    a.hurst = std::make_shared<const filters::HurstOutcome>(
        filter.filter(*a.prices, a.cointegration->passing, hurst_threshold));
    return StateAccess::make<Stage::HurstFiltered>(std::move(a));
}

FinalState filter_mean_reversion(const HurstState& state,
                                 const filters::MeanReversionFilter& filter,
                                 double min_crossovers_per_year) {
    auto a = artifacts_of(state);
    a.mean_reversion = std::make_shared<const filters::MeanReversionOutcome>(
        filter.filter(a.hurst->spreads, a.hurst->passing, min_crossovers_per_year));
    return StateAccess::make<Stage::Finalized>(std::move(a));
}

// ─── SelectionSummary ─────────────────────────────────────────────────────────

std::string SelectionSummary::to_string() const {
    std::string out;
    out += fmt::format("{:<32} {:>8}\n", "Assets", assets);
    out += fmt::format("{:<32} {:>8}\n", "Clusters formed", clusters);
    out += fmt::format("{:<32} {:>8}\n", "Candidate pairs", candidates);
    out += fmt::format("{:<32} {:>8}\n", "Pairs passing cointegration", cointegrated);
    out += fmt::format("{:<32} {:>8}\n", "Pairs passing Hurst threshold", hurst_passing);
    out += fmt::format("{:<32} {:>8}\n", "Pairs passing half-life", half_life_passing);
    out += fmt::format("{:<32} {:>8}\n", "Final selected pairs", final_pairs);
    return out;
}

SelectionSummary summarize(const FinalState& state) {
    SelectionSummary s;
    s.assets = state.clusters().assets.size();
    s.clusters = state.clusters().cluster_count();
    s.candidates = state.candidates().size();
    s.cointegrated = state.cointegration().passing.size();
    s.hurst_passing = state.hurst().passing.size();
    s.half_life_passing = state.mean_reversion().half_life_pass.size();
    s.final_pairs = state.final_pairs().size();
    return s;
}

// ─── PairsSelector ────────────────────────────────────────────────────────────

PairsSelector::PairsSelector(SelectorConfig config,
                             filters::CointegrationTestFn cointegration_test,
                             filters::OUEstimateFn ou_estimator)
    : config_(std::move(config))
    , cointegration_test_(std::move(cointegration_test))
    , ou_estimator_(std::move(ou_estimator))
{}

FinalState PairsSelector::run(PricePanel prices) const {
    const bool verbose = config_.verbose;

    const auto raw = make_state(std::move(prices));
    if (verbose) {
        fmt::print(stderr, "[pairsel] prices: {} observations x {} assets\n",
                   raw.prices().rows(), raw.prices().cols());
    }

    const auto returns = compute_returns(raw);
    if (verbose) {
        fmt::print(stderr, "[pairsel] returns: {} observations kept\n",
                   returns.returns().rows());
    }

    const auto features = reduce_dimensions(returns, config_.num_features);
    if (verbose) {
        fmt::print(stderr, "[pairsel] reduction: {} components, {:.1f}% variance explained\n",
                   features.features().dimensions(),
                   100.0 * features.pca().explained_variance_ratio.sum());
    }

    const auto clustered = cluster_assets(features, config_.optics);
    if (verbose) {
        const auto& labels = clustered.clusters().labels;
        const auto noise = static_cast<std::size_t>(
            std::count(labels.begin(), labels.end(), constants::NOISE_LABEL));
        fmt::print(stderr, "[pairsel] clustering: {} clusters, {} noise assets\n",
                   clustered.clusters().cluster_count(), noise);
    }

    const auto candidates = generate_candidates(clustered);
    if (verbose) {
        fmt::print(stderr, "[pairsel] candidates: {} pairs\n", candidates.candidates().size());
    }

    const filters::CointegrationFilter coint_filter(cointegration_test_);
    const auto cointegrated =
        filter_cointegration(candidates, coint_filter, config_.pvalue_threshold);
    if (verbose) {
        for (const auto& r : cointegrated.cointegration().results) {
            if (!std::isfinite(r.hedge_ratio)) {
                fmt::print(stderr, "[pairsel] cointegration: {} has no hedge ratio\n",
                           r.pair.label());
            }
        }
        fmt::print(stderr, "[pairsel] cointegration: {} of {} pairs at p <= {}\n",
                   cointegrated.cointegration().passing.size(),
                   cointegrated.cointegration().results.size(),
                   config_.pvalue_threshold);
    }

    const filters::HurstFilter hurst_filter(config_.hurst_max_lags);
    const auto hurst = filter_hurst(cointegrated, hurst_filter, config_.hurst_threshold);
    if (verbose) {
        for (const auto& reading : hurst.hurst().readings) {
            if (!reading.exponent) {
                fmt::print(stderr, "[pairsel] hurst: {} has no defined exponent\n",
                           reading.pair.label());
            }
        }
        fmt::print(stderr, "[pairsel] hurst: {} pairs below H = {}\n",
                   hurst.hurst().passing.size(), config_.hurst_threshold);
    }

    const filters::MeanReversionFilter mr_filter(
        ou_estimator_, config_.half_life, config_.test_window_years);
    auto final_state =
        filter_mean_reversion(hurst, mr_filter, config_.min_crossovers_per_year);
    if (verbose) {
        fmt::print(stderr, "[pairsel] mean reversion: {} within half-life bounds, {} final\n",
                   final_state.mean_reversion().half_life_pass.size(),
                   final_state.final_pairs().size());
    }
    return final_state;
}

}  // namespace pairsel::pipeline
