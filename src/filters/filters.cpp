/// @file src/filters/filters.cpp
/// @brief CointegrationFilter, HurstFilter and MeanReversionFilter.

#include "pairsel/filters.hpp"
#include "pairsel/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace pairsel::filters {

namespace {

void require_collaborator_count(std::size_t got, std::size_t expected, const char* what) {
    if (got != expected) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("{} returned {} records for {} pairs",
                                        what, got, expected));
    }
}

}  // anonymous namespace

// ─── CointegrationFilter ──────────────────────────────────────────────────────

CointegrationFilter::CointegrationFilter(CointegrationTestFn test)
    : test_(std::move(test)) {
    if (!test_) {
        throw PipelineError(ErrorKind::InvalidInput, "cointegration test is not set");
    }
}

CointegrationOutcome
CointegrationFilter::filter(const PricePanel& prices,
                            std::span<const AssetPair> candidates,
                            double pvalue_threshold) const {
    if (candidates.empty()) {
        throw PipelineError(ErrorKind::NoCandidates,
                            "cointegration filter received no candidate pairs");
    }

    CointegrationOutcome out;
    out.results = test_(prices, candidates);
    require_collaborator_count(out.results.size(), candidates.size(), "cointegration test");

    for (const auto& r : out.results) {
        if (r.pvalue <= pvalue_threshold) {
            out.passing.push_back(r);
        }
    }
    return out;
}

// ─── HurstFilter ──────────────────────────────────────────────────────────────

Vector HurstFilter::build_spread(const PricePanel& prices, const CointegrationResult& record) {
    const auto dependent = prices.column(record.pair.first);
    const auto independent = prices.column(record.pair.second);
    if (!dependent || !independent) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("pair {} references an asset missing from the prices",
                                        record.pair.label()));
    }
    return *dependent - record.hedge_ratio * *independent;
}

HurstOutcome HurstFilter::filter(const PricePanel& prices,
                                 std::span<const CointegrationResult> cointegrated,
                                 double hurst_threshold) const {
    if (cointegrated.empty()) {
        throw PipelineError(ErrorKind::NoCandidates,
                            "Hurst filter received no cointegrated pairs");
    }

    HurstOutcome out;
    out.readings.reserve(cointegrated.size());
    std::vector<Vector> kept;

    for (const auto& record : cointegrated) {
        Vector spread = build_spread(prices, record);
        const auto h = estimator_.estimate(
            std::span<const double>(spread.data(), static_cast<std::size_t>(spread.size())));
        out.readings.push_back(HurstReading{record.pair, h});

        if (h && *h < hurst_threshold) {
            out.passing.push_back(record.pair);
            kept.push_back(std::move(spread));
        }
    }

    out.spreads.index = prices.index;
    out.spreads.values.resize(static_cast<Eigen::Index>(prices.rows()),
                              static_cast<Eigen::Index>(kept.size()));
    for (std::size_t c = 0; c < kept.size(); ++c) {
        out.spreads.columns.push_back(out.passing[c].label());
        out.spreads.values.col(static_cast<Eigen::Index>(c)) = kept[c];
    }
    return out;
}

// ─── MeanReversionFilter ──────────────────────────────────────────────────────

MeanReversionFilter::MeanReversionFilter(OUEstimateFn estimate,
                                         HalfLifeBounds bounds,
                                         int test_window_years)
    : estimate_(std::move(estimate))
    , bounds_(bounds)
    , window_years_(test_window_years) {
    if (!estimate_) {
        throw PipelineError(ErrorKind::InvalidInput, "OU estimator is not set");
    }
    if (!(bounds_.min < bounds_.max)) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("half-life bounds ({}, {}) are empty",
                                        bounds_.min, bounds_.max));
    }
}

MeanReversionOutcome
MeanReversionFilter::filter(const SpreadTable& spreads,
                            std::span<const AssetPair> pairs,
                            double min_crossovers_per_year) const {
    if (pairs.empty()) {
        throw PipelineError(ErrorKind::NoCandidates,
                            "mean-reversion filter received no pairs");
    }

    MeanReversionOutcome out;
    out.fits = estimate_(spreads, pairs, window_years_, min_crossovers_per_year);
    require_collaborator_count(out.fits.size(), pairs.size(), "OU estimator");

    for (std::size_t i = 0; i < out.fits.size(); ++i) {
        const auto& fit = out.fits[i];
        if (fit.half_life > bounds_.min && fit.half_life < bounds_.max) {
            out.half_life_pass.push_back(pairs[i]);
            if (fit.crossover_pass) {
                out.final_pairs.push_back(pairs[i]);
            }
        }
    }
    return out;
}

}  // namespace pairsel::filters
