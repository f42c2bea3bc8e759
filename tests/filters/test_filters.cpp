/// @file tests/filters/test_filters.cpp
/// @brief Unit tests for the cointegration, Hurst and mean-reversion filters.
///
/// The statistical collaborators are replaced with scripted fakes so every
/// threshold boundary can be hit exactly.

#include <gtest/gtest.h>
#include "pairsel/filters.hpp"
#include "pairsel/errors.hpp"
#include "support/synthetic_prices.hpp"

#include <limits>
#include <vector>

using namespace pairsel;
using namespace pairsel::filters;
using pairsel::testing::NormalSource;
using pairsel::testing::random_walk;
using pairsel::testing::ar1;
using pairsel::testing::make_panel;

namespace {

/// Cointegration fake returning the scripted p-values in candidate order.
CointegrationTestFn scripted_pvalues(std::vector<double> pvalues) {
    return [pvalues](const PricePanel&, std::span<const AssetPair> candidates) {
        std::vector<CointegrationResult> out;
        for (std::size_t i = 0; i < candidates.size() && i < pvalues.size(); ++i) {
            out.push_back(CointegrationResult{candidates[i], pvalues[i], 1.0});
        }
        return out;
    };
}

struct ScriptedFit {
    double half_life;
    bool crossover_pass;
};

/// OU fake returning the scripted fits in pair order.
OUEstimateFn scripted_fits(std::vector<ScriptedFit> fits, int* seen_window = nullptr) {
    return [fits, seen_window](const SpreadTable&, std::span<const AssetPair> pairs,
                               int window_years, double) {
        if (seen_window) *seen_window = window_years;
        std::vector<OUFitResult> out;
        for (std::size_t i = 0; i < pairs.size() && i < fits.size(); ++i) {
            out.push_back(OUFitResult{pairs[i], 0.1, fits[i].half_life, 30,
                                      fits[i].crossover_pass});
        }
        return out;
    };
}

template <typename Fn>
ErrorKind error_of(Fn&& fn) {
    try {
        fn();
    } catch (const PipelineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected PipelineError";
    return ErrorKind::NotReady;
}

/// A = F + noise_a, B = F + noise_b, W an unrelated walk.
PricePanel three_assets() {
    NormalSource normal(41);
    const auto f = random_walk(normal, 400, 100.0);
    const auto na = ar1(normal, 400, 0.3);
    const auto nb = ar1(normal, 400, 0.3);
    const auto w = random_walk(normal, 400, 60.0);
    std::vector<double> a(400);
    std::vector<double> b(400);
    for (std::size_t t = 0; t < 400; ++t) {
        a[t] = f[t] + na[t];
        b[t] = f[t] + nb[t];
    }
    return make_panel({"A", "B", "W"}, {a, b, w});
}

const std::vector<AssetPair> kCandidates = {{"A", "B"}, {"A", "W"}, {"B", "W"}};

}  // anonymous namespace

// ─── CointegrationFilter ──────────────────────────────────────────────────────

TEST(CointegrationFilter, KeepsPValuesAtOrBelowThreshold) {
    const CointegrationFilter filter(scripted_pvalues({0.01, 0.0100001, 0.0}));
    const auto out = filter.filter(three_assets(), kCandidates, 0.01);

    ASSERT_EQ(out.results.size(), 3u);
    ASSERT_EQ(out.passing.size(), 2u);
    EXPECT_EQ(out.passing[0].pair, kCandidates[0]);
    EXPECT_EQ(out.passing[1].pair, kCandidates[2]);
}

TEST(CointegrationFilter, RecordsEveryCandidate) {
    const CointegrationFilter filter(scripted_pvalues({0.5, 0.6, 0.7}));
    const auto out = filter.filter(three_assets(), kCandidates);
    EXPECT_EQ(out.results.size(), 3u);
    EXPECT_TRUE(out.passing.empty());
}

TEST(CointegrationFilter, EmptyCandidatesGiveNoCandidates) {
    const CointegrationFilter filter(scripted_pvalues({}));
    EXPECT_EQ(error_of([&] { (void)filter.filter(three_assets(), {}); }),
              ErrorKind::NoCandidates);
}

TEST(CointegrationFilter, ShortCollaboratorOutputIsInvalidInput) {
    const CointegrationFilter filter(scripted_pvalues({0.0}));
    EXPECT_EQ(error_of([&] { (void)filter.filter(three_assets(), kCandidates); }),
              ErrorKind::InvalidInput);
}

TEST(CointegrationFilter, MissingCollaboratorIsInvalidInput) {
    EXPECT_EQ(error_of([] { CointegrationFilter filter(nullptr); }),
              ErrorKind::InvalidInput);
}

// ─── HurstFilter ──────────────────────────────────────────────────────────────

TEST(HurstFilter, SpreadUsesHedgeRatio) {
    const auto prices = three_assets();
    const CointegrationResult record{{"A", "B"}, 0.0, 0.5};
    const Vector spread = HurstFilter::build_spread(prices, record);
    const Vector a = *prices.column("A");
    const Vector b = *prices.column("B");
    EXPECT_TRUE(spread.isApprox(a - 0.5 * b));
}

TEST(HurstFilter, ThresholdIsStrict) {
    const auto prices = three_assets();
    const CointegrationResult record{{"A", "B"}, 0.0, 1.0};
    const Vector spread = HurstFilter::build_spread(prices, record);
    const auto h = stats::HurstEstimator().estimate(
        std::span<const double>(spread.data(), static_cast<std::size_t>(spread.size())));
    ASSERT_TRUE(h.has_value());

    const std::vector<CointegrationResult> records = {record};
    const HurstFilter filter;
    EXPECT_TRUE(filter.filter(prices, records, *h).passing.empty());
    EXPECT_EQ(filter.filter(prices, records, *h + 1e-9).passing.size(), 1u);
}

TEST(HurstFilter, SpreadTableHoldsPassingPairsOnly) {
    const auto prices = three_assets();
    const std::vector<CointegrationResult> records = {
        {{"A", "B"}, 0.0, 1.0},
        {{"W", "A"}, 0.0, 0.1},  // trending spread, H near 0.5
    };
    const auto out = HurstFilter().filter(prices, records, 0.3);

    ASSERT_EQ(out.readings.size(), 2u);
    ASSERT_EQ(out.passing.size(), 1u);
    EXPECT_EQ(out.passing[0], (AssetPair{"A", "B"}));
    EXPECT_EQ(out.spreads.columns, std::vector<std::string>{"(A, B)"});
    EXPECT_EQ(out.spreads.index, prices.index);
    EXPECT_EQ(out.spreads.values.rows(), static_cast<Eigen::Index>(prices.rows()));
}

TEST(HurstFilter, UndefinedExponentRejectsThePair) {
    std::vector<double> base(300);
    for (std::size_t t = 0; t < base.size(); ++t) base[t] = 10.0 + static_cast<double>(t % 7);
    std::vector<double> twice(base.size());
    for (std::size_t t = 0; t < base.size(); ++t) twice[t] = 2.0 * base[t];
    const auto prices = make_panel({"P", "Q"}, {twice, base});

    // P − 2·Q is identically zero.
    const std::vector<CointegrationResult> records = {{{"P", "Q"}, 0.0, 2.0}};
    const auto out = HurstFilter().filter(prices, records, 0.5);
    ASSERT_EQ(out.readings.size(), 1u);
    EXPECT_FALSE(out.readings[0].exponent.has_value());
    EXPECT_TRUE(out.passing.empty());
    EXPECT_EQ(out.spreads.values.cols(), 0);
}

TEST(HurstFilter, MissingAssetIsInvalidInput) {
    const std::vector<CointegrationResult> records = {{{"A", "NOPE"}, 0.0, 1.0}};
    EXPECT_EQ(error_of([&] { (void)HurstFilter().filter(three_assets(), records); }),
              ErrorKind::InvalidInput);
}

TEST(HurstFilter, EmptyInputGivesNoCandidates) {
    EXPECT_EQ(error_of([] { (void)HurstFilter().filter(three_assets(), {}); }),
              ErrorKind::NoCandidates);
}

// ─── MeanReversionFilter ──────────────────────────────────────────────────────

TEST(MeanReversionFilter, HalfLifeBoundsAreExclusive) {
    const MeanReversionFilter filter(scripted_fits({
        {1.0, true}, {1.0001, true}, {364.9, true}, {365.0, true},
        {std::numeric_limits<double>::infinity(), true},
    }));
    const std::vector<AssetPair> pairs = {
        {"A", "B"}, {"C", "D"}, {"E", "F"}, {"G", "H"}, {"I", "J"}};
    const auto out = filter.filter(SpreadTable{}, pairs);

    ASSERT_EQ(out.fits.size(), 5u);
    const std::vector<AssetPair> expected = {{"C", "D"}, {"E", "F"}};
    EXPECT_EQ(out.half_life_pass, expected);
    EXPECT_EQ(out.final_pairs, expected);
}

TEST(MeanReversionFilter, CrossoverFailureDropsFromFinalOnly) {
    const MeanReversionFilter filter(scripted_fits({{10.0, false}, {20.0, true}}));
    const std::vector<AssetPair> pairs = {{"A", "B"}, {"C", "D"}};
    const auto out = filter.filter(SpreadTable{}, pairs);

    EXPECT_EQ(out.half_life_pass.size(), 2u);
    ASSERT_EQ(out.final_pairs.size(), 1u);
    EXPECT_EQ(out.final_pairs[0], pairs[1]);
}

TEST(MeanReversionFilter, ForwardsTestWindow) {
    int window = 0;
    const MeanReversionFilter filter(scripted_fits({{5.0, true}}, &window),
                                     HalfLifeBounds{}, 3);
    const std::vector<AssetPair> pairs = {{"A", "B"}};
    (void)filter.filter(SpreadTable{}, pairs);
    EXPECT_EQ(window, 3);
}

TEST(MeanReversionFilter, CustomBounds) {
    const MeanReversionFilter filter(scripted_fits({{5.0, true}, {50.0, true}}),
                                     HalfLifeBounds{2.0, 30.0});
    const std::vector<AssetPair> pairs = {{"A", "B"}, {"C", "D"}};
    const auto out = filter.filter(SpreadTable{}, pairs);
    ASSERT_EQ(out.final_pairs.size(), 1u);
    EXPECT_EQ(out.final_pairs[0], pairs[0]);
}

TEST(MeanReversionFilter, InvalidConstruction) {
    EXPECT_EQ(error_of([] { MeanReversionFilter filter(nullptr); }),
              ErrorKind::InvalidInput);
    EXPECT_EQ(error_of([] {
                  MeanReversionFilter filter(scripted_fits({}), HalfLifeBounds{10.0, 10.0});
              }),
              ErrorKind::InvalidInput);
}

TEST(MeanReversionFilter, EmptyInputGivesNoCandidates) {
    const MeanReversionFilter filter(scripted_fits({}));
    EXPECT_EQ(error_of([&] { (void)filter.filter(SpreadTable{}, {}); }),
              ErrorKind::NoCandidates);
}

TEST(MeanReversionFilter, ShortCollaboratorOutputIsInvalidInput) {
    const MeanReversionFilter filter(scripted_fits({{5.0, true}}));
    const std::vector<AssetPair> pairs = {{"A", "B"}, {"C", "D"}};
    EXPECT_EQ(error_of([&] { (void)filter.filter(SpreadTable{}, pairs); }),
              ErrorKind::InvalidInput);
}
