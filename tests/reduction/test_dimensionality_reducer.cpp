/// @file tests/reduction/test_dimensionality_reducer.cpp
/// @brief Unit tests for DimensionalityReducer (standardization + PCA).

#include <gtest/gtest.h>
#include "pairsel/reduction.hpp"
#include "pairsel/errors.hpp"
#include "support/synthetic_prices.hpp"

#include <cmath>
#include <limits>

using namespace pairsel;
using namespace pairsel::reduction;
using pairsel::testing::NormalSource;
using pairsel::testing::make_panel;

namespace {

/// Returns panel of `assets` columns driven by one common factor plus noise.
ReturnPanel factor_returns(std::size_t n, std::size_t assets, std::uint64_t seed) {
    NormalSource normal(seed);
    std::vector<std::vector<double>> cols(assets, std::vector<double>(n));
    for (std::size_t t = 0; t < n; ++t) {
        const double f = normal();
        for (std::size_t j = 0; j < assets; ++j) {
            cols[j][t] = 0.01 * f + 0.002 * normal();
        }
    }
    std::vector<std::string> names;
    for (std::size_t j = 0; j < assets; ++j) names.push_back("S" + std::to_string(j));
    return make_panel(names, cols);
}

ErrorKind reduce_error(const ReturnPanel& r, std::size_t k) {
    try {
        (void)DimensionalityReducer::reduce(r, k);
    } catch (const PipelineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected PipelineError";
    return ErrorKind::NoCandidates;
}

}  // anonymous namespace

// ─── standardize ──────────────────────────────────────────────────────────────

TEST(DimensionalityReducer, StandardizeGivesZeroMeanUnitVariance) {
    Matrix m(4, 2);
    m << 1, 10,
         2, 20,
         3, 30,
         4, 50;
    const Matrix z = DimensionalityReducer::standardize(m);
    for (Eigen::Index j = 0; j < z.cols(); ++j) {
        const double mean = z.col(j).mean();
        const double var = (z.col(j).array() - mean).square().mean();
        EXPECT_NEAR(mean, 0.0, 1e-12);
        EXPECT_NEAR(var, 1.0, 1e-12);  // population variance
    }
}

TEST(DimensionalityReducer, FlatColumnBecomesZeros) {
    Matrix m(3, 1);
    m << 5, 5, 5;
    const Matrix z = DimensionalityReducer::standardize(m);
    EXPECT_TRUE(z.isZero(1e-15));
}

// ─── fit_pca ──────────────────────────────────────────────────────────────────

TEST(DimensionalityReducer, ComponentsAreOrthonormal) {
    const auto r = factor_returns(300, 6, 3);
    PcaResult pca;
    (void)DimensionalityReducer::reduce(r, 3, pca);

    const Matrix gram = pca.components * pca.components.transpose();
    EXPECT_TRUE(gram.isApprox(Matrix::Identity(3, 3), 1e-10));
}

TEST(DimensionalityReducer, ExplainedVarianceIsDescending) {
    const auto r = factor_returns(300, 6, 4);
    PcaResult pca;
    (void)DimensionalityReducer::reduce(r, 4, pca);
    for (Eigen::Index i = 1; i < pca.explained_variance.size(); ++i) {
        EXPECT_GE(pca.explained_variance(i - 1), pca.explained_variance(i));
    }
    EXPECT_LE(pca.explained_variance_ratio.sum(), 1.0 + 1e-12);
}

TEST(DimensionalityReducer, CommonFactorDominatesFirstComponent) {
    const auto r = factor_returns(500, 5, 5);
    PcaResult pca;
    (void)DimensionalityReducer::reduce(r, 2, pca);
    EXPECT_GT(pca.explained_variance_ratio(0), 0.8);

    // Every asset loads on the factor with the same sign.
    for (Eigen::Index j = 0; j < pca.components.cols(); ++j) {
        EXPECT_GT(pca.components(0, j), 0.0);
    }
}

TEST(DimensionalityReducer, SignConventionLargestLoadingPositive) {
    const auto r = factor_returns(200, 4, 6);
    PcaResult pca;
    (void)DimensionalityReducer::reduce(r, 3, pca);
    for (Eigen::Index c = 0; c < pca.components.rows(); ++c) {
        Eigen::Index arg = 0;
        pca.components.row(c).cwiseAbs().maxCoeff(&arg);
        EXPECT_GT(pca.components(c, arg), 0.0);
    }
}

// ─── reduce ───────────────────────────────────────────────────────────────────

TEST(DimensionalityReducer, FeatureTableHasOneRowPerAsset) {
    const auto r = factor_returns(100, 7, 7);
    const auto features = DimensionalityReducer::reduce(r, 3);
    EXPECT_EQ(features.assets, r.columns);
    EXPECT_EQ(features.loadings.rows(), 7);
    EXPECT_EQ(features.dimensions(), 3u);
}

TEST(DimensionalityReducer, IsDeterministic) {
    const auto r = factor_returns(150, 5, 8);
    const auto a = DimensionalityReducer::reduce(r, 2);
    const auto b = DimensionalityReducer::reduce(r, 2);
    EXPECT_EQ(a.loadings, b.loadings);
}

TEST(DimensionalityReducer, EmptyReturnsAreNotReady) {
    EXPECT_EQ(reduce_error(ReturnPanel{}, 2), ErrorKind::NotReady);
}

TEST(DimensionalityReducer, ComputedButEmptyReturnsAreInvalidInput) {
    ReturnPanel r;
    r.columns = {"A", "B"};
    r.values = Matrix(0, 2);
    EXPECT_EQ(reduce_error(r, 1), ErrorKind::InvalidInput);
}

TEST(DimensionalityReducer, NoCompleteRowIsInvalidInput) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto r = make_panel({"A", "B"}, {{0.1, nan, 0.3}, {nan, 0.2, nan}});
    EXPECT_EQ(reduce_error(r, 1), ErrorKind::InvalidInput);
}

TEST(DimensionalityReducer, TooManyComponentsIsInvalidInput) {
    const auto r = factor_returns(50, 4, 9);
    EXPECT_EQ(reduce_error(r, 5), ErrorKind::InvalidInput);
    EXPECT_EQ(reduce_error(r, 0), ErrorKind::InvalidInput);
}

TEST(DimensionalityReducer, MoreComponentsThanObservationsIsInvalidInput) {
    const auto r = factor_returns(3, 6, 10);
    EXPECT_EQ(reduce_error(r, 4), ErrorKind::InvalidInput);
}
