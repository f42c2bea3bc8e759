/// @file tests/clustering/test_optics.cpp
/// @brief Unit tests for Optics and ClusteringEngine.
///
/// Test categories:
///   - Well separated blobs → one label per blob, no noise
///   - Isolated outlier → noise
///   - Fewer points than min_samples → all noise
///   - Reachability / ordering structure
///   - Configuration and readiness errors

#include <gtest/gtest.h>
#include "pairsel/clustering.hpp"
#include "pairsel/errors.hpp"

#include <cmath>
#include <set>
#include <vector>

using namespace pairsel;
using namespace pairsel::cluster;

namespace {

/// Six points within 0.15 of `(x, y)`.
void add_blob(std::vector<std::pair<double, double>>& pts, double x, double y) {
    const double offsets[6][2] = {
        {0.0, 0.0}, {0.1, 0.0}, {0.0, 0.1}, {0.1, 0.1}, {0.05, 0.05}, {0.02, 0.07}};
    for (const auto& o : offsets) pts.emplace_back(x + o[0], y + o[1]);
}

Matrix to_matrix(const std::vector<std::pair<double, double>>& pts) {
    Matrix m(static_cast<Eigen::Index>(pts.size()), 2);
    for (std::size_t i = 0; i < pts.size(); ++i) {
        m(static_cast<Eigen::Index>(i), 0) = pts[i].first;
        m(static_cast<Eigen::Index>(i), 1) = pts[i].second;
    }
    return m;
}

FeatureTable to_features(const Matrix& m) {
    FeatureTable f;
    for (Eigen::Index i = 0; i < m.rows(); ++i) f.assets.push_back("P" + std::to_string(i));
    f.loadings = m;
    return f;
}

ErrorKind fit_error(const OpticsConfig& cfg) {
    Matrix m(3, 1);
    m << 0, 1, 2;
    try {
        (void)Optics(cfg).fit(m);
    } catch (const PipelineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected PipelineError";
    return ErrorKind::NoCandidates;
}

}  // anonymous namespace

// ─── Cluster structure ────────────────────────────────────────────────────────

TEST(Optics, TwoBlobsGiveTwoClusters) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 5.0, 5.0);

    OpticsConfig cfg;
    cfg.min_samples = 3;
    const auto result = Optics(cfg).fit(to_matrix(pts));

    ASSERT_EQ(result.labels.size(), 12u);
    for (int l : result.labels) EXPECT_NE(l, constants::NOISE_LABEL);
    for (std::size_t i = 1; i < 6; ++i) {
        EXPECT_EQ(result.labels[i], result.labels[0]);
        EXPECT_EQ(result.labels[6 + i], result.labels[6]);
    }
    EXPECT_NE(result.labels[0], result.labels[6]);
}

TEST(Optics, ThreeBlobsAndAnOutlier) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 5.0, 5.0);
    add_blob(pts, 10.0, 0.0);
    pts.emplace_back(20.0, 20.0);

    OpticsConfig cfg;
    cfg.min_samples = 4;
    const auto result = Optics(cfg).fit(to_matrix(pts));

    EXPECT_EQ(result.labels.back(), constants::NOISE_LABEL);
    std::set<int> distinct;
    for (std::size_t b = 0; b < 3; ++b) {
        for (std::size_t i = 0; i < 6; ++i) {
            EXPECT_EQ(result.labels[6 * b + i], result.labels[6 * b]);
        }
        distinct.insert(result.labels[6 * b]);
    }
    EXPECT_EQ(distinct.size(), 3u);
    EXPECT_EQ(distinct.count(constants::NOISE_LABEL), 0u);
}

TEST(Optics, MaxEpsDoesNotSplitTightBlobs) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 5.0, 5.0);

    OpticsConfig cfg;
    cfg.min_samples = 3;
    cfg.max_eps = 1.0;
    const auto result = Optics(cfg).fit(to_matrix(pts));
    EXPECT_NE(result.labels[0], constants::NOISE_LABEL);
    EXPECT_NE(result.labels[6], constants::NOISE_LABEL);
    EXPECT_NE(result.labels[0], result.labels[6]);
}

TEST(Optics, OrderingIsAPermutation) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 3.0, 0.0);

    OpticsConfig cfg;
    cfg.min_samples = 3;
    const auto result = Optics(cfg).fit(to_matrix(pts));

    std::set<std::size_t> seen(result.ordering.begin(), result.ordering.end());
    EXPECT_EQ(seen.size(), pts.size());
    EXPECT_EQ(result.ordering.front(), 0u);  // all reachabilities start at +inf
    EXPECT_TRUE(std::isinf(result.reachability[0]));
    EXPECT_EQ(result.predecessor[0], -1);
}

TEST(Optics, CoreDistanceCountsThePointItself) {
    Matrix m(3, 1);
    m << 0.0, 1.0, 3.0;
    OpticsConfig cfg;
    cfg.min_samples = 2;
    const auto result = Optics(cfg).fit(m);
    EXPECT_DOUBLE_EQ(result.core_distances[0], 1.0);
    EXPECT_DOUBLE_EQ(result.core_distances[1], 1.0);
    EXPECT_DOUBLE_EQ(result.core_distances[2], 2.0);
}

TEST(Optics, FewerPointsThanMinSamplesAreAllNoise) {
    Matrix m(4, 2);
    m << 0, 0,
         0.1, 0,
         0, 0.1,
         0.1, 0.1;
    const auto result = Optics(OpticsConfig{}).fit(m);  // min_samples 5
    for (int l : result.labels) EXPECT_EQ(l, constants::NOISE_LABEL);
    for (double c : result.core_distances) EXPECT_TRUE(std::isinf(c));
}

TEST(Optics, IsDeterministic) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 2.0, 1.0);
    OpticsConfig cfg;
    cfg.min_samples = 3;
    const auto a = Optics(cfg).fit(to_matrix(pts));
    const auto b = Optics(cfg).fit(to_matrix(pts));
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.ordering, b.ordering);
}

// ─── Configuration errors ─────────────────────────────────────────────────────

TEST(Optics, InvalidConfigurationIsRejected) {
    OpticsConfig small;
    small.min_samples = 1;
    EXPECT_EQ(fit_error(small), ErrorKind::InvalidInput);

    OpticsConfig xi_zero;
    xi_zero.xi = 0.0;
    EXPECT_EQ(fit_error(xi_zero), ErrorKind::InvalidInput);

    OpticsConfig xi_one;
    xi_one.xi = 1.0;
    EXPECT_EQ(fit_error(xi_one), ErrorKind::InvalidInput);

    OpticsConfig tiny_cluster;
    tiny_cluster.min_cluster_size = 1;
    EXPECT_EQ(fit_error(tiny_cluster), ErrorKind::InvalidInput);

    OpticsConfig no_radius;
    no_radius.max_eps = 0.0;
    EXPECT_EQ(fit_error(no_radius), ErrorKind::InvalidInput);
}

// ─── ClusteringEngine ─────────────────────────────────────────────────────────

TEST(ClusteringEngine, LabelsEveryAsset) {
    std::vector<std::pair<double, double>> pts;
    add_blob(pts, 0.0, 0.0);
    add_blob(pts, 5.0, 5.0);
    OpticsConfig cfg;
    cfg.min_samples = 3;

    const auto features = to_features(to_matrix(pts));
    const auto assignment = ClusteringEngine(cfg).cluster(features);
    EXPECT_EQ(assignment.assets, features.assets);
    EXPECT_EQ(assignment.labels.size(), features.assets.size());
    EXPECT_EQ(assignment.cluster_count(), 2u);
}

TEST(ClusteringEngine, EmptyFeatureTableIsNotReady) {
    try {
        (void)ClusteringEngine().cluster(FeatureTable{});
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotReady);
    }
}
