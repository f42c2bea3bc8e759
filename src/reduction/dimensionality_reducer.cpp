/// @file src/reduction/dimensionality_reducer.cpp
/// @brief Column standardization and SVD-based PCA.

#include "pairsel/reduction.hpp"
#include "pairsel/constants.hpp"
#include "pairsel/errors.hpp"

#include <Eigen/SVD>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace pairsel::reduction {

// ─── standardize ──────────────────────────────────────────────────────────────

Matrix DimensionalityReducer::standardize(const Matrix& returns) {
    Matrix out = returns;

    for (Eigen::Index j = 0; j < returns.cols(); ++j) {
        double sum = 0.0;
        Eigen::Index count = 0;
        for (Eigen::Index t = 0; t < returns.rows(); ++t) {
            const double v = returns(t, j);
            if (std::isfinite(v)) {
                sum += v;
                ++count;
            }
        }
        if (count == 0) {
            continue;
        }
        const double mean = sum / static_cast<double>(count);

        double sq_sum = 0.0;
        for (Eigen::Index t = 0; t < returns.rows(); ++t) {
            const double v = returns(t, j);
            if (std::isfinite(v)) {
                sq_sum += (v - mean) * (v - mean);
            }
        }
        // Population (n) standard deviation.
        const double sd = std::sqrt(sq_sum / static_cast<double>(count));
        const double scale = sd < constants::FLAT_STDDEV_THRESHOLD ? 1.0 : sd;

        for (Eigen::Index t = 0; t < returns.rows(); ++t) {
            out(t, j) = (returns(t, j) - mean) / scale;
        }
    }
    return out;
}

// ─── fit_pca ──────────────────────────────────────────────────────────────────

PcaResult DimensionalityReducer::fit_pca(const Matrix& data,
                                         std::size_t num_components) {
    const Eigen::Index n = data.rows();
    const Eigen::Index p = data.cols();
    if (n == 0 || p == 0) {
        throw PipelineError(ErrorKind::InvalidInput,
                            "cannot fit PCA on an empty matrix");
    }
    const auto k = static_cast<Eigen::Index>(num_components);
    if (k == 0 || k > std::min(n, p)) {
        throw PipelineError(
            ErrorKind::InvalidInput,
            fmt::format("num_features={} must be between 1 and min({}, {})",
                        num_components, n, p));
    }

    const Eigen::RowVectorXd means = data.colwise().mean();
    const Matrix centered = data.rowwise() - means;

    Eigen::BDCSVD<Matrix> svd(centered, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Vector& sigma = svd.singularValues();
    const Matrix& v = svd.matrixV();

    PcaResult result;
    result.components = v.leftCols(k).transpose();

    // Deterministic signs: largest |loading| of every component is positive.
    for (Eigen::Index c = 0; c < k; ++c) {
        Eigen::Index arg = 0;
        result.components.row(c).cwiseAbs().maxCoeff(&arg);
        if (result.components(c, arg) < 0.0) {
            result.components.row(c) *= -1.0;
        }
    }

    const double dof = n > 1 ? static_cast<double>(n - 1) : 1.0;
    const Vector all_variance = (sigma.array().square() / dof).matrix();
    const double total = all_variance.sum();

    result.explained_variance = all_variance.head(k);
    result.explained_variance_ratio =
        total > 0.0 ? Vector(result.explained_variance / total)
                    : Vector(Vector::Zero(k));
    return result;
}

// ─── reduce ───────────────────────────────────────────────────────────────────

FeatureTable DimensionalityReducer::reduce(const ReturnPanel& returns,
                                           std::size_t num_features) {
    PcaResult unused;
    return reduce(returns, num_features, unused);
}

FeatureTable DimensionalityReducer::reduce(const ReturnPanel& returns,
                                           std::size_t num_features,
                                           PcaResult& fitted) {
    if (returns.columns.empty()) {
        throw PipelineError(
            ErrorKind::NotReady,
            "dimensionality reduction requires returns computed from a price panel");
    }
    if (returns.index.empty() || returns.values.size() == 0) {
        throw PipelineError(
            ErrorKind::InvalidInput,
            fmt::format("returns for {} assets have no complete observation; "
                        "every price row is missing a value for some asset",
                        returns.cols()));
    }

    const Matrix scaled = standardize(returns.values);

    // Drop any row that still carries a non-finite value.
    std::vector<Eigen::Index> rows;
    rows.reserve(static_cast<std::size_t>(scaled.rows()));
    for (Eigen::Index t = 0; t < scaled.rows(); ++t) {
        if (scaled.row(t).allFinite()) {
            rows.push_back(t);
        }
    }
    Matrix clean(static_cast<Eigen::Index>(rows.size()), scaled.cols());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        clean.row(static_cast<Eigen::Index>(r)) = scaled.row(rows[r]);
    }

    if (rows.empty()) {
        throw PipelineError(
            ErrorKind::InvalidInput,
            fmt::format("no return row is finite for all {} assets after standardization",
                        returns.cols()));
    }

    fitted = fit_pca(clean, num_features);

    FeatureTable features;
    features.assets = returns.columns;
    features.loadings = fitted.components.transpose();
    return features;
}

}  // namespace pairsel::reduction
