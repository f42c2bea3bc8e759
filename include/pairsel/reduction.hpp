#pragma once

/// @file include/pairsel/reduction.hpp
/// @brief DimensionalityReducer — standardized returns → PCA loadings.
///
/// # Module: Dimensionality Reducer
///
/// ## Responsibility
/// Summarise each asset's exposure to the dominant co-movement factors of the
/// universe as a short feature vector, so that assets which move together
/// land close to each other in feature space.
///
/// ## Pipeline
///   1. Standardize every return column: z = (r − mean) / σ, with mean and
///      population σ fit on the full column (feature extraction, not
///      prediction: no train/test split)
///   2. Drop rows that still hold a non-finite value
///   3. PCA with exactly K components: thin SVD of the column-centered
///      matrix X = U Σ Vᵀ; components are the first K rows of Vᵀ
///   4. Transpose: row i of the feature table is asset i's K loadings
///
/// ## Sign Convention
/// PCA components are defined up to sign. Each component is flipped so its
/// largest-magnitude loading is positive, which makes the output
/// deterministic. Distances between assets are unaffected.
///
/// ## Errors
/// - `NotReady`     — the return panel has no assets (no prices were processed)
/// - `InvalidInput` — returns were computed but no observation is complete,
///   or K = 0 or K > min(observations, assets)

#include "pairsel/types.hpp"

namespace pairsel::reduction {

// ─── PcaResult ────────────────────────────────────────────────────────────────

/// Fitted principal components.
struct PcaResult {
    Matrix components;                 ///< K × assets, rows have unit norm
    Vector explained_variance;         ///< σ_k² / (n − 1), descending
    Vector explained_variance_ratio;   ///< explained_variance / total variance
};

// ─── DimensionalityReducer ────────────────────────────────────────────────────

/// Stateless PCA feature extraction.
class DimensionalityReducer {
public:
    /// Standardize each column to zero mean and unit population variance.
    ///
    /// Non-finite entries are ignored when fitting a column's parameters and
    /// stay non-finite in the output. A zero-variance column is centered only
    /// (it becomes all zeros).
    [[nodiscard]] static Matrix standardize(const Matrix& returns);

    /// Fit PCA with `num_components` components on an observations × assets
    /// matrix. Columns are centered before the SVD.
    ///
    /// # Errors
    /// `InvalidInput` if the matrix is empty or `num_components` is 0 or
    /// exceeds min(rows, cols).
    [[nodiscard]] static PcaResult fit_pca(const Matrix& data,
                                           std::size_t num_components);

    /// Full reduction: standardize, drop incomplete rows, fit PCA, transpose.
    [[nodiscard]] static FeatureTable reduce(const ReturnPanel& returns,
                                             std::size_t num_features);

    /// Same as `reduce` but also hands back the fitted components.
    [[nodiscard]] static FeatureTable reduce(const ReturnPanel& returns,
                                             std::size_t num_features,
                                             PcaResult& fitted);
};

}  // namespace pairsel::reduction
