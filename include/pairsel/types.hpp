#pragma once

/// @file include/pairsel/types.hpp
/// @brief Shared value types for the pairs selection pipeline.
///
/// Every stage includes this file. It defines the time-indexed panel used for
/// prices, returns and spreads, the per-asset feature table, cluster labels,
/// asset pairs and the per-pair records exchanged with the statistical
/// collaborators. Matrices are Eigen3 throughout.

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pairsel {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dense column-major matrix (rows = observations unless stated otherwise).
using Matrix = Eigen::MatrixXd;

/// Dense column vector.
using Vector = Eigen::VectorXd;

// ─── Identifiers & Time ───────────────────────────────────────────────────────

/// Stable column key of an asset (ticker, ISIN, ...).
using AssetId = std::string;

/// One observation timestamp. Daily granularity.
using TimePoint = std::chrono::sys_days;

// ─── Panel ────────────────────────────────────────────────────────────────────

/// A time-indexed table of named numeric series.
///
/// Layout:
///   - `index`   — one timestamp per row, strictly increasing
///   - `columns` — one identifier per column, unique
///   - `values`  — index.size() × columns.size(); NaN marks a missing value
struct Panel {
    std::vector<TimePoint> index;
    std::vector<std::string> columns;
    Matrix values;

    /// Number of observations.
    [[nodiscard]] std::size_t rows() const noexcept { return index.size(); }

    /// Number of series.
    [[nodiscard]] std::size_t cols() const noexcept { return columns.size(); }

    /// True when there is no observation or no series.
    [[nodiscard]] bool empty() const noexcept {
        return index.empty() || columns.empty();
    }

    /// Position of a column, or `nullopt` if the identifier is unknown.
    [[nodiscard]] std::optional<Eigen::Index>
    column_of(const std::string& name) const noexcept;

    /// Copy of one column by identifier. Returns `nullopt` if unknown.
    [[nodiscard]] std::optional<Vector>
    column(const std::string& name) const;
};

/// Raw prices: rows = time steps, columns = asset identifiers.
using PricePanel = Panel;

/// Cleaned simple returns (first row dropped, no infinities, no NaN rows).
using ReturnPanel = Panel;

/// Hedge-ratio adjusted spreads, one column per pair, sharing the price index.
using SpreadTable = Panel;

// ─── FeatureTable ─────────────────────────────────────────────────────────────

/// One K-dimensional feature vector per asset.
///
/// `loadings` is assets.size() × K; row i belongs to `assets[i]`.
struct FeatureTable {
    std::vector<AssetId> assets;
    Matrix loadings;

    [[nodiscard]] bool empty() const noexcept { return assets.empty(); }

    /// Number of components per asset.
    [[nodiscard]] std::size_t dimensions() const noexcept {
        return static_cast<std::size_t>(loadings.cols());
    }
};

// ─── ClusterAssignment ────────────────────────────────────────────────────────

/// Cluster label per asset. Label -1 (`constants::NOISE_LABEL`) is noise.
struct ClusterAssignment {
    std::vector<AssetId> assets;
    std::vector<int> labels;

    [[nodiscard]] bool empty() const noexcept { return assets.empty(); }

    /// Number of distinct non-noise labels.
    [[nodiscard]] std::size_t cluster_count() const;
};

// ─── AssetPair ────────────────────────────────────────────────────────────────

/// Two asset identifiers.
///
/// For candidates the pair is unordered (`first` precedes `second` in cluster
/// order). Once a pair has gone through cointegration testing the orientation
/// carries meaning: `first` is the dependent asset and `second` the one the
/// hedge ratio multiplies.
struct AssetPair {
    AssetId first;
    AssetId second;

    /// Column label used in spread tables, e.g. "(AAA, BBB)".
    [[nodiscard]] std::string label() const;

    /// Same two assets regardless of orientation.
    [[nodiscard]] bool same_assets(const AssetPair& other) const noexcept {
        return (first == other.first && second == other.second) ||
               (first == other.second && second == other.first);
    }

    friend bool operator==(const AssetPair&, const AssetPair&) = default;
};

// ─── Collaborator Records ─────────────────────────────────────────────────────

/// Output of the cointegration collaborator for one candidate.
struct CointegrationResult {
    AssetPair pair;      ///< Oriented: first = dependent, second = independent
    double pvalue;       ///< Cointegration test p-value in [0, 1]
    double hedge_ratio;  ///< price[first] ≈ hedge_ratio × price[second]
};

/// Output of the Ornstein-Uhlenbeck collaborator for one spread.
struct OUFitResult {
    AssetPair pair;
    double theta;              ///< Mean-reversion speed per observation
    double half_life;          ///< ln 2 / θ; +inf when not mean reverting
    std::size_t crossovers;    ///< Mean crossings inside the test window
    bool crossover_pass;       ///< Crossing rate meets the requested minimum
};

}  // namespace pairsel
