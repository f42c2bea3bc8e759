#pragma once

/// @file include/pairsel/clustering.hpp
/// @brief OPTICS density clustering of asset feature vectors.
///
/// # Module: Clustering Engine
///
/// ## Responsibility
/// Group assets whose feature vectors lie in dense regions, without knowing
/// the number of groups in advance. Assets outside every dense region are
/// labelled noise (-1) and never paired.
///
/// ## Algorithm
/// OPTICS (Ankerst et al., 1999) orders points by reachability distance:
///
///   core_dist(p)     = distance to the min_samples-th nearest point
///                      (p itself counts as the first)
///   reach_dist(o, p) = max(core_dist(p), ‖o − p‖)
///
/// Points are expanded in order of smallest reachability. Clusters are then
/// read off the reachability plot with the ξ-steep method: a cluster starts
/// at a ξ-steep downward area and ends at a matching ξ-steep upward area
/// (a drop or rise of at least a factor 1 − ξ between neighbours).
///
/// ## Edge Cases
/// - Fewer points than `min_samples`: every core distance is +inf, every
///   point is noise
/// - Nested clusters: the smallest enclosing cluster is labelled first;
///   points keep the first label they receive
///
/// ## Errors
/// - `NotReady`     — empty feature table
/// - `InvalidInput` — min_samples < 2, ξ ∉ (0, 1), min_cluster_size < 2,
///                    max_eps ≤ 0

#include "pairsel/types.hpp"
#include "pairsel/constants.hpp"

#include <optional>
#include <vector>

namespace pairsel::cluster {

// ─── OpticsConfig ─────────────────────────────────────────────────────────────

/// OPTICS tuning parameters.
struct OpticsConfig {
    /// Neighbourhood size defining a core point (point itself included).
    std::size_t min_samples = constants::DEFAULT_MIN_SAMPLES;

    /// Neighbourhood radius; points farther apart are never reachable.
    double max_eps = constants::DEFAULT_MAX_EPS;

    /// Minimum relative steepness of a cluster boundary.
    double xi = constants::DEFAULT_XI;

    /// Smallest cluster reported; defaults to `min_samples`.
    std::optional<std::size_t> min_cluster_size;

    /// Shrink clusters whose end point's predecessor lies outside them.
    bool predecessor_correction = true;
};

// ─── OpticsResult ─────────────────────────────────────────────────────────────

/// Full OPTICS output, indexed by input point unless stated otherwise.
struct OpticsResult {
    std::vector<std::size_t> ordering;   ///< Expansion order (point indices)
    std::vector<double> core_distances;  ///< +inf for non-core points
    std::vector<double> reachability;    ///< +inf for the first point of a component
    std::vector<long> predecessor;       ///< Point that reached it; -1 for none
    std::vector<int> labels;             ///< Cluster id or NOISE_LABEL
};

// ─── Optics ───────────────────────────────────────────────────────────────────

/// OPTICS ordering plus ξ cluster extraction over Euclidean distance.
class Optics {
public:
    explicit Optics(OpticsConfig config = OpticsConfig{});

    /// Cluster the rows of `points` (one row per point).
    ///
    /// # Errors
    /// `InvalidInput` for an invalid configuration.
    [[nodiscard]] OpticsResult fit(const Matrix& points) const;

    [[nodiscard]] const OpticsConfig& config() const noexcept { return config_; }

private:
    /// A [start, end] range of positions in the reachability plot.
    struct Span {
        std::size_t start;
        std::size_t end;
    };

    /// Core distances, reachability, predecessors and ordering.
    void compute_graph(const Matrix& points, OpticsResult& out) const;

    /// ξ-steep cluster spans over the ordered reachability plot.
    [[nodiscard]] std::vector<Span>
    xi_clusters(const std::vector<double>& reach_plot,
                const std::vector<long>& pred_plot,
                const std::vector<std::size_t>& ordering) const;

    /// Label points from cluster spans (first fitting span wins).
    [[nodiscard]] static std::vector<int>
    extract_labels(const std::vector<std::size_t>& ordering,
                   const std::vector<Span>& clusters);

    OpticsConfig config_;
};

// ─── ClusteringEngine ─────────────────────────────────────────────────────────

/// Pipeline stage wrapping `Optics` over a FeatureTable.
class ClusteringEngine {
public:
    explicit ClusteringEngine(OpticsConfig config = OpticsConfig{});

    /// Assign a cluster label to every asset of the feature table.
    ///
    /// # Errors
    /// `NotReady` for an empty table, `InvalidInput` for a bad configuration.
    [[nodiscard]] ClusterAssignment cluster(const FeatureTable& features) const;

    /// Same as `cluster` but also hands back the OPTICS internals.
    [[nodiscard]] ClusterAssignment cluster(const FeatureTable& features,
                                            OpticsResult& details) const;

private:
    Optics optics_;
};

}  // namespace pairsel::cluster
