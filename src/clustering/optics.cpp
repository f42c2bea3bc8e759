/// @file src/clustering/optics.cpp
/// @brief OPTICS ordering and ξ-steep cluster extraction.
///
/// The reachability plot used for extraction is the reachability of the
/// points in expansion order with +inf appended, so that a cluster reaching
/// the end of the ordering still sees a closing upward area.

#include "pairsel/clustering.hpp"
#include "pairsel/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace pairsel::cluster {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

/// End of a steep region starting at `start`.
///
/// The region grows over steep points and tolerates at most `min_samples`
/// consecutive points that are neither steep nor moving in the opposite
/// direction (`xward`). It stops at the first opposite move.
[[nodiscard]] std::size_t extend_region(const std::vector<bool>& steep,
                                        const std::vector<bool>& xward,
                                        std::size_t start,
                                        std::size_t min_samples) noexcept {
    std::size_t non_xward = 0;
    std::size_t end = start;
    for (std::size_t i = start; i < steep.size(); ++i) {
        if (steep[i]) {
            non_xward = 0;
            end = i;
        } else if (!xward[i]) {
            // Not steep, but still going the same way.
            ++non_xward;
            if (non_xward > min_samples) {
                break;
            }
        } else {
            return end;
        }
    }
    return end;
}

/// Steep-down area: a candidate cluster start.
struct SteepDownArea {
    std::size_t start;
    std::size_t end;
    double mib;  ///< Maximum reachability seen between this area and now
};

/// Drop areas whose start is no longer ξ-steep above `mib`, then raise the
/// stored in-between maximum of the survivors.
void update_filter_sdas(std::vector<SteepDownArea>& sdas,
                        double mib,
                        double xi_complement,
                        const std::vector<double>& reach_plot) {
    if (std::isinf(mib)) {
        sdas.clear();
        return;
    }
    std::erase_if(sdas, [&](const SteepDownArea& d) {
        return !(mib <= reach_plot[d.start] * xi_complement);
    });
    for (auto& d : sdas) {
        d.mib = std::max(d.mib, mib);
    }
}

}  // anonymous namespace

// ─── Optics ───────────────────────────────────────────────────────────────────

Optics::Optics(OpticsConfig config)
    : config_(std::move(config)) {}

OpticsResult Optics::fit(const Matrix& points) const {
    if (config_.min_samples < 2) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("min_samples must be at least 2, got {}",
                                        config_.min_samples));
    }
    if (!(config_.xi > 0.0 && config_.xi < 1.0)) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("xi must lie in (0, 1), got {}", config_.xi));
    }
    if (config_.min_cluster_size && *config_.min_cluster_size < 2) {
        throw PipelineError(ErrorKind::InvalidInput,
                            "min_cluster_size must be at least 2");
    }
    if (!(config_.max_eps > 0.0)) {
        throw PipelineError(ErrorKind::InvalidInput, "max_eps must be positive");
    }

    OpticsResult out;
    compute_graph(points, out);

    std::vector<double> reach_plot;
    std::vector<long> pred_plot;
    reach_plot.reserve(out.ordering.size() + 1);
    pred_plot.reserve(out.ordering.size());
    for (std::size_t idx : out.ordering) {
        reach_plot.push_back(out.reachability[idx]);
        pred_plot.push_back(out.predecessor[idx]);
    }
    reach_plot.push_back(kInf);

    const auto clusters = xi_clusters(reach_plot, pred_plot, out.ordering);
    out.labels = extract_labels(out.ordering, clusters);
    return out;
}

// ─── compute_graph ────────────────────────────────────────────────────────────

void Optics::compute_graph(const Matrix& points, OpticsResult& out) const {
    const auto n = static_cast<std::size_t>(points.rows());

    // Pairwise Euclidean distances; n is the asset count, so O(n²) is fine.
    Matrix dist(points.rows(), points.rows());
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        dist(i, i) = 0.0;
        for (Eigen::Index j = i + 1; j < points.rows(); ++j) {
            const double d = (points.row(i) - points.row(j)).norm();
            dist(i, j) = d;
            dist(j, i) = d;
        }
    }

    out.core_distances.assign(n, kInf);
    if (n >= config_.min_samples) {
        std::vector<double> row(n);
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = 0; j < n; ++j) {
                row[j] = dist(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
            }
            const auto kth = row.begin() + static_cast<std::ptrdiff_t>(config_.min_samples - 1);
            std::nth_element(row.begin(), kth, row.end());
            out.core_distances[i] = *kth > config_.max_eps ? kInf : *kth;
        }
    }

    out.reachability.assign(n, kInf);
    out.predecessor.assign(n, -1);
    out.ordering.clear();
    out.ordering.reserve(n);
    std::vector<bool> processed(n, false);

    for (std::size_t step = 0; step < n; ++step) {
        // Unprocessed point with the smallest reachability; ties → lowest index.
        std::size_t point = n;
        for (std::size_t j = 0; j < n; ++j) {
            if (processed[j]) continue;
            if (point == n || out.reachability[j] < out.reachability[point]) {
                point = j;
            }
        }
        processed[point] = true;
        out.ordering.push_back(point);

        const double core = out.core_distances[point];
        if (std::isinf(core)) {
            continue;
        }
        for (std::size_t j = 0; j < n; ++j) {
            if (processed[j]) continue;
            const double d = dist(static_cast<Eigen::Index>(point), static_cast<Eigen::Index>(j));
            if (d > config_.max_eps) continue;
            const double reach = std::max(d, core);
            if (reach < out.reachability[j]) {
                out.reachability[j] = reach;
                out.predecessor[j] = static_cast<long>(point);
            }
        }
    }
}

// ─── xi_clusters ──────────────────────────────────────────────────────────────

std::vector<Optics::Span>
Optics::xi_clusters(const std::vector<double>& reach_plot,
                    const std::vector<long>& pred_plot,
                    const std::vector<std::size_t>& ordering) const {
    const std::size_t n = ordering.size();
    const std::size_t min_samples = config_.min_samples;
    const std::size_t min_cluster_size =
        config_.min_cluster_size.value_or(config_.min_samples);
    const double xi_complement = 1.0 - config_.xi;

    // Neighbour ratios; inf/inf yields NaN which is neither steep nor moving.
    std::vector<bool> steep_up(n), steep_down(n), upward(n), downward(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double ratio = reach_plot[i] / reach_plot[i + 1];
        steep_up[i]   = ratio <= xi_complement;
        steep_down[i] = ratio >= 1.0 / xi_complement;
        downward[i]   = ratio > 1.0;
        upward[i]     = ratio < 1.0;
    }

    // Shrink [s, e] until its end point was reached from inside it.
    auto correct_predecessor = [&](std::size_t s, std::size_t e) -> std::optional<Span> {
        while (s < e) {
            if (reach_plot[s] > reach_plot[e]) {
                return Span{s, e};
            }
            const long p_e = pred_plot[e];
            for (std::size_t i = s; i < e; ++i) {
                if (p_e == static_cast<long>(ordering[i])) {
                    return Span{s, e};
                }
            }
            --e;
        }
        return std::nullopt;
    };

    std::vector<SteepDownArea> sdas;
    std::vector<Span> clusters;
    std::size_t index = 0;
    double mib = 0.0;

    for (std::size_t steep_index = 0; steep_index < n; ++steep_index) {
        if (!steep_up[steep_index] && !steep_down[steep_index]) continue;
        if (steep_index < index) continue;

        for (std::size_t i = index; i <= steep_index; ++i) {
            mib = std::max(mib, reach_plot[i]);
        }

        if (steep_down[steep_index]) {
            update_filter_sdas(sdas, mib, xi_complement, reach_plot);
            const std::size_t d_start = steep_index;
            const std::size_t d_end =
                extend_region(steep_down, upward, d_start, min_samples);
            sdas.push_back(SteepDownArea{d_start, d_end, 0.0});
            index = d_end + 1;
            mib = reach_plot[index];
            continue;
        }

        // Steep-up area: try to close a cluster with every open steep-down area.
        update_filter_sdas(sdas, mib, xi_complement, reach_plot);
        const std::size_t u_start = steep_index;
        const std::size_t u_end = extend_region(steep_up, downward, u_start, min_samples);
        index = u_end + 1;
        mib = reach_plot[index];

        std::vector<Span> u_clusters;
        for (const auto& d : sdas) {
            std::size_t c_start = d.start;
            std::size_t c_end = u_end;

            if (reach_plot[c_end + 1] * xi_complement < d.mib) {
                continue;
            }

            const double d_max = reach_plot[d.start];
            if (d_max * xi_complement >= reach_plot[c_end + 1]) {
                // Start from the first point level with the cluster end.
                while (reach_plot[c_start + 1] > reach_plot[c_end + 1] && c_start < d.end) {
                    ++c_start;
                }
            } else if (reach_plot[c_end + 1] * xi_complement >= d_max) {
                // End at the last point level with the cluster start.
                while (reach_plot[c_end - 1] > d_max && c_end > u_start) {
                    --c_end;
                }
            }

            if (config_.predecessor_correction) {
                const auto corrected = correct_predecessor(c_start, c_end);
                if (!corrected) {
                    continue;
                }
                c_start = corrected->start;
                c_end = corrected->end;
            }

            const long size = static_cast<long>(c_end) - static_cast<long>(c_start) + 1;
            if (size < static_cast<long>(min_cluster_size)) continue;
            if (c_start > d.end) continue;
            if (c_end < u_start) continue;

            u_clusters.push_back(Span{c_start, c_end});
        }

        // Smaller (inner) clusters first.
        clusters.insert(clusters.end(), u_clusters.rbegin(), u_clusters.rend());
    }

    return clusters;
}

// ─── extract_labels ───────────────────────────────────────────────────────────

std::vector<int>
Optics::extract_labels(const std::vector<std::size_t>& ordering,
                       const std::vector<Span>& clusters) {
    std::vector<int> ordered(ordering.size(), constants::NOISE_LABEL);
    int label = 0;
    for (const auto& c : clusters) {
        const bool untouched = std::all_of(
            ordered.begin() + static_cast<std::ptrdiff_t>(c.start),
            ordered.begin() + static_cast<std::ptrdiff_t>(c.end) + 1,
            [](int l) { return l == constants::NOISE_LABEL; });
        if (untouched) {
            std::fill(ordered.begin() + static_cast<std::ptrdiff_t>(c.start),
                      ordered.begin() + static_cast<std::ptrdiff_t>(c.end) + 1,
                      label);
            ++label;
        }
    }

    std::vector<int> labels(ordering.size(), constants::NOISE_LABEL);
    for (std::size_t i = 0; i < ordering.size(); ++i) {
        labels[ordering[i]] = ordered[i];
    }
    return labels;
}

// ─── ClusteringEngine ─────────────────────────────────────────────────────────

ClusteringEngine::ClusteringEngine(OpticsConfig config)
    : optics_(std::move(config)) {}

ClusterAssignment ClusteringEngine::cluster(const FeatureTable& features) const {
    OpticsResult unused;
    return cluster(features, unused);
}

ClusterAssignment ClusteringEngine::cluster(const FeatureTable& features,
                                            OpticsResult& details) const {
    if (features.empty() || features.loadings.rows() == 0) {
        throw PipelineError(
            ErrorKind::NotReady,
            "clustering requires feature vectors; run dimensionality reduction first");
    }
    if (features.loadings.rows() != static_cast<Eigen::Index>(features.assets.size())) {
        throw PipelineError(
            ErrorKind::InvalidInput,
            fmt::format("feature table has {} rows for {} assets",
                        features.loadings.rows(), features.assets.size()));
    }

    details = optics_.fit(features.loadings);

    ClusterAssignment assignment;
    assignment.assets = features.assets;
    assignment.labels = details.labels;
    return assignment;
}

}  // namespace pairsel::cluster
