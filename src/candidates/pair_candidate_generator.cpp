/// @file src/candidates/pair_candidate_generator.cpp

#include "pairsel/candidates.hpp"
#include "pairsel/constants.hpp"
#include "pairsel/errors.hpp"

#include <fmt/format.h>

#include <map>
#include <set>
#include <utility>

namespace pairsel::candidates {

std::vector<AssetPair>
PairCandidateGenerator::generate(const ClusterAssignment& assignment) {
    if (assignment.empty()) {
        throw PipelineError(ErrorKind::NotReady,
                            "candidate generation requires a cluster assignment");
    }
    if (assignment.labels.size() != assignment.assets.size()) {
        throw PipelineError(
            ErrorKind::InvalidInput,
            fmt::format("cluster assignment has {} labels for {} assets",
                        assignment.labels.size(), assignment.assets.size()));
    }

    // std::map keeps labels ascending.
    std::map<int, std::vector<AssetId>> members;
    for (std::size_t i = 0; i < assignment.assets.size(); ++i) {
        const int label = assignment.labels[i];
        if (label == constants::NOISE_LABEL) continue;
        members[label].push_back(assignment.assets[i]);
    }

    std::vector<AssetPair> pairs;
    std::set<std::pair<AssetId, AssetId>> seen;

    for (const auto& [label, assets] : members) {
        for (std::size_t i = 0; i < assets.size(); ++i) {
            for (std::size_t j = i + 1; j < assets.size(); ++j) {
                const auto& a = assets[i];
                const auto& b = assets[j];
                if (a == b) continue;
                auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
                if (!seen.insert(std::move(key)).second) continue;
                pairs.push_back(AssetPair{a, b});
            }
        }
    }

    if (pairs.empty()) {
        throw PipelineError(
            ErrorKind::NoCandidates,
            fmt::format("no cluster holds two distinct assets ({} clusters, {} assets)",
                        assignment.cluster_count(), assignment.assets.size()));
    }
    return pairs;
}

}  // namespace pairsel::candidates
