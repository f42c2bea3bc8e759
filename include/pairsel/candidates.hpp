#pragma once

/// @file include/pairsel/candidates.hpp
/// @brief PairCandidateGenerator — every intra-cluster 2-combination.
///
/// # Module: Pair Candidate Generator
///
/// ## Responsibility
/// Turn a cluster assignment into the list of asset pairs worth testing.
/// Only assets sharing a non-noise label are paired.
///
/// ## Ordering
/// Labels are visited in ascending order. Inside a label, assets keep the
/// order in which they first appear in the assignment, and pairs follow
/// combinatorial order: (a0,a1), (a0,a2), ..., (a1,a2), ...
///
/// ## Guarantees
/// - No self-pair (first ≠ second)
/// - No unordered pair emitted twice, even if an asset id repeats
/// - Noise (-1) never pairs, not even with other noise
///
/// ## Errors
/// - `NotReady`     — empty assignment (clustering has not run)
/// - `NoCandidates` — no cluster holds two distinct assets

#include "pairsel/types.hpp"

#include <vector>

namespace pairsel::candidates {

class PairCandidateGenerator {
public:
    [[nodiscard]] static std::vector<AssetPair>
    generate(const ClusterAssignment& assignment);
};

}  // namespace pairsel::candidates
