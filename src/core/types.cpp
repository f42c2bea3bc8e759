/// @file src/core/types.cpp
/// @brief Out-of-line members of the shared value types and error taxonomy.

#include "pairsel/types.hpp"
#include "pairsel/errors.hpp"
#include "pairsel/constants.hpp"

#include <fmt/format.h>

#include <set>

namespace pairsel {

// ─── Panel ────────────────────────────────────────────────────────────────────

std::optional<Eigen::Index>
Panel::column_of(const std::string& name) const noexcept {
    for (std::size_t j = 0; j < columns.size(); ++j) {
        if (columns[j] == name) {
            return static_cast<Eigen::Index>(j);
        }
    }
    return std::nullopt;
}

std::optional<Vector> Panel::column(const std::string& name) const {
    const auto j = column_of(name);
    if (!j || *j >= values.cols()) {
        return std::nullopt;
    }
    return Vector(values.col(*j));
}

// ─── ClusterAssignment ────────────────────────────────────────────────────────

std::size_t ClusterAssignment::cluster_count() const {
    std::set<int> distinct;
    for (int label : labels) {
        if (label != constants::NOISE_LABEL) {
            distinct.insert(label);
        }
    }
    return distinct.size();
}

// ─── AssetPair ────────────────────────────────────────────────────────────────

std::string AssetPair::label() const {
    return fmt::format("({}, {})", first, second);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::NotReady:     return "NotReady";
        case ErrorKind::NoCandidates: return "NoCandidates";
    }
    return "Unknown";
}

PipelineError::PipelineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {}

}  // namespace pairsel
