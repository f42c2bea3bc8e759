#pragma once

/// @file include/pairsel/preprocess.hpp
/// @brief ReturnPreprocessor — price panel → cleaned simple returns.
///
/// # Module: Return Preprocessor
///
/// ## Responsibility
/// Convert a PricePanel into a ReturnPanel suitable for standardization and
/// PCA.
///
/// ## Algorithm
/// For every column j and row t ≥ 1:
///   r[t][j] = (p[t][j] − p[t−1][j]) / p[t−1][j]
///
///   1. ±inf (zero prior price) is treated as missing
///   2. missing values are forward filled from the last valid return
///   3. the first row (no prior price) is dropped
///   4. rows still holding a missing value (leading history) are dropped
///
/// ## Edge Cases
/// - A column that never produces a valid return removes every row
/// - Single-row panel: valid input, empty ReturnPanel
///
/// ## Errors
/// Throws `PipelineError{InvalidInput}` when the panel is empty, its
/// dimensions disagree, its index is not strictly increasing, or a column
/// identifier repeats.

#include "pairsel/types.hpp"

namespace pairsel::preprocess {

/// Stateless price → return conversion.
class ReturnPreprocessor {
public:
    /// Compute cleaned simple returns.
    ///
    /// The returned panel keeps the column order of `prices`; its index is
    /// the subset of `prices.index` whose rows survived cleaning.
    [[nodiscard]] static ReturnPanel compute(const PricePanel& prices);

    /// Check the structural invariants of a price panel.
    ///
    /// # Returns
    /// `nullopt` when the panel is usable, otherwise a description of the
    /// first violated invariant.
    [[nodiscard]] static std::optional<std::string>
    validate(const PricePanel& prices);
};

}  // namespace pairsel::preprocess
