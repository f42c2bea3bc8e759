/// @file src/preprocess/return_preprocessor.cpp
/// @brief ReturnPreprocessor — relative change, inf → missing, forward fill,
///        drop incomplete rows.

#include "pairsel/preprocess.hpp"
#include "pairsel/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <set>

namespace pairsel::preprocess {

// ─── validate ─────────────────────────────────────────────────────────────────

std::optional<std::string>
ReturnPreprocessor::validate(const PricePanel& prices) {
    if (prices.empty()) {
        return "price panel is empty";
    }
    if (prices.values.rows() != static_cast<Eigen::Index>(prices.rows()) ||
        prices.values.cols() != static_cast<Eigen::Index>(prices.cols())) {
        return fmt::format(
            "price matrix is {}x{} but index/columns describe {}x{}",
            prices.values.rows(), prices.values.cols(),
            prices.rows(), prices.cols());
    }
    for (std::size_t t = 1; t < prices.rows(); ++t) {
        if (prices.index[t] <= prices.index[t - 1]) {
            return fmt::format("time index is not strictly increasing at row {}", t);
        }
    }
    std::set<std::string> seen;
    for (const auto& name : prices.columns) {
        if (!seen.insert(name).second) {
            return fmt::format("duplicate asset identifier '{}'", name);
        }
    }
    return std::nullopt;
}

// ─── compute ──────────────────────────────────────────────────────────────────

ReturnPanel ReturnPreprocessor::compute(const PricePanel& prices) {
    if (auto problem = validate(prices)) {
        throw PipelineError(ErrorKind::InvalidInput, *problem);
    }

    const Eigen::Index n = prices.values.rows();
    const Eigen::Index m = prices.values.cols();
    constexpr double missing = std::numeric_limits<double>::quiet_NaN();

    // Row t of `raw` is the return from t to t+1; the first price row has no
    // predecessor and is dropped here.
    Matrix raw(n > 0 ? n - 1 : 0, m);

    for (Eigen::Index j = 0; j < m; ++j) {
        double last_valid = missing;
        for (Eigen::Index t = 1; t < n; ++t) {
            const double prev = prices.values(t - 1, j);
            const double curr = prices.values(t, j);
            double r = (curr - prev) / prev;

            // Zero prior price gives ±inf; NaN prices propagate as NaN.
            if (!std::isfinite(r)) {
                r = missing;
            }
            if (std::isnan(r)) {
                r = last_valid;  // forward fill (stays NaN before first value)
            } else {
                last_valid = r;
            }
            raw(t - 1, j) = r;
        }
    }

    // Keep only rows with no missing value left after the fill.
    std::vector<Eigen::Index> keep;
    keep.reserve(static_cast<std::size_t>(raw.rows()));
    for (Eigen::Index t = 0; t < raw.rows(); ++t) {
        if (raw.row(t).allFinite()) {
            keep.push_back(t);
        }
    }

    ReturnPanel out;
    out.columns = prices.columns;
    out.values.resize(static_cast<Eigen::Index>(keep.size()), m);
    out.index.reserve(keep.size());
    for (std::size_t k = 0; k < keep.size(); ++k) {
        out.values.row(static_cast<Eigen::Index>(k)) = raw.row(keep[k]);
        out.index.push_back(prices.index[static_cast<std::size_t>(keep[k]) + 1]);
    }
    return out;
}

}  // namespace pairsel::preprocess
