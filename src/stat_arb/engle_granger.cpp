/// @file src/stat_arb/engle_granger.cpp
/// @brief Engle-Granger two-step cointegration test over a price panel.

#include "pairsel/stat_arb.hpp"
#include "pairsel/errors.hpp"
#include "pairsel/stats.hpp"

#include <fmt/format.h>

#include <cmath>

namespace pairsel::stat_arb {

namespace {

// R² above 1 − 100·√ε counts as an exact linear relation.
constexpr double COLLINEAR_RESIDUAL_SHARE = 100.0 * 1.4901161193847656e-08;

[[nodiscard]] Vector column_or_throw(const PricePanel& prices, const AssetId& asset) {
    auto col = prices.column(asset);
    if (!col) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("asset '{}' is not a column of the price panel", asset));
    }
    return *std::move(col);
}

}  // anonymous namespace

EngleGrangerTester::EngleGrangerTester(EngleGrangerConfig config)
    : config_(config) {}

EngleGrangerResult EngleGrangerTester::test(std::span<const double> y,
                                            std::span<const double> x) const noexcept {
    EngleGrangerResult result;
    if (y.size() != x.size()) return result;

    std::vector<double> ys;
    std::vector<double> xs;
    ys.reserve(y.size());
    xs.reserve(x.size());
    for (std::size_t t = 0; t < y.size(); ++t) {
        if (std::isfinite(y[t]) && std::isfinite(x[t])) {
            ys.push_back(y[t]);
            xs.push_back(x[t]);
        }
    }
    result.nobs = ys.size();
    if (ys.size() < config_.min_observations || ys.size() < 3) return result;

    // Step 1: cointegrating regression.
    const auto line = stats::fit_line(xs, ys);
    if (!line) return result;

    const double y_mean = *stats::mean(ys);
    std::vector<double> residuals(ys.size());
    double ssr = 0.0;
    double sst = 0.0;
    for (std::size_t t = 0; t < ys.size(); ++t) {
        residuals[t] = ys[t] - line->intercept - line->slope * xs[t];
        ssr += residuals[t] * residuals[t];
        sst += (ys[t] - y_mean) * (ys[t] - y_mean);
    }
    if (!(sst > 0.0)) return result;

    if (ssr / sst <= COLLINEAR_RESIDUAL_SHARE) {
        result.statistic = -std::numeric_limits<double>::infinity();
        result.pvalue = 0.0;
        result.hedge_ratio = line->slope;
        result.intercept = line->intercept;
        return result;
    }

    // Step 2: unit root in the residuals.
    const auto adf = AdfTest::run(residuals);
    if (!adf) return result;

    const auto pvalue = mackinnon_pvalue(adf->statistic, 2);
    if (!pvalue) return result;

    result.statistic = adf->statistic;
    result.pvalue = *pvalue;
    result.hedge_ratio = line->slope;
    result.intercept = line->intercept;
    return result;
}

std::vector<CointegrationResult>
EngleGrangerTester::operator()(const PricePanel& prices,
                               std::span<const AssetPair> candidates) const {
    std::vector<CointegrationResult> out;
    out.reserve(candidates.size());

    for (const auto& pair : candidates) {
        const Vector first = column_or_throw(prices, pair.first);
        const Vector second = column_or_throw(prices, pair.second);
        const std::span<const double> a(first.data(), static_cast<std::size_t>(first.size()));
        const std::span<const double> b(second.data(), static_cast<std::size_t>(second.size()));

        const auto forward = test(a, b);
        if (config_.orientation == Orientation::LowestPValue) {
            const auto reverse = test(b, a);
            if (reverse.pvalue < forward.pvalue) {
                out.push_back(CointegrationResult{
                    AssetPair{pair.second, pair.first}, reverse.pvalue, reverse.hedge_ratio});
                continue;
            }
        }
        out.push_back(CointegrationResult{pair, forward.pvalue, forward.hedge_ratio});
    }
    return out;
}

}  // namespace pairsel::stat_arb
