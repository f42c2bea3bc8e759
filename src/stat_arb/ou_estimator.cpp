/// @file src/stat_arb/ou_estimator.cpp
/// @brief Ornstein-Uhlenbeck fit by AR(1) regression and mean-crossing count.

#include "pairsel/stat_arb.hpp"
#include "pairsel/errors.hpp"
#include "pairsel/stats.hpp"

#include <fmt/format.h>

#include <cmath>
#include <numbers>
#include <vector>

namespace pairsel::stat_arb {

OrnsteinUhlenbeckEstimator::OrnsteinUhlenbeckEstimator(OuEstimatorConfig config)
    : config_(config) {}

std::optional<OuParameters>
OrnsteinUhlenbeckEstimator::fit(std::span<const double> series) noexcept {
    if (series.size() < 3) return std::nullopt;

    std::vector<double> lagged;
    std::vector<double> current;
    lagged.reserve(series.size() - 1);
    current.reserve(series.size() - 1);
    for (std::size_t t = 1; t < series.size(); ++t) {
        if (std::isfinite(series[t - 1]) && std::isfinite(series[t])) {
            lagged.push_back(series[t - 1]);
            current.push_back(series[t]);
        }
    }
    const auto line = stats::fit_line(lagged, current);
    if (!line) return std::nullopt;

    OuParameters p;
    p.ar_coefficient = line->slope;
    if (line->slope > 0.0 && line->slope < 1.0) {
        p.theta = -std::log(line->slope);
        p.half_life = std::numbers::ln2 / p.theta;
        p.mean = line->intercept / (1.0 - line->slope);
    } else {
        p.theta = std::numeric_limits<double>::quiet_NaN();
        p.half_life = std::numeric_limits<double>::infinity();
        p.mean = std::numeric_limits<double>::quiet_NaN();
    }
    return p;
}

std::size_t
OrnsteinUhlenbeckEstimator::count_mean_crossings(std::span<const double> series) noexcept {
    const auto mu = stats::mean(series);
    if (!mu) return 0;

    std::size_t crossings = 0;
    int previous = 0;
    for (double v : series) {
        const double d = v - *mu;
        const int sign = d > 0.0 ? 1 : (d < 0.0 ? -1 : previous);
        if (previous != 0 && sign != previous) {
            ++crossings;
        }
        previous = sign;
    }
    return crossings;
}

TimePoint OrnsteinUhlenbeckEstimator::window_cutoff(TimePoint last, int years) noexcept {
    const std::chrono::year_month_day ymd{last};
    const std::chrono::year_month_day shifted = ymd - std::chrono::years{years};
    if (shifted.ok()) {
        return TimePoint{shifted};
    }
    // 29 February in a non-leap target year.
    return TimePoint{shifted.year() / shifted.month() / std::chrono::last};
}

std::vector<OUFitResult>
OrnsteinUhlenbeckEstimator::operator()(const SpreadTable& spreads,
                                       std::span<const AssetPair> pairs,
                                       int window_years,
                                       double min_crossovers_per_year) const {
    if (window_years < 1) {
        throw PipelineError(ErrorKind::InvalidInput,
                            fmt::format("test window must be at least one year, got {}",
                                        window_years));
    }

    std::vector<OUFitResult> out;
    out.reserve(pairs.size());
    if (pairs.empty()) return out;

    if (spreads.index.empty()) {
        throw PipelineError(ErrorKind::InvalidInput, "spread table has no observations");
    }
    const TimePoint cutoff = window_cutoff(spreads.index.back(), window_years);

    std::vector<double> window;
    std::vector<double> values;
    std::vector<TimePoint> dates;
    for (const auto& pair : pairs) {
        const auto col = spreads.column_of(pair.label());
        if (!col) {
            throw PipelineError(ErrorKind::InvalidInput,
                                fmt::format("spread table has no column {}", pair.label()));
        }

        window.clear();
        values.clear();
        dates.clear();
        for (std::size_t t = 0; t < spreads.rows(); ++t) {
            if (!(spreads.index[t] > cutoff)) continue;
            const double v = spreads.values(static_cast<Eigen::Index>(t), *col);
            window.push_back(v);
            if (std::isfinite(v)) {
                values.push_back(v);
                dates.push_back(spreads.index[t]);
            }
        }

        OUFitResult rec;
        rec.pair = pair;
        rec.theta = std::numeric_limits<double>::quiet_NaN();
        rec.half_life = std::numeric_limits<double>::infinity();
        if (const auto params = fit(window)) {
            rec.theta = params->theta;
            rec.half_life = params->half_life;
        }

        rec.crossovers = count_mean_crossings(values);
        rec.crossover_pass = false;
        if (values.size() >= config_.min_window_observations && !dates.empty()) {
            const double span_years =
                static_cast<double>((dates.back() - dates.front()).count()) /
                constants::DAYS_PER_YEAR;
            rec.crossover_pass =
                static_cast<double>(rec.crossovers) >= min_crossovers_per_year * span_years;
        }
        out.push_back(rec);
    }
    return out;
}

}  // namespace pairsel::stat_arb
