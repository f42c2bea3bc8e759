/**
 * @file  hurst_estimator.cpp
 * @brief HurstEstimator::estimate.
 */

#include "pairsel/stats.hpp"

#include <cmath>

namespace pairsel::stats {

std::optional<double>
HurstEstimator::estimate(std::span<const double> series) const noexcept {
    if (max_lags_ < 4) return std::nullopt;

    std::size_t finite = 0;
    for (double v : series) {
        if (std::isfinite(v)) ++finite;
    }
    if (finite <= max_lags_) return std::nullopt;

    std::vector<double> log_lag;
    std::vector<double> log_tau;
    log_lag.reserve(max_lags_ - 2);
    log_tau.reserve(max_lags_ - 2);

    // Differences stay on the original time axis; a gap removes only the
    // differences that touch it.
    std::vector<double> diff;
    diff.reserve(series.size());
    for (std::size_t lag = 2; lag < max_lags_; ++lag) {
        diff.clear();
        for (std::size_t i = lag; i < series.size(); ++i) {
            if (std::isfinite(series[i]) && std::isfinite(series[i - lag])) {
                diff.push_back(series[i] - series[i - lag]);
            }
        }
        const auto sd = population_stddev(diff);
        if (!sd || !(*sd > 0.0)) return std::nullopt;

        log_lag.push_back(std::log(static_cast<double>(lag)));
        log_tau.push_back(std::log(std::sqrt(*sd)));
    }

    const auto fit = fit_line(log_lag, log_tau);
    if (!fit) return std::nullopt;
    return 2.0 * fit->slope;
}

} // namespace pairsel::stats
