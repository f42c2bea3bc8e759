/**
 * @file  descriptive.cpp
 * @brief mean, population standard deviation and least-squares line fit.
 */

#include "pairsel/stats.hpp"

#include <cmath>

namespace pairsel::stats {

std::optional<double> mean(std::span<const double> values) noexcept {
    if (values.empty()) return std::nullopt;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

std::optional<double> population_stddev(std::span<const double> values) noexcept {
    const auto mu = mean(values);
    if (!mu) return std::nullopt;
    double sq = 0.0;
    for (double v : values) {
        const double d = v - *mu;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(values.size()));
}

std::optional<LinearFit>
fit_line(std::span<const double> x, std::span<const double> y) noexcept {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const auto mx = mean(x);
    const auto my = mean(y);
    if (!mx || !my || !std::isfinite(*mx) || !std::isfinite(*my)) return std::nullopt;

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - *mx;
        sxx += dx * dx;
        sxy += dx * (y[i] - *my);
    }
    if (sxx < constants::SINGULARITY_EPSILON) return std::nullopt;

    LinearFit fit;
    fit.slope = sxy / sxx;
    fit.intercept = *my - fit.slope * *mx;
    if (!std::isfinite(fit.slope) || !std::isfinite(fit.intercept)) return std::nullopt;
    return fit;
}

} // namespace pairsel::stats
