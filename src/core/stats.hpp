#pragma once

/// @file src/core/stats.hpp
/// @brief Small descriptive-statistics helpers shared by the stages.
///
/// Internal header: not installed, not part of the public API.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace runstream::stats {

[[nodiscard]] inline double mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    return sum / static_cast<double>(xs.size());
}

/// Population standard deviation. 0 for fewer than 2 samples.
[[nodiscard]] inline double stddev(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return 0.0;
    const double m = mean(xs);
    double sq = 0.0;
    for (double x : xs) {
        const double d = x - m;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(xs.size()));
}

[[nodiscard]] inline std::optional<double> median(std::vector<double> xs) noexcept {
    if (xs.empty()) return std::nullopt;
    std::sort(xs.begin(), xs.end());
    const std::size_t mid = xs.size() / 2;
    if (xs.size() % 2 == 1) return xs[mid];
    return 0.5 * (xs[mid - 1] + xs[mid]);
}

/// Pearson correlation. `nullopt` when either side has no variance.
[[nodiscard]] inline std::optional<double>
pearson(std::span<const double> xs, std::span<const double> ys) noexcept {
    const std::size_t n = std::min(xs.size(), ys.size());
    if (n < 2) return std::nullopt;
    const double mx = mean(xs.first(n));
    const double my = mean(ys.first(n));
    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = xs[i] - mx;
        const double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx < 1e-12 || syy < 1e-12) return std::nullopt;
    return sxy / std::sqrt(sxx * syy);
}

/// Round half away from zero to `decimals` places.
[[nodiscard]] inline double round_to(double x, int decimals) noexcept {
    const double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

}  // namespace runstream::stats
