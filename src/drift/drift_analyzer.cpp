/// @file src/drift/drift_analyzer.cpp
/// @brief DriftAnalyzer: cardiac drift, pace drift and cadence trend.

#include "runstream/drift.hpp"
#include "runstream/constants.hpp"

#include "../core/stats.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace runstream {

const char* to_string(DriftSplit split) noexcept {
    switch (split) {
        case DriftSplit::Distance: return "distance";
        case DriftSplit::Time:     return "time";
    }
    return "unknown";
}

namespace {

/// Analysis indices partitioned at the split midpoint.
struct Halves {
    std::vector<std::size_t> first;
    std::vector<std::size_t> second;
};

Halves split_halves(std::span<const std::size_t> idx,
                    const std::vector<double>& key) noexcept {
    Halves h;
    if (idx.empty()) return h;
    const double mid = 0.5 * (key[idx.front()] + key[idx.back()]);
    for (std::size_t i : idx) {
        (key[i] < mid ? h.first : h.second).push_back(i);
    }
    return h;
}

std::optional<double> mean_of(const std::vector<double>& channel,
                              std::span<const std::size_t> idx) noexcept {
    if (idx.empty()) return std::nullopt;
    double sum = 0.0;
    for (std::size_t i : idx) sum += channel[i];
    return sum / static_cast<double>(idx.size());
}

/// Pace (s/km) over one half: moving velocity when present, otherwise the
/// distance and time covered between consecutive samples of the half.
std::optional<double> half_pace(const StreamSeries& series,
                                std::span<const std::size_t> idx,
                                std::size_t& samples) noexcept {
    if (series.velocity_mps) {
        const auto& v = *series.velocity_mps;
        double sum = 0.0;
        std::size_t moving = 0;
        for (std::size_t i : idx) {
            if (v[i] > constants::MOVING_VELOCITY_MPS) {
                sum += v[i];
                ++moving;
            }
        }
        samples += moving;
        if (moving == 0 || sum <= 0.0) return std::nullopt;
        return 1000.0 / (sum / static_cast<double>(moving));
    }
    if (series.distance_m) {
        const auto& d = *series.distance_m;
        double covered = 0.0;
        double elapsed = 0.0;
        for (std::size_t k = 1; k < idx.size(); ++k) {
            if (idx[k] != idx[k - 1] + 1) continue;
            covered += d[idx[k]] - d[idx[k - 1]];
            elapsed += static_cast<double>(series.time_s[idx[k]] - series.time_s[idx[k - 1]]);
        }
        samples += idx.size();
        if (covered <= 0.0) return std::nullopt;
        return elapsed / (covered / 1000.0);
    }
    return std::nullopt;
}

}  // namespace

// ─── DriftAnalyzer::analysis_indices ──────────────────────────────────────────

std::vector<std::size_t>
DriftAnalyzer::analysis_indices(std::size_t point_count,
                                std::span<const Segment> segments) noexcept {
    std::vector<std::size_t> idx;
    for (const auto& seg : segments) {
        if (seg.type != SegmentType::Work && seg.type != SegmentType::Steady) continue;
        for (std::size_t i = seg.start_index; i <= seg.end_index && i < point_count; ++i) {
            idx.push_back(i);
        }
    }
    if (idx.empty()) {
        idx.resize(point_count);
        for (std::size_t i = 0; i < point_count; ++i) idx[i] = i;
    }
    return idx;
}

// ─── DriftAnalyzer::cumulative_distance ───────────────────────────────────────

std::optional<std::vector<double>>
DriftAnalyzer::cumulative_distance(const StreamSeries& series) noexcept {
    if (series.distance_m) {
        return series.distance_m;
    }
    if (!series.velocity_mps || series.size() == 0) {
        return std::nullopt;
    }
    const auto& v = *series.velocity_mps;
    std::vector<double> cum(series.size(), 0.0);
    for (std::size_t i = 1; i < series.size(); ++i) {
        const double dt = static_cast<double>(series.time_s[i] - series.time_s[i - 1]);
        cum[i] = cum[i - 1] + v[i - 1] * dt;
    }
    return cum;
}

// ─── DriftAnalyzer::linear_slope ──────────────────────────────────────────────

std::optional<double>
DriftAnalyzer::linear_slope(std::span<const double> x, std::span<const double> y) noexcept {
    const std::size_t n = std::min(x.size(), y.size());
    if (n < 2) return std::nullopt;
    if (stats::stddev(x.first(n)) < 1e-9) return std::nullopt;

    const auto rows = static_cast<Eigen::Index>(n);
    Eigen::MatrixXd design(rows, 2);
    Eigen::VectorXd target(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        design(r, 0) = x[static_cast<std::size_t>(r)];
        design(r, 1) = 1.0;
        target(r)    = y[static_cast<std::size_t>(r)];
    }

    const Eigen::Vector2d coeffs = design.colPivHouseholderQr().solve(target);
    if (!std::isfinite(coeffs(0))) return std::nullopt;
    return coeffs(0);
}

// ─── DriftAnalyzer::analyze ───────────────────────────────────────────────────

DriftMetrics DriftAnalyzer::analyze(const StreamSeries& series,
                                    std::span<const Segment> segments) noexcept {
    DriftMetrics out;
    const std::size_t n = series.size();
    if (n < 2) return out;

    const auto idx = analysis_indices(n, segments);

    // ── Split the analysis set in two halves ─────────────────────────────────
    Halves halves;
    if (series.distance_m) {
        out.split = DriftSplit::Distance;
        halves = split_halves(idx, *series.distance_m);
    }
    if (halves.first.empty() || halves.second.empty()) {
        out.split = DriftSplit::Time;
        std::vector<double> t(n);
        for (std::size_t i = 0; i < n; ++i) t[i] = static_cast<double>(series.time_s[i]);
        halves = split_halves(idx, t);
    }

    // ── Cardiac drift ────────────────────────────────────────────────────────
    if (series.heartrate_bpm) {
        const auto first  = mean_of(*series.heartrate_bpm, halves.first);
        const auto second = mean_of(*series.heartrate_bpm, halves.second);
        out.hr_samples = halves.first.size() + halves.second.size();
        if (first && second && *first > 0.0) {
            out.cardiac_drift_pct.value = stats::round_to((*second / *first - 1.0) * 100.0, 2);
        }
    }

    // ── Pace drift (positive = slower) ───────────────────────────────────────
    if (series.velocity_mps || series.distance_m) {
        std::size_t samples = 0;
        const auto first  = half_pace(series, halves.first, samples);
        const auto second = half_pace(series, halves.second, samples);
        out.velocity_samples = samples;
        if (first && second && *first > 0.0) {
            out.pace_drift_pct.value = stats::round_to((*second / *first - 1.0) * 100.0, 2);
        }
    }

    // ── Cadence trend vs distance ────────────────────────────────────────────
    const auto cum = cumulative_distance(series);
    if (series.cadence_spm && cum) {
        std::vector<double> km;
        std::vector<double> cadence;
        km.reserve(idx.size());
        cadence.reserve(idx.size());
        for (std::size_t i : idx) {
            if ((*series.cadence_spm)[i] <= 0.0) continue;
            km.push_back((*cum)[i] / 1000.0);
            cadence.push_back((*series.cadence_spm)[i]);
        }
        out.cadence_samples = cadence.size();
        const auto slope = linear_slope(km, cadence);
        if (slope) {
            out.cadence_trend_bpm_per_km.value = stats::round_to(*slope, 3);
        }
    }

    return out;
}

}  // namespace runstream
