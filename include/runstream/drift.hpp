#pragma once

/// @file include/runstream/drift.hpp
/// @brief DriftAnalyzer: first-half vs second-half physiological drift.
///
/// # Module: Drift Analyzer
///
/// ## Formulas
/// The analysis set is every point inside `work` and `steady` segments (all
/// points when there are none), split at the cumulative-distance midpoint
/// (elapsed-time midpoint without distance).
///
///   cardiac_drift_pct = (mean HR₂ / mean HR₁ − 1) · 100
///   pace_drift_pct    = (pace₂ / pace₁ − 1) · 100        (positive = slower)
///   cadence_trend     = least-squares slope of cadence vs distance (km)
///
/// ## Edge Cases
/// - Absent source channel → `nullopt`
/// - Empty half, zero pace, zero distance span → `nullopt`
/// - Null is never coerced to zero

#include "runstream/segmentation.hpp"
#include "runstream/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace runstream {

enum class DriftSplit {
    Distance,
    Time,
};

[[nodiscard]] const char* to_string(DriftSplit split) noexcept;

struct DriftMetrics {
    Gated<double> cardiac_drift_pct;
    Gated<double> pace_drift_pct;
    Gated<double> cadence_trend_bpm_per_km;
    DriftSplit    split = DriftSplit::Time;
    std::size_t   hr_samples       = 0;
    std::size_t   velocity_samples = 0;
    std::size_t   cadence_samples  = 0;
};

class DriftAnalyzer {
public:
    /// Compute drift metrics over the work/steady portion of a run.
    [[nodiscard]] static DriftMetrics
    analyze(const StreamSeries& series, std::span<const Segment> segments) noexcept;

    /// Indices of points inside work/steady segments, or all points.
    [[nodiscard]] static std::vector<std::size_t>
    analysis_indices(std::size_t point_count,
                     std::span<const Segment> segments) noexcept;

    /// Cumulative distance per point: the distance channel, else integrated
    /// velocity, else `nullopt`.
    [[nodiscard]] static std::optional<std::vector<double>>
    cumulative_distance(const StreamSeries& series) noexcept;

    /// Ordinary least-squares slope of y on x.
    ///
    /// `nullopt` for fewer than 2 samples or zero variance in x.
    [[nodiscard]] static std::optional<double>
    linear_slope(std::span<const double> x, std::span<const double> y) noexcept;
};

}  // namespace runstream
