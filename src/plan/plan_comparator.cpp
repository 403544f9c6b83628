/// @file src/plan/plan_comparator.cpp
/// @brief PlanComparator: planned vs actual totals and interval count.

#include "runstream/plan.hpp"
#include "runstream/constants.hpp"

#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>

namespace runstream {

namespace {

/// `actual − planned`, or `nullopt` when either side is unknown.
Gated<double> delta(const std::optional<double>& actual,
                    const std::optional<double>& planned,
                    int decimals) noexcept {
    Gated<double> out;
    if (actual && planned) {
        out.value = stats::round_to(*actual - *planned, decimals);
    }
    return out;
}

std::optional<double> usable(const std::optional<double>& v) noexcept {
    if (v && std::isfinite(*v) && *v > 0.0) return v;
    return std::nullopt;
}

}  // namespace

// ─── PlanComparator::actual_distance_km ───────────────────────────────────────

std::optional<double>
PlanComparator::actual_distance_km(const StreamSeries& series) noexcept {
    if (!series.distance_m || series.size() == 0) return std::nullopt;
    const auto& d = *series.distance_m;
    return std::max(0.0, d.back() - d.front()) / 1000.0;
}

// ─── PlanComparator::actual_pace_s_km ─────────────────────────────────────────

std::optional<double>
PlanComparator::actual_pace_s_km(const StreamSeries& series) noexcept {
    if (series.velocity_mps) {
        double sum = 0.0;
        std::size_t moving = 0;
        for (double v : *series.velocity_mps) {
            if (v > constants::MOVING_VELOCITY_MPS) {
                sum += v;
                ++moving;
            }
        }
        if (moving > 0 && sum > 0.0) {
            return 1000.0 / (sum / static_cast<double>(moving));
        }
    }
    const auto km = actual_distance_km(series);
    if (km && *km > 0.0 && series.elapsed_s() > 0) {
        return static_cast<double>(series.elapsed_s()) / *km;
    }
    return std::nullopt;
}

// ─── PlanComparator::compare ──────────────────────────────────────────────────

std::optional<PlanComparison>
PlanComparator::compare(const StreamSeries& series,
                        std::span<const Segment> segments,
                        const std::optional<PlannedWorkout>& plan) noexcept {
    if (!plan) return std::nullopt;

    PlanComparison out;

    out.planned_duration_min = usable(plan->duration_min);
    out.actual_duration_min  = stats::round_to(static_cast<double>(series.elapsed_s()) / 60.0, 2);
    out.duration_delta_min   = delta(out.actual_duration_min, out.planned_duration_min, 2);

    out.planned_distance_km = usable(plan->distance_km);
    if (const auto km = actual_distance_km(series)) {
        out.actual_distance_km = stats::round_to(*km, 3);
    }
    out.distance_delta_km = delta(out.actual_distance_km, out.planned_distance_km, 3);

    out.planned_pace_s_km = usable(plan->pace_s_km);
    if (const auto pace = actual_pace_s_km(series)) {
        out.actual_pace_s_km = stats::round_to(*pace, 1);
    }
    out.pace_delta_s_km = delta(out.actual_pace_s_km, out.planned_pace_s_km, 1);

    if (plan->interval_count && *plan->interval_count >= 0) {
        const auto work = std::count_if(segments.begin(), segments.end(), [](const Segment& s) {
            return s.type == SegmentType::Work;
        });
        out.planned_interval_count = plan->interval_count;
        out.detected_work_count    = static_cast<int>(work);
        out.interval_count_match   = out.detected_work_count == out.planned_interval_count;
    }

    return out;
}

}  // namespace runstream
