#pragma once

/// @file include/runstream/plan.hpp
/// @brief PlanComparator: totals-level plan vs execution reconciliation.
///
/// # Module: Plan Comparator
///
/// Compares duration, distance, pace and interval count. Each delta is
/// `actual − planned` and is `nullopt` when either side is unknown; a plan
/// value is never inferred from the run.

#include "runstream/segmentation.hpp"
#include "runstream/types.hpp"

#include <optional>
#include <span>

namespace runstream {

/// What the athlete was scheduled to do. Every field is optional.
struct PlannedWorkout {
    std::optional<double> duration_min;
    std::optional<double> distance_km;
    std::optional<double> pace_s_km;
    std::optional<int>    interval_count;
};

struct PlanComparison {
    std::optional<double> planned_duration_min;
    std::optional<double> actual_duration_min;
    Gated<double>         duration_delta_min;

    std::optional<double> planned_distance_km;
    std::optional<double> actual_distance_km;
    Gated<double>         distance_delta_km;

    std::optional<double> planned_pace_s_km;
    std::optional<double> actual_pace_s_km;
    Gated<double>         pace_delta_s_km;

    std::optional<int>    planned_interval_count;
    std::optional<int>    detected_work_count;
    std::optional<bool>   interval_count_match;
};

class PlanComparator {
public:
    /// Reconcile a run against its plan.
    ///
    /// # Returns
    /// `nullopt` when no plan is linked.
    [[nodiscard]] static std::optional<PlanComparison>
    compare(const StreamSeries& series,
            std::span<const Segment> segments,
            const std::optional<PlannedWorkout>& plan) noexcept;

    /// Moving pace in s/km from velocity, else elapsed pace from distance.
    [[nodiscard]] static std::optional<double>
    actual_pace_s_km(const StreamSeries& series) noexcept;

    /// Covered distance in km from the distance channel.
    [[nodiscard]] static std::optional<double>
    actual_distance_km(const StreamSeries& series) noexcept;
};

}  // namespace runstream
