#pragma once

/// @file include/runstream/effort.hpp
/// @brief EffortNormalizer: tiered per-point intensity in [0, 1].
///
/// # Module: Effort Normalizer
///
/// ## Responsibility
/// Pick the highest tier the physiology context supports, then map every
/// point's heart rate (or, failing that, velocity) onto a clamped effort
/// scalar. The tier is chosen once per call.
///
/// ## Tiers
/// | Tier | Needs            | HR formula                                  |
/// |------|------------------|---------------------------------------------|
/// | 1    | threshold_hr     | HR / threshold_hr                           |
/// | 2    | resting + max HR | (HR − rest) / (est − rest), est = rest + 0.88·(max − rest) |
/// | 3    | max_hr           | HR / max_hr                                 |
/// | 4    | nothing          | mid-rank percentile within this run         |
///
/// Without usable HR, velocity is ratioed to threshold pace (tier 1) or
/// ranked within the run (tier 4). Grade-adjusted velocity is used when the
/// grade channel is present.
///
/// ## Guarantees
/// - Every effort value is finite and in [0, 1]
/// - Tier 4 ⇒ `cross_run_comparable == false`
/// - More context never lowers confidence

#include "runstream/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace runstream {

// ─── EffortSeries ─────────────────────────────────────────────────────────────

struct EffortSeries {
    std::vector<double>        values;
    EffortTier                 tier   = EffortTier::Tier4StreamRelative;
    EffortSource               source = EffortSource::Heartrate;
    bool                       cross_run_comparable = false;
    std::vector<EstimatedFlag> flags;
};

// ─── EffortNormalizer ─────────────────────────────────────────────────────────

class EffortNormalizer {
public:
    /// Choose the tier.
    ///
    /// # Arguments
    /// * `physiology` : Athlete context, `nullopt` when unknown
    /// * `hr_usable`  : HR channel present and reliable
    [[nodiscard]] static EffortTier
    resolve_tier(const std::optional<AthletePhysiologyContext>& physiology,
                 bool hr_usable) noexcept;

    /// Compute the effort series for a validated stream.
    ///
    /// Precondition: heart rate (when `hr_usable`) or velocity is present.
    [[nodiscard]] static EffortSeries
    normalize(const StreamSeries& series,
              const std::optional<AthletePhysiologyContext>& physiology,
              bool hr_usable) noexcept;

    /// Tier confidence discounted by missing optional channels, 4 decimals.
    ///
    /// # Arguments
    /// * `missing_channels` : Missing optional channels (0..6)
    [[nodiscard]] static double
    confidence(EffortTier tier, std::size_t missing_channels) noexcept;

    /// Flat-ground equivalent of `velocity_mps` on `grade_pct`.
    [[nodiscard]] static double
    grade_adjusted_velocity(double velocity_mps, double grade_pct) noexcept;

    /// Mid-rank percentile of each value: (below + 0.5·equal) / n.
    [[nodiscard]] static std::vector<double>
    percentile_ranks(std::span<const double> values) noexcept;

    /// Threshold HR implied by resting and max HR (Karvonen, 88 % HRR).
    [[nodiscard]] static double
    estimated_threshold_hr(double resting_hr, double max_hr) noexcept;
};

}  // namespace runstream
