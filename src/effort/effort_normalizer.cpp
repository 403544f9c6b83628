/// @file src/effort/effort_normalizer.cpp
/// @brief EffortNormalizer: tier resolution and per-point clamped effort.

#include "runstream/effort.hpp"
#include "runstream/constants.hpp"

#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace runstream {

namespace {

// ─── Anchors ──────────────────────────────────────────────────────────────────

/// Physiology values that survived plausibility checks.
struct Anchors {
    std::optional<double> threshold_hr;
    std::optional<double> resting_hr;
    std::optional<double> max_hr;
    std::optional<double> threshold_pace_s_per_km;
};

std::optional<double> plausible(const std::optional<double>& v, double upper) noexcept {
    if (v && std::isfinite(*v) && *v > 0.0 && *v <= upper) return v;
    return std::nullopt;
}

Anchors sanitize(const std::optional<AthletePhysiologyContext>& ctx) noexcept {
    Anchors a;
    if (!ctx) return a;
    a.threshold_hr = plausible(ctx->threshold_hr, constants::HR_MAX_BPM);
    a.resting_hr   = plausible(ctx->resting_hr, constants::HR_MAX_BPM);
    a.max_hr       = plausible(ctx->max_hr, constants::HR_MAX_BPM);
    a.threshold_pace_s_per_km = plausible(ctx->threshold_pace_s_per_km, 3600.0);

    // Inconsistent pair: neither value can be trusted.
    if (a.resting_hr && a.max_hr && *a.resting_hr >= *a.max_hr) {
        a.resting_hr.reset();
        a.max_hr.reset();
    }
    return a;
}

// ─── Strategies ───────────────────────────────────────────────────────────────

/// effort = (x − offset) / span, clamped to [0, 1].
struct LinearScale {
    double offset;
    double span;
};

/// Anchored scale for HR-derived effort. `nullopt` means rank within run.
std::optional<LinearScale> hr_scale(EffortTier tier, const Anchors& a) noexcept {
    switch (tier) {
        case EffortTier::Tier1ThresholdHr:
            return LinearScale{0.0, *a.threshold_hr};
        case EffortTier::Tier2EstimatedHrr: {
            const double est = EffortNormalizer::estimated_threshold_hr(*a.resting_hr, *a.max_hr);
            return LinearScale{*a.resting_hr, est - *a.resting_hr};
        }
        case EffortTier::Tier3MaxHr:
            return LinearScale{0.0, *a.max_hr};
        case EffortTier::Tier4StreamRelative:
            return std::nullopt;
    }
    return std::nullopt;
}

/// Anchored scale for velocity-derived effort. Only threshold pace anchors it.
std::optional<LinearScale> velocity_scale(EffortTier tier, const Anchors& a) noexcept {
    switch (tier) {
        case EffortTier::Tier1ThresholdHr:
            return LinearScale{0.0, 1000.0 / *a.threshold_pace_s_per_km};
        case EffortTier::Tier2EstimatedHrr:
        case EffortTier::Tier3MaxHr:
        case EffortTier::Tier4StreamRelative:
            return std::nullopt;
    }
    return std::nullopt;
}

double clamp01(double x) noexcept {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

}  // namespace

// ─── EffortNormalizer::resolve_tier ───────────────────────────────────────────

EffortTier
EffortNormalizer::resolve_tier(const std::optional<AthletePhysiologyContext>& physiology,
                               bool hr_usable) noexcept {
    const Anchors a = sanitize(physiology);
    if (!hr_usable) {
        return a.threshold_pace_s_per_km ? EffortTier::Tier1ThresholdHr
                                         : EffortTier::Tier4StreamRelative;
    }
    if (a.threshold_hr)              return EffortTier::Tier1ThresholdHr;
    if (a.resting_hr && a.max_hr)    return EffortTier::Tier2EstimatedHrr;
    if (a.max_hr)                    return EffortTier::Tier3MaxHr;
    return EffortTier::Tier4StreamRelative;
}

// ─── EffortNormalizer::normalize ──────────────────────────────────────────────

EffortSeries
EffortNormalizer::normalize(const StreamSeries& series,
                            const std::optional<AthletePhysiologyContext>& physiology,
                            bool hr_usable) noexcept {
    const Anchors anchors = sanitize(physiology);
    const bool has_hr       = series.heartrate_bpm.has_value();
    const bool has_velocity = series.velocity_mps.has_value();

    // Unreliable HR still drives effort when it is the only signal, but only
    // as a within-run ranking.
    const bool use_hr = has_hr && (hr_usable || !has_velocity);

    EffortSeries out;
    out.source = use_hr ? EffortSource::Heartrate : EffortSource::Velocity;
    out.tier   = (use_hr && !hr_usable) ? EffortTier::Tier4StreamRelative
                                        : resolve_tier(physiology, use_hr);
    out.cross_run_comparable = out.tier != EffortTier::Tier4StreamRelative;

    if (has_hr && !hr_usable) {
        out.flags.push_back(EstimatedFlag::HrUnreliable);
    }

    // ── Build the raw signal ──────────────────────────────────────────────────
    std::vector<double> signal;
    if (use_hr) {
        signal = *series.heartrate_bpm;
    } else if (has_velocity) {
        signal = *series.velocity_mps;
        out.flags.push_back(EstimatedFlag::VelocitySubstitutedForHr);
        if (series.grade_pct) {
            const auto& grade = *series.grade_pct;
            for (std::size_t i = 0; i < signal.size(); ++i) {
                signal[i] = grade_adjusted_velocity(signal[i], grade[i]);
            }
            out.flags.push_back(EstimatedFlag::GradeAdjustedVelocity);
        }
    } else {
        signal.assign(series.size(), 0.0);
    }

    // ── Apply the tier strategy ───────────────────────────────────────────────
    const auto scale = use_hr ? hr_scale(out.tier, anchors)
                              : velocity_scale(out.tier, anchors);
    if (scale && scale->span > 0.0) {
        out.values.reserve(signal.size());
        for (double x : signal) {
            out.values.push_back(clamp01((x - scale->offset) / scale->span));
        }
    } else {
        out.values = percentile_ranks(signal);
        for (double& v : out.values) v = clamp01(v);
    }

    switch (out.tier) {
        case EffortTier::Tier2EstimatedHrr:
            out.flags.push_back(EstimatedFlag::ThresholdHrEstimatedFromHrr);
            break;
        case EffortTier::Tier4StreamRelative:
            out.flags.push_back(EstimatedFlag::StreamRelativeClassification);
            break;
        case EffortTier::Tier1ThresholdHr:
        case EffortTier::Tier3MaxHr:
            break;
    }

    return out;
}

// ─── EffortNormalizer::confidence ─────────────────────────────────────────────

double EffortNormalizer::confidence(EffortTier tier, std::size_t missing_channels) noexcept {
    double base = constants::TIER4_BASE_CONFIDENCE;
    switch (tier) {
        case EffortTier::Tier1ThresholdHr:    base = constants::TIER1_BASE_CONFIDENCE; break;
        case EffortTier::Tier2EstimatedHrr:   base = constants::TIER2_BASE_CONFIDENCE; break;
        case EffortTier::Tier3MaxHr:          base = constants::TIER3_BASE_CONFIDENCE; break;
        case EffortTier::Tier4StreamRelative: base = constants::TIER4_BASE_CONFIDENCE; break;
    }
    const double total   = static_cast<double>(OPTIONAL_CHANNELS.size());
    const double missing = std::min(static_cast<double>(missing_channels), total);
    const double value   = base * (1.0 - constants::MISSING_CHANNEL_DISCOUNT * missing / total);
    return stats::round_to(std::clamp(value, 0.0, 1.0), 4);
}

// ─── EffortNormalizer::grade_adjusted_velocity ────────────────────────────────

double EffortNormalizer::grade_adjusted_velocity(double velocity_mps, double grade_pct) noexcept {
    const double coeff = grade_pct >= 0.0 ? constants::GAP_UPHILL_COEFF
                                          : constants::GAP_DOWNHILL_COEFF;
    const double factor = std::clamp(1.0 + coeff * grade_pct,
                                     constants::GAP_FACTOR_MIN,
                                     constants::GAP_FACTOR_MAX);
    return velocity_mps * factor;
}

// ─── EffortNormalizer::percentile_ranks ───────────────────────────────────────

std::vector<double> EffortNormalizer::percentile_ranks(std::span<const double> values) noexcept {
    const std::size_t n = values.size();
    std::vector<double> ranks(n, 0.0);
    if (n == 0) return ranks;

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return values[a] < values[b];
    });

    // Ties share the mid-rank of their group.
    std::size_t group_start = 0;
    while (group_start < n) {
        std::size_t group_end = group_start + 1;
        while (group_end < n && values[order[group_end]] == values[order[group_start]]) {
            ++group_end;
        }
        const double equal = static_cast<double>(group_end - group_start);
        const double rank  = (static_cast<double>(group_start) + 0.5 * equal) /
                             static_cast<double>(n);
        for (std::size_t k = group_start; k < group_end; ++k) {
            ranks[order[k]] = rank;
        }
        group_start = group_end;
    }
    return ranks;
}

// ─── EffortNormalizer::estimated_threshold_hr ─────────────────────────────────

double EffortNormalizer::estimated_threshold_hr(double resting_hr, double max_hr) noexcept {
    return resting_hr + constants::TIER2_THRESHOLD_HRR_FRACTION * (max_hr - resting_hr);
}

}  // namespace runstream
