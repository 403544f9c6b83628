/// @file src/trust/trust_gate.cpp
/// @brief TrustGate and the output metric registry.

#include "runstream/trust.hpp"

#include <utility>

namespace runstream {

// ─── MetricRegistry ───────────────────────────────────────────────────────────

MetricRegistry MetricRegistry::defaults() {
    MetricRegistry r;

    r.add({.key = "cardiac_drift_pct", .polarity_ambiguous = false,
           .higher_is_better = false, .min_samples = constants::MIN_DRIFT_SAMPLES,
           .requires_hr = true});
    r.add({.key = "pace_drift_pct", .polarity_ambiguous = false,
           .higher_is_better = false, .min_samples = constants::MIN_DRIFT_SAMPLES});
    r.add({.key = "cadence_trend_bpm_per_km",
           .min_samples = constants::MIN_CADENCE_TREND_SAMPLES});

    // Over- or under-shooting a plan has no better direction.
    r.add({.key = "plan.duration_delta_min"});
    r.add({.key = "plan.distance_delta_km"});
    r.add({.key = "plan.pace_delta_s_km"});

    r.add({.key = moment_key(MomentType::CardiacDriftOnset), .polarity_ambiguous = false,
           .higher_is_better = false, .requires_hr = true});
    r.add({.key = moment_key(MomentType::CadenceDrop)});
    r.add({.key = moment_key(MomentType::CadenceSurge)});
    r.add({.key = moment_key(MomentType::PaceSurge)});
    r.add({.key = moment_key(MomentType::PaceFade)});
    r.add({.key = moment_key(MomentType::GradeAdjustedAnomaly)});
    r.add({.key = moment_key(MomentType::RecoveryHrDelay), .polarity_ambiguous = false,
           .higher_is_better = false, .requires_hr = true});
    r.add({.key = moment_key(MomentType::EffortZoneTransition)});
    return r;
}

void MetricRegistry::add(MetricMeta meta) {
    auto key = meta.key;
    entries_.insert_or_assign(std::move(key), std::move(meta));
}

std::optional<MetricMeta> MetricRegistry::find(std::string_view key) const noexcept {
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool MetricRegistry::is_consistent(const MetricMeta& meta) noexcept {
    if (meta.key.empty()) return false;
    if (meta.polarity_ambiguous && meta.higher_is_better.has_value()) return false;
    if (!meta.polarity_ambiguous && !meta.higher_is_better.has_value()) return false;
    return true;
}

std::string MetricRegistry::moment_key(MomentType type) {
    return std::string("moment.") + to_string(type);
}

// ─── TrustGate ────────────────────────────────────────────────────────────────

TrustGate::TrustGate(TrustConfig config, MetricRegistry registry)
    : config_(config)
    , registry_(std::move(registry))
{}

std::optional<SuppressionReason>
TrustGate::evaluate(std::string_view key, const TrustEvidence& evidence) const noexcept {
    const auto meta = registry_.find(key);
    if (!meta)                                    return SuppressionReason::UnregisteredMetric;
    if (!MetricRegistry::is_consistent(*meta))    return SuppressionReason::InvalidMetadata;
    if (!evidence.value_present)                  return SuppressionReason::SourceChannelMissing;
    if (!evidence.plan_target_present)            return SuppressionReason::PlanTargetMissing;
    if (meta->requires_hr && !evidence.hr_reliable) return SuppressionReason::HrUnreliable;
    if (evidence.samples < meta->min_samples)     return SuppressionReason::InsufficientSamples;
    if (meta->requires_comparable_tier && evidence.tier == EffortTier::Tier4StreamRelative) {
        return SuppressionReason::StreamRelativeTier;
    }
    if (evidence.confidence < config_.min_confidence) return SuppressionReason::LowConfidence;
    return std::nullopt;
}

void TrustGate::apply(StreamAnalysisResult& result) const noexcept {
    const TrustEvidence base{
        .value_present       = false,
        .plan_target_present = true,
        .hr_reliable         = result.hr_reliable,
        .samples             = result.point_count,
        .tier                = result.tier_used,
        .confidence          = result.confidence,
    };

    // ── Drift ────────────────────────────────────────────────────────────────
    auto ev = base;
    ev.samples = result.drift.hr_samples;
    gate(result.drift.cardiac_drift_pct, "cardiac_drift_pct", ev);

    ev.samples = result.drift.velocity_samples;
    gate(result.drift.pace_drift_pct, "pace_drift_pct", ev);

    ev.samples = result.drift.cadence_samples;
    gate(result.drift.cadence_trend_bpm_per_km, "cadence_trend_bpm_per_km", ev);

    // ── Plan variances ───────────────────────────────────────────────────────
    if (result.plan_comparison) {
        auto& plan = *result.plan_comparison;
        auto plan_gate = [&](Gated<double>& field, std::string_view key,
                             const std::optional<double>& actual,
                             const std::optional<double>& planned) {
            auto e = base;
            e.value_present       = actual.has_value();
            e.plan_target_present = planned.has_value();
            field.suppressed_reason = evaluate(key, e);
        };
        plan_gate(plan.duration_delta_min, "plan.duration_delta_min",
                  plan.actual_duration_min, plan.planned_duration_min);
        plan_gate(plan.distance_delta_km, "plan.distance_delta_km",
                  plan.actual_distance_km, plan.planned_distance_km);
        plan_gate(plan.pace_delta_s_km, "plan.pace_delta_s_km",
                  plan.actual_pace_s_km, plan.planned_pace_s_km);
    }

    // ── Moments ──────────────────────────────────────────────────────────────
    for (auto& moment : result.moments) {
        gate(moment.value, MetricRegistry::moment_key(moment.type), base);
    }
}

}  // namespace runstream
