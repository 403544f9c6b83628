/// @file tests/trust/test_trust_gate.cpp
/// @brief Unit tests for TrustGate and MetricRegistry.
///
/// Tests cover:
///   - Registry defaults and polarity consistency
///   - Precondition order (first failing reason wins)
///   - Fail-closed on unregistered and inconsistent metrics
///   - apply(): values are never touched, plan variances gated

#include "runstream/trust.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace runstream;

namespace {

/// Evidence that passes every precondition.
TrustEvidence passing() {
    return TrustEvidence{
        .value_present       = true,
        .plan_target_present = true,
        .hr_reliable         = true,
        .samples             = 3600,
        .tier                = EffortTier::Tier1ThresholdHr,
        .confidence          = 0.9,
    };
}

} // anonymous namespace

// ─── MetricRegistry ───────────────────────────────────────────────────────────

TEST(MetricRegistryTest, defaults_cover_every_gated_field) {
    const auto registry = MetricRegistry::defaults();
    for (const char* key : {"cardiac_drift_pct", "pace_drift_pct", "cadence_trend_bpm_per_km",
                            "plan.duration_delta_min", "plan.distance_delta_km",
                            "plan.pace_delta_s_km"}) {
        EXPECT_TRUE(registry.find(key).has_value()) << key;
    }
    for (auto type : {MomentType::CardiacDriftOnset, MomentType::CadenceDrop,
                      MomentType::CadenceSurge, MomentType::PaceSurge, MomentType::PaceFade,
                      MomentType::GradeAdjustedAnomaly, MomentType::RecoveryHrDelay,
                      MomentType::EffortZoneTransition}) {
        EXPECT_TRUE(registry.find(MetricRegistry::moment_key(type)).has_value());
    }
}

TEST(MetricRegistryTest, defaults_are_consistent) {
    const auto registry = MetricRegistry::defaults();
    for (const char* key : {"cardiac_drift_pct", "cadence_trend_bpm_per_km",
                            "plan.pace_delta_s_km", "moment.recovery_hr_delay"}) {
        EXPECT_TRUE(MetricRegistry::is_consistent(*registry.find(key))) << key;
    }
}

TEST(MetricRegistryTest, cadence_trend_has_no_direction) {
    const auto meta = MetricRegistry::defaults().find("cadence_trend_bpm_per_km");
    ASSERT_TRUE(meta.has_value());
    EXPECT_TRUE(meta->polarity_ambiguous);
    EXPECT_FALSE(meta->higher_is_better.has_value());
}

TEST(MetricRegistryTest, polarity_consistency) {
    EXPECT_FALSE(MetricRegistry::is_consistent({.key = "x", .polarity_ambiguous = true,
                                                .higher_is_better = true}));
    EXPECT_FALSE(MetricRegistry::is_consistent({.key = "x", .polarity_ambiguous = false}));
    EXPECT_FALSE(MetricRegistry::is_consistent({.key = ""}));
    EXPECT_TRUE(MetricRegistry::is_consistent({.key = "x", .polarity_ambiguous = false,
                                               .higher_is_better = false}));
}

TEST(MetricRegistryTest, moment_key_format) {
    EXPECT_EQ(MetricRegistry::moment_key(MomentType::PaceSurge), "moment.pace_surge");
}

// ─── Precondition order ───────────────────────────────────────────────────────

TEST(TrustGateTest, all_preconditions_pass) {
    TrustGate gate;
    EXPECT_FALSE(gate.evaluate("cardiac_drift_pct", passing()).has_value());
}

TEST(TrustGateTest, unregistered_metric_fails_closed) {
    TrustGate gate;
    EXPECT_EQ(gate.evaluate("vo2max_estimate", passing()),
              SuppressionReason::UnregisteredMetric);
}

TEST(TrustGateTest, inconsistent_metadata_fails_closed) {
    MetricRegistry registry;
    registry.add({.key = "bad", .polarity_ambiguous = false});
    TrustGate gate(TrustConfig{}, registry);
    EXPECT_EQ(gate.evaluate("bad", passing()), SuppressionReason::InvalidMetadata);
}

TEST(TrustGateTest, missing_value_is_source_channel_missing) {
    TrustGate gate;
    auto ev = passing();
    ev.value_present = false;
    ev.hr_reliable   = false;
    ev.samples       = 0;
    EXPECT_EQ(gate.evaluate("cardiac_drift_pct", ev), SuppressionReason::SourceChannelMissing);
}

TEST(TrustGateTest, missing_plan_target) {
    TrustGate gate;
    auto ev = passing();
    ev.plan_target_present = false;
    ev.confidence = 0.1;
    EXPECT_EQ(gate.evaluate("plan.pace_delta_s_km", ev), SuppressionReason::PlanTargetMissing);
}

TEST(TrustGateTest, unreliable_hr_before_sample_count) {
    TrustGate gate;
    auto ev = passing();
    ev.hr_reliable = false;
    ev.samples     = 10;
    EXPECT_EQ(gate.evaluate("cardiac_drift_pct", ev), SuppressionReason::HrUnreliable);
    // Pace drift does not depend on HR.
    EXPECT_EQ(gate.evaluate("pace_drift_pct", ev), SuppressionReason::InsufficientSamples);
}

TEST(TrustGateTest, stream_relative_tier_blocks_every_default_metric) {
    TrustGate gate;
    auto ev = passing();
    ev.tier = EffortTier::Tier4StreamRelative;
    for (const char* key : {"cardiac_drift_pct", "pace_drift_pct", "cadence_trend_bpm_per_km",
                            "plan.duration_delta_min", "plan.distance_delta_km",
                            "plan.pace_delta_s_km", "moment.cardiac_drift_onset",
                            "moment.pace_surge", "moment.recovery_hr_delay",
                            "moment.effort_zone_transition"}) {
        EXPECT_EQ(gate.evaluate(key, ev), SuppressionReason::StreamRelativeTier) << key;
    }
}

TEST(TrustGateTest, stream_relative_tier_holds_under_a_lower_confidence_floor) {
    TrustGate gate(TrustConfig{.min_confidence = 0.4});
    auto ev = passing();
    ev.tier = EffortTier::Tier4StreamRelative;
    ev.confidence = 0.45;
    EXPECT_EQ(gate.evaluate("pace_drift_pct", ev), SuppressionReason::StreamRelativeTier);
}

TEST(TrustGateTest, custom_metric_may_opt_out_of_tier_comparability) {
    MetricRegistry registry = MetricRegistry::defaults();
    registry.add({.key = "stride_count", .requires_comparable_tier = false});
    TrustGate gate(TrustConfig{}, registry);
    auto ev = passing();
    ev.tier = EffortTier::Tier4StreamRelative;
    EXPECT_FALSE(gate.evaluate("stride_count", ev).has_value());
}

TEST(TrustGateTest, low_confidence_is_last) {
    TrustGate gate;
    auto ev = passing();
    ev.confidence = 0.45;
    EXPECT_EQ(gate.evaluate("pace_drift_pct", ev), SuppressionReason::LowConfidence);
}

TEST(TrustGateTest, confidence_floor_is_configurable) {
    TrustGate gate(TrustConfig{.min_confidence = 0.95});
    EXPECT_EQ(gate.evaluate("pace_drift_pct", passing()), SuppressionReason::LowConfidence);
}

// ─── apply() ──────────────────────────────────────────────────────────────────

TEST(TrustGateTest, apply_annotates_without_touching_values) {
    StreamAnalysisResult result;
    result.hr_reliable = true;
    result.point_count = 3600;
    result.tier_used   = EffortTier::Tier1ThresholdHr;
    result.confidence  = 0.9;
    result.drift.cardiac_drift_pct.value = 4.2;
    result.drift.hr_samples              = 3600;
    result.drift.pace_drift_pct.value    = 1.5;
    result.drift.velocity_samples        = 100;

    TrustGate{}.apply(result);

    EXPECT_FALSE(result.drift.cardiac_drift_pct.suppressed_reason.has_value());
    EXPECT_DOUBLE_EQ(*result.drift.cardiac_drift_pct.value, 4.2);
    EXPECT_EQ(result.drift.pace_drift_pct.suppressed_reason,
              SuppressionReason::InsufficientSamples);
    EXPECT_DOUBLE_EQ(*result.drift.pace_drift_pct.value, 1.5);
    EXPECT_EQ(result.drift.cadence_trend_bpm_per_km.suppressed_reason,
              SuppressionReason::SourceChannelMissing);
}

TEST(TrustGateTest, apply_gates_plan_variances_by_side) {
    StreamAnalysisResult result;
    result.hr_reliable = true;
    result.tier_used   = EffortTier::Tier1ThresholdHr;
    result.confidence  = 0.9;
    PlanComparison plan;
    plan.planned_duration_min = 40.0;
    plan.actual_duration_min  = 42.0;
    plan.duration_delta_min.value = 2.0;
    plan.actual_distance_km = 7.0;
    result.plan_comparison = plan;

    TrustGate{}.apply(result);

    const auto& cmp = *result.plan_comparison;
    EXPECT_FALSE(cmp.duration_delta_min.suppressed_reason.has_value());
    EXPECT_EQ(cmp.distance_delta_km.suppressed_reason, SuppressionReason::PlanTargetMissing);
    EXPECT_EQ(cmp.pace_delta_s_km.suppressed_reason, SuppressionReason::SourceChannelMissing);
}

TEST(TrustGateTest, apply_gates_moments) {
    StreamAnalysisResult result;
    result.hr_reliable = false;
    result.tier_used   = EffortTier::Tier4StreamRelative;
    result.confidence  = 0.45;
    result.moments.push_back(Moment{.type = MomentType::RecoveryHrDelay, .index = 0,
                                    .time_s = 0, .value = Gated<double>{.value = 45.0}});

    TrustGate{}.apply(result);

    EXPECT_EQ(result.moments[0].value.suppressed_reason, SuppressionReason::HrUnreliable);
    EXPECT_DOUBLE_EQ(*result.moments[0].value.value, 45.0);
}
