/// @file src/core/types.cpp
/// @brief Wire names for the shared enums.

#include "runstream/types.hpp"

namespace runstream {

const char* to_string(Channel channel) noexcept {
    switch (channel) {
        case Channel::Time:      return "time";
        case Channel::Distance:  return "distance";
        case Channel::Heartrate: return "heartrate";
        case Channel::Cadence:   return "cadence";
        case Channel::Altitude:  return "altitude";
        case Channel::Velocity:  return "velocity";
        case Channel::Grade:     return "grade";
    }
    return "unknown";
}

const char* to_string(EffortTier tier) noexcept {
    switch (tier) {
        case EffortTier::Tier1ThresholdHr:    return "tier1_threshold_hr";
        case EffortTier::Tier2EstimatedHrr:   return "tier2_estimated_hrr";
        case EffortTier::Tier3MaxHr:          return "tier3_max_hr";
        case EffortTier::Tier4StreamRelative: return "tier4_stream_relative";
    }
    return "unknown";
}

const char* to_string(EffortSource source) noexcept {
    switch (source) {
        case EffortSource::Heartrate: return "heartrate";
        case EffortSource::Velocity:  return "velocity";
    }
    return "unknown";
}

const char* to_string(EstimatedFlag flag) noexcept {
    switch (flag) {
        case EstimatedFlag::StreamRelativeClassification: return "stream_relative_classification";
        case EstimatedFlag::ThresholdHrEstimatedFromHrr:  return "threshold_hr_estimated_from_hrr";
        case EstimatedFlag::VelocitySubstitutedForHr:     return "velocity_substituted_for_hr";
        case EstimatedFlag::GradeAdjustedVelocity:        return "grade_adjusted_velocity";
        case EstimatedFlag::HrUnreliable:                 return "hr_unreliable";
    }
    return "unknown";
}

const char* to_string(SuppressionReason reason) noexcept {
    switch (reason) {
        case SuppressionReason::NotEvaluated:         return "not_evaluated";
        case SuppressionReason::UnregisteredMetric:   return "unregistered_metric";
        case SuppressionReason::InvalidMetadata:      return "invalid_metadata";
        case SuppressionReason::SourceChannelMissing: return "source_channel_missing";
        case SuppressionReason::PlanTargetMissing:    return "plan_target_missing";
        case SuppressionReason::HrUnreliable:         return "hr_unreliable";
        case SuppressionReason::InsufficientSamples:  return "insufficient_samples";
        case SuppressionReason::StreamRelativeTier:   return "stream_relative_tier";
        case SuppressionReason::LowConfidence:        return "low_confidence";
    }
    return "unknown";
}

// ─── StreamSeries::channel ────────────────────────────────────────────────────

const std::optional<std::vector<double>>&
StreamSeries::channel(Channel channel) const noexcept {
    static const std::optional<std::vector<double>> none;
    switch (channel) {
        case Channel::Distance:  return distance_m;
        case Channel::Heartrate: return heartrate_bpm;
        case Channel::Cadence:   return cadence_spm;
        case Channel::Altitude:  return altitude_m;
        case Channel::Velocity:  return velocity_mps;
        case Channel::Grade:     return grade_pct;
        case Channel::Time:      break;
    }
    return none;
}

}  // namespace runstream
