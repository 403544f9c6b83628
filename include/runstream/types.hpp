#pragma once

/// @file include/runstream/types.hpp
/// @brief Shared value types for the run stream analysis engine.
///
/// Every stage includes this file. It defines the raw input records, the
/// dense per-channel series produced by validation, the physiology context
/// and the closed enums that appear in the serialized result.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace runstream {

// ─── Channels ─────────────────────────────────────────────────────────────────

/// Sensor channels a stream may carry. `Time` is always required.
enum class Channel {
    Time,
    Distance,
    Heartrate,
    Cadence,
    Altitude,
    Velocity,
    Grade,
};

/// The six channels besides time, in serialization order.
inline constexpr std::array<Channel, 6> OPTIONAL_CHANNELS = {
    Channel::Distance, Channel::Heartrate, Channel::Cadence,
    Channel::Altitude, Channel::Velocity,  Channel::Grade,
};

[[nodiscard]] const char* to_string(Channel channel) noexcept;

// ─── Raw Input ────────────────────────────────────────────────────────────────

/// One time-indexed sample of an activity stream.
struct StreamPoint {
    std::int64_t          time_s;         ///< Seconds since activity start
    std::optional<double> distance_m;     ///< Cumulative distance
    std::optional<double> heartrate_bpm;
    std::optional<double> cadence_spm;
    std::optional<double> altitude_m;
    std::optional<double> velocity_mps;
    std::optional<double> grade_pct;
};

/// Column-oriented stream as delivered by the fetch pipeline.
///
/// Every present vector must have the same length as `time_s`. A NaN entry
/// marks a missing sample.
struct ChannelArrays {
    std::vector<std::int64_t>          time_s;
    std::optional<std::vector<double>> distance_m;
    std::optional<std::vector<double>> heartrate_bpm;
    std::optional<std::vector<double>> cadence_spm;
    std::optional<std::vector<double>> altitude_m;
    std::optional<std::vector<double>> velocity_mps;
    std::optional<std::vector<double>> grade_pct;
};

/// Dense, gap-filled series for every usable channel.
///
/// Produced by ChannelValidator. A channel is either absent (`nullopt`) or
/// holds exactly `size()` finite samples.
struct StreamSeries {
    std::vector<std::int64_t>          time_s;
    std::optional<std::vector<double>> distance_m;
    std::optional<std::vector<double>> heartrate_bpm;
    std::optional<std::vector<double>> cadence_spm;
    std::optional<std::vector<double>> altitude_m;
    std::optional<std::vector<double>> velocity_mps;
    std::optional<std::vector<double>> grade_pct;

    [[nodiscard]] std::size_t size() const noexcept { return time_s.size(); }

    /// Elapsed seconds from the first to the last sample (0 when empty).
    [[nodiscard]] std::int64_t elapsed_s() const noexcept {
        return time_s.empty() ? 0 : time_s.back() - time_s.front();
    }

    /// Read-only access by channel. `Channel::Time` yields `nullopt`.
    [[nodiscard]] const std::optional<std::vector<double>>&
    channel(Channel channel) const noexcept;
};

// ─── Physiology ───────────────────────────────────────────────────────────────

/// What is known about the athlete. Non-positive values count as unknown.
struct AthletePhysiologyContext {
    std::optional<double> threshold_hr;
    std::optional<double> resting_hr;
    std::optional<double> max_hr;
    std::optional<double> threshold_pace_s_per_km;
};

/// Precedence level of physiological context used for effort.
enum class EffortTier {
    Tier1ThresholdHr,
    Tier2EstimatedHrr,
    Tier3MaxHr,
    Tier4StreamRelative,
};

[[nodiscard]] const char* to_string(EffortTier tier) noexcept;

/// Which raw signal an effort series was derived from.
enum class EffortSource {
    Heartrate,
    Velocity,
};

[[nodiscard]] const char* to_string(EffortSource source) noexcept;

/// Provenance flags describing how the effort series was obtained.
enum class EstimatedFlag {
    StreamRelativeClassification,
    ThresholdHrEstimatedFromHrr,
    VelocitySubstitutedForHr,
    GradeAdjustedVelocity,
    HrUnreliable,
};

[[nodiscard]] const char* to_string(EstimatedFlag flag) noexcept;

// ─── Trust Annotation ─────────────────────────────────────────────────────────

/// Why a field's directional interpretation was withheld.
enum class SuppressionReason {
    NotEvaluated,
    UnregisteredMetric,
    InvalidMetadata,
    SourceChannelMissing,
    PlanTargetMissing,
    HrUnreliable,
    InsufficientSamples,
    StreamRelativeTier,
    LowConfidence,
};

[[nodiscard]] const char* to_string(SuppressionReason reason) noexcept;

/// A nullable numeric fact plus an optional suppression reason.
///
/// Fields start out suppressed as `NotEvaluated`; only the TrustGate clears
/// the reason, and it never touches `value`.
template <typename T>
struct Gated {
    std::optional<T>                 value;
    std::optional<SuppressionReason> suppressed_reason = SuppressionReason::NotEvaluated;

    /// True when the value exists and may carry directional interpretation.
    [[nodiscard]] bool interpretable() const noexcept {
        return value.has_value() && !suppressed_reason.has_value();
    }
};

}  // namespace runstream
