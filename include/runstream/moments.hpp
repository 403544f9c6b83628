#pragma once

/// @file include/runstream/moments.hpp
/// @brief MomentDetector: discrete, timestamped, typed observations.
///
/// # Module: Moment Detector
///
/// ## Moment types
/// - `cardiac_drift_onset`   : first sustained rise of HR (or HR/velocity)
///                             above the early-run baseline; at most one
/// - `cadence_drop/surge`    : excursion beyond 3 % of segment mean cadence
/// - `pace_surge/fade`       : excursion beyond 10 % of segment mean velocity
/// - `grade_adjusted_anomaly` : a pace excursion explained by sustained grade
/// - `recovery_hr_delay`     : seconds for HR to fall half-way after work
/// - `effort_zone_transition` : one per segment boundary
///
/// Moments never explain themselves; `context` is an enum, not prose.

#include "runstream/constants.hpp"
#include "runstream/segmentation.hpp"
#include "runstream/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace runstream {

enum class MomentType {
    CardiacDriftOnset,
    CadenceDrop,
    CadenceSurge,
    PaceSurge,
    PaceFade,
    GradeAdjustedAnomaly,
    RecoveryHrDelay,
    EffortZoneTransition,
};

[[nodiscard]] const char* to_string(MomentType type) noexcept;

enum class MomentUnit {
    Pct,
    Spm,
    Seconds,
    GradePct,
    Effort,
};

[[nodiscard]] const char* to_string(MomentUnit unit) noexcept;

enum class MomentContext {
    Warmup,
    Work,
    Recovery,
    Cooldown,
    Steady,
    HrPaceRatio,
    HrOnly,
    Uphill,
    Downhill,
    NotRecovered,
    BandUp,
    BandDown,
};

[[nodiscard]] const char* to_string(MomentContext context) noexcept;

/// The context value naming a segment type.
[[nodiscard]] MomentContext context_for(SegmentType type) noexcept;

struct Moment {
    MomentType                   type;
    std::size_t                  index;
    std::int64_t                 time_s;
    Gated<double>                value;
    std::optional<MomentUnit>    unit;
    std::optional<MomentContext> context;
};

struct MomentConfig {
    std::size_t  min_points             = constants::MIN_MOMENT_POINTS;
    std::int64_t min_segment_s          = constants::MIN_MOMENT_SEGMENT_S;
    std::int64_t min_duration_s         = constants::MIN_MOMENT_DURATION_S;
    std::int64_t drift_stabilize_s      = constants::DRIFT_STABILIZE_S;
    std::int64_t drift_window_s         = constants::DRIFT_WINDOW_S;
    double       drift_onset_rise_pct   = constants::DRIFT_ONSET_RISE_PCT;
    double       cadence_step_fraction  = constants::CADENCE_STEP_FRACTION;
    double       pace_step_fraction     = constants::PACE_STEP_FRACTION;
    double       grade_significant_pct  = constants::GRADE_SIGNIFICANT_PCT;
    std::int64_t grade_window_s         = constants::GRADE_SUSTAINED_WINDOW_S;
    double       grade_window_fraction  = constants::GRADE_SUSTAINED_FRACTION;
    std::int64_t recovery_peak_window_s = constants::RECOVERY_PEAK_WINDOW_S;
    std::int64_t recovery_delay_min_s   = constants::RECOVERY_HR_DELAY_MIN_S;
};

class MomentDetector {
public:
    explicit MomentDetector(MomentConfig config = MomentConfig{}) noexcept;

    /// Detect all moments, sorted by (time_s, type).
    ///
    /// `hr_usable` gates every HR-based detector.
    [[nodiscard]] std::vector<Moment>
    detect(const StreamSeries& series,
           std::span<const Segment> segments,
           bool hr_usable) const noexcept;

    [[nodiscard]] std::optional<Moment>
    detect_drift_onset(const StreamSeries& series,
                       std::span<const Segment> segments) const noexcept;

    [[nodiscard]] std::vector<Moment>
    detect_cadence(const StreamSeries& series,
                   std::span<const Segment> segments) const noexcept;

    [[nodiscard]] std::vector<Moment>
    detect_pace(const StreamSeries& series,
                std::span<const Segment> segments) const noexcept;

    [[nodiscard]] std::vector<Moment>
    detect_recovery_delay(const StreamSeries& series,
                          std::span<const Segment> segments) const noexcept;

    [[nodiscard]] static std::vector<Moment>
    detect_transitions(std::span<const Segment> segments) noexcept;

    [[nodiscard]] const MomentConfig& config() const noexcept { return config_; }

private:
    /// Contiguous run of samples beyond a threshold on one side of the mean.
    struct Excursion {
        std::size_t start;
        std::size_t end;       ///< Inclusive
        bool        above;     ///< True for an upward excursion
        double      peak;      ///< Largest |deviation| inside the run
    };

    [[nodiscard]] std::vector<Excursion>
    find_excursions(std::span<const std::int64_t> time_s,
                    std::span<const double> values,
                    std::size_t start,
                    std::size_t end,
                    double mean,
                    double threshold) const noexcept;

    /// Mean grade over the window starting at `index` when it is sustained
    /// in one direction.
    [[nodiscard]] std::optional<double>
    sustained_grade(std::span<const std::int64_t> time_s,
                    std::span<const double> grade,
                    std::size_t index) const noexcept;

    MomentConfig config_;
};

}  // namespace runstream
