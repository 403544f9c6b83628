#pragma once

/// @file include/runstream/segmentation.hpp
/// @brief SegmentationEngine: contiguous labeled intervals of a run.
///
/// # Module: Segmentation Engine
///
/// ## Pipeline
/// 1. Pick the banding signal. With a velocity channel, grade-adjusted
///    velocity over the run's median moving velocity; HR drift cannot move
///    it. Without velocity, the effort series and its per-tier cuts.
/// 2. Smooth the signal with a centered ±15 s time window.
/// 3. Classify each sample into low / moderate / high, with a hysteresis
///    margin on downward moves.
/// 4. Merge same-band runs into candidates, absorb candidates under 30 s.
/// 5. With velocity, move each boundary onto the largest pace step within
///    ±20 s.
/// 6. Fold everything before the first and after the last high candidate
///    into one warmup and one cooldown. Label the rest and compute
///    per-segment averages.
///
/// ## Guarantees
/// - Segments are contiguous, non-overlapping and cover every point
/// - Runs under 120 s, or without a band change, yield one `steady` segment
/// - An average is `nullopt` exactly when its source channel is absent

#include "runstream/constants.hpp"
#include "runstream/effort.hpp"
#include "runstream/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace runstream {

// ─── Segment ──────────────────────────────────────────────────────────────────

enum class SegmentType {
    Warmup,
    Work,
    Recovery,
    Cooldown,
    Steady,
};

[[nodiscard]] const char* to_string(SegmentType type) noexcept;

enum class EffortBand {
    Low,
    Moderate,
    High,
};

[[nodiscard]] const char* to_string(EffortBand band) noexcept;

struct Segment {
    SegmentType           type;
    std::size_t           start_index;   ///< Inclusive
    std::size_t           end_index;     ///< Inclusive
    std::int64_t          start_time_s;
    std::int64_t          end_time_s;
    std::int64_t          duration_s;
    std::optional<double> avg_pace_s_km;
    std::optional<double> avg_hr;
    std::optional<double> avg_cadence;
    std::optional<double> avg_grade_pct;
    double                avg_effort = 0.0;
};

// ─── SegmentConfig ────────────────────────────────────────────────────────────

/// Effort cut points: below `low` is Low, at or above `high` is High.
struct BandCuts {
    double low;
    double high;
};

struct SegmentConfig {
    double       smoothing_half_window_s      = constants::SMOOTHING_HALF_WINDOW_S;
    double       hysteresis                   = constants::BAND_HYSTERESIS;
    std::int64_t min_segment_duration_s       = constants::MIN_SEGMENT_DURATION_S;
    std::int64_t min_multi_segment_duration_s = constants::MIN_MULTI_SEGMENT_DURATION_S;
    std::int64_t pace_align_window_s          = constants::PACE_ALIGN_WINDOW_S;
    double       pace_step_min_mps            = constants::PACE_STEP_MIN_MPS;
    double       velocity_hysteresis          = constants::VELOCITY_BAND_HYSTERESIS;

    /// Cuts on the velocity ratio, used whenever velocity is present.
    BandCuts velocity_cuts = {constants::VELOCITY_BAND_LOW, constants::VELOCITY_BAND_HIGH};

    /// Indexed by EffortTier.
    std::array<BandCuts, 4> band_cuts = {{
        {constants::TIER1_BAND_LOW, constants::TIER1_BAND_HIGH},
        {constants::TIER2_BAND_LOW, constants::TIER2_BAND_HIGH},
        {constants::TIER3_BAND_LOW, constants::TIER3_BAND_HIGH},
        {constants::TIER4_BAND_LOW, constants::TIER4_BAND_HIGH},
    }};

    [[nodiscard]] BandCuts cuts_for(EffortTier tier) const noexcept {
        return band_cuts[static_cast<std::size_t>(tier)];
    }
};

// ─── SegmentationEngine ───────────────────────────────────────────────────────

class SegmentationEngine {
public:
    explicit SegmentationEngine(SegmentConfig config = SegmentConfig{}) noexcept;

    /// Segment a validated stream given its effort series.
    ///
    /// # Returns
    /// At least one segment for any non-empty series; empty for an empty one.
    [[nodiscard]] std::vector<Segment>
    segment(const StreamSeries& series, const EffortSeries& effort) const noexcept;

    /// Centered time-window moving average (O(n), prefix sums).
    ///
    /// Sample i averages every j with |t_j − t_i| ≤ half_window_s.
    [[nodiscard]] static std::vector<double>
    smooth(std::span<const std::int64_t> time_s,
           std::span<const double> values,
           double half_window_s) noexcept;

    /// Band each smoothed effort sample with hysteresis on downward transitions.
    [[nodiscard]] std::vector<EffortBand>
    classify_bands(std::span<const double> smoothed, EffortTier tier) const noexcept;

    /// Band each smoothed velocity ratio with `velocity_cuts`.
    [[nodiscard]] std::vector<EffortBand>
    classify_velocity_bands(std::span<const double> smoothed) const noexcept;

    /// Grade-adjusted velocity over the median moving velocity, per sample.
    ///
    /// # Returns
    /// `nullopt` without a velocity channel or when the runner never moves.
    [[nodiscard]] static std::optional<std::vector<double>>
    velocity_ratio(const StreamSeries& series) noexcept;

    /// Averages for the inclusive index range [start, end].
    [[nodiscard]] static Segment
    summarize(const StreamSeries& series,
              std::span<const double> effort,
              SegmentType type,
              std::size_t start,
              std::size_t end) noexcept;

    [[nodiscard]] const SegmentConfig& config() const noexcept { return config_; }

private:
    struct Candidate {
        EffortBand  band;
        std::size_t start;
        std::size_t end;
    };

    /// Run-length encode bands into candidates.
    [[nodiscard]] static std::vector<Candidate>
    build_candidates(std::span<const EffortBand> bands) noexcept;

    /// Absorb short candidates into their closest-band neighbor.
    void absorb_short(std::vector<Candidate>& candidates,
                      std::span<const std::int64_t> time_s) const noexcept;

    [[nodiscard]] static std::vector<EffortBand>
    band(std::span<const double> smoothed, BandCuts cuts, double hysteresis) noexcept;

    /// Move boundaries onto pace steps inside the alignment window.
    void align_to_pace(std::vector<Candidate>& candidates,
                       std::span<const std::int64_t> time_s,
                       std::span<const double> velocity) const noexcept;

    /// Merge candidates ahead of the first and after the last high one.
    static void fold_edges(std::vector<Candidate>& candidates) noexcept;

    [[nodiscard]] static std::vector<SegmentType>
    label(std::span<const Candidate> candidates) noexcept;

    SegmentConfig config_;
};

}  // namespace runstream
