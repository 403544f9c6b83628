#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/runstream/constants.hpp
/// @brief Tuning constants for the run stream analysis engine.
///
/// Every threshold used by a classification or detection stage lives here.
/// Stages read them through their config structs (SegmentConfig,
/// MomentConfig, TrustConfig) so callers can recalibrate without editing
/// code; these are the shipped defaults.

namespace runstream::constants {

// ─── Channel Validation ───────────────────────────────────────────────────────

/// Minimum number of points that establishes a time base.
static constexpr std::size_t MIN_POINT_COUNT = 2;

/// Fraction of points that must carry a channel for it to count as present.
static constexpr double MIN_CHANNEL_COVERAGE = 0.90;

static constexpr double HR_MIN_BPM       = 0.0;
static constexpr double HR_MAX_BPM       = 250.0;
static constexpr double CADENCE_MAX_SPM  = 260.0;
static constexpr double VELOCITY_MAX_MPS = 15.0;
static constexpr double ALTITUDE_MIN_M   = -500.0;
static constexpr double ALTITUDE_MAX_M   = 9000.0;
static constexpr double GRADE_LIMIT_PCT  = 60.0;

/// Distance may step backwards by at most this much (GPS re-sampling jitter).
static constexpr double DISTANCE_REGRESSION_TOLERANCE_M = 1.0;

// ─── HR Sanity Check ──────────────────────────────────────────────────────────

/// HR at or below this value is treated as a sensor dropout sample.
static constexpr double HR_DROPOUT_BPM = 30.0;

/// A contiguous dropout at least this long marks HR unreliable.
static constexpr std::int64_t HR_DROPOUT_SUSTAINED_S = 60;

/// Dropout samples above this fraction of the run mark HR unreliable.
static constexpr double HR_DROPOUT_MAX_FRACTION = 0.10;

/// HR standard deviation below this while pace varies is a stuck sensor.
static constexpr double HR_FLATLINE_STDDEV_BPM = 2.0;

/// Velocity standard deviation above which pace is considered varying.
static constexpr double VELOCITY_VARYING_STDDEV_MPS = 0.2;

/// Median HR below this at a running median velocity is implausible.
static constexpr double HR_IMPLAUSIBLY_LOW_BPM = 100.0;
static constexpr double RUNNING_VELOCITY_MPS   = 2.2;

/// Pearson r between HR and velocity at or below this is inverted.
static constexpr double HR_INVERSE_CORRELATION = -0.5;

// ─── Effort Normalization ─────────────────────────────────────────────────────

/// Karvonen fraction of heart-rate reserve used to estimate threshold HR.
static constexpr double TIER2_THRESHOLD_HRR_FRACTION = 0.88;

/// Grade-adjusted velocity coefficients (per grade percent).
static constexpr double GAP_UPHILL_COEFF   = 0.033;
static constexpr double GAP_DOWNHILL_COEFF = 0.018;
static constexpr double GAP_FACTOR_MIN     = 0.5;
static constexpr double GAP_FACTOR_MAX     = 2.0;

/// Base confidence per tier. Index by EffortTier.
static constexpr double TIER1_BASE_CONFIDENCE = 0.90;
static constexpr double TIER2_BASE_CONFIDENCE = 0.75;
static constexpr double TIER3_BASE_CONFIDENCE = 0.60;
static constexpr double TIER4_BASE_CONFIDENCE = 0.45;

/// Confidence multiplier lost when every optional channel is missing.
static constexpr double MISSING_CHANNEL_DISCOUNT = 0.5;

/// Velocities at or below this are standing still (excluded from pace).
static constexpr double MOVING_VELOCITY_MPS = 0.5;

// ─── Segmentation ─────────────────────────────────────────────────────────────

/// Half-width of the centered smoothing window.
static constexpr double SMOOTHING_HALF_WINDOW_S = 15.0;

/// Margin below a band cut before a downward transition is accepted.
static constexpr double BAND_HYSTERESIS = 0.03;

/// Candidates shorter than this are absorbed into a neighbor.
static constexpr std::int64_t MIN_SEGMENT_DURATION_S = 30;

/// Runs shorter than this are emitted as a single steady segment.
static constexpr std::int64_t MIN_MULTI_SEGMENT_DURATION_S = 120;

/// How far a boundary may move, either way, to meet a pace step.
static constexpr std::int64_t PACE_ALIGN_WINDOW_S = 20;

/// Smallest velocity step (m/s) worth aligning a boundary to.
static constexpr double PACE_STEP_MIN_MPS = 0.3;

static constexpr double TIER1_BAND_LOW  = 0.85;
static constexpr double TIER1_BAND_HIGH = 0.92;
static constexpr double TIER2_BAND_LOW  = 0.80;
static constexpr double TIER2_BAND_HIGH = 0.90;
static constexpr double TIER3_BAND_LOW  = 0.72;
static constexpr double TIER3_BAND_HIGH = 0.82;
static constexpr double TIER4_BAND_LOW  = 0.30;
static constexpr double TIER4_BAND_HIGH = 0.70;

/// Velocity bands, as a ratio of grade-adjusted velocity to the run's median
/// moving velocity. Used whenever the velocity channel is present.
static constexpr double VELOCITY_BAND_LOW        = 0.80;
static constexpr double VELOCITY_BAND_HIGH       = 1.15;
static constexpr double VELOCITY_BAND_HYSTERESIS = 0.02;

// ─── Moment Detection ─────────────────────────────────────────────────────────

/// Runs with fewer points than this produce no moments.
static constexpr std::size_t MIN_MOMENT_POINTS = 60;

/// Segments shorter than this are not scanned for excursions.
static constexpr std::int64_t MIN_MOMENT_SEGMENT_S = 60;

/// An excursion must hold at least this long to be emitted.
static constexpr std::int64_t MIN_MOMENT_DURATION_S = 15;

static constexpr std::int64_t DRIFT_STABILIZE_S       = 120;
static constexpr std::int64_t DRIFT_WINDOW_S          = 300;
static constexpr double       DRIFT_ONSET_RISE_PCT    = 3.0;
static constexpr double       CADENCE_STEP_FRACTION   = 0.03;
static constexpr double       PACE_STEP_FRACTION      = 0.10;
static constexpr double       GRADE_SIGNIFICANT_PCT   = 3.0;
static constexpr std::int64_t GRADE_SUSTAINED_WINDOW_S = 30;
static constexpr double       GRADE_SUSTAINED_FRACTION = 0.70;
static constexpr std::int64_t RECOVERY_PEAK_WINDOW_S  = 30;
static constexpr std::int64_t RECOVERY_HR_DELAY_MIN_S = 30;

// ─── Trust Gate ───────────────────────────────────────────────────────────────

/// Results below this confidence never carry directional interpretation.
static constexpr double MIN_INTERPRETABLE_CONFIDENCE = 0.5;

/// Minimum samples behind a drift percentage before it is interpretable.
static constexpr std::size_t MIN_DRIFT_SAMPLES = 600;

/// Minimum samples behind the cadence trend fit.
static constexpr std::size_t MIN_CADENCE_TREND_SAMPLES = 600;

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Default compute budget in milliseconds (p99 latency target).
static constexpr std::int64_t DEFAULT_TIME_BUDGET_MS = 350;

}  // namespace runstream::constants
