#pragma once

/// @file include/runstream/validator.hpp
/// @brief ChannelValidator: structural checks and usable channel set.
///
/// # Module: Channel Validator
///
/// ## Responsibility
/// Turn a raw stream (row or column form) into a dense StreamSeries, or
/// reject it with a single non-retryable AnalysisError.
///
/// ## Rules (applied in order)
/// 1. Fewer than 2 points → MALFORMED_STREAM_DATA.
/// 2. `time_s` negative or not strictly increasing → MALFORMED_STREAM_DATA.
/// 3. A point carrying no optional channel → MALFORMED_STREAM_DATA.
/// 4. Non-finite or out-of-range value → MALFORMED_STREAM_DATA.
/// 5. A channel is present when declared and carried by ≥ 90 % of points.
///    Gaps are forward-filled; leading gaps take the first sample.
/// 6. Neither heart rate nor velocity present → PARTIAL_CHANNELS_INSUFFICIENT.
///
/// ## HR sanity
/// `check_heart_rate` flags a present HR channel that cannot be trusted
/// (dropouts, stuck sensor, implausible values, inverted relation to pace).

#include "runstream/errors.hpp"
#include "runstream/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace runstream {

// ─── ValidationReport ─────────────────────────────────────────────────────────

struct ValidationReport {
    StreamSeries                 series;            ///< Dense usable channels
    std::vector<Channel>         channels_present;  ///< Always includes Time
    std::vector<Channel>         channels_missing;
    std::optional<AnalysisError> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// ─── HR Sanity ────────────────────────────────────────────────────────────────

enum class HrIssue {
    ChannelAbsent,
    SustainedDropout,
    Flatline,
    ImplausiblyLow,
    InversePaceCorrelation,
};

[[nodiscard]] const char* to_string(HrIssue issue) noexcept;

struct HrReliability {
    bool                   reliable = false;
    std::optional<HrIssue> issue;
};

// ─── ChannelValidator ─────────────────────────────────────────────────────────

class ChannelValidator {
public:
    /// Validate row-form points.
    ///
    /// # Arguments
    /// * `points`   : Raw samples in time order
    /// * `declared` : Channels the source claims to carry. Empty means
    ///                "not declared": every channel is eligible.
    [[nodiscard]] static ValidationReport
    validate(std::span<const StreamPoint> points,
             std::span<const Channel> declared = {}) noexcept;

    /// Validate column-form arrays. A channel vector whose length differs
    /// from `time_s` is MALFORMED_STREAM_DATA; otherwise same as `validate`.
    [[nodiscard]] static ValidationReport
    validate_columns(const ChannelArrays& columns,
                     std::span<const Channel> declared = {}) noexcept;

    /// Convert column form into row form. `nullopt` on a length mismatch.
    [[nodiscard]] static std::optional<std::vector<StreamPoint>>
    to_points(const ChannelArrays& columns) noexcept;

    /// Decide whether a dense HR channel is trustworthy.
    ///
    /// `time_s` must match both series in length when they are present.
    [[nodiscard]] static HrReliability
    check_heart_rate(std::span<const std::int64_t> time_s,
                     const std::optional<std::vector<double>>& heartrate,
                     const std::optional<std::vector<double>>& velocity) noexcept;
};

}  // namespace runstream
