/// @file src/validation/channel_validator.cpp
/// @brief ChannelValidator: structural checks, coverage and gap filling.

#include "runstream/validator.hpp"
#include "runstream/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>

namespace runstream {

namespace {

// ─── Channel bindings ─────────────────────────────────────────────────────────

/// Where one optional channel lives in each representation, and its range.
struct ChannelBinding {
    Channel                                         channel;
    std::optional<double> StreamPoint::*            point_field;
    std::optional<std::vector<double>> StreamSeries::* series_field;
    std::optional<std::vector<double>> ChannelArrays::* column_field;
    double                                          min_value;
    double                                          max_value;
};

constexpr double UNBOUNDED = std::numeric_limits<double>::max();

const std::array<ChannelBinding, 6>& bindings() noexcept {
    static const std::array<ChannelBinding, 6> table = {{
        {Channel::Distance,  &StreamPoint::distance_m,    &StreamSeries::distance_m,
         &ChannelArrays::distance_m,    0.0, UNBOUNDED},
        {Channel::Heartrate, &StreamPoint::heartrate_bpm, &StreamSeries::heartrate_bpm,
         &ChannelArrays::heartrate_bpm, constants::HR_MIN_BPM, constants::HR_MAX_BPM},
        {Channel::Cadence,   &StreamPoint::cadence_spm,   &StreamSeries::cadence_spm,
         &ChannelArrays::cadence_spm,   0.0, constants::CADENCE_MAX_SPM},
        {Channel::Altitude,  &StreamPoint::altitude_m,    &StreamSeries::altitude_m,
         &ChannelArrays::altitude_m,    constants::ALTITUDE_MIN_M, constants::ALTITUDE_MAX_M},
        {Channel::Velocity,  &StreamPoint::velocity_mps,  &StreamSeries::velocity_mps,
         &ChannelArrays::velocity_mps,  0.0, constants::VELOCITY_MAX_MPS},
        {Channel::Grade,     &StreamPoint::grade_pct,     &StreamSeries::grade_pct,
         &ChannelArrays::grade_pct,     -constants::GRADE_LIMIT_PCT, constants::GRADE_LIMIT_PCT},
    }};
    return table;
}

ValidationReport reject(AnalysisErrorCode code, std::string message) {
    ValidationReport report;
    report.error = AnalysisError::make(code, std::move(message));
    return report;
}

bool is_declared(std::span<const Channel> declared, Channel channel) noexcept {
    if (declared.empty()) return true;
    return std::find(declared.begin(), declared.end(), channel) != declared.end();
}

/// Forward-fill gaps; leading gaps take the first sample.
/// Precondition: at least one sample is set.
std::vector<double> fill_gaps(std::span<const StreamPoint> points,
                              std::optional<double> StreamPoint::* field) {
    std::vector<double> dense(points.size(), 0.0);
    std::optional<double> last;
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto& sample = points[i].*field;
        if (sample && !last) {
            std::fill(dense.begin(), dense.begin() + static_cast<std::ptrdiff_t>(i), *sample);
        }
        if (sample) last = sample;
        if (last) dense[i] = *last;
    }
    return dense;
}

}  // namespace

// ─── ChannelValidator::validate ───────────────────────────────────────────────

ValidationReport
ChannelValidator::validate(std::span<const StreamPoint> points,
                           std::span<const Channel> declared) noexcept {
    const std::size_t n = points.size();

    // ── Rule 1: a time base needs two samples ────────────────────────────────
    if (n < constants::MIN_POINT_COUNT) {
        return reject(AnalysisErrorCode::MalformedStreamData,
                      fmt::format("stream has {} point(s); at least {} required",
                                  n, constants::MIN_POINT_COUNT));
    }

    // ── Rule 2: time is non-negative and strictly increasing ─────────────────
    for (std::size_t i = 0; i < n; ++i) {
        if (points[i].time_s < 0) {
            return reject(AnalysisErrorCode::MalformedStreamData,
                          fmt::format("negative time_s {} at index {}", points[i].time_s, i));
        }
        if (i > 0 && points[i].time_s <= points[i - 1].time_s) {
            return reject(AnalysisErrorCode::MalformedStreamData,
                          fmt::format("time_s not strictly increasing at index {} ({} after {})",
                                      i, points[i].time_s, points[i - 1].time_s));
        }
    }

    // ── Rules 3 and 4: every point carries a valid optional sample ───────────
    std::array<std::size_t, 6> coverage{};
    std::optional<double> last_distance;
    for (std::size_t i = 0; i < n; ++i) {
        bool any = false;
        for (std::size_t c = 0; c < bindings().size(); ++c) {
            const auto& binding = bindings()[c];
            const auto& sample = points[i].*(binding.point_field);
            if (!sample) continue;
            any = true;
            ++coverage[c];

            const double v = *sample;
            if (!std::isfinite(v) || v < binding.min_value || v > binding.max_value) {
                return reject(AnalysisErrorCode::MalformedStreamData,
                              fmt::format("{} value {} out of range at index {}",
                                          to_string(binding.channel), v, i));
            }
            if (binding.channel == Channel::Distance) {
                if (last_distance &&
                    v < *last_distance - constants::DISTANCE_REGRESSION_TOLERANCE_M) {
                    return reject(AnalysisErrorCode::MalformedStreamData,
                                  fmt::format("distance decreases at index {} ({} after {})",
                                              i, v, *last_distance));
                }
                last_distance = std::max(v, last_distance.value_or(v));
            }
        }
        if (!any) {
            return reject(AnalysisErrorCode::MalformedStreamData,
                          fmt::format("point at index {} carries no channel", i));
        }
    }

    // ── Rule 5: usable channel set ───────────────────────────────────────────
    ValidationReport report;
    report.series.time_s.reserve(n);
    for (const auto& p : points) report.series.time_s.push_back(p.time_s);
    report.channels_present.push_back(Channel::Time);

    for (std::size_t c = 0; c < bindings().size(); ++c) {
        const auto& binding = bindings()[c];
        const double covered = static_cast<double>(coverage[c]) / static_cast<double>(n);
        const bool usable = coverage[c] > 0 &&
                            covered + 1e-12 >= constants::MIN_CHANNEL_COVERAGE &&
                            is_declared(declared, binding.channel);
        if (usable) {
            report.series.*(binding.series_field) = fill_gaps(points, binding.point_field);
            report.channels_present.push_back(binding.channel);
        } else {
            report.channels_missing.push_back(binding.channel);
        }
    }

    // ── Rule 6: an effort source must exist ──────────────────────────────────
    if (!report.series.heartrate_bpm && !report.series.velocity_mps) {
        return reject(AnalysisErrorCode::PartialChannelsInsufficient,
                      "neither heartrate nor velocity is usable");
    }

    return report;
}

// ─── ChannelValidator::to_points ──────────────────────────────────────────────

std::optional<std::vector<StreamPoint>>
ChannelValidator::to_points(const ChannelArrays& columns) noexcept {
    const std::size_t n = columns.time_s.size();
    for (const auto& binding : bindings()) {
        const auto& column = columns.*(binding.column_field);
        if (column && column->size() != n) return std::nullopt;
    }

    std::vector<StreamPoint> points(n);
    for (std::size_t i = 0; i < n; ++i) {
        points[i].time_s = columns.time_s[i];
        for (const auto& binding : bindings()) {
            const auto& column = columns.*(binding.column_field);
            if (!column) continue;
            // NaN in a column marks a missing sample.
            const double v = (*column)[i];
            if (!std::isnan(v)) points[i].*(binding.point_field) = v;
        }
    }
    return points;
}

// ─── ChannelValidator::validate_columns ───────────────────────────────────────

ValidationReport
ChannelValidator::validate_columns(const ChannelArrays& columns,
                                   std::span<const Channel> declared) noexcept {
    const std::size_t n = columns.time_s.size();
    for (const auto& binding : bindings()) {
        const auto& column = columns.*(binding.column_field);
        if (column && column->size() != n) {
            return reject(AnalysisErrorCode::MalformedStreamData,
                          fmt::format("{} has {} samples but time has {}",
                                      to_string(binding.channel), column->size(), n));
        }
    }

    auto points = to_points(columns);
    if (!points) {
        return reject(AnalysisErrorCode::MalformedStreamData, "channel length mismatch");
    }
    return validate(*points, declared);
}

}  // namespace runstream
