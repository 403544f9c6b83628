/// @file src/validation/hr_sanity.cpp
/// @brief Heart-rate sanity check: decides whether HR may drive effort.

#include "runstream/validator.hpp"
#include "runstream/constants.hpp"

#include "../core/stats.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace runstream {

const char* to_string(HrIssue issue) noexcept {
    switch (issue) {
        case HrIssue::ChannelAbsent:          return "channel_absent";
        case HrIssue::SustainedDropout:       return "sustained_dropout";
        case HrIssue::Flatline:               return "flatline";
        case HrIssue::ImplausiblyLow:         return "implausibly_low";
        case HrIssue::InversePaceCorrelation: return "inverse_pace_correlation";
    }
    return "unknown";
}

namespace {

HrReliability unreliable(HrIssue issue) noexcept {
    return HrReliability{.reliable = false, .issue = issue};
}

/// True when the stream has a run of near-zero HR lasting the sustained
/// limit, or too many near-zero samples overall.
bool has_dropout(std::span<const std::int64_t> time_s,
                 std::span<const double> hr) noexcept {
    std::size_t dropped = 0;
    std::size_t run_start = 0;
    bool in_run = false;
    for (std::size_t i = 0; i < hr.size(); ++i) {
        if (hr[i] <= constants::HR_DROPOUT_BPM) {
            ++dropped;
            if (!in_run) {
                in_run = true;
                run_start = i;
            }
            if (time_s[i] - time_s[run_start] >= constants::HR_DROPOUT_SUSTAINED_S) {
                return true;
            }
        } else {
            in_run = false;
        }
    }
    const double fraction = static_cast<double>(dropped) / static_cast<double>(hr.size());
    return fraction >= constants::HR_DROPOUT_MAX_FRACTION;
}

}  // namespace

// ─── ChannelValidator::check_heart_rate ───────────────────────────────────────

HrReliability
ChannelValidator::check_heart_rate(std::span<const std::int64_t> time_s,
                                   const std::optional<std::vector<double>>& heartrate,
                                   const std::optional<std::vector<double>>& velocity) noexcept {
    if (!heartrate || heartrate->empty() || heartrate->size() != time_s.size()) {
        return unreliable(HrIssue::ChannelAbsent);
    }
    const std::span<const double> hr(*heartrate);

    if (has_dropout(time_s, hr)) {
        return unreliable(HrIssue::SustainedDropout);
    }

    // Without velocity there is nothing to cross-check HR against.
    if (!velocity || velocity->size() != hr.size()) {
        return HrReliability{.reliable = true, .issue = std::nullopt};
    }
    const std::span<const double> v(*velocity);
    const bool pace_varies = stats::stddev(v) > constants::VELOCITY_VARYING_STDDEV_MPS;

    if (pace_varies && stats::stddev(hr) < constants::HR_FLATLINE_STDDEV_BPM) {
        return unreliable(HrIssue::Flatline);
    }

    std::vector<double> moving_hr;
    std::vector<double> moving_v;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] > constants::MOVING_VELOCITY_MPS) {
            moving_hr.push_back(hr[i]);
            moving_v.push_back(v[i]);
        }
    }
    const auto median_v  = stats::median(moving_v);
    const auto median_hr = stats::median(moving_hr);
    if (median_v && median_hr &&
        *median_v >= constants::RUNNING_VELOCITY_MPS &&
        *median_hr < constants::HR_IMPLAUSIBLY_LOW_BPM) {
        return unreliable(HrIssue::ImplausiblyLow);
    }

    if (pace_varies) {
        const auto r = stats::pearson(hr, v);
        if (r && *r <= constants::HR_INVERSE_CORRELATION) {
            return unreliable(HrIssue::InversePaceCorrelation);
        }
    }

    return HrReliability{.reliable = true, .issue = std::nullopt};
}

}  // namespace runstream
