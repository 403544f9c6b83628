/// @file src/moments/moment_detector.cpp
/// @brief MomentDetector: excursions, drift onset, recovery delay, transitions.

#include "runstream/moments.hpp"

#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace runstream {

const char* to_string(MomentType type) noexcept {
    switch (type) {
        case MomentType::CardiacDriftOnset:    return "cardiac_drift_onset";
        case MomentType::CadenceDrop:          return "cadence_drop";
        case MomentType::CadenceSurge:         return "cadence_surge";
        case MomentType::PaceSurge:            return "pace_surge";
        case MomentType::PaceFade:             return "pace_fade";
        case MomentType::GradeAdjustedAnomaly: return "grade_adjusted_anomaly";
        case MomentType::RecoveryHrDelay:      return "recovery_hr_delay";
        case MomentType::EffortZoneTransition: return "effort_zone_transition";
    }
    return "unknown";
}

const char* to_string(MomentUnit unit) noexcept {
    switch (unit) {
        case MomentUnit::Pct:      return "pct";
        case MomentUnit::Spm:      return "spm";
        case MomentUnit::Seconds:  return "s";
        case MomentUnit::GradePct: return "grade_pct";
        case MomentUnit::Effort:   return "effort";
    }
    return "unknown";
}

const char* to_string(MomentContext context) noexcept {
    switch (context) {
        case MomentContext::Warmup:       return "warmup";
        case MomentContext::Work:         return "work";
        case MomentContext::Recovery:     return "recovery";
        case MomentContext::Cooldown:     return "cooldown";
        case MomentContext::Steady:       return "steady";
        case MomentContext::HrPaceRatio:  return "hr_pace_ratio";
        case MomentContext::HrOnly:       return "hr_only";
        case MomentContext::Uphill:       return "uphill";
        case MomentContext::Downhill:     return "downhill";
        case MomentContext::NotRecovered: return "not_recovered";
        case MomentContext::BandUp:       return "band_up";
        case MomentContext::BandDown:     return "band_down";
    }
    return "unknown";
}

MomentContext context_for(SegmentType type) noexcept {
    switch (type) {
        case SegmentType::Warmup:   return MomentContext::Warmup;
        case SegmentType::Work:     return MomentContext::Work;
        case SegmentType::Recovery: return MomentContext::Recovery;
        case SegmentType::Cooldown: return MomentContext::Cooldown;
        case SegmentType::Steady:   return MomentContext::Steady;
    }
    return MomentContext::Steady;
}

namespace {

Moment make_moment(MomentType type, const StreamSeries& series, std::size_t index,
                   std::optional<double> value, MomentUnit unit,
                   MomentContext context) noexcept {
    return Moment{
        .type    = type,
        .index   = index,
        .time_s  = series.time_s[index],
        .value   = Gated<double>{.value = value},
        .unit    = unit,
        .context = context,
    };
}

}  // namespace

// ─── MomentDetector constructor ───────────────────────────────────────────────

MomentDetector::MomentDetector(MomentConfig config) noexcept
    : config_(config)
{}

// ─── MomentDetector::detect ───────────────────────────────────────────────────

std::vector<Moment>
MomentDetector::detect(const StreamSeries& series,
                       std::span<const Segment> segments,
                       bool hr_usable) const noexcept {
    std::vector<Moment> out;
    if (series.size() < config_.min_points || segments.empty()) {
        return out;
    }

    if (hr_usable) {
        if (auto onset = detect_drift_onset(series, segments)) {
            out.push_back(*onset);
        }
        for (auto& m : detect_recovery_delay(series, segments)) out.push_back(m);
    }
    for (auto& m : detect_cadence(series, segments)) out.push_back(m);
    for (auto& m : detect_pace(series, segments))    out.push_back(m);
    for (auto& m : detect_transitions(segments))     out.push_back(m);

    std::sort(out.begin(), out.end(), [](const Moment& a, const Moment& b) {
        return std::make_tuple(a.time_s, static_cast<int>(a.type), a.index) <
               std::make_tuple(b.time_s, static_cast<int>(b.type), b.index);
    });
    return out;
}

// ─── MomentDetector::detect_drift_onset ───────────────────────────────────────

std::optional<Moment>
MomentDetector::detect_drift_onset(const StreamSeries& series,
                                   std::span<const Segment> segments) const noexcept {
    if (!series.heartrate_bpm) return std::nullopt;
    const auto& t  = series.time_s;
    const auto& hr = *series.heartrate_bpm;
    const bool use_ratio = series.velocity_mps.has_value();

    // First work/steady segment long enough to hold the baseline window.
    const std::int64_t baseline_span = config_.drift_stabilize_s + config_.drift_window_s;
    auto host = std::find_if(segments.begin(), segments.end(), [&](const Segment& seg) {
        return (seg.type == SegmentType::Work || seg.type == SegmentType::Steady) &&
               seg.duration_s > baseline_span;
    });
    if (host == segments.end()) return std::nullopt;

    // HR per unit velocity; standing samples carry no ratio.
    const std::size_t start = host->start_index;
    const std::size_t end   = host->end_index;
    std::vector<double> signal(end - start + 1, 0.0);
    std::vector<bool>   valid(signal.size(), true);
    for (std::size_t i = start; i <= end; ++i) {
        if (use_ratio) {
            const double v = (*series.velocity_mps)[i];
            valid[i - start]  = v > constants::MOVING_VELOCITY_MPS;
            signal[i - start] = valid[i - start] ? hr[i] / v : 0.0;
        } else {
            signal[i - start] = hr[i];
        }
    }

    // ── Baseline ─────────────────────────────────────────────────────────────
    const std::int64_t base_from = t[start] + config_.drift_stabilize_s;
    const std::int64_t base_to   = base_from + config_.drift_window_s;
    double base_sum = 0.0;
    std::size_t base_n = 0;
    std::size_t scan_from = end + 1;
    for (std::size_t i = start; i <= end; ++i) {
        if (t[i] < base_from) continue;
        if (t[i] >= base_to) {
            scan_from = std::min(scan_from, i);
            continue;
        }
        if (valid[i - start]) {
            base_sum += signal[i - start];
            ++base_n;
        }
    }
    if (base_n == 0 || scan_from > end) return std::nullopt;
    const double baseline = base_sum / static_cast<double>(base_n);
    if (baseline <= 0.0) return std::nullopt;

    // ── Centered rolling mean after the baseline ─────────────────────────────
    const std::size_t m = signal.size();
    std::vector<double> psum(m + 1, 0.0);
    std::vector<std::size_t> pcnt(m + 1, 0);
    for (std::size_t k = 0; k < m; ++k) {
        psum[k + 1] = psum[k] + (valid[k] ? signal[k] : 0.0);
        pcnt[k + 1] = pcnt[k] + (valid[k] ? 1 : 0);
    }

    const std::int64_t half = config_.drift_window_s / 2;
    std::size_t lo = 0;
    std::size_t hi = 0;
    for (std::size_t i = start; i <= end; ++i) {
        const std::size_t k = i - start;
        while (t[start + lo] < t[i] - half) ++lo;
        if (hi < k) hi = k;
        while (hi + 1 < m && t[start + hi + 1] <= t[i] + half) ++hi;
        if (i < scan_from) continue;

        const std::size_t count = pcnt[hi + 1] - pcnt[lo];
        if (count == 0) continue;
        const double window_mean = (psum[hi + 1] - psum[lo]) / static_cast<double>(count);
        const double rise_pct = (window_mean / baseline - 1.0) * 100.0;
        if (rise_pct >= config_.drift_onset_rise_pct) {
            return make_moment(MomentType::CardiacDriftOnset, series, i,
                               stats::round_to(rise_pct, 2), MomentUnit::Pct,
                               use_ratio ? MomentContext::HrPaceRatio : MomentContext::HrOnly);
        }
    }
    return std::nullopt;
}

// ─── MomentDetector::find_excursions ──────────────────────────────────────────

std::vector<MomentDetector::Excursion>
MomentDetector::find_excursions(std::span<const std::int64_t> time_s,
                                std::span<const double> values,
                                std::size_t start,
                                std::size_t end,
                                double mean,
                                double threshold) const noexcept {
    std::vector<Excursion> out;
    std::optional<Excursion> open;

    auto close = [&](std::size_t last) {
        const std::int64_t stop = (last + 1 <= end) ? time_s[last + 1] : time_s[last];
        if (stop - time_s[open->start] >= config_.min_duration_s) {
            open->end = last;
            out.push_back(*open);
        }
        open.reset();
    };

    for (std::size_t i = start; i <= end; ++i) {
        const double dev = values[i] - mean;
        const bool above = dev > threshold;
        const bool below = dev < -threshold;
        if (open && !((open->above && above) || (!open->above && below))) {
            close(i - 1);
        }
        if (above || below) {
            if (!open) {
                open = Excursion{.start = i, .end = i, .above = above, .peak = 0.0};
            }
            open->peak = std::max(open->peak, std::abs(dev));
        }
    }
    if (open) close(end);
    return out;
}

// ─── MomentDetector::sustained_grade ──────────────────────────────────────────

std::optional<double>
MomentDetector::sustained_grade(std::span<const std::int64_t> time_s,
                                std::span<const double> grade,
                                std::size_t index) const noexcept {
    const std::int64_t until = time_s[index] + config_.grade_window_s;
    std::size_t total = 0;
    std::size_t up = 0;
    std::size_t down = 0;
    double sum = 0.0;
    for (std::size_t i = index; i < time_s.size() && time_s[i] < until; ++i) {
        ++total;
        sum += grade[i];
        if (grade[i] >= config_.grade_significant_pct)  ++up;
        if (grade[i] <= -config_.grade_significant_pct) ++down;
    }
    if (total == 0) return std::nullopt;
    const double n = static_cast<double>(total);
    if (static_cast<double>(up) / n >= config_.grade_window_fraction ||
        static_cast<double>(down) / n >= config_.grade_window_fraction) {
        return sum / n;
    }
    return std::nullopt;
}

// ─── MomentDetector::detect_cadence ───────────────────────────────────────────

std::vector<Moment>
MomentDetector::detect_cadence(const StreamSeries& series,
                               std::span<const Segment> segments) const noexcept {
    std::vector<Moment> out;
    if (!series.cadence_spm) return out;
    const auto& cadence = *series.cadence_spm;

    for (const auto& seg : segments) {
        if (seg.duration_s < config_.min_segment_s) continue;
        const auto slice = std::span<const double>(cadence)
                               .subspan(seg.start_index, seg.end_index - seg.start_index + 1);
        const double mean = stats::mean(slice);
        if (mean <= 0.0) continue;

        for (const auto& ex : find_excursions(series.time_s, cadence, seg.start_index,
                                              seg.end_index, mean,
                                              config_.cadence_step_fraction * mean)) {
            out.push_back(make_moment(ex.above ? MomentType::CadenceSurge : MomentType::CadenceDrop,
                                      series, ex.start, stats::round_to(ex.peak, 1),
                                      MomentUnit::Spm, context_for(seg.type)));
        }
    }
    return out;
}

// ─── MomentDetector::detect_pace ──────────────────────────────────────────────

std::vector<Moment>
MomentDetector::detect_pace(const StreamSeries& series,
                            std::span<const Segment> segments) const noexcept {
    std::vector<Moment> out;
    if (!series.velocity_mps) return out;
    const auto& v = *series.velocity_mps;

    for (const auto& seg : segments) {
        if (seg.type == SegmentType::Warmup || seg.type == SegmentType::Cooldown) continue;
        if (seg.duration_s < config_.min_segment_s) continue;

        double sum = 0.0;
        std::size_t moving = 0;
        for (std::size_t i = seg.start_index; i <= seg.end_index; ++i) {
            if (v[i] > constants::MOVING_VELOCITY_MPS) {
                sum += v[i];
                ++moving;
            }
        }
        if (moving == 0) continue;
        const double mean = sum / static_cast<double>(moving);

        for (const auto& ex : find_excursions(series.time_s, v, seg.start_index,
                                              seg.end_index, mean,
                                              config_.pace_step_fraction * mean)) {
            // Slower uphill or faster downhill is the terrain, not the runner.
            if (series.grade_pct) {
                const auto grade = sustained_grade(series.time_s, *series.grade_pct, ex.start);
                if (grade && ((!ex.above && *grade > 0.0) || (ex.above && *grade < 0.0))) {
                    out.push_back(make_moment(MomentType::GradeAdjustedAnomaly, series, ex.start,
                                              stats::round_to(*grade, 2), MomentUnit::GradePct,
                                              *grade > 0.0 ? MomentContext::Uphill
                                                           : MomentContext::Downhill));
                    continue;
                }
            }
            out.push_back(make_moment(ex.above ? MomentType::PaceSurge : MomentType::PaceFade,
                                      series, ex.start, stats::round_to(ex.peak / mean * 100.0, 1),
                                      MomentUnit::Pct, context_for(seg.type)));
        }
    }
    return out;
}

// ─── MomentDetector::detect_recovery_delay ────────────────────────────────────

std::vector<Moment>
MomentDetector::detect_recovery_delay(const StreamSeries& series,
                                      std::span<const Segment> segments) const noexcept {
    std::vector<Moment> out;
    if (!series.heartrate_bpm) return out;
    const auto& t  = series.time_s;
    const auto& hr = *series.heartrate_bpm;

    for (std::size_t s = 0; s + 1 < segments.size(); ++s) {
        const Segment& work = segments[s];
        const Segment& rest = segments[s + 1];
        if (work.type != SegmentType::Work || rest.type != SegmentType::Recovery) continue;

        // Peak over the final seconds of the work segment.
        double peak = 0.0;
        for (std::size_t i = work.end_index + 1; i-- > work.start_index;) {
            if (t[work.end_index] - t[i] > config_.recovery_peak_window_s) break;
            peak = std::max(peak, hr[i]);
        }
        const auto rest_slice = std::span<const double>(hr).subspan(
            rest.start_index, rest.end_index - rest.start_index + 1);
        const double rest_mean = stats::mean(rest_slice);
        if (peak <= rest_mean) continue;

        // HR must reach the half-way target and hold there; a brief dip
        // does not count as recovered.
        const double target = peak - 0.5 * (peak - rest_mean);
        std::optional<std::int64_t> delay;
        std::optional<std::size_t> hold_start;
        for (std::size_t i = rest.start_index; i <= rest.end_index; ++i) {
            if (hr[i] > target) {
                hold_start.reset();
                continue;
            }
            if (!hold_start) hold_start = i;
            if (t[i] - t[*hold_start] >= config_.min_duration_s) {
                delay = t[*hold_start] - t[rest.start_index];
                break;
            }
        }

        if (!delay) {
            // Never reached: the value is a lower bound.
            out.push_back(make_moment(MomentType::RecoveryHrDelay, series, rest.start_index,
                                      static_cast<double>(rest.duration_s),
                                      MomentUnit::Seconds, MomentContext::NotRecovered));
        } else if (*delay >= config_.recovery_delay_min_s) {
            out.push_back(make_moment(MomentType::RecoveryHrDelay, series, rest.start_index,
                                      static_cast<double>(*delay),
                                      MomentUnit::Seconds, MomentContext::Recovery));
        }
    }
    return out;
}

// ─── MomentDetector::detect_transitions ───────────────────────────────────────

std::vector<Moment>
MomentDetector::detect_transitions(std::span<const Segment> segments) noexcept {
    std::vector<Moment> out;
    for (std::size_t s = 1; s < segments.size(); ++s) {
        const double delta = stats::round_to(segments[s].avg_effort - segments[s - 1].avg_effort, 4);
        out.push_back(Moment{
            .type    = MomentType::EffortZoneTransition,
            .index   = segments[s].start_index,
            .time_s  = segments[s].start_time_s,
            .value   = Gated<double>{.value = delta},
            .unit    = MomentUnit::Effort,
            .context = delta >= 0.0 ? MomentContext::BandUp : MomentContext::BandDown,
        });
    }
    return out;
}

}  // namespace runstream
