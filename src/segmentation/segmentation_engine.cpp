/// @file src/segmentation/segmentation_engine.cpp
/// @brief SegmentationEngine: smoothing, banding, candidate merge, labels.

#include "runstream/segmentation.hpp"

#include "runstream/constants.hpp"

#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <utility>

namespace runstream {

const char* to_string(SegmentType type) noexcept {
    switch (type) {
        case SegmentType::Warmup:   return "warmup";
        case SegmentType::Work:     return "work";
        case SegmentType::Recovery: return "recovery";
        case SegmentType::Cooldown: return "cooldown";
        case SegmentType::Steady:   return "steady";
    }
    return "unknown";
}

const char* to_string(EffortBand band) noexcept {
    switch (band) {
        case EffortBand::Low:      return "low";
        case EffortBand::Moderate: return "moderate";
        case EffortBand::High:     return "high";
    }
    return "unknown";
}

namespace {

int band_rank(EffortBand band) noexcept {
    return static_cast<int>(band);
}

/// Seconds a candidate spans, counted up to the next candidate's first sample.
std::int64_t span_s(std::span<const std::int64_t> time_s,
                    std::size_t start, std::size_t end) noexcept {
    const std::int64_t stop = (end + 1 < time_s.size()) ? time_s[end + 1] : time_s[end];
    return stop - time_s[start];
}

}  // namespace

// ─── SegmentationEngine constructor ───────────────────────────────────────────

SegmentationEngine::SegmentationEngine(SegmentConfig config) noexcept
    : config_(config)
{}

// ─── SegmentationEngine::segment ──────────────────────────────────────────────

std::vector<Segment>
SegmentationEngine::segment(const StreamSeries& series,
                            const EffortSeries& effort) const noexcept {
    const std::size_t n = series.size();
    if (n == 0 || effort.values.size() != n) {
        return {};
    }

    // ── Step 1: band on pace when it exists, effort otherwise ────────────────
    const auto ratio = velocity_ratio(series);
    const auto bands = ratio
        ? classify_velocity_bands(smooth(series.time_s, *ratio, config_.smoothing_half_window_s))
        : classify_bands(smooth(series.time_s, effort.values, config_.smoothing_half_window_s),
                         effort.tier);

    // ── Step 2: candidates, short ones absorbed ──────────────────────────────
    auto candidates = build_candidates(bands);
    absorb_short(candidates, series.time_s);

    const bool too_short = series.elapsed_s() < config_.min_multi_segment_duration_s;
    if (too_short || candidates.size() <= 1) {
        return {summarize(series, effort.values, SegmentType::Steady, 0, n - 1)};
    }

    // ── Step 3: snap boundaries onto pace steps ──────────────────────────────
    if (ratio) {
        align_to_pace(candidates, series.time_s, *series.velocity_mps);
    }

    // ── Step 4: fold edges, label and summarize ──────────────────────────────
    fold_edges(candidates);
    const auto labels = label(candidates);
    std::vector<Segment> segments;
    segments.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        segments.push_back(summarize(series, effort.values, labels[i],
                                     candidates[i].start, candidates[i].end));
    }
    return segments;
}

// ─── SegmentationEngine::velocity_ratio ───────────────────────────────────────

std::optional<std::vector<double>>
SegmentationEngine::velocity_ratio(const StreamSeries& series) noexcept {
    if (!series.velocity_mps) {
        return std::nullopt;
    }
    const auto& velocity = *series.velocity_mps;

    std::vector<double> adjusted(velocity.size(), 0.0);
    std::vector<double> moving;
    moving.reserve(velocity.size());
    for (std::size_t i = 0; i < velocity.size(); ++i) {
        const double grade = series.grade_pct ? (*series.grade_pct)[i] : 0.0;
        adjusted[i] = EffortNormalizer::grade_adjusted_velocity(velocity[i], grade);
        if (velocity[i] > constants::MOVING_VELOCITY_MPS) {
            moving.push_back(adjusted[i]);
        }
    }

    const auto median = stats::median(std::move(moving));
    if (!median || *median <= 0.0) {
        return std::nullopt;
    }
    for (double& a : adjusted) {
        a /= *median;
    }
    return adjusted;
}

// ─── SegmentationEngine::smooth ───────────────────────────────────────────────

std::vector<double>
SegmentationEngine::smooth(std::span<const std::int64_t> time_s,
                           std::span<const double> values,
                           double half_window_s) noexcept {
    const std::size_t n = std::min(time_s.size(), values.size());
    std::vector<double> out(n, 0.0);
    if (n == 0) return out;

    std::vector<double> prefix(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + values[i];
    }

    std::size_t lo = 0;
    std::size_t hi = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(time_s[i]);
        while (static_cast<double>(time_s[lo]) < t - half_window_s) ++lo;
        if (hi < i) hi = i;
        while (hi + 1 < n && static_cast<double>(time_s[hi + 1]) <= t + half_window_s) ++hi;
        out[i] = (prefix[hi + 1] - prefix[lo]) / static_cast<double>(hi + 1 - lo);
    }
    return out;
}

// ─── SegmentationEngine::classify_bands ───────────────────────────────────────

std::vector<EffortBand>
SegmentationEngine::classify_bands(std::span<const double> smoothed,
                                   EffortTier tier) const noexcept {
    return band(smoothed, config_.cuts_for(tier), config_.hysteresis);
}

std::vector<EffortBand>
SegmentationEngine::classify_velocity_bands(std::span<const double> smoothed) const noexcept {
    return band(smoothed, config_.velocity_cuts, config_.velocity_hysteresis);
}

std::vector<EffortBand>
SegmentationEngine::band(std::span<const double> smoothed, BandCuts cuts,
                         double hysteresis) noexcept {
    auto plain = [&](double x) {
        if (x >= cuts.high) return EffortBand::High;
        if (x < cuts.low)   return EffortBand::Low;
        return EffortBand::Moderate;
    };

    std::vector<EffortBand> bands;
    bands.reserve(smoothed.size());
    if (smoothed.empty()) return bands;

    EffortBand state = plain(smoothed[0]);
    for (double x : smoothed) {
        const EffortBand raw = plain(x);
        if (band_rank(raw) > band_rank(state)) {
            state = raw;
        } else if (band_rank(raw) < band_rank(state)) {
            // Downward moves must clear the cut by the hysteresis margin.
            if (state == EffortBand::High && x < cuts.high - hysteresis) {
                state = EffortBand::Moderate;
            }
            if (state == EffortBand::Moderate && x < cuts.low - hysteresis) {
                state = EffortBand::Low;
            }
        }
        bands.push_back(state);
    }
    return bands;
}

// ─── SegmentationEngine::build_candidates ─────────────────────────────────────

std::vector<SegmentationEngine::Candidate>
SegmentationEngine::build_candidates(std::span<const EffortBand> bands) noexcept {
    std::vector<Candidate> out;
    for (std::size_t i = 0; i < bands.size(); ++i) {
        if (!out.empty() && out.back().band == bands[i]) {
            out.back().end = i;
        } else {
            out.push_back(Candidate{.band = bands[i], .start = i, .end = i});
        }
    }
    return out;
}

// ─── SegmentationEngine::absorb_short ─────────────────────────────────────────

void SegmentationEngine::absorb_short(std::vector<Candidate>& candidates,
                                      std::span<const std::int64_t> time_s) const noexcept {
    while (candidates.size() > 1) {
        // Shortest candidate under the floor; earliest wins ties.
        std::size_t victim = candidates.size();
        std::int64_t shortest = std::numeric_limits<std::int64_t>::max();
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            const auto d = span_s(time_s, candidates[i].start, candidates[i].end);
            if (d < config_.min_segment_duration_s && d < shortest) {
                shortest = d;
                victim = i;
            }
        }
        if (victim == candidates.size()) break;

        // Closest band wins; the previous neighbor wins ties.
        const int own = band_rank(candidates[victim].band);
        std::size_t into = 0;
        if (victim == 0) {
            into = 1;
        } else if (victim + 1 == candidates.size()) {
            into = victim - 1;
        } else {
            const int prev_gap = std::abs(band_rank(candidates[victim - 1].band) - own);
            const int next_gap = std::abs(band_rank(candidates[victim + 1].band) - own);
            into = (next_gap < prev_gap) ? victim + 1 : victim - 1;
        }

        if (into < victim) {
            candidates[into].end = candidates[victim].end;
        } else {
            candidates[into].start = candidates[victim].start;
        }
        candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(victim));

        // Consolidate same-band neighbors.
        std::vector<Candidate> merged;
        merged.reserve(candidates.size());
        for (const auto& c : candidates) {
            if (!merged.empty() && merged.back().band == c.band) {
                merged.back().end = c.end;
            } else {
                merged.push_back(c);
            }
        }
        candidates = std::move(merged);
    }
}

// ─── SegmentationEngine::align_to_pace ────────────────────────────────────────

void SegmentationEngine::align_to_pace(std::vector<Candidate>& candidates,
                                       std::span<const std::int64_t> time_s,
                                       std::span<const double> velocity) const noexcept {
    const std::int64_t window = config_.pace_align_window_s;
    for (std::size_t i = 0; i + 1 < candidates.size(); ++i) {
        Candidate& before = candidates[i];
        Candidate& after  = candidates[i + 1];
        const std::size_t boundary = after.start;
        const bool rising = band_rank(after.band) > band_rank(before.band);

        // Both sides keep at least one sample.
        std::size_t lo = boundary;
        while (lo > before.start + 1 && time_s[boundary] - time_s[lo - 1] <= window) --lo;
        std::size_t hi = boundary;
        while (hi < after.end && time_s[hi + 1] - time_s[boundary] <= window) ++hi;

        // Largest step in the band's direction; the nearest one wins ties.
        std::optional<std::size_t> best;
        double best_step = config_.pace_step_min_mps;
        std::int64_t best_offset = 0;
        for (std::size_t cand = lo; cand <= hi; ++cand) {
            const double step = velocity[cand] - velocity[cand - 1];
            const double directed = rising ? step : -step;
            const std::int64_t offset = std::abs(time_s[cand] - time_s[boundary]);
            if (directed > best_step ||
                (directed == best_step && (!best || offset < best_offset))) {
                best_step = directed;
                best_offset = offset;
                best = cand;
            }
        }
        if (!best || *best == boundary) continue;

        // Neither side may fall under the floor.
        if (span_s(time_s, before.start, *best - 1) < config_.min_segment_duration_s) continue;
        if (span_s(time_s, *best, after.end) < config_.min_segment_duration_s) continue;
        before.end  = *best - 1;
        after.start = *best;
    }
}

// ─── SegmentationEngine::fold_edges ───────────────────────────────────────────

void SegmentationEngine::fold_edges(std::vector<Candidate>& candidates) noexcept {
    std::optional<std::size_t> first_high;
    std::optional<std::size_t> last_high;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].band == EffortBand::High) {
            if (!first_high) first_high = i;
            last_high = i;
        }
    }
    if (!first_high) return;

    if (*last_high + 2 < candidates.size()) {
        candidates[*last_high + 1].end = candidates.back().end;
        candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(*last_high + 2),
                         candidates.end());
    }
    if (*first_high > 1) {
        candidates[0].end = candidates[*first_high - 1].end;
        candidates.erase(candidates.begin() + 1,
                         candidates.begin() + static_cast<std::ptrdiff_t>(*first_high));
    }
}

// ─── SegmentationEngine::label ────────────────────────────────────────────────

std::vector<SegmentType>
SegmentationEngine::label(std::span<const Candidate> candidates) noexcept {
    const std::size_t k = candidates.size();
    std::vector<SegmentType> labels(k, SegmentType::Steady);
    if (k < 2) return labels;

    const bool has_work = std::any_of(candidates.begin(), candidates.end(),
        [](const Candidate& c) { return c.band == EffortBand::High; });

    // Structured session: head is warmup, tail is cooldown, gaps are recovery.
    if (has_work) {
        for (std::size_t i = 0; i < k; ++i) {
            if (candidates[i].band == EffortBand::High) {
                labels[i] = SegmentType::Work;
            } else if (i == 0) {
                labels[i] = SegmentType::Warmup;
            } else if (i + 1 == k) {
                labels[i] = SegmentType::Cooldown;
            } else {
                labels[i] = SegmentType::Recovery;
            }
        }
        return labels;
    }

    if (band_rank(candidates[1].band) > band_rank(candidates[0].band)) {
        labels[0] = SegmentType::Warmup;
    }
    if (band_rank(candidates[k - 2].band) > band_rank(candidates[k - 1].band)) {
        labels[k - 1] = SegmentType::Cooldown;
    }
    return labels;
}

// ─── SegmentationEngine::summarize ────────────────────────────────────────────

Segment SegmentationEngine::summarize(const StreamSeries& series,
                                      std::span<const double> effort,
                                      SegmentType type,
                                      std::size_t start,
                                      std::size_t end) noexcept {
    const std::size_t count = end - start + 1;
    auto slice = [&](const std::vector<double>& v) {
        return std::span<const double>(v).subspan(start, count);
    };

    Segment seg{
        .type         = type,
        .start_index  = start,
        .end_index    = end,
        .start_time_s = series.time_s[start],
        .end_time_s   = series.time_s[end],
        .duration_s   = series.time_s[end] - series.time_s[start],
    };

    if (series.heartrate_bpm) {
        seg.avg_hr = stats::round_to(stats::mean(slice(*series.heartrate_bpm)), 1);
    }
    if (series.cadence_spm) {
        seg.avg_cadence = stats::round_to(stats::mean(slice(*series.cadence_spm)), 1);
    }

    // Pace: elapsed over covered distance, else moving mean velocity.
    if (series.distance_m) {
        const double covered = (*series.distance_m)[end] - (*series.distance_m)[start];
        if (covered > 0.0 && seg.duration_s > 0) {
            seg.avg_pace_s_km = stats::round_to(
                static_cast<double>(seg.duration_s) / (covered / 1000.0), 1);
        }
    }
    if (!seg.avg_pace_s_km && series.velocity_mps) {
        double sum = 0.0;
        std::size_t moving = 0;
        for (double v : slice(*series.velocity_mps)) {
            if (v > constants::MOVING_VELOCITY_MPS) {
                sum += v;
                ++moving;
            }
        }
        if (moving > 0 && sum > 0.0) {
            seg.avg_pace_s_km = stats::round_to(
                1000.0 / (sum / static_cast<double>(moving)), 1);
        }
    }

    // Grade: distance-weighted where distance advances.
    if (series.grade_pct) {
        const auto grade = slice(*series.grade_pct);
        double weighted = 0.0;
        double total = 0.0;
        if (series.distance_m) {
            const auto& d = *series.distance_m;
            for (std::size_t i = start; i < end; ++i) {
                const double step = std::max(0.0, d[i + 1] - d[i]);
                weighted += (*series.grade_pct)[i] * step;
                total += step;
            }
        }
        const double avg = total > 0.0 ? weighted / total : stats::mean(grade);
        seg.avg_grade_pct = stats::round_to(avg, 2);
    }

    seg.avg_effort = stats::round_to(stats::mean(effort.subspan(start, count)), 4);
    return seg;
}

}  // namespace runstream
