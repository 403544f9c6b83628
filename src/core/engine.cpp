/// @file src/core/engine.cpp
/// @brief Run stream analysis engine: stage orchestration and budget.

#include "runstream/engine.hpp"
#include "runstream/drift.hpp"
#include "runstream/effort.hpp"
#include "runstream/validator.hpp"

#include <fmt/core.h>

#include <utility>

namespace runstream {

namespace {

AnalysisOutcome timed_out(std::chrono::milliseconds budget, const char* stage) {
    return AnalysisOutcome::failure(AnalysisError::make(
        AnalysisErrorCode::AnalysisTimeout,
        fmt::format("compute budget of {} ms exhausted before {}", budget.count(), stage)));
}

}  // namespace

// ─── AnalysisOutcome ──────────────────────────────────────────────────────────

AnalysisOutcome AnalysisOutcome::success(StreamAnalysisResult result) noexcept {
    AnalysisOutcome out;
    out.result_ = std::move(result);
    return out;
}

AnalysisOutcome AnalysisOutcome::failure(AnalysisError error) noexcept {
    AnalysisOutcome out;
    out.errors_.push_back(std::move(error));
    return out;
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , segmenter_(config_.segmentation)
    , detector_(config_.moments)
    , gate_(config_.trust)
{}

// ─── Engine::analyze ──────────────────────────────────────────────────────────

AnalysisOutcome
Engine::analyze(std::span<const StreamPoint> points,
                const AnalysisRequest& request) const noexcept {
    const auto started = std::chrono::steady_clock::now();
    if (over_budget(started)) {
        return timed_out(config_.time_budget, "validation");
    }
    auto report = ChannelValidator::validate(points, request.declared_channels);
    return run_pipeline(std::move(report), request, started);
}

// ─── Engine::analyze_columns ──────────────────────────────────────────────────

AnalysisOutcome
Engine::analyze_columns(const ChannelArrays& columns,
                        const AnalysisRequest& request) const noexcept {
    const auto started = std::chrono::steady_clock::now();
    if (over_budget(started)) {
        return timed_out(config_.time_budget, "validation");
    }
    auto report = ChannelValidator::validate_columns(columns, request.declared_channels);
    return run_pipeline(std::move(report), request, started);
}

// ─── Engine::analyze_fetched ──────────────────────────────────────────────────

AnalysisOutcome
Engine::analyze_fetched(FetchState state,
                        std::span<const StreamPoint> points,
                        const AnalysisRequest& request) const noexcept {
    if (state != FetchState::Success) {
        auto error = AnalysisError::from_fetch_state(state);
        if (config_.verbose) {
            fmt::print(stderr, "[runstream] fetch state {} -> {} (retryable={})\n",
                       to_string(state), to_string(error.code), error.retryable);
        }
        return AnalysisOutcome::failure(std::move(error));
    }
    return analyze(points, request);
}

// ─── Engine::over_budget ──────────────────────────────────────────────────────

bool Engine::over_budget(std::chrono::steady_clock::time_point started) const noexcept {
    if (config_.time_budget.count() <= 0) return true;
    return std::chrono::steady_clock::now() - started > config_.time_budget;
}

// ─── Engine::run_pipeline ─────────────────────────────────────────────────────

AnalysisOutcome
Engine::run_pipeline(ValidationReport report,
                     const AnalysisRequest& request,
                     std::chrono::steady_clock::time_point started) const noexcept {
    // ── Step 1: validation verdict ───────────────────────────────────────────
    if (!report.ok()) {
        if (config_.verbose) {
            fmt::print(stderr, "[runstream] rejected: {} ({})\n",
                       to_string(report.error->code), report.error->message);
        }
        return AnalysisOutcome::failure(std::move(*report.error));
    }
    if (request.require_plan && !request.plan) {
        return AnalysisOutcome::failure(AnalysisError::make(
            AnalysisErrorCode::PlanDataMissing,
            "plan comparison requested but no planned workout is linked"));
    }
    if (over_budget(started)) return timed_out(config_.time_budget, "effort normalization");

    const StreamSeries& series = report.series;

    // ── Step 2: HR sanity and effort ─────────────────────────────────────────
    const auto hr = ChannelValidator::check_heart_rate(series.time_s,
                                                       series.heartrate_bpm,
                                                       series.velocity_mps);
    auto effort = EffortNormalizer::normalize(series, request.physiology, hr.reliable);
    if (config_.verbose) {
        fmt::print(stderr, "[runstream] {} points, tier={}, source={}, hr_reliable={}\n",
                   series.size(), to_string(effort.tier), to_string(effort.source),
                   hr.reliable);
    }
    if (over_budget(started)) return timed_out(config_.time_budget, "segmentation");

    // ── Step 3: segmentation ─────────────────────────────────────────────────
    auto segments = segmenter_.segment(series, effort);
    if (over_budget(started)) return timed_out(config_.time_budget, "drift analysis");

    // ── Step 4: drift and moments ────────────────────────────────────────────
    auto drift   = DriftAnalyzer::analyze(series, segments);
    auto moments = detector_.detect(series, segments, hr.reliable);
    if (over_budget(started)) return timed_out(config_.time_budget, "plan comparison");

    // ── Step 5: plan ─────────────────────────────────────────────────────────
    auto plan = PlanComparator::compare(series, segments, request.plan);

    // ── Step 6: assemble ─────────────────────────────────────────────────────
    std::size_t missing = report.channels_missing.size();
    if (series.heartrate_bpm && !hr.reliable) ++missing;

    StreamAnalysisResult result;
    result.point_count          = series.size();
    result.segments             = std::move(segments);
    result.drift                = std::move(drift);
    result.moments              = std::move(moments);
    result.plan_comparison      = std::move(plan);
    result.channels_present     = std::move(report.channels_present);
    result.channels_missing     = std::move(report.channels_missing);
    result.confidence           = EffortNormalizer::confidence(effort.tier, missing);
    result.tier_used            = effort.tier;
    result.effort_source        = effort.source;
    result.estimated_flags      = std::move(effort.flags);
    result.cross_run_comparable = effort.cross_run_comparable;
    result.effort               = std::move(effort.values);
    result.hr_reliable          = hr.reliable;
    result.hr_issue             = hr.issue;

    // ── Step 7: trust gate ───────────────────────────────────────────────────
    gate_.apply(result);
    if (over_budget(started)) return timed_out(config_.time_budget, "result delivery");

    if (config_.verbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        fmt::print(stderr, "[runstream] {} segments, {} moments, confidence={} in {} us\n",
                   result.segments.size(), result.moments.size(), result.confidence,
                   elapsed.count());
    }
    return AnalysisOutcome::success(std::move(result));
}

}  // namespace runstream
