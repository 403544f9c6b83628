/**
 * @file  bench/bench_analyze.cpp
 * @brief Google Benchmark suite for the run stream analysis pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Validate           : ChannelValidator over an hour at 1 Hz
 *   BM_EffortNormalize    : tier 1 effort series
 *   BM_Segment            : smoothing, banding and merging
 *   BM_AnalyzeHour        : full Engine::analyze, 3600 points, 7 channels
 *   BM_AnalyzeToJson      : analyze plus serialization
 *
 * Build (CMake):
 *   cmake -DRUNSTREAM_BENCH=ON ..
 *   cmake --build . --target bench_analyze
 *   ./bench_analyze --benchmark_format=json
 *
 * Throughput units: items/second (stream points processed).
 */

#include "benchmark/benchmark.h"

#include "runstream/effort.hpp"
#include "runstream/engine.hpp"
#include "runstream/segmentation.hpp"
#include "runstream/serialize.hpp"
#include "runstream/validator.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

using namespace runstream;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// One hour at 1 Hz: 10 min warm-up, 6 x (3 min hard / 2 min easy), steady
/// finish. Every channel present.
static std::vector<StreamPoint> make_session(std::int64_t seconds = 3600) {
    std::vector<StreamPoint> points;
    points.reserve(static_cast<std::size_t>(seconds));
    double distance = 0.0;
    double altitude = 40.0;
    for (std::int64_t t = 0; t < seconds; ++t) {
        double v = 3.0;
        if (t >= 600 && t < 600 + 6 * 300) {
            v = ((t - 600) % 300) < 180 ? 4.4 : 2.4;
        }
        const double grade = 2.0 * std::sin(static_cast<double>(t) / 200.0);
        const double hr    = 110.0 + 14.0 * v + 0.002 * static_cast<double>(t);
        points.push_back(StreamPoint{
            .time_s        = t,
            .distance_m    = distance,
            .heartrate_bpm = hr,
            .cadence_spm   = 160.0 + 5.0 * v,
            .altitude_m    = altitude,
            .velocity_mps  = v,
            .grade_pct     = grade,
        });
        distance += v;
        altitude += v * grade / 100.0;
    }
    return points;
}

static AnalysisRequest make_request() {
    AnalysisRequest request;
    request.physiology = AthletePhysiologyContext{.threshold_hr = 172.0, .resting_hr = 48.0,
                                                  .max_hr = 192.0};
    request.plan = PlannedWorkout{.duration_min = 60.0, .distance_km = 11.5,
                                  .interval_count = 6};
    return request;
}

// ── Stage benchmarks ───────────────────────────────────────────────────────────

static void BM_Validate(benchmark::State& state) {
    const auto points = make_session(state.range(0));
    for (auto _ : state) {
        auto report = ChannelValidator::validate(points);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Validate)->Arg(600)->Arg(3600)->Arg(14400);

static void BM_EffortNormalize(benchmark::State& state) {
    const auto series = ChannelValidator::validate(make_session(state.range(0))).series;
    const auto physio = make_request().physiology;
    for (auto _ : state) {
        auto effort = EffortNormalizer::normalize(series, physio, true);
        benchmark::DoNotOptimize(effort);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EffortNormalize)->Arg(3600);

static void BM_Segment(benchmark::State& state) {
    const auto series = ChannelValidator::validate(make_session(state.range(0))).series;
    const auto effort = EffortNormalizer::normalize(series, make_request().physiology, true);
    const SegmentationEngine segmenter;
    for (auto _ : state) {
        auto segments = segmenter.segment(series, effort);
        benchmark::DoNotOptimize(segments);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Segment)->Arg(3600);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_AnalyzeHour(benchmark::State& state) {
    const auto points  = make_session(state.range(0));
    const auto request = make_request();
    const Engine engine;
    for (auto _ : state) {
        auto outcome = engine.analyze(points, request);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AnalyzeHour)->Arg(3600)->Arg(14400);

static void BM_AnalyzeToJson(benchmark::State& state) {
    const auto points  = make_session(3600);
    const auto request = make_request();
    const Engine engine;
    for (auto _ : state) {
        auto json = serialize::to_json(engine.analyze(points, request));
        benchmark::DoNotOptimize(json);
    }
    state.SetItemsProcessed(state.iterations() * 3600);
}
BENCHMARK(BM_AnalyzeToJson);

BENCHMARK_MAIN();
