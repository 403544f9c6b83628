#pragma once

/// @file include/runstream/engine.hpp
/// @brief Run stream analysis engine: public API.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate the full analysis pipeline:
///   StreamPoint[] → ChannelValidator → EffortNormalizer →
///   SegmentationEngine → DriftAnalyzer + MomentDetector →
///   PlanComparator → TrustGate → AnalysisOutcome
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto loaded = DataLoader::load_csv("run.csv");
/// if (loaded) {
///     auto outcome = engine.analyze(loaded->points, AnalysisRequest{});
///     if (outcome.ok()) fmt::print("{}\n", serialize::to_json(*outcome.result()));
/// }
/// ```
///
/// ## Guarantees
/// - Never throws: every failure is a typed AnalysisError
/// - Result xor errors, exactly one error per failed call
/// - `analyze` is const and keeps no state between calls
/// - Identical inputs give byte-identical serialized results

#include "runstream/constants.hpp"
#include "runstream/errors.hpp"
#include "runstream/moments.hpp"
#include "runstream/plan.hpp"
#include "runstream/result.hpp"
#include "runstream/segmentation.hpp"
#include "runstream/trust.hpp"
#include "runstream/types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <vector>

namespace runstream {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    SegmentConfig segmentation{};
    MomentConfig  moments{};
    TrustConfig   trust{};

    /// Compute budget checked between stages. Zero always times out.
    std::chrono::milliseconds time_budget{constants::DEFAULT_TIME_BUDGET_MS};

    /// If true, emit per-stage diagnostics to stderr.
    bool verbose = false;
};

// ─── AnalysisRequest ──────────────────────────────────────────────────────────

struct AnalysisRequest {
    std::optional<AthletePhysiologyContext> physiology;
    std::optional<PlannedWorkout>           plan;

    /// Channels the source declares. Empty means every channel is eligible.
    std::vector<Channel> declared_channels;

    /// Fail with PLAN_DATA_MISSING when no plan is linked.
    bool require_plan = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Analyze one run given in row form.
    [[nodiscard]] AnalysisOutcome
    analyze(std::span<const StreamPoint> points,
            const AnalysisRequest& request) const noexcept;

    /// Analyze one run given in column form.
    [[nodiscard]] AnalysisOutcome
    analyze_columns(const ChannelArrays& columns,
                    const AnalysisRequest& request) const noexcept;

    /// Analyze a run at the fetch-pipeline boundary.
    ///
    /// Any state other than `Success` fails without reading `points`.
    [[nodiscard]] AnalysisOutcome
    analyze_fetched(FetchState state,
                    std::span<const StreamPoint> points,
                    const AnalysisRequest& request) const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Stages after validation, shared by row and column entry points.
    [[nodiscard]] AnalysisOutcome
    run_pipeline(ValidationReport report,
                 const AnalysisRequest& request,
                 std::chrono::steady_clock::time_point started) const noexcept;

    /// True when the budget measured from `started` is spent.
    [[nodiscard]] bool
    over_budget(std::chrono::steady_clock::time_point started) const noexcept;

    EngineConfig       config_;
    SegmentationEngine segmenter_;
    MomentDetector     detector_;
    TrustGate          gate_;
};

}  // namespace runstream
