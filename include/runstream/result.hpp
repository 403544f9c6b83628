#pragma once

/// @file include/runstream/result.hpp
/// @brief StreamAnalysisResult and the result-xor-errors AnalysisOutcome.

#include "runstream/drift.hpp"
#include "runstream/errors.hpp"
#include "runstream/moments.hpp"
#include "runstream/plan.hpp"
#include "runstream/segmentation.hpp"
#include "runstream/types.hpp"
#include "runstream/validator.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace runstream {

// ─── StreamAnalysisResult ─────────────────────────────────────────────────────

struct StreamAnalysisResult {
    std::vector<Segment>          segments;
    DriftMetrics                  drift;
    std::vector<Moment>           moments;
    std::optional<PlanComparison> plan_comparison;
    std::vector<Channel>          channels_present;
    std::vector<Channel>          channels_missing;
    std::size_t                   point_count = 0;
    double                        confidence  = 0.0;
    EffortTier                    tier_used   = EffortTier::Tier4StreamRelative;
    EffortSource                  effort_source = EffortSource::Heartrate;
    std::vector<EstimatedFlag>    estimated_flags;
    bool                          cross_run_comparable = false;
    std::vector<double>           effort;
    bool                          hr_reliable = false;
    std::optional<HrIssue>        hr_issue;
};

// ─── AnalysisOutcome ──────────────────────────────────────────────────────────

/// Exactly one of: a result with no errors, or errors with no result.
class AnalysisOutcome {
public:
    [[nodiscard]] static AnalysisOutcome success(StreamAnalysisResult result) noexcept;
    [[nodiscard]] static AnalysisOutcome failure(AnalysisError error) noexcept;

    [[nodiscard]] bool ok() const noexcept { return result_.has_value(); }

    [[nodiscard]] const std::optional<StreamAnalysisResult>& result() const noexcept {
        return result_;
    }

    [[nodiscard]] const std::vector<AnalysisError>& errors() const noexcept {
        return errors_;
    }

private:
    AnalysisOutcome() = default;

    std::optional<StreamAnalysisResult> result_;
    std::vector<AnalysisError>          errors_;
};

}  // namespace runstream
