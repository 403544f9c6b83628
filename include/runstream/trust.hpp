#pragma once

/// @file include/runstream/trust.hpp
/// @brief TrustGate: withholds directional interpretation of weak facts.
///
/// # Module: Trust Gate
///
/// ## Responsibility
/// One post-processing pass over an assembled result. For every gated field
/// the gate looks up the metric's registry entry and records the first
/// failing precondition as `suppressed_reason`, or clears the reason when
/// all pass. Values are never deleted.
///
/// ## Precondition order
/// 1. `unregistered_metric` / `invalid_metadata` (fail closed)
/// 2. `source_channel_missing`
/// 3. `plan_target_missing`
/// 4. `hr_unreliable`
/// 5. `insufficient_samples`
/// 6. `stream_relative_tier`
/// 7. `low_confidence`

#include "runstream/constants.hpp"
#include "runstream/result.hpp"
#include "runstream/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace runstream {

// ─── Metric Registry ──────────────────────────────────────────────────────────

/// Declared interpretation rules for one output metric.
///
/// `polarity_ambiguous` and `higher_is_better` must agree: an ambiguous
/// metric has no preferred direction, an unambiguous one must name it.
/// A stream-relative (tier 4) result never carries a directional claim
/// unless an entry opts out of `requires_comparable_tier`.
struct MetricMeta {
    std::string         key;
    bool                polarity_ambiguous = true;
    std::optional<bool> higher_is_better;
    std::size_t         min_samples = 0;
    bool                requires_hr = false;
    bool                requires_comparable_tier = true;
};

class MetricRegistry {
public:
    /// Registry covering every gated field the engine emits.
    [[nodiscard]] static MetricRegistry defaults();

    /// Insert or replace an entry.
    void add(MetricMeta meta);

    [[nodiscard]] std::optional<MetricMeta> find(std::string_view key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// True when the polarity fields are consistent and the key is set.
    [[nodiscard]] static bool is_consistent(const MetricMeta& meta) noexcept;

    /// Registry key for a moment type, e.g. "moment.pace_surge".
    [[nodiscard]] static std::string moment_key(MomentType type);

private:
    std::map<std::string, MetricMeta, std::less<>> entries_;
};

// ─── TrustGate ────────────────────────────────────────────────────────────────

struct TrustConfig {
    double min_confidence = constants::MIN_INTERPRETABLE_CONFIDENCE;
};

/// Facts about one gated field that the preconditions are checked against.
///
/// For plan variances `value_present` describes the actual side and
/// `plan_target_present` the planned side.
struct TrustEvidence {
    bool        value_present       = false;
    bool        plan_target_present = true;
    bool        hr_reliable         = false;
    std::size_t samples             = 0;
    EffortTier  tier                = EffortTier::Tier4StreamRelative;
    double      confidence          = 0.0;
};

class TrustGate {
public:
    explicit TrustGate(TrustConfig config = TrustConfig{},
                       MetricRegistry registry = MetricRegistry::defaults());

    /// Annotate every gated field of `result` in place.
    void apply(StreamAnalysisResult& result) const noexcept;

    /// First failing precondition for `key`, or `nullopt` when interpretable.
    [[nodiscard]] std::optional<SuppressionReason>
    evaluate(std::string_view key, const TrustEvidence& evidence) const noexcept;

    [[nodiscard]] const MetricRegistry& registry() const noexcept { return registry_; }

private:
    template <typename T>
    void gate(Gated<T>& field, std::string_view key, TrustEvidence evidence) const noexcept {
        evidence.value_present = field.value.has_value();
        field.suppressed_reason = evaluate(key, evidence);
    }

    TrustConfig    config_;
    MetricRegistry registry_;
};

}  // namespace runstream
