/// @file src/core/serialize.cpp
/// @brief Deterministic JSON rendering with nlohmann::ordered_json.

#include "runstream/serialize.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace runstream::serialize {

namespace {

/// Insertion-ordered, so keys come out in the order they are set.
using Json = nlohmann::ordered_json;

/// Compact output; invalid UTF-8 in messages is replaced, never thrown on.
std::string dump(const Json& j) {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

template <typename T>
Json optional_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    if constexpr (std::is_enum_v<T>) {
        return to_string(*v);
    } else {
        return *v;
    }
}

Json gated_json(const Gated<double>& g) {
    Json j;
    j["value"]             = optional_json(g.value);
    j["suppressed_reason"] = optional_json(g.suppressed_reason);
    return j;
}

template <typename Enum>
Json enum_list_json(const std::vector<Enum>& values) {
    Json j = Json::array();
    for (const auto v : values) j.push_back(to_string(v));
    return j;
}

Json segment_json(const Segment& s) {
    Json j;
    j["type"]          = to_string(s.type);
    j["start_index"]   = s.start_index;
    j["end_index"]     = s.end_index;
    j["start_time_s"]  = s.start_time_s;
    j["end_time_s"]    = s.end_time_s;
    j["duration_s"]    = s.duration_s;
    j["avg_pace_s_km"] = optional_json(s.avg_pace_s_km);
    j["avg_hr"]        = optional_json(s.avg_hr);
    j["avg_cadence"]   = optional_json(s.avg_cadence);
    j["avg_grade_pct"] = optional_json(s.avg_grade_pct);
    j["avg_effort"]    = s.avg_effort;
    return j;
}

Json drift_json(const DriftMetrics& d) {
    Json j;
    j["cardiac_drift_pct"]        = gated_json(d.cardiac_drift_pct);
    j["pace_drift_pct"]           = gated_json(d.pace_drift_pct);
    j["cadence_trend_bpm_per_km"] = gated_json(d.cadence_trend_bpm_per_km);
    j["split"]                    = to_string(d.split);
    j["hr_samples"]               = d.hr_samples;
    j["velocity_samples"]         = d.velocity_samples;
    j["cadence_samples"]          = d.cadence_samples;
    return j;
}

Json moment_json(const Moment& m) {
    Json j;
    j["type"]              = to_string(m.type);
    j["index"]             = m.index;
    j["time_s"]            = m.time_s;
    j["value"]             = optional_json(m.value.value);
    j["unit"]              = optional_json(m.unit);
    j["context"]           = optional_json(m.context);
    j["suppressed_reason"] = optional_json(m.value.suppressed_reason);
    return j;
}

Json plan_json(const PlanComparison& p) {
    Json j;
    j["planned_duration_min"]   = optional_json(p.planned_duration_min);
    j["actual_duration_min"]    = optional_json(p.actual_duration_min);
    j["duration_delta_min"]     = gated_json(p.duration_delta_min);
    j["planned_distance_km"]    = optional_json(p.planned_distance_km);
    j["actual_distance_km"]     = optional_json(p.actual_distance_km);
    j["distance_delta_km"]      = gated_json(p.distance_delta_km);
    j["planned_pace_s_km"]      = optional_json(p.planned_pace_s_km);
    j["actual_pace_s_km"]       = optional_json(p.actual_pace_s_km);
    j["pace_delta_s_km"]        = gated_json(p.pace_delta_s_km);
    j["planned_interval_count"] = optional_json(p.planned_interval_count);
    j["detected_work_count"]    = optional_json(p.detected_work_count);
    j["interval_count_match"]   = optional_json(p.interval_count_match);
    return j;
}

Json result_json(const StreamAnalysisResult& r) {
    Json j;
    j["point_count"]          = r.point_count;
    j["confidence"]           = r.confidence;
    j["tier_used"]            = to_string(r.tier_used);
    j["effort_source"]        = to_string(r.effort_source);
    j["cross_run_comparable"] = r.cross_run_comparable;
    j["estimated_flags"]      = enum_list_json(r.estimated_flags);
    j["channels_present"]     = enum_list_json(r.channels_present);
    j["channels_missing"]     = enum_list_json(r.channels_missing);
    j["hr_reliable"]          = r.hr_reliable;
    j["hr_issue"]             = optional_json(r.hr_issue);

    Json segments = Json::array();
    for (const auto& s : r.segments) segments.push_back(segment_json(s));
    j["segments"] = std::move(segments);

    j["drift"] = drift_json(r.drift);

    Json moments = Json::array();
    for (const auto& m : r.moments) moments.push_back(moment_json(m));
    j["moments"] = std::move(moments);

    j["plan_comparison"] = r.plan_comparison ? plan_json(*r.plan_comparison) : Json(nullptr);

    // Non-finite values dump as null.
    Json effort = Json::array();
    for (const double e : r.effort) effort.push_back(e);
    j["effort"] = std::move(effort);
    return j;
}

Json errors_json(std::span<const AnalysisError> errors) {
    Json j = Json::array();
    for (const auto& e : errors) {
        Json entry;
        entry["code"]      = to_string(e.code);
        entry["message"]   = e.message;
        entry["retryable"] = e.retryable;
        j.push_back(std::move(entry));
    }
    return j;
}

}  // namespace

std::string to_json(const StreamAnalysisResult& result) {
    return dump(result_json(result));
}

std::string to_json(std::span<const AnalysisError> errors) {
    return dump(errors_json(errors));
}

std::string to_json(const AnalysisOutcome& outcome) {
    Json j;
    j["result"] = outcome.result() ? result_json(*outcome.result()) : Json(nullptr);
    j["errors"] = errors_json(outcome.errors());
    return dump(j);
}

}  // namespace runstream::serialize
