#pragma once

/// @file include/runstream/errors.hpp
/// @brief Closed error taxonomy and retry policy.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name every way an analysis call can fail and decide, per failure, whether
/// the caller may retry. The engine itself never retries.
///
/// | Code                          | Retryable                              |
/// |-------------------------------|----------------------------------------|
/// | STREAMS_NOT_FOUND             | iff fetch is pending/fetching/failed/deferred |
/// | STREAMS_UNAVAILABLE           | no                                     |
/// | PARTIAL_CHANNELS_INSUFFICIENT | no                                     |
/// | MALFORMED_STREAM_DATA         | no                                     |
/// | ANALYSIS_TIMEOUT              | yes                                    |
/// | PLAN_DATA_MISSING             | no                                     |

#include <string>

namespace runstream {

// ─── AnalysisErrorCode ────────────────────────────────────────────────────────

enum class AnalysisErrorCode {
    StreamsNotFound,
    StreamsUnavailable,
    PartialChannelsInsufficient,
    MalformedStreamData,
    AnalysisTimeout,
    PlanDataMissing,
};

/// Upper-snake wire name, e.g. "MALFORMED_STREAM_DATA".
[[nodiscard]] const char* to_string(AnalysisErrorCode code) noexcept;

// ─── FetchState ───────────────────────────────────────────────────────────────

/// State of the upstream stream-fetch pipeline for one activity.
enum class FetchState {
    Success,
    Pending,
    Fetching,
    Failed,
    Deferred,
    Unavailable,
};

[[nodiscard]] const char* to_string(FetchState state) noexcept;

/// True when waiting on the fetch pipeline may still yield streams.
[[nodiscard]] bool is_retryable(FetchState state) noexcept;

// ─── AnalysisError ────────────────────────────────────────────────────────────

/// A typed, machine-actionable failure. `message` is for developers only.
struct AnalysisError {
    AnalysisErrorCode code;
    std::string       message;
    bool              retryable = false;

    /// Build an error whose retryability is fixed by its code.
    ///
    /// `StreamsNotFound` has no fixed policy; use `streams_not_found()`.
    [[nodiscard]] static AnalysisError make(AnalysisErrorCode code,
                                            std::string message) noexcept;

    /// Map a non-success fetch state onto STREAMS_NOT_FOUND or
    /// STREAMS_UNAVAILABLE with the matching retry policy.
    [[nodiscard]] static AnalysisError from_fetch_state(FetchState state) noexcept;
};

}  // namespace runstream
