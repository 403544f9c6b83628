/// @file src/core/errors.cpp
/// @brief Error codes, fetch states and the retry policy.

#include "runstream/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace runstream {

const char* to_string(AnalysisErrorCode code) noexcept {
    switch (code) {
        case AnalysisErrorCode::StreamsNotFound:             return "STREAMS_NOT_FOUND";
        case AnalysisErrorCode::StreamsUnavailable:          return "STREAMS_UNAVAILABLE";
        case AnalysisErrorCode::PartialChannelsInsufficient: return "PARTIAL_CHANNELS_INSUFFICIENT";
        case AnalysisErrorCode::MalformedStreamData:         return "MALFORMED_STREAM_DATA";
        case AnalysisErrorCode::AnalysisTimeout:             return "ANALYSIS_TIMEOUT";
        case AnalysisErrorCode::PlanDataMissing:             return "PLAN_DATA_MISSING";
    }
    return "UNKNOWN";
}

const char* to_string(FetchState state) noexcept {
    switch (state) {
        case FetchState::Success:     return "success";
        case FetchState::Pending:     return "pending";
        case FetchState::Fetching:    return "fetching";
        case FetchState::Failed:      return "failed";
        case FetchState::Deferred:    return "deferred";
        case FetchState::Unavailable: return "unavailable";
    }
    return "unknown";
}

bool is_retryable(FetchState state) noexcept {
    switch (state) {
        case FetchState::Pending:
        case FetchState::Fetching:
        case FetchState::Failed:
        case FetchState::Deferred:
            return true;
        case FetchState::Success:
        case FetchState::Unavailable:
            return false;
    }
    return false;
}

// ─── AnalysisError ────────────────────────────────────────────────────────────

AnalysisError AnalysisError::make(AnalysisErrorCode code, std::string message) noexcept {
    return AnalysisError{
        .code      = code,
        .message   = std::move(message),
        .retryable = code == AnalysisErrorCode::AnalysisTimeout,
    };
}

AnalysisError AnalysisError::from_fetch_state(FetchState state) noexcept {
    if (state == FetchState::Unavailable) {
        return AnalysisError{
            .code      = AnalysisErrorCode::StreamsUnavailable,
            .message   = "activity has no streams at the provider",
            .retryable = false,
        };
    }
    return AnalysisError{
        .code      = AnalysisErrorCode::StreamsNotFound,
        .message   = fmt::format("streams not available yet (fetch state: {})",
                                 to_string(state)),
        .retryable = is_retryable(state),
    };
}

}  // namespace runstream
