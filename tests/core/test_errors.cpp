/// @file tests/core/test_errors.cpp
/// @brief Unit tests for the error taxonomy and retry policy.

#include "runstream/errors.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace runstream;

TEST(ErrorsTest, wire_names) {
    EXPECT_STREQ(to_string(AnalysisErrorCode::StreamsNotFound), "STREAMS_NOT_FOUND");
    EXPECT_STREQ(to_string(AnalysisErrorCode::PartialChannelsInsufficient),
                 "PARTIAL_CHANNELS_INSUFFICIENT");
    EXPECT_STREQ(to_string(AnalysisErrorCode::MalformedStreamData), "MALFORMED_STREAM_DATA");
    EXPECT_STREQ(to_string(AnalysisErrorCode::AnalysisTimeout), "ANALYSIS_TIMEOUT");
    EXPECT_STREQ(to_string(AnalysisErrorCode::PlanDataMissing), "PLAN_DATA_MISSING");
}

TEST(ErrorsTest, only_timeout_is_retryable_by_code) {
    EXPECT_TRUE(AnalysisError::make(AnalysisErrorCode::AnalysisTimeout, "t").retryable);
    for (auto code : {AnalysisErrorCode::StreamsUnavailable,
                      AnalysisErrorCode::PartialChannelsInsufficient,
                      AnalysisErrorCode::MalformedStreamData,
                      AnalysisErrorCode::PlanDataMissing}) {
        EXPECT_FALSE(AnalysisError::make(code, "x").retryable) << to_string(code);
    }
}

TEST(ErrorsTest, make_keeps_message) {
    const auto e = AnalysisError::make(AnalysisErrorCode::MalformedStreamData, "time went back");
    EXPECT_EQ(e.code, AnalysisErrorCode::MalformedStreamData);
    EXPECT_EQ(e.message, "time went back");
}

// ─── Fetch states ─────────────────────────────────────────────────────────────

TEST(FetchStateTest, transient_states_are_retryable) {
    for (auto state : {FetchState::Pending, FetchState::Fetching,
                       FetchState::Failed, FetchState::Deferred}) {
        const auto e = AnalysisError::from_fetch_state(state);
        EXPECT_EQ(e.code, AnalysisErrorCode::StreamsNotFound) << to_string(state);
        EXPECT_TRUE(e.retryable) << to_string(state);
    }
}

TEST(FetchStateTest, unavailable_is_terminal) {
    const auto e = AnalysisError::from_fetch_state(FetchState::Unavailable);
    EXPECT_EQ(e.code, AnalysisErrorCode::StreamsUnavailable);
    EXPECT_FALSE(e.retryable);
    EXPECT_FALSE(is_retryable(FetchState::Unavailable));
    EXPECT_FALSE(is_retryable(FetchState::Success));
}

TEST(FetchStateTest, message_names_the_state) {
    const auto e = AnalysisError::from_fetch_state(FetchState::Deferred);
    EXPECT_NE(e.message.find("deferred"), std::string::npos);
}
