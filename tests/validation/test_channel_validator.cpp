/// @file tests/validation/test_channel_validator.cpp
/// @brief Unit tests for ChannelValidator structural rules and gap filling.
///
/// Tests cover:
///   - Point count and time ordering
///   - Out-of-range samples and distance regression
///   - Coverage threshold and declared channel sets
///   - Forward fill of gaps
///   - Effort-source requirement (PARTIAL_CHANNELS_INSUFFICIENT)
///   - Column form: length mismatch and NaN gaps

#include "runstream/validator.hpp"
#include "fixtures/stream_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace runstream;

namespace {

bool contains(const std::vector<Channel>& set, Channel c) {
    return std::find(set.begin(), set.end(), c) != set.end();
}

std::vector<StreamPoint> two_velocity_points() {
    return {
        StreamPoint{.time_s = 0, .velocity_mps = 3.0},
        StreamPoint{.time_s = 1, .velocity_mps = 3.1},
    };
}

} // anonymous namespace

// ─── Structural rules ─────────────────────────────────────────────────────────

TEST(ChannelValidatorTest, empty_stream_is_malformed) {
    std::vector<StreamPoint> empty;
    auto report = ChannelValidator::validate(empty);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::MalformedStreamData);
    EXPECT_FALSE(report.error->retryable);
}

TEST(ChannelValidatorTest, single_point_is_malformed) {
    std::vector<StreamPoint> one{StreamPoint{.time_s = 0, .velocity_mps = 3.0}};
    auto report = ChannelValidator::validate(one);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::MalformedStreamData);
}

TEST(ChannelValidatorTest, two_points_are_enough) {
    auto report = ChannelValidator::validate(two_velocity_points());
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.series.size(), 2u);
}

TEST(ChannelValidatorTest, non_monotonic_time_is_malformed) {
    auto points = fixtures::constant_run(120);
    std::swap(points[50].time_s, points[51].time_s);
    auto report = ChannelValidator::validate(points);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::MalformedStreamData);
}

TEST(ChannelValidatorTest, duplicate_time_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[10].time_s = points[9].time_s;
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, negative_time_is_malformed) {
    std::vector<StreamPoint> points{
        StreamPoint{.time_s = -1, .velocity_mps = 3.0},
        StreamPoint{.time_s = 0,  .velocity_mps = 3.0},
    };
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, point_without_any_channel_is_malformed) {
    auto points = two_velocity_points();
    points.push_back(StreamPoint{.time_s = 2});
    auto report = ChannelValidator::validate(points);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::MalformedStreamData);
}

// ─── Range checks ─────────────────────────────────────────────────────────────

TEST(ChannelValidatorTest, heart_rate_above_limit_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[7].heartrate_bpm = 300.0;
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, negative_velocity_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[7].velocity_mps = -0.5;
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, non_finite_sample_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[3].cadence_spm = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, grade_beyond_limit_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[3].grade_pct = -75.0;
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, distance_regression_beyond_tolerance_is_malformed) {
    auto points = fixtures::constant_run(120);
    points[60].distance_m = *points[59].distance_m - 5.0;
    EXPECT_FALSE(ChannelValidator::validate(points).ok());
}

TEST(ChannelValidatorTest, distance_jitter_within_tolerance_is_accepted) {
    auto points = fixtures::constant_run(120);
    points[60].distance_m = *points[59].distance_m - 0.5;
    EXPECT_TRUE(ChannelValidator::validate(points).ok());
}

// ─── Coverage and declared channels ───────────────────────────────────────────

TEST(ChannelValidatorTest, full_stream_reports_every_channel_present) {
    auto report = ChannelValidator::validate(fixtures::constant_run(120));
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.channels_present.size(), 7u);
    EXPECT_TRUE(contains(report.channels_present, Channel::Time));
    EXPECT_TRUE(report.channels_missing.empty());
}

TEST(ChannelValidatorTest, sparse_channel_below_coverage_is_missing) {
    auto points = fixtures::constant_run(100);
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i % 5 == 0) points[i].cadence_spm.reset();  // 80 % coverage
    }
    auto report = ChannelValidator::validate(points);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(contains(report.channels_missing, Channel::Cadence));
    EXPECT_FALSE(report.series.cadence_spm.has_value());
}

TEST(ChannelValidatorTest, channel_at_coverage_threshold_is_usable) {
    auto points = fixtures::constant_run(100);
    for (std::size_t i = 0; i < 10; ++i) points[i * 10].cadence_spm.reset();  // 90 %
    auto report = ChannelValidator::validate(points);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(contains(report.channels_present, Channel::Cadence));
}

TEST(ChannelValidatorTest, undeclared_channel_is_missing_even_when_sampled) {
    const std::vector<Channel> declared{Channel::Time, Channel::Heartrate, Channel::Velocity};
    auto report = ChannelValidator::validate(fixtures::constant_run(120), declared);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(contains(report.channels_missing, Channel::Altitude));
    EXPECT_TRUE(contains(report.channels_missing, Channel::Cadence));
    EXPECT_FALSE(report.series.altitude_m.has_value());
    EXPECT_TRUE(report.series.heartrate_bpm.has_value());
}

TEST(ChannelValidatorTest, gaps_are_forward_filled) {
    auto points = fixtures::constant_run(100);
    points[0].heartrate_bpm.reset();
    points[1].heartrate_bpm = 140.0;
    points[2].heartrate_bpm.reset();
    points[3].heartrate_bpm.reset();
    auto report = ChannelValidator::validate(points);
    ASSERT_TRUE(report.ok());
    const auto& hr = *report.series.heartrate_bpm;
    EXPECT_DOUBLE_EQ(hr[0], 140.0);  // leading gap takes the first sample
    EXPECT_DOUBLE_EQ(hr[2], 140.0);
    EXPECT_DOUBLE_EQ(hr[3], 140.0);
    EXPECT_DOUBLE_EQ(hr[4], 150.0);
}

// ─── Effort source ────────────────────────────────────────────────────────────

TEST(ChannelValidatorTest, no_heart_rate_and_no_velocity_is_insufficient) {
    auto points = fixtures::without(fixtures::constant_run(120),
                                    /*heartrate=*/true, false, false, /*velocity=*/true);
    auto report = ChannelValidator::validate(points);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::PartialChannelsInsufficient);
    EXPECT_FALSE(report.error->retryable);
}

TEST(ChannelValidatorTest, velocity_alone_is_sufficient) {
    auto points = fixtures::without(fixtures::constant_run(120), true, true, true);
    auto report = ChannelValidator::validate(points);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(contains(report.channels_missing, Channel::Heartrate));
}

// ─── Column form ──────────────────────────────────────────────────────────────

TEST(ChannelValidatorTest, column_length_mismatch_is_malformed) {
    ChannelArrays columns;
    columns.time_s = {0, 1, 2};
    columns.velocity_mps = std::vector<double>{3.0, 3.0};
    auto report = ChannelValidator::validate_columns(columns);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error->code, AnalysisErrorCode::MalformedStreamData);
    EXPECT_FALSE(ChannelValidator::to_points(columns).has_value());
}

TEST(ChannelValidatorTest, column_nan_is_a_missing_sample) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ChannelArrays columns;
    columns.time_s = {0, 1, 2};
    columns.velocity_mps = std::vector<double>{3.0, nan, 3.2};

    auto points = ChannelValidator::to_points(columns);
    ASSERT_TRUE(points.has_value());
    ASSERT_EQ(points->size(), 3u);
    EXPECT_FALSE((*points)[1].velocity_mps.has_value());
    EXPECT_FALSE((*points)[1].heartrate_bpm.has_value());
}

TEST(ChannelValidatorTest, columns_and_rows_validate_identically) {
    const auto rows = fixtures::constant_run(200);
    ChannelArrays columns;
    std::vector<double> hr, v;
    for (const auto& p : rows) {
        columns.time_s.push_back(p.time_s);
        hr.push_back(*p.heartrate_bpm);
        v.push_back(*p.velocity_mps);
    }
    columns.heartrate_bpm = hr;
    columns.velocity_mps = v;

    auto from_columns = ChannelValidator::validate_columns(columns);
    auto from_rows = ChannelValidator::validate(
        fixtures::without(rows, false, true, true, false, true, true));
    ASSERT_TRUE(from_columns.ok());
    ASSERT_TRUE(from_rows.ok());
    EXPECT_EQ(from_columns.series.heartrate_bpm, from_rows.series.heartrate_bpm);
    EXPECT_EQ(from_columns.channels_missing, from_rows.channels_missing);
}
