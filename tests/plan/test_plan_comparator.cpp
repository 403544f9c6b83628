/// @file tests/plan/test_plan_comparator.cpp
/// @brief Unit tests for PlanComparator.
///
/// Tests cover:
///   - No plan linked
///   - Duration, distance and pace deltas
///   - Null deltas when either side is unknown
///   - Interval count match

#include "runstream/plan.hpp"
#include "fixtures/stream_fixtures.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace runstream;

namespace {

std::vector<Segment> segments_of_types(std::initializer_list<SegmentType> types) {
    std::vector<Segment> out;
    std::size_t i = 0;
    for (auto type : types) {
        out.push_back(Segment{.type = type, .start_index = i, .end_index = i});
        ++i;
    }
    return out;
}

} // anonymous namespace

TEST(PlanComparatorTest, no_plan_gives_no_comparison) {
    const auto series = fixtures::series_of(fixtures::constant_run(600));
    EXPECT_FALSE(PlanComparator::compare(series, {}, std::nullopt).has_value());
}

TEST(PlanComparatorTest, totals_and_deltas) {
    // 2401 samples at 3 m/s: 40 min elapsed, 7.2 km, 333.3 s/km.
    const auto series = fixtures::series_of(fixtures::constant_run(2401, 3.0));
    const PlannedWorkout plan{.duration_min = 45.0, .distance_km = 8.0, .pace_s_km = 330.0};
    const auto cmp = PlanComparator::compare(series, {}, plan);
    ASSERT_TRUE(cmp.has_value());

    EXPECT_DOUBLE_EQ(*cmp->actual_duration_min, 40.0);
    EXPECT_DOUBLE_EQ(*cmp->duration_delta_min.value, -5.0);

    EXPECT_DOUBLE_EQ(*cmp->actual_distance_km, 7.2);
    EXPECT_NEAR(*cmp->distance_delta_km.value, -0.8, 1e-9);

    EXPECT_DOUBLE_EQ(*cmp->actual_pace_s_km, 333.3);
    EXPECT_NEAR(*cmp->pace_delta_s_km.value, 3.3, 1e-9);
}

TEST(PlanComparatorTest, unknown_plan_fields_give_null_deltas) {
    const auto series = fixtures::series_of(fixtures::constant_run(600));
    const PlannedWorkout plan{.duration_min = 10.0};
    const auto cmp = PlanComparator::compare(series, {}, plan);
    ASSERT_TRUE(cmp.has_value());
    EXPECT_TRUE(cmp->duration_delta_min.value.has_value());
    EXPECT_FALSE(cmp->planned_distance_km.has_value());
    EXPECT_FALSE(cmp->distance_delta_km.value.has_value());
    EXPECT_FALSE(cmp->pace_delta_s_km.value.has_value());
    // Actuals are still reported.
    EXPECT_TRUE(cmp->actual_distance_km.has_value());
    EXPECT_FALSE(cmp->interval_count_match.has_value());
}

TEST(PlanComparatorTest, non_positive_plan_values_are_unknown) {
    const auto series = fixtures::series_of(fixtures::constant_run(600));
    const PlannedWorkout plan{.duration_min = 0.0, .distance_km = -1.0};
    const auto cmp = PlanComparator::compare(series, {}, plan);
    ASSERT_TRUE(cmp.has_value());
    EXPECT_FALSE(cmp->planned_duration_min.has_value());
    EXPECT_FALSE(cmp->duration_delta_min.value.has_value());
    EXPECT_FALSE(cmp->distance_delta_km.value.has_value());
}

TEST(PlanComparatorTest, missing_distance_gives_null_distance) {
    const auto series = fixtures::series_of(
        fixtures::without(fixtures::constant_run(600), false, false, false, false, true));
    const PlannedWorkout plan{.distance_km = 2.0, .pace_s_km = 330.0};
    const auto cmp = PlanComparator::compare(series, {}, plan);
    ASSERT_TRUE(cmp.has_value());
    EXPECT_FALSE(cmp->actual_distance_km.has_value());
    EXPECT_FALSE(cmp->distance_delta_km.value.has_value());
    // Pace still comes from velocity.
    EXPECT_TRUE(cmp->pace_delta_s_km.value.has_value());
}

TEST(PlanComparatorTest, pace_from_distance_without_velocity) {
    const auto series = fixtures::series_of(
        fixtures::without(fixtures::constant_run(1001, 4.0), false, false, false, true));
    const auto pace = PlanComparator::actual_pace_s_km(series);
    ASSERT_TRUE(pace.has_value());
    EXPECT_DOUBLE_EQ(*pace, 250.0);
}

// ─── Interval count ───────────────────────────────────────────────────────────

TEST(PlanComparatorTest, interval_count_matches_work_segments) {
    const auto series = fixtures::series_of(fixtures::constant_run(600));
    const auto segments = segments_of_types({SegmentType::Warmup, SegmentType::Work,
                                             SegmentType::Recovery, SegmentType::Work,
                                             SegmentType::Cooldown});
    const auto cmp = PlanComparator::compare(series, segments, PlannedWorkout{.interval_count = 2});
    ASSERT_TRUE(cmp.has_value());
    EXPECT_EQ(cmp->detected_work_count, 2);
    EXPECT_EQ(cmp->interval_count_match, true);
}

TEST(PlanComparatorTest, interval_count_mismatch) {
    const auto series = fixtures::series_of(fixtures::constant_run(600));
    const auto segments = segments_of_types({SegmentType::Steady});
    const auto cmp = PlanComparator::compare(series, segments, PlannedWorkout{.interval_count = 6});
    ASSERT_TRUE(cmp.has_value());
    EXPECT_EQ(cmp->detected_work_count, 0);
    EXPECT_EQ(cmp->interval_count_match, false);
}
