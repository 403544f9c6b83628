/**
 * @file  prop_effort_clamp.cpp
 * @brief Property: every effort value lies in [0, 1] for any tier and stream.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_effort_clamp
 *
 * Effort is a fraction of the athlete's reference intensity. Values above
 * threshold or below the stream minimum are clamped, so no combination of
 * heart rate, velocity, grade or physiology may push a point out of range.
 */

#include <rapidcheck.h>

#include "runstream/effort.hpp"
#include "fixtures/stream_fixtures.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

using namespace runstream;

namespace {

std::vector<StreamPoint> random_stream(const std::vector<double>& hr,
                                       const std::vector<double>& velocity,
                                       const std::vector<double>& grade) {
    std::vector<StreamPoint> points;
    double distance = 0.0;
    for (std::size_t i = 0; i < hr.size(); ++i) {
        points.push_back(fixtures::sample(static_cast<std::int64_t>(i), distance, hr[i], 170.0,
                                          50.0, velocity[i], grade[i]));
        distance += velocity[i];
    }
    return points;
}

} // anonymous namespace

int main() {
    // ── Property 1: clamped for every tier ───────────────────────────────────
    rc::check(
        "effort_clamp: values in [0, 1] for arbitrary HR and physiology",
        []() {
            const auto n = *rc::gen::inRange<std::size_t>(2, 400);
            const auto hr = *rc::gen::container<std::vector<double>>(
                n, rc::gen::map(rc::gen::inRange(40, 220), [](int x) { return double(x); }));
            const auto velocity = *rc::gen::container<std::vector<double>>(
                n, rc::gen::map(rc::gen::inRange(0, 80), [](int x) { return x / 10.0; }));
            const auto grade = *rc::gen::container<std::vector<double>>(
                n, rc::gen::map(rc::gen::inRange(-300, 300), [](int x) { return x / 10.0; }));

            AthletePhysiologyContext physio;
            if (*rc::gen::arbitrary<bool>()) physio.threshold_hr = *rc::gen::inRange(120, 200);
            if (*rc::gen::arbitrary<bool>()) physio.resting_hr   = *rc::gen::inRange(35, 80);
            if (*rc::gen::arbitrary<bool>()) physio.max_hr       = *rc::gen::inRange(160, 215);
            const bool hr_usable = *rc::gen::arbitrary<bool>();

            const auto series = fixtures::series_of(random_stream(hr, velocity, grade));
            const auto effort = EffortNormalizer::normalize(series, physio, hr_usable);

            RC_ASSERT(effort.values.size() == n);
            for (double e : effort.values) {
                RC_ASSERT(std::isfinite(e));
                RC_ASSERT(e >= 0.0);
                RC_ASSERT(e <= 1.0);
            }
        }
    );

    // ── Property 2: percentile ranks are in (0, 1) ───────────────────────────
    rc::check(
        "effort_clamp: percentile ranks strictly inside (0, 1)",
        [](const std::vector<int>& raw) {
            RC_PRE(!raw.empty());
            std::vector<double> values(raw.begin(), raw.end());
            for (double r : EffortNormalizer::percentile_ranks(values)) {
                RC_ASSERT(r > 0.0);
                RC_ASSERT(r < 1.0);
            }
        }
    );

    return 0;
}
