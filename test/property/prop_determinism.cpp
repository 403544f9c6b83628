/**
 * @file  prop_determinism.cpp
 * @brief Property: the same input always serializes to the same bytes.
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_determinism
 *
 * Engine::analyze keeps no state between calls. Two engines, or one engine
 * called twice, must agree byte for byte on any stream, including streams
 * that fail validation.
 */

#include <rapidcheck.h>

#include "runstream/engine.hpp"
#include "runstream/serialize.hpp"
#include "fixtures/stream_fixtures.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace runstream;

int main() {
    rc::check(
        "determinism: repeated analysis gives identical JSON",
        []() {
            const auto n = *rc::gen::inRange<std::size_t>(1, 900);
            std::vector<StreamPoint> points;
            std::int64_t t = 0;
            double distance = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                const double v  = *rc::gen::inRange(0, 60) / 10.0;
                const double hr = *rc::gen::inRange(60, 200);
                points.push_back(fixtures::sample(t, distance, hr,
                                                  *rc::gen::inRange(150, 190), 50.0, v,
                                                  *rc::gen::inRange(-80, 80) / 10.0));
                distance += v;
                t += *rc::gen::inRange<std::int64_t>(1, 4);
            }
            AnalysisRequest request;
            if (*rc::gen::arbitrary<bool>()) {
                request.physiology = AthletePhysiologyContext{.threshold_hr = 168.0};
            }

            const std::string first = serialize::to_json(Engine{}.analyze(points, request));
            Engine engine;
            RC_ASSERT(serialize::to_json(engine.analyze(points, request)) == first);
            RC_ASSERT(serialize::to_json(engine.analyze(points, request)) == first);
        }
    );
    return 0;
}
