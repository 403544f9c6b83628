/**
 * @file  fuzz_analyze.cpp
 * @brief libFuzzer target for CSV loading plus the full analysis pipeline
 *
 * Build:
 *   cmake -DRUNSTREAM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_analyze
 *
 * Run for 60 seconds:
 *   ./fuzz_analyze -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The outcome holds a result xor exactly one error.
 *   3. If a result is returned:
 *      a. every effort value is in [0, 1]
 *      b. segments tile [0, point_count)
 *      c. confidence is in [0, 1]
 *   4. Serialization never fails and is repeatable.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "runstream/data_loader.hpp"
#include "runstream/engine.hpp"
#include "runstream/serialize.hpp"

using namespace runstream;

namespace {

void check(bool condition) {
    if (!condition) std::abort();
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto loaded = DataLoader::parse_csv_string(input);

    AnalysisRequest request;
    request.declared_channels = loaded.columns;
    if (size > 0 && (data[0] & 1u)) {
        request.physiology = AthletePhysiologyContext{.threshold_hr = 170.0};
    }

    EngineConfig config;
    config.time_budget = std::chrono::milliseconds{60'000};
    const Engine engine(config);
    const auto outcome = engine.analyze(loaded.points, request);

    check(outcome.ok() != !outcome.errors().empty());
    if (outcome.ok()) {
        check(outcome.errors().empty());
        const auto& r = *outcome.result();
        for (double e : r.effort) check(e >= 0.0 && e <= 1.0);
        check(r.confidence >= 0.0 && r.confidence <= 1.0);
        if (r.point_count > 0) {
            check(!r.segments.empty());
            check(r.segments.front().start_index == 0);
            check(r.segments.back().end_index == r.point_count - 1);
            for (std::size_t i = 1; i < r.segments.size(); ++i) {
                check(r.segments[i].start_index == r.segments[i - 1].end_index + 1);
            }
        }
    } else {
        check(outcome.errors().size() == 1);
    }

    check(serialize::to_json(outcome) == serialize::to_json(outcome));
    return 0;
}
