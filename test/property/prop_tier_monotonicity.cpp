/**
 * @file  prop_tier_monotonicity.cpp
 * @brief Property: more physiological context never yields a weaker tier
 *        or a lower confidence.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_tier_monotonicity
 *
 * Tiers are ordered Tier1 (threshold HR) < Tier2 (resting + max HR) <
 * Tier3 (max HR) < Tier4 (stream relative). Adding a usable field to the
 * context may only move the tier toward Tier1. Confidence follows the tier
 * and shrinks as optional channels go missing.
 */

#include <rapidcheck.h>

#include "runstream/effort.hpp"

#include <cstddef>
#include <optional>

using namespace runstream;

int main() {
    // ── Property 1: adding a field never weakens the tier ────────────────────
    rc::check(
        "tier_monotonicity: superset context gives an equal or stronger tier",
        []() {
            AthletePhysiologyContext base;
            if (*rc::gen::arbitrary<bool>()) base.threshold_hr = *rc::gen::inRange(120, 200);
            if (*rc::gen::arbitrary<bool>()) base.resting_hr   = *rc::gen::inRange(35, 80);
            if (*rc::gen::arbitrary<bool>()) base.max_hr       = *rc::gen::inRange(160, 215);

            AthletePhysiologyContext richer = base;
            switch (*rc::gen::inRange(0, 3)) {
                case 0: richer.threshold_hr = *rc::gen::inRange(120, 200); break;
                case 1: richer.max_hr       = *rc::gen::inRange(160, 215); break;
                default:
                    richer.resting_hr = *rc::gen::inRange(35, 80);
                    richer.max_hr     = *rc::gen::inRange(160, 215);
                    break;
            }

            const auto before = EffortNormalizer::resolve_tier(base, true);
            const auto after  = EffortNormalizer::resolve_tier(richer, true);
            RC_ASSERT(static_cast<int>(after) <= static_cast<int>(before));
        }
    );

    // ── Property 2: unusable HR always means Tier4 ───────────────────────────
    rc::check(
        "tier_monotonicity: unusable HR is stream relative",
        []() {
            AthletePhysiologyContext physio;
            physio.threshold_hr = *rc::gen::inRange(120, 200);
            physio.max_hr       = *rc::gen::inRange(160, 215);
            RC_ASSERT(EffortNormalizer::resolve_tier(physio, false) ==
                      EffortTier::Tier4StreamRelative);
            RC_ASSERT(EffortNormalizer::resolve_tier(std::nullopt, true) ==
                      EffortTier::Tier4StreamRelative);
        }
    );

    // ── Property 3: confidence ordered by tier, discounted by missing ────────
    rc::check(
        "tier_monotonicity: confidence falls with tier and missing channels",
        []() {
            const auto missing = *rc::gen::inRange<std::size_t>(0, 6);
            const auto t = *rc::gen::inRange(0, 3);
            const auto stronger = static_cast<EffortTier>(t);
            const auto weaker   = static_cast<EffortTier>(t + 1);
            RC_ASSERT(EffortNormalizer::confidence(stronger, missing) >
                      EffortNormalizer::confidence(weaker, missing));
            RC_ASSERT(EffortNormalizer::confidence(stronger, missing + 1) <=
                      EffortNormalizer::confidence(stronger, missing));
        }
    );

    return 0;
}
