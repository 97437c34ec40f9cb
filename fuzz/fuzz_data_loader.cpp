/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV feed parsers and the Engine pipeline
 *
 * Build:
 *   cmake -DPARLAY_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed prop and prediction carries finite numbers.
 *   3. Every graded leg has grade ∈ [0, 1] and hit probabilities that sum
 *      to 1.
 *   4. Every priced parlay has decimal odds ∈ [1, base] and no duplicate
 *      player + stat key.
 *   5. InvalidOdds is the only exception that may escape Engine::analyze,
 *      and only when a graded leg is priced at 0.
 *
 * Fuzzer strategy:
 *   The input is split at the first "===" line: the part before it is the
 *   prop feed, the part after it the prediction feed. The whole input is
 *   also parsed as context and injury feeds. This exercises:
 *     • Binary garbage (null bytes, high bytes)
 *     • "NaN", "inf", "1e308" numeric cells
 *     • Ragged rows, trailing commas, CRLF line endings
 *     • Odds of 0 and integer overflow in odds cells
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "parlay/data_loader.hpp"
#include "parlay/engine.hpp"
#include "parlay/odds.hpp"

using namespace parlay;
using namespace parlay::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto split = input.find("\n===\n");
    const std::string_view prop_csv =
        split == std::string_view::npos ? input : input.substr(0, split);
    const std::string_view pred_csv =
        split == std::string_view::npos ? std::string_view{} : input.substr(split + 5);

    GameSlate slate;
    slate.props            = DataLoader::parse_props(prop_csv);
    slate.predictions      = DataLoader::parse_predictions(pred_csv);
    slate.context          = DataLoader::parse_context(input);
    slate.context.injuries = DataLoader::parse_injuries(input);

    // Invariant 2: parsers only emit finite numbers
    for (const auto& p : slate.props) {
        assert(std::isfinite(p.line));
        assert(!p.player_id.empty());
    }
    for (const auto& p : slate.predictions) {
        assert(std::isfinite(p.predicted));
        assert(std::isfinite(p.edge));
    }

    const Engine engine;

    // Invariant 3: graded legs
    const auto legs = engine.grade_props(slate);
    for (const auto& leg : legs) {
        assert(leg.grade >= 0.0 && leg.grade <= 1.0);
        assert(std::abs(leg.over_hit_prob + leg.under_hit_prob - 1.0) < 1e-12);
        assert(leg.strength >= 0.0);
    }

    // Invariant 4: priced parlays
    try {
        const auto analysis = engine.analyze(slate);
        for (const auto& p : analysis.parlays) {
            assert(p.decimal_odds >= 1.0);
            assert(p.decimal_odds <= p.base_decimal + 1e-9);
            assert(p.discount_factor >= 0.65 && p.discount_factor <= 0.95 + 1e-12);

            std::set<std::string> keys;
            for (const auto& leg : p.candidate.legs) {
                assert(leg.recommended != Side::Push);
                const bool inserted = keys.insert(leg.key()).second;
                assert(inserted);
                (void)inserted;
            }
        }
    } catch (const InvalidOdds&) {
        // Invariant 5: only a leg priced at 0 makes analyze throw
        const bool zero_odds = std::any_of(legs.begin(), legs.end(),
            [](const Leg& leg) { return leg.recommended_odds.value == 0; });
        assert(zero_odds);
        (void)zero_odds;
    }

    return 0;
}
