/// @file src/core/engine.cpp
/// @brief Engine — pipeline orchestration for one game.

#include "parlay/engine.hpp"
#include "parlay/builder.hpp"
#include "parlay/grade.hpp"
#include "parlay/matcher.hpp"
#include "parlay/odds.hpp"
#include "parlay/pricer.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace parlay::core {

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{
    if (!std::isfinite(config_.stake) || config_.stake < constants::MIN_STAKE) {
        config_.stake = std::isfinite(config_.stake) ? constants::MIN_STAKE
                                                     : constants::DEFAULT_STAKE;
    }
}

// ─── Engine::grade_props ──────────────────────────────────────────────────────

std::vector<Leg> Engine::grade_props(const GameSlate& slate) const {
    const auto matched = PropMatcher::match(slate.props, slate.predictions);
    auto graded = GradeCalculator::grade_all(matched, slate.context);

    if (config_.verbose) {
        const auto pushes = std::count_if(graded.begin(), graded.end(),
            [](const Leg& l) { return l.recommended == Side::Push; });
        fmt::print(stderr,
                   "[parlay] {} props, {} predictions -> {} legs ({} push)\n",
                   slate.props.size(), slate.predictions.size(),
                   graded.size(), pushes);
    }

    return graded;
}

// ─── Engine::analyze ──────────────────────────────────────────────────────────

GameAnalysis Engine::analyze(const GameSlate& slate) const {
    GameAnalysis out;
    out.legs = grade_props(slate);

    const auto candidates = ParlayBuilder::build(out.legs);
    if (config_.verbose) {
        fmt::print(stderr, "[parlay] {} parlay variants built\n", candidates.size());
    }

    out.parlays.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        auto priced = ParlayPricer::price(candidate, config_.stake);
        if (!priced) {
            // Identify the leg whose price is unusable.
            for (const auto& leg : candidate.legs) {
                if (!OddsMath::isValid(leg.recommended_odds)) {
                    throw InvalidOdds(fmt::format(
                        "invalid odds {} for {} {} ({})",
                        leg.recommended_odds.value, leg.player_name,
                        leg.stat_label, candidate.id()));
                }
            }
            throw InvalidOdds(fmt::format(
                "cannot price parlay {}", candidate.id()));
        }

        if (config_.verbose) {
            fmt::print(stderr, "[parlay] {}: {} legs, {} (correlation {:.0f})\n",
                       candidate.id(), candidate.legs.size(),
                       OddsMath::format(priced->american_odds),
                       priced->correlation_score);
        }
        out.parlays.push_back(std::move(*priced));
    }

    return out;
}

}  // namespace parlay::core
