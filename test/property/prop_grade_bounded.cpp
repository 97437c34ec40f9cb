/**
 * @file  prop_grade_bounded.cpp
 * @brief Property: ∀ leg, context: GradeCalculator::grade ∈ [0, 1]
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_grade_bounded
 *
 * Basis:
 *   The raw sum of terms ranges from −0.18 (small edge, cold, slow game,
 *   blowout underdog) to 1.46 (saturated edge with every boost), so the
 *   clamp is load-bearing at both ends.
 *
 * Failure modes this test guards against:
 *   • Clamp applied to a single term instead of the sum
 *   • NaN leaking from a missing market into the total
 *   • Factor list disagreeing with the grade (delta of 0 reported)
 */

#include <rapidcheck.h>
#include <cmath>
#include <iterator>
#include <string>

#include "parlay/grade.hpp"

using namespace parlay;

namespace {

constexpr StatType kStats[] = {
    StatType::Points, StatType::Rebounds, StatType::Assists, StatType::Steals,
    StatType::Blocks, StatType::Threes, StatType::PointsRebounds,
    StatType::PointsAssists, StatType::ReboundsAssists,
    StatType::PointsReboundsAssists, StatType::StealsBlocks,
};

Leg random_leg() {
    Leg leg;
    leg.player_id  = "100";
    leg.team_id    = *rc::gen::element<std::string>("HOME", "AWAY", "", "OTHER");
    leg.venue      = *rc::gen::element(Venue::Unknown, Venue::Home, Venue::Away);
    leg.stat       = kStats[*rc::gen::inRange<std::size_t>(0, std::size(kStats))];
    leg.edge       = *rc::gen::inRange(-400, 401) / 10.0;
    leg.strength   = std::abs(leg.edge);
    leg.confidence = *rc::gen::element(Confidence::Low, Confidence::Medium,
                                       Confidence::High);
    leg.trend      = *rc::gen::element(Trend::Neutral, Trend::Hot, Trend::Cold);
    return leg;
}

ContextSignals random_context() {
    ContextSignals ctx;
    ctx.home_team_id = "HOME";
    ctx.away_team_id = "AWAY";
    if (*rc::gen::arbitrary<bool>()) {
        ctx.spread = *rc::gen::inRange(-250, 251) / 10.0;
    }
    if (*rc::gen::arbitrary<bool>()) {
        ctx.over_under = *rc::gen::inRange(1800, 2600) / 10.0;
    }
    const int injured = *rc::gen::inRange(0, 6);
    for (int i = 0; i < injured; ++i) {
        ctx.injuries.push_back(InjuryEntry{
            .athlete_id = std::to_string(200 + i),
            .team_id    = *rc::gen::element<std::string>("HOME", "AWAY"),
            .status     = *rc::gen::element<std::string>("OUT", "Day-To-Day"),
            .position   = *rc::gen::element<std::string>("G", "F", "C", ""),
        });
    }
    return ctx;
}

}  // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: grade ∈ [0, 1] for arbitrary inputs ─────────────────────
    ok &= rc::check(
        "grade_bounded: grade in [0, 1]",
        []() {
            const auto r = GradeCalculator::grade(random_leg(), random_context());
            RC_ASSERT(std::isfinite(r.grade));
            RC_ASSERT(r.grade >= 0.0);
            RC_ASSERT(r.grade <= 1.0);
        }
    );

    // ── Property 2: every reported factor is non-zero ───────────────────────
    ok &= rc::check(
        "grade_bounded: factors carry non-zero deltas and labels",
        []() {
            const auto r = GradeCalculator::grade(random_leg(), random_context());
            RC_ASSERT(r.factors.size() <= 6u);
            for (const auto& f : r.factors) {
                RC_ASSERT(f.delta != 0.0);
                RC_ASSERT(!f.label.empty());
            }
        }
    );

    // ── Property 3: all boosts maxed saturates at 1 ─────────────────────────
    ok &= rc::check(
        "grade_bounded: maxed adjustments clamp to 1",
        []() {
            Leg leg;
            leg.player_id  = "100";
            leg.team_id    = "HOME";
            leg.venue      = Venue::Home;
            leg.stat       = StatType::Points;
            leg.edge       = *rc::gen::inRange(100, 1000) / 10.0;
            leg.strength   = leg.edge;
            leg.confidence = Confidence::High;
            leg.trend      = Trend::Hot;

            ContextSignals ctx;
            ctx.home_team_id = "HOME";
            ctx.spread       = 0.0;
            ctx.over_under   = 240.0;
            for (int i = 0; i < 3; ++i) {
                ctx.injuries.push_back({std::to_string(200 + i), "HOME", "OUT", "G"});
            }

            RC_ASSERT(GradeCalculator::grade(leg, ctx).grade == 1.0);
        }
    );

    // ── Property 4: all penalties maxed floors at 0 ─────────────────────────
    ok &= rc::check(
        "grade_bounded: minimised adjustments clamp to 0",
        []() {
            Leg leg;
            leg.player_id  = "100";
            leg.team_id    = "AWAY";
            leg.venue      = Venue::Away;
            leg.stat       = StatType::Points;
            leg.edge       = -*rc::gen::inRange(0, 25) / 10.0;
            leg.strength   = std::abs(leg.edge);
            leg.confidence = Confidence::Low;
            leg.trend      = Trend::Cold;

            ContextSignals ctx;
            ctx.home_team_id = "HOME";
            ctx.away_team_id = "AWAY";
            ctx.spread       = -20.0;
            ctx.over_under   = 195.0;

            RC_ASSERT(GradeCalculator::grade(leg, ctx).grade == 0.0);
        }
    );

    return ok ? 0 : 1;
}
