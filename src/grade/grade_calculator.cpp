/// @file src/grade/grade_calculator.cpp
/// @brief GradeCalculator — additive contextual grade model.

#include "parlay/grade.hpp"
#include "parlay/constants.hpp"
#include "parlay/stat_type.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace parlay {

using namespace constants;

namespace {

bool iequals(const std::string& a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Guard, forward or center (PG, SG, SF, PF, C, G-F, ...).
bool is_primary_position(const std::string& position) noexcept {
    for (char c : position) {
        const char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (u == 'G' || u == 'F' || u == 'C') {
            return true;
        }
    }
    return false;
}

void add_factor(std::vector<GradeFactor>& factors, FactorKind kind,
                double delta, std::string label) {
    if (delta != 0.0) {
        factors.push_back(GradeFactor{kind, delta, std::move(label)});
    }
}

}  // anonymous namespace

// ─── Helpers ──────────────────────────────────────────────────────────────────

double GradeCalculator::confidence_multiplier(Confidence c) noexcept {
    switch (c) {
        case Confidence::High:   return CONFIDENCE_MULT_HIGH;
        case Confidence::Medium: return CONFIDENCE_MULT_MEDIUM;
        case Confidence::Low:    return CONFIDENCE_MULT_LOW;
    }
    return CONFIDENCE_MULT_LOW;
}

double GradeCalculator::base_term(double edge, Confidence c) noexcept {
    if (!std::isfinite(edge)) {
        return 0.0;
    }
    return std::min(std::abs(edge) / GRADE_EDGE_SCALE, 1.0) * confidence_multiplier(c);
}

int GradeCalculator::significant_injuries(const Leg& leg,
                                          const ContextSignals& context) noexcept {
    int count = 0;
    for (const auto& inj : context.injuries) {
        if (inj.athlete_id == leg.player_id) {
            continue;
        }
        if (leg.team_id.empty() || inj.team_id != leg.team_id) {
            continue;
        }
        if (iequals(inj.status, "OUT") && is_primary_position(inj.position)) {
            ++count;
        }
    }
    return count;
}

Venue GradeCalculator::resolve_venue(const Leg& leg,
                                     const ContextSignals& context) noexcept {
    if (leg.venue != Venue::Unknown || leg.team_id.empty()) {
        return leg.venue;
    }
    if (leg.team_id == context.home_team_id) return Venue::Home;
    if (leg.team_id == context.away_team_id) return Venue::Away;
    return Venue::Unknown;
}

bool GradeCalculator::is_underdog(Venue venue, double spread) noexcept {
    // Spread is quoted for the home side: negative means home is favoured.
    switch (venue) {
        case Venue::Home:    return spread > 0.0;
        case Venue::Away:    return spread < 0.0;
        case Venue::Unknown: return false;
    }
    return false;
}

GradeTier GradeCalculator::tier(double grade) noexcept {
    if (grade >= GRADE_TIER_STRONG) return GradeTier::Strong;
    if (grade >= GRADE_TIER_SOLID)  return GradeTier::Solid;
    if (grade >= GRADE_TIER_LEAN)   return GradeTier::Lean;
    return GradeTier::Weak;
}

// ─── GradeCalculator::grade ───────────────────────────────────────────────────

GradeResult GradeCalculator::grade(const Leg& leg, const ContextSignals& context) {
    std::vector<GradeFactor> factors;

    // Base: edge size scaled by model confidence.
    const double base = base_term(leg.edge, leg.confidence);
    add_factor(factors, FactorKind::Base, base,
               fmt::format("+{:.0f}% edge {:.1f} ({} confidence)",
                           base * 100.0, leg.strength, to_string(leg.confidence)));

    // Injuries: usage shifts to the remaining rotation.
    const int injured = significant_injuries(leg, context);
    const double injury = std::min(injured * INJURY_BOOST_PER_PLAYER, INJURY_BOOST_CAP);
    add_factor(factors, FactorKind::Injury, injury,
               fmt::format("+{:.0f}% teammate injuries ({})", injury * 100.0, injured));

    // Venue.
    const Venue venue = resolve_venue(leg, context);
    double venue_term = 0.0;
    if (venue == Venue::Home && leg.edge > 0.0) {
        venue_term = HOME_BOOST;
    }
    add_factor(factors, FactorKind::Venue, venue_term, "+5% home court advantage");

    // Pace from the game total.
    double pace = 0.0;
    std::string pace_label;
    if (context.over_under && std::isfinite(*context.over_under)) {
        const double ou = *context.over_under;
        if (is_scoring_type(leg.stat)) {
            if (ou >= PACE_HIGH_TOTAL) {
                pace = PACE_HIGH_BOOST;
                pace_label = "+8% high-pace game (O/U 230+)";
            } else if (ou >= PACE_ABOVE_AVG_TOTAL) {
                pace = PACE_ABOVE_AVG_BOOST;
                pace_label = "+5% above-average pace (O/U 220+)";
            } else if (ou < PACE_LOW_TOTAL) {
                pace = PACE_LOW_PENALTY;
                pace_label = "-5% low-pace game (O/U <210)";
            }
        }
        // A slow game favours rebounds and blocks; overrides the scoring term
        // for combined markets.
        if (is_defensive_type(leg.stat) && ou < PACE_LOW_TOTAL) {
            pace = PACE_DEFENSIVE_BOOST;
            pace_label = "+5% defensive game (O/U <210)";
        }
    }
    add_factor(factors, FactorKind::Pace, pace, std::move(pace_label));

    // Competitiveness from the spread.
    double competitive = 0.0;
    std::string competitive_label;
    if (context.spread && std::isfinite(*context.spread)) {
        const double abs_spread = std::abs(*context.spread);
        if (abs_spread <= CLOSE_GAME_SPREAD) {
            competitive = CLOSE_GAME_BOOST;
            competitive_label = "+6% close game expected (more minutes)";
        } else if (abs_spread > BLOWOUT_SPREAD && is_underdog(venue, *context.spread)) {
            competitive = BLOWOUT_PENALTY;
            competitive_label = "-8% blowout risk (potential minute reduction)";
        }
    }
    add_factor(factors, FactorKind::Competitiveness, competitive,
               std::move(competitive_label));

    // Recent form.
    double trend = 0.0;
    std::string trend_label;
    if (leg.trend == Trend::Hot) {
        trend = TREND_BOOST;
        trend_label = "+5% player trending up";
    } else if (leg.trend == Trend::Cold) {
        trend = -TREND_BOOST;
        trend_label = "-5% player trending down";
    }
    add_factor(factors, FactorKind::Trend, trend, std::move(trend_label));

    const double total = base + injury + venue_term + pace + competitive + trend;
    return GradeResult{
        .grade   = std::clamp(total, 0.0, 1.0),
        .factors = std::move(factors),
    };
}

// ─── GradeCalculator::grade_all ───────────────────────────────────────────────

std::vector<Leg>
GradeCalculator::grade_all(std::span<const Leg> legs, const ContextSignals& context) {
    std::vector<Leg> graded;
    graded.reserve(legs.size());

    for (const auto& leg : legs) {
        auto result = grade(leg, context);
        Leg out = leg;
        out.grade   = result.grade;
        out.factors = std::move(result.factors);
        graded.push_back(std::move(out));
    }

    return graded;
}

}  // namespace parlay
