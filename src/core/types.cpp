/// @file src/core/types.cpp
/// @brief Enum names and display helpers for the shared value types.

#include "parlay/types.hpp"
#include "parlay/odds.hpp"

#include <fmt/format.h>

namespace parlay {

// ─── Enum names ───────────────────────────────────────────────────────────────

std::string_view to_string(StatType s) noexcept {
    switch (s) {
        case StatType::Points:                return "points";
        case StatType::Rebounds:              return "rebounds";
        case StatType::Assists:               return "assists";
        case StatType::Steals:                return "steals";
        case StatType::Blocks:                return "blocks";
        case StatType::Threes:                return "threes";
        case StatType::PointsRebounds:        return "points+rebounds";
        case StatType::PointsAssists:         return "points+assists";
        case StatType::ReboundsAssists:       return "rebounds+assists";
        case StatType::PointsReboundsAssists: return "points+rebounds+assists";
        case StatType::StealsBlocks:          return "steals+blocks";
    }
    return "unknown";
}

std::string_view to_string(Side s) noexcept {
    switch (s) {
        case Side::Over:  return "OVER";
        case Side::Under: return "UNDER";
        case Side::Push:  return "PUSH";
    }
    return "unknown";
}

std::string_view to_string(Confidence c) noexcept {
    switch (c) {
        case Confidence::Low:    return "Low";
        case Confidence::Medium: return "Medium";
        case Confidence::High:   return "High";
    }
    return "unknown";
}

std::string_view to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Neutral: return "neutral";
        case Trend::Hot:     return "hot";
        case Trend::Cold:    return "cold";
    }
    return "unknown";
}

std::string_view to_string(Venue v) noexcept {
    switch (v) {
        case Venue::Unknown: return "unknown";
        case Venue::Home:    return "home";
        case Venue::Away:    return "away";
    }
    return "unknown";
}

std::string_view to_string(RiskLevel r) noexcept {
    switch (r) {
        case RiskLevel::Low:    return "Low";
        case RiskLevel::Medium: return "Medium";
        case RiskLevel::High:   return "High";
    }
    return "unknown";
}

std::string_view to_string(ConfidenceLabel c) noexcept {
    switch (c) {
        case ConfidenceLabel::Medium:     return "Medium";
        case ConfidenceLabel::MediumHigh: return "Medium-High";
        case ConfidenceLabel::High:       return "High";
    }
    return "unknown";
}

std::string_view to_string(GradeTier t) noexcept {
    switch (t) {
        case GradeTier::Weak:   return "Weak";
        case GradeTier::Lean:   return "Lean";
        case GradeTier::Solid:  return "Solid";
        case GradeTier::Strong: return "Strong";
    }
    return "unknown";
}

std::string_view to_string(FactorKind k) noexcept {
    switch (k) {
        case FactorKind::Base:            return "base";
        case FactorKind::Injury:          return "injury";
        case FactorKind::Venue:           return "venue";
        case FactorKind::Pace:            return "pace";
        case FactorKind::Competitiveness: return "competitiveness";
        case FactorKind::Trend:           return "trend";
    }
    return "unknown";
}

// ─── Leg ──────────────────────────────────────────────────────────────────────

double Leg::hit_probability() const noexcept {
    switch (recommended) {
        case Side::Over:  return over_hit_prob;
        case Side::Under: return under_hit_prob;
        case Side::Push:  return 0.5;
    }
    return 0.5;
}

std::string Leg::key() const {
    return fmt::format("{}-{}", player_id, parlay::to_string(stat));
}

std::string Leg::to_string() const {
    return fmt::format(
        "{:<24} {:<24} {:>6.1f} {:>6.1f} {:>+6.1f}  {:<5} {:>5}  {:.2f}",
        player_name, stat_label, line, predicted, edge,
        parlay::to_string(recommended),
        OddsMath::format(recommended_odds), grade);
}

// ─── ParlayCandidate ──────────────────────────────────────────────────────────

std::string_view ParlayCandidate::id() const noexcept {
    switch (variant) {
        case Variant::Safe2:       return "2leg-safe";
        case Variant::Balanced3:   return "3leg-balanced";
        case Variant::Aggressive4: return "4leg-aggro";
        case Variant::ValuePlay:   return "value-play";
    }
    return "unknown";
}

std::string_view ParlayCandidate::name() const noexcept {
    switch (variant) {
        case Variant::Safe2:       return "Safe 2-Leg Parlay";
        case Variant::Balanced3:   return "Balanced 3-Leg Parlay";
        case Variant::Aggressive4: return "Aggressive 4-Leg Parlay";
        case Variant::ValuePlay:   return "Value Play";
    }
    return "unknown";
}

std::string_view ParlayCandidate::description() const noexcept {
    switch (variant) {
        case Variant::Safe2:       return "Most confident picks";
        case Variant::Balanced3:   return "Good balance of odds and safety";
        case Variant::Aggressive4: return "Higher payout, more risk";
        case Variant::ValuePlay:   return "Best edges vs Vegas lines";
    }
    return "";
}

// ─── PricedParlay ─────────────────────────────────────────────────────────────

std::string PricedParlay::to_string() const {
    std::string out = fmt::format(
        "── {} ({}) ── risk {} · confidence {}\n"
        "   {}\n",
        candidate.name(), candidate.id(),
        parlay::to_string(candidate.risk),
        parlay::to_string(candidate.confidence),
        candidate.description());

    for (const auto& leg : candidate.legs) {
        out += fmt::format("   • {:<24} {:<5} {:>5.1f} {:<24} {:>5}\n",
                           leg.player_name,
                           parlay::to_string(leg.recommended),
                           leg.line,
                           leg.stat_label,
                           OddsMath::format(leg.recommended_odds));
    }

    out += fmt::format(
        "   Odds {:>6} (decimal {:.2f}, base {:.2f}, SGP discount {:.1f}%)\n"
        "   Bet ${:.2f} to win ${:.2f} · payout ${:.2f}\n"
        "   Hit probability {:.1f}% · implied {:.1f}% · EV ${:+.2f}\n"
        "   {}\n",
        OddsMath::format(american_odds), decimal_odds, base_decimal,
        discount_percent,
        stake, profit, payout,
        hit_probability, implied_probability, expected_value,
        candidate.reasoning);
    return out;
}

}  // namespace parlay
