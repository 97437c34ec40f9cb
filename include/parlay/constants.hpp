#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/parlay/constants.hpp
/// @brief Numeric constants of the grading and pricing model.

namespace parlay::constants {

// ─── Odds ─────────────────────────────────────────────────────────────────────

/// Largest American magnitude decimalToAmerican reports; larger prices
/// saturate here.
static constexpr std::int64_t AMERICAN_ODDS_LIMIT = 1'000'000'000'000'000'000;

// ─── Hit Probability Heuristic ────────────────────────────────────────────────

/// Hit probability of the favoured side at zero edge.
static constexpr double HIT_PROB_BASE = 0.55;

/// Hit probability added per point of |edge|.
static constexpr double HIT_PROB_PER_POINT = 0.02;

/// |edge| beyond this contributes nothing more to hit probability.
static constexpr double HIT_PROB_EDGE_CAP = 10.0;

// ─── Grade Model ──────────────────────────────────────────────────────────────

/// |edge| at which the base grade saturates.
static constexpr double GRADE_EDGE_SCALE = 10.0;

static constexpr double CONFIDENCE_MULT_HIGH   = 1.0;
static constexpr double CONFIDENCE_MULT_MEDIUM = 0.85;
static constexpr double CONFIDENCE_MULT_LOW    = 0.70;

static constexpr double INJURY_BOOST_PER_PLAYER = 0.08;
static constexpr double INJURY_BOOST_CAP        = 0.20;

static constexpr double HOME_BOOST = 0.05;

static constexpr double PACE_HIGH_TOTAL      = 230.0;
static constexpr double PACE_ABOVE_AVG_TOTAL = 220.0;
static constexpr double PACE_LOW_TOTAL       = 210.0;
static constexpr double PACE_HIGH_BOOST      = 0.08;
static constexpr double PACE_ABOVE_AVG_BOOST = 0.05;
static constexpr double PACE_LOW_PENALTY     = -0.05;
static constexpr double PACE_DEFENSIVE_BOOST = 0.05;

static constexpr double CLOSE_GAME_SPREAD   = 5.0;
static constexpr double BLOWOUT_SPREAD      = 12.0;
static constexpr double CLOSE_GAME_BOOST    = 0.06;
static constexpr double BLOWOUT_PENALTY     = -0.08;

static constexpr double TREND_BOOST = 0.05;

static constexpr double GRADE_TIER_STRONG = 0.70;
static constexpr double GRADE_TIER_SOLID  = 0.50;
static constexpr double GRADE_TIER_LEAN   = 0.30;

// ─── Correlation Score ────────────────────────────────────────────────────────

static constexpr double CORRELATION_MULTI_TEAM_BONUS = 20.0;
static constexpr double CORRELATION_PER_STAT_TYPE    = 10.0;
static constexpr double CORRELATION_SINGLE_STAT_PENALTY = 30.0;

/// Clamp range of the score before it is mapped to a discount factor.
static constexpr double CORRELATION_MIN = -30.0;
static constexpr double CORRELATION_MAX = 50.0;

// ─── SGP Discount ─────────────────────────────────────────────────────────────

/// Discount factor at CORRELATION_MIN (fully correlated legs).
static constexpr double DISCOUNT_FACTOR_MIN = 0.65;

/// Width of the discount factor range; factor at CORRELATION_MAX is 0.95.
static constexpr double DISCOUNT_FACTOR_SPAN = 0.30;

// ─── Leg Selection ────────────────────────────────────────────────────────────

/// Number of rotation offsets tried by the diversified selection.
static constexpr std::size_t DIVERSIFY_ATTEMPTS = 5;

static constexpr double SELECTION_EDGE_WEIGHT        = 0.7;
static constexpr double SELECTION_CORRELATION_WEIGHT = 0.3;

/// Signed edge a leg needs to enter the value-play pool.
static constexpr double VALUE_PLAY_MIN_EDGE = 2.0;

/// Value play is emitted with at least this many legs.
static constexpr std::size_t VALUE_PLAY_MIN_LEGS = 2;

// ─── Stake ────────────────────────────────────────────────────────────────────

static constexpr double DEFAULT_STAKE = 10.0;
static constexpr double MIN_STAKE     = 1.0;

}  // namespace parlay::constants
