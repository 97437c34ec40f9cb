#pragma once

/// @file include/parlay/types.hpp
/// @brief Shared value types for the parlay grading and pricing engine.
///
/// Every module includes this file. It defines the feed records consumed by
/// the engine (PropLine, Prediction, ContextSignals), the derived value
/// objects it produces (Leg, ParlayCandidate, PricedParlay) and the Eigen
/// alias used for per-leg reductions.
///
/// All types are plain values: constructed fresh per request, never shared,
/// no back-references.

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parlay {

// ─── Strong Scalar Types ──────────────────────────────────────────────────────

/// Sportsbook price in American notation (+120, −110).
/// Zero is not a valid price. 64-bit so that long-shot parlay prices fit.
struct AmericanOdds {
    std::int64_t value;
};

/// Sportsbook price in decimal notation (total return per unit staked).
/// Valid prices are strictly greater than 1.0.
struct DecimalOdds {
    double value;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// One value per leg (decimal odds, hit probabilities, strengths).
using LegArray = Eigen::ArrayXd;

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Normalised statistical category of a prop or prediction.
enum class StatType {
    Points,
    Rebounds,
    Assists,
    Steals,
    Blocks,
    Threes,
    PointsRebounds,
    PointsAssists,
    ReboundsAssists,
    PointsReboundsAssists,
    StealsBlocks,
};

/// Recommended side of a prop.
enum class Side {
    Over,
    Under,
    Push,  ///< predicted == line; nothing to exploit
};

/// Model confidence attached to a prediction.
enum class Confidence {
    Low,
    Medium,
    High,
};

/// Recent-form tag attached to a prediction.
enum class Trend {
    Neutral,
    Hot,
    Cold,
};

/// Which side of the court the player's team is on for this game.
enum class Venue {
    Unknown,
    Home,
    Away,
};

/// Risk label of a generated parlay variant.
enum class RiskLevel {
    Low,
    Medium,
    High,
};

/// Confidence label of a generated parlay variant.
enum class ConfidenceLabel {
    Medium,
    MediumHigh,
    High,
};

/// Display bucket for a [0,1] grade.
enum class GradeTier {
    Weak,    ///< < 0.30
    Lean,    ///< [0.30, 0.50)
    Solid,   ///< [0.50, 0.70)
    Strong,  ///< ≥ 0.70
};

/// The fixed parlay shapes produced by ParlayBuilder.
enum class Variant {
    Safe2,
    Balanced3,
    Aggressive4,
    ValuePlay,
};

/// Source term of a grade adjustment.
enum class FactorKind {
    Base,
    Injury,
    Venue,
    Pace,
    Competitiveness,
    Trend,
};

[[nodiscard]] std::string_view to_string(StatType s) noexcept;
[[nodiscard]] std::string_view to_string(Side s) noexcept;
[[nodiscard]] std::string_view to_string(Confidence c) noexcept;
[[nodiscard]] std::string_view to_string(Trend t) noexcept;
[[nodiscard]] std::string_view to_string(Venue v) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel r) noexcept;
[[nodiscard]] std::string_view to_string(ConfidenceLabel c) noexcept;
[[nodiscard]] std::string_view to_string(GradeTier t) noexcept;
[[nodiscard]] std::string_view to_string(FactorKind k) noexcept;

// ─── Feed Records ─────────────────────────────────────────────────────────────

/// One sportsbook player prop. Sourced externally, never modified.
///
/// A prop is tradable only when both sides are priced; one-sided props are
/// alternate lines.
struct PropLine {
    std::string                 player_id;
    std::string                 player_name;
    std::string                 team_id;        ///< May be empty
    Venue                       venue = Venue::Unknown;
    std::string                 stat_label;     ///< Sportsbook label, e.g. "Total Points"
    double                      line = 0.0;
    std::optional<AmericanOdds> over_odds;
    std::optional<AmericanOdds> under_odds;
};

/// One model prediction for a player statistic.
struct Prediction {
    std::string athlete_id;
    std::string stat_label;  ///< Model label, e.g. "points"
    double      predicted = 0.0;
    double      edge      = 0.0;  ///< predicted − line, signed
    Confidence  confidence = Confidence::Low;
    Trend       trend      = Trend::Neutral;
};

/// One injury-report entry.
struct InjuryEntry {
    std::string athlete_id;
    std::string team_id;
    std::string status;    ///< e.g. "OUT", "Day-To-Day"
    std::string position;  ///< e.g. "G", "SF", "C"
};

/// Per-game context read by GradeCalculator only.
struct ContextSignals {
    std::string              home_team_id;
    std::string              away_team_id;
    std::optional<double>    spread;      ///< Home point spread; negative = home favoured
    std::optional<double>    over_under;  ///< Game total
    std::vector<InjuryEntry> injuries;
};

// ─── Derived Objects ──────────────────────────────────────────────────────────

/// One non-zero contribution to a leg's grade.
struct GradeFactor {
    FactorKind  kind  = FactorKind::Base;
    double      delta = 0.0;  ///< Signed grade contribution
    std::string label;  ///< e.g. "+8% high-pace game (O/U 230+)"
};

/// A matched prop + prediction pair, graded. Built once, never mutated.
struct Leg {
    std::string  player_id;
    std::string  player_name;
    std::string  team_id;
    Venue        venue = Venue::Unknown;
    StatType     stat  = StatType::Points;
    std::string  stat_label;

    double       line      = 0.0;
    AmericanOdds over_odds{0};
    AmericanOdds under_odds{0};
    double       predicted = 0.0;
    double       edge      = 0.0;
    double       strength  = 0.0;  ///< |edge|
    Confidence   confidence = Confidence::Low;
    Trend        trend      = Trend::Neutral;

    Side         recommended = Side::Push;
    AmericanOdds recommended_odds{0};
    double       over_hit_prob  = 0.5;
    double       under_hit_prob = 0.5;

    double                   grade = 0.0;
    std::vector<GradeFactor> factors;

    /// Hit probability of the recommended side (0.5 for a push).
    [[nodiscard]] double hit_probability() const noexcept;

    /// Duplicate-detection key: player id + stat type.
    [[nodiscard]] std::string key() const;

    /// One-line table row.
    [[nodiscard]] std::string to_string() const;
};

/// A duplicate-free combination of legs, as selected by ParlayBuilder.
struct ParlayCandidate {
    Variant          variant    = Variant::Safe2;
    std::vector<Leg> legs;
    RiskLevel        risk       = RiskLevel::Low;
    ConfidenceLabel  confidence = ConfidenceLabel::Medium;
    std::string      reasoning;

    [[nodiscard]] std::string_view id() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] std::string_view description() const noexcept;
};

/// A candidate with its correlation-discounted price. Terminal output.
struct PricedParlay {
    ParlayCandidate candidate;

    double       base_decimal        = 1.0;  ///< Π leg decimals, undiscounted
    double       decimal_odds        = 1.0;  ///< 1 + (base − 1)·f
    AmericanOdds american_odds{0};
    double       correlation_score   = 0.0;  ///< Raw CorrelationScorer output
    double       discount_factor     = 0.0;  ///< f ∈ [0.65, 0.95]
    double       discount_percent    = 0.0;  ///< (1 − f)·100
    double       stake               = 0.0;
    double       payout              = 0.0;  ///< stake · decimal_odds
    double       profit              = 0.0;  ///< payout − stake
    double       hit_probability     = 0.0;  ///< Π leg hit probabilities, percent
    double       implied_probability = 0.0;  ///< 100 / decimal_odds, percent
    double       expected_value      = 0.0;  ///< p·profit − (1−p)·stake

    /// Multi-line summary card.
    [[nodiscard]] std::string to_string() const;
};

/// All inputs for one game, fully fetched by the caller.
struct GameSlate {
    std::vector<PropLine>   props;
    std::vector<Prediction> predictions;
    ContextSignals          context;
};

/// Engine output for one game.
struct GameAnalysis {
    std::vector<Leg>          legs;     ///< Graded legs, feed order
    std::vector<PricedParlay> parlays;  ///< Variants that could be filled
};

}  // namespace parlay
