#pragma once

/// @file include/parlay/pricer.hpp
/// @brief ParlayPricer — combined odds with a same-game-parlay discount.
///
/// # Module: ParlayPricer
///
/// ## Pricing
/// 1. base = Π americanToDecimal(leg.recommended_odds)   (independent price)
/// 2. c    = clamp(CorrelationScorer(legs), −30, 50)
///    f    = 0.65 + ((c + 30) / 80) · 0.30               (f ∈ [0.65, 0.95])
/// 3. adjusted = 1 + (base − 1) · f                      (profit portion only)
/// 4. American odds from `adjusted`
/// 5. payout = stake · adjusted, profit = payout − stake,
///    discount = (1 − f) · 100
///
/// The combined hit probability Π p_leg(recommended side) is reported next
/// to the price. It is independent of the discount, which models how books
/// price correlated legs, not the true joint probability.
///
/// An empty leg list prices at decimal 1 (American +0, zero profit).
///
/// ## Guarantees
/// - Pure functions; thread-safe
/// - `nullopt` when any leg carries an unconvertible price (odds of 0)

#include "parlay/types.hpp"
#include "parlay/constants.hpp"

#include <optional>
#include <span>

namespace parlay {

/// Price of a set of legs for one stake.
struct OddsQuote {
    double       base_decimal      = 1.0;
    double       decimal_odds      = 1.0;
    AmericanOdds american_odds{0};
    double       correlation_score = 0.0;
    double       discount_factor   = 0.0;
    double       discount_percent  = 0.0;
    double       payout            = 0.0;
    double       profit            = 0.0;
};

class ParlayPricer {
public:
    ParlayPricer() = delete;

    /// Map a correlation score to the SGP discount factor f ∈ [0.65, 0.95].
    [[nodiscard]] static double discount_factor(double correlation) noexcept;

    /// Undiscounted product of the legs' decimal prices (1 for no legs).
    [[nodiscard]] static std::optional<double>
    base_decimal(std::span<const Leg> legs) noexcept;

    /// Discounted combined price for `stake`.
    ///
    /// # Returns
    /// `nullopt` if any leg's recommended odds are 0 or `stake` is negative
    /// or non-finite.
    [[nodiscard]] static std::optional<OddsQuote>
    combined_odds(std::span<const Leg> legs,
                  double stake = constants::DEFAULT_STAKE);

    /// Π hit probability of each leg's recommended side, as a percentage.
    /// 0 for no legs.
    [[nodiscard]] static double
    combined_probability(std::span<const Leg> legs) noexcept;

    /// Price a candidate into the terminal output object.
    [[nodiscard]] static std::optional<PricedParlay>
    price(const ParlayCandidate& candidate,
          double stake = constants::DEFAULT_STAKE);
};

}  // namespace parlay
