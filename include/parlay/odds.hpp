#pragma once

/// @file include/parlay/odds.hpp
/// @brief OddsMath — conversions between American odds, decimal odds and
///        implied probability.
///
/// # Module: OddsMath
///
/// ## Conversions
///   American → decimal:   +A ↦ A/100 + 1          −A ↦ 100/A + 1
///   Decimal → American:   d ≥ 2 ↦ +round((d−1)·100)
///                         d < 2 ↦ −round(100/(d−1))
///   Implied probability:  p = 1 / decimal
///
/// Decimal → American rounds to whole units, so a round trip recovers the
/// original price within ±1. −100 and +100 both denote even money and map
/// to decimal 2.0, which converts back to +100.
///
/// ## Guarantees
/// - All functions are noexcept and return std::optional for invalid input
/// - Pure functions of their inputs; thread-safe
///
/// ## NOT Responsible For
/// - Correlation discounting (see pricer.hpp)

#include "parlay/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace parlay {

/// Data-integrity fault: a price of 0 reached the pricing stage.
/// Thrown by Engine, never by OddsMath.
class InvalidOdds : public std::runtime_error {
public:
    explicit InvalidOdds(const std::string& what_arg)
        : std::runtime_error(what_arg) {}
};

/// Static utility class for odds-space conversions.
class OddsMath {
public:
    OddsMath() = delete;

    /// True iff `odds` is a usable American price (non-zero).
    [[nodiscard]] static bool isValid(AmericanOdds odds) noexcept;

    /// True iff `decimal` is finite and strictly greater than 1.
    [[nodiscard]] static bool isValid(DecimalOdds decimal) noexcept;

    /// Convert American odds to decimal odds.
    ///
    /// # Returns
    /// - decimal > 1 for any non-zero American price
    /// - `nullopt` for odds == 0
    [[nodiscard]] static std::optional<DecimalOdds>
    americanToDecimal(AmericanOdds odds) noexcept;

    /// Convert decimal odds back to (rounded) American odds.
    ///
    /// # Returns
    /// `nullopt` if decimal ≤ 1 or non-finite. Magnitudes beyond
    /// `constants::AMERICAN_ODDS_LIMIT` saturate at that limit.
    [[nodiscard]] static std::optional<AmericanOdds>
    decimalToAmerican(DecimalOdds decimal) noexcept;

    /// Implied probability 1 / americanToDecimal(odds), in (0, 1).
    [[nodiscard]] static std::optional<double>
    impliedProbability(AmericanOdds odds) noexcept;

    /// Render as "+120" / "-110".
    [[nodiscard]] static std::string format(AmericanOdds odds);
};

}  // namespace parlay
