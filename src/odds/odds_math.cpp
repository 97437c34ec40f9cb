/// @file src/odds/odds_math.cpp
/// @brief OddsMath — American / decimal / probability conversions.

#include "parlay/odds.hpp"
#include "parlay/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace parlay {

// ─── Validation ───────────────────────────────────────────────────────────────

bool OddsMath::isValid(AmericanOdds odds) noexcept {
    return odds.value != 0;
}

bool OddsMath::isValid(DecimalOdds decimal) noexcept {
    return std::isfinite(decimal.value) && decimal.value > 1.0;
}

// ─── Conversions ──────────────────────────────────────────────────────────────

std::optional<DecimalOdds>
OddsMath::americanToDecimal(AmericanOdds odds) noexcept {
    if (!isValid(odds)) {
        return std::nullopt;
    }

    const double a = static_cast<double>(odds.value);
    if (odds.value > 0) {
        return DecimalOdds{a / 100.0 + 1.0};
    }
    // Extreme favourites round to 1.0; keep the result strictly above it.
    return DecimalOdds{std::max(100.0 / std::abs(a) + 1.0,
                                std::nextafter(1.0, 2.0))};
}

std::optional<AmericanOdds>
OddsMath::decimalToAmerican(DecimalOdds decimal) noexcept {
    if (!isValid(decimal)) {
        return std::nullopt;
    }

    const double profit = decimal.value - 1.0;
    const bool   plus   = decimal.value >= 2.0;
    const double magnitude = plus ? std::round(profit * 100.0)
                                  : std::round(100.0 / profit);

    // Long-shot parlays can exceed any quoted price; saturate.
    constexpr auto limit = constants::AMERICAN_ODDS_LIMIT;
    const std::int64_t units = magnitude < static_cast<double>(limit)
                             ? static_cast<std::int64_t>(magnitude)
                             : limit;
    return AmericanOdds{plus ? units : -units};
}

std::optional<double>
OddsMath::impliedProbability(AmericanOdds odds) noexcept {
    auto d = americanToDecimal(odds);
    if (!d) {
        return std::nullopt;
    }
    return 1.0 / d->value;
}

std::string OddsMath::format(AmericanOdds odds) {
    return fmt::format("{:+d}", odds.value);
}

}  // namespace parlay
