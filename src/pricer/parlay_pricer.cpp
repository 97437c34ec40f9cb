/// @file src/pricer/parlay_pricer.cpp
/// @brief ParlayPricer — SGP-discounted combined odds, payout and EV.

#include "parlay/pricer.hpp"
#include "parlay/correlation.hpp"
#include "parlay/odds.hpp"

#include <algorithm>
#include <cmath>

namespace parlay {

using namespace constants;

// ─── ParlayPricer::discount_factor ────────────────────────────────────────────

double ParlayPricer::discount_factor(double correlation) noexcept {
    if (std::isnan(correlation)) {
        correlation = CORRELATION_MIN;
    }
    const double c = std::clamp(correlation, CORRELATION_MIN, CORRELATION_MAX);
    const double t = (c - CORRELATION_MIN) / (CORRELATION_MAX - CORRELATION_MIN);
    return DISCOUNT_FACTOR_MIN + t * DISCOUNT_FACTOR_SPAN;
}

// ─── ParlayPricer::base_decimal ───────────────────────────────────────────────

std::optional<double>
ParlayPricer::base_decimal(std::span<const Leg> legs) noexcept {
    LegArray decimals = LegArray::Ones(static_cast<Eigen::Index>(legs.size()));
    for (std::size_t i = 0; i < legs.size(); ++i) {
        auto d = OddsMath::americanToDecimal(legs[i].recommended_odds);
        if (!d) {
            return std::nullopt;
        }
        decimals(static_cast<Eigen::Index>(i)) = d->value;
    }
    // prod() of an empty array is 1.
    return decimals.prod();
}

// ─── ParlayPricer::combined_odds ──────────────────────────────────────────────

std::optional<OddsQuote>
ParlayPricer::combined_odds(std::span<const Leg> legs, double stake) {
    if (!std::isfinite(stake) || stake < 0.0) {
        return std::nullopt;
    }

    auto base = base_decimal(legs);
    if (!base) {
        return std::nullopt;
    }

    const double correlation = CorrelationScorer::score(legs);
    const double f = discount_factor(correlation);

    // The principal is returned in full; only the profit is discounted.
    const double adjusted = 1.0 + (*base - 1.0) * f;

    AmericanOdds american{0};
    if (auto a = OddsMath::decimalToAmerican(DecimalOdds{adjusted})) {
        american = *a;
    } else if (!legs.empty()) {
        return std::nullopt;
    }

    const double payout = stake * adjusted;

    return OddsQuote{
        .base_decimal      = *base,
        .decimal_odds      = adjusted,
        .american_odds     = american,
        .correlation_score = correlation,
        .discount_factor   = f,
        .discount_percent  = (1.0 - f) * 100.0,
        .payout            = payout,
        .profit            = payout - stake,
    };
}

// ─── ParlayPricer::combined_probability ───────────────────────────────────────

double ParlayPricer::combined_probability(std::span<const Leg> legs) noexcept {
    if (legs.empty()) {
        return 0.0;
    }

    LegArray probs(static_cast<Eigen::Index>(legs.size()));
    for (std::size_t i = 0; i < legs.size(); ++i) {
        probs(static_cast<Eigen::Index>(i)) = legs[i].hit_probability();
    }
    return probs.prod() * 100.0;
}

// ─── ParlayPricer::price ──────────────────────────────────────────────────────

std::optional<PricedParlay>
ParlayPricer::price(const ParlayCandidate& candidate, double stake) {
    auto quote = combined_odds(candidate.legs, stake);
    if (!quote) {
        return std::nullopt;
    }

    const double hit = combined_probability(candidate.legs);
    const double p   = hit / 100.0;

    return PricedParlay{
        .candidate           = candidate,
        .base_decimal        = quote->base_decimal,
        .decimal_odds        = quote->decimal_odds,
        .american_odds       = quote->american_odds,
        .correlation_score   = quote->correlation_score,
        .discount_factor     = quote->discount_factor,
        .discount_percent    = quote->discount_percent,
        .stake               = stake,
        .payout              = quote->payout,
        .profit              = quote->profit,
        .hit_probability     = hit,
        .implied_probability = 100.0 / quote->decimal_odds,
        .expected_value      = p * quote->profit - (1.0 - p) * stake,
    };
}

}  // namespace parlay
