/// @file src/matcher/prop_matcher.cpp
/// @brief PropMatcher — prop/prediction pairing and leg construction.

#include "parlay/matcher.hpp"
#include "parlay/constants.hpp"
#include "parlay/stat_type.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace parlay {

// ─── PropMatcher::favoured_hit_probability ────────────────────────────────────

double PropMatcher::favoured_hit_probability(double edge) noexcept {
    const double capped = std::min(std::abs(edge), constants::HIT_PROB_EDGE_CAP);
    const double p = constants::HIT_PROB_BASE
                   + capped * constants::HIT_PROB_PER_POINT;
    return std::clamp(p, 0.0, 1.0);
}

// ─── PropMatcher::find_prediction ─────────────────────────────────────────────

const Prediction*
PropMatcher::find_prediction(std::span<const Prediction> predictions,
                             const std::string&          player_id,
                             StatType                    stat) {
    // An exact stat match wins over a component of a combined prop.
    const Prediction* contained = nullptr;
    for (const auto& p : predictions) {
        if (p.athlete_id != player_id) {
            continue;
        }
        const auto pred_stat = parse_stat_type(p.stat_label);
        if (!pred_stat) {
            continue;
        }
        if (*pred_stat == stat) {
            return &p;
        }
        if (contained == nullptr && stat_contains(stat, *pred_stat)) {
            contained = &p;
        }
    }
    return contained;
}

// ─── PropMatcher::build_leg ───────────────────────────────────────────────────

std::optional<Leg>
PropMatcher::build_leg(const PropLine& prop, const Prediction& prediction,
                       StatType stat) {
    // One-sided props are alternate lines.
    if (!prop.over_odds || !prop.under_odds) {
        return std::nullopt;
    }
    if (!std::isfinite(prop.line) ||
        !std::isfinite(prediction.predicted) ||
        !std::isfinite(prediction.edge)) {
        return std::nullopt;
    }

    Leg leg;
    leg.player_id   = prop.player_id;
    leg.player_name = prop.player_name.empty() ? prop.player_id : prop.player_name;
    leg.team_id     = prop.team_id;
    leg.venue       = prop.venue;
    leg.stat        = stat;
    leg.stat_label  = prop.stat_label;
    leg.line        = prop.line;
    leg.over_odds   = *prop.over_odds;
    leg.under_odds  = *prop.under_odds;
    leg.predicted   = prediction.predicted;
    leg.edge        = prediction.edge;
    leg.strength    = std::abs(prediction.edge);
    leg.confidence  = prediction.confidence;
    leg.trend       = prediction.trend;

    const double favoured = favoured_hit_probability(prediction.edge);
    if (prediction.edge > 0.0) {
        leg.recommended      = Side::Over;
        leg.recommended_odds = leg.over_odds;
        leg.over_hit_prob    = favoured;
        leg.under_hit_prob   = 1.0 - favoured;
    } else if (prediction.edge < 0.0) {
        leg.recommended      = Side::Under;
        leg.recommended_odds = leg.under_odds;
        leg.under_hit_prob   = favoured;
        leg.over_hit_prob    = 1.0 - favoured;
    } else {
        leg.recommended      = Side::Push;
        leg.recommended_odds = leg.over_odds;
        leg.over_hit_prob    = 0.5;
        leg.under_hit_prob   = 0.5;
    }

    return leg;
}

// ─── PropMatcher::match ───────────────────────────────────────────────────────

std::vector<Leg>
PropMatcher::match(std::span<const PropLine>   props,
                   std::span<const Prediction> predictions) {
    std::vector<Leg> legs;
    legs.reserve(props.size());

    for (const auto& prop : props) {
        if (!prop.over_odds || !prop.under_odds) {
            continue;
        }

        const auto stat = parse_stat_type(prop.stat_label);
        if (!stat) {
            continue;
        }

        const Prediction* pred = find_prediction(predictions, prop.player_id, *stat);
        if (pred == nullptr) {
            continue;
        }

        if (auto leg = build_leg(prop, *pred, *stat)) {
            legs.push_back(std::move(*leg));
        }
    }

    return legs;
}

// ─── filter_legs ──────────────────────────────────────────────────────────────

std::vector<Leg>
filter_legs(std::span<const Leg> legs, const LegFilter& filter) {
    std::vector<Leg> out;
    for (const auto& leg : legs) {
        if (filter.team_id && leg.team_id != *filter.team_id) {
            continue;
        }
        if (filter.player_id && leg.player_id != *filter.player_id) {
            continue;
        }
        if (!filter.stats.empty() &&
            std::find(filter.stats.begin(), filter.stats.end(), leg.stat)
                == filter.stats.end()) {
            continue;
        }
        out.push_back(leg);
    }
    return out;
}

}  // namespace parlay
