/// @file src/builder/parlay_builder.cpp
/// @brief ParlayBuilder — deterministic multi-start leg selection.

#include "parlay/builder.hpp"
#include "parlay/constants.hpp"
#include "parlay/correlation.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

namespace parlay {

using namespace constants;

// ─── ParlayBuilder::rank ──────────────────────────────────────────────────────

std::vector<Leg> ParlayBuilder::rank(std::span<const Leg> legs) {
    std::vector<Leg> pool;
    pool.reserve(legs.size());
    for (const auto& leg : legs) {
        if (leg.recommended != Side::Push) {
            pool.push_back(leg);
        }
    }

    std::stable_sort(pool.begin(), pool.end(),
                     [](const Leg& a, const Leg& b) { return a.strength > b.strength; });
    return pool;
}

// ─── ParlayBuilder::walk ──────────────────────────────────────────────────────

std::vector<Leg>
ParlayBuilder::walk(std::span<const Leg> pool, std::size_t count, std::size_t offset) {
    std::vector<Leg> selected;
    std::set<std::string> used;

    for (std::size_t n = 0; n < pool.size() && selected.size() < count; ++n) {
        const Leg& leg = pool[(offset + n) % pool.size()];
        if (used.insert(leg.key()).second) {
            selected.push_back(leg);
        }
    }
    return selected;
}

// ─── ParlayBuilder::selection_score ───────────────────────────────────────────

double ParlayBuilder::selection_score(std::span<const Leg> legs) {
    if (legs.empty()) {
        return 0.0;
    }

    LegArray strengths(static_cast<Eigen::Index>(legs.size()));
    for (std::size_t i = 0; i < legs.size(); ++i) {
        strengths(static_cast<Eigen::Index>(i)) = legs[i].strength;
    }

    return SELECTION_EDGE_WEIGHT * strengths.mean()
         + SELECTION_CORRELATION_WEIGHT * CorrelationScorer::score(legs);
}

// ─── ParlayBuilder::select_legs ───────────────────────────────────────────────

std::vector<Leg>
ParlayBuilder::select_legs(std::span<const Leg> pool, std::size_t count, bool diversify) {
    if (count == 0 || pool.empty()) {
        return {};
    }

    if (!diversify) {
        return walk(pool, count, 0);
    }

    const std::size_t attempts = std::min(DIVERSIFY_ATTEMPTS, pool.size());

    std::vector<Leg> best;
    std::optional<double> best_score;

    for (std::size_t offset = 0; offset < attempts; ++offset) {
        auto candidate = walk(pool, count, offset);
        if (candidate.size() < count) {
            continue;
        }
        const double s = selection_score(candidate);
        if (!best_score || s > *best_score) {
            best_score = s;
            best = std::move(candidate);
        }
    }

    return best;
}

// ─── ParlayBuilder::reasoning ─────────────────────────────────────────────────

std::string ParlayBuilder::reasoning(std::span<const Leg> legs) {
    if (legs.empty()) {
        return {};
    }

    double edge_sum = 0.0;
    std::size_t high_conf = 0;
    for (const auto& leg : legs) {
        edge_sum += leg.edge;
        if (leg.confidence == Confidence::High) {
            ++high_conf;
        }
    }
    const double avg_edge = edge_sum / static_cast<double>(legs.size());

    std::string out = fmt::format(
        "This parlay has an average edge of {:.1f} points over Vegas lines. ", avg_edge);

    const std::size_t teams = CorrelationScorer::distinct_teams(legs);
    if (teams > 1) {
        out += fmt::format("Props are spread across {} teams, reducing correlation risk. ", teams);
    } else {
        out += "All props from same team - higher correlation risk. ";
    }

    const std::size_t stats = CorrelationScorer::distinct_stats(legs);
    if (stats + 1 >= legs.size()) {
        out += "Diverse stat types provide good independence. ";
    } else if (stats == 1) {
        out += "All same stat type - outcomes are correlated. ";
    }

    if (high_conf == legs.size()) {
        out += "All legs have high confidence ratings.";
    } else if (high_conf > 0) {
        out += fmt::format("{} of {} legs have high confidence.", high_conf, legs.size());
    }

    // Drop a trailing space left by the sentence joins.
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

// ─── ParlayBuilder::build ─────────────────────────────────────────────────────

std::vector<ParlayCandidate> ParlayBuilder::build(std::span<const Leg> legs) {
    const auto pool = rank(legs);
    std::vector<ParlayCandidate> parlays;

    struct Shape {
        Variant         variant;
        std::size_t     size;
        RiskLevel       risk;
        ConfidenceLabel confidence;
    };
    static constexpr Shape DIVERSIFIED[] = {
        {Variant::Safe2,       2, RiskLevel::Low,    ConfidenceLabel::High},
        {Variant::Balanced3,   3, RiskLevel::Medium, ConfidenceLabel::MediumHigh},
        {Variant::Aggressive4, 4, RiskLevel::High,   ConfidenceLabel::Medium},
    };

    for (const auto& shape : DIVERSIFIED) {
        auto selected = select_legs(pool, shape.size, /*diversify=*/true);
        if (selected.size() < shape.size) {
            continue;
        }
        auto why = reasoning(selected);
        parlays.push_back(ParlayCandidate{
            .variant    = shape.variant,
            .legs       = std::move(selected),
            .risk       = shape.risk,
            .confidence = shape.confidence,
            .reasoning  = std::move(why),
        });
    }

    // Value play: raw edge only, positive edges above the threshold.
    std::vector<Leg> value_pool;
    for (const auto& leg : pool) {
        if (leg.edge > VALUE_PLAY_MIN_EDGE) {
            value_pool.push_back(leg);
        }
    }
    auto value_legs = select_legs(value_pool, 3, /*diversify=*/false);
    if (value_legs.size() >= VALUE_PLAY_MIN_LEGS) {
        auto why = reasoning(value_legs);
        parlays.push_back(ParlayCandidate{
            .variant    = Variant::ValuePlay,
            .legs       = std::move(value_legs),
            .risk       = RiskLevel::Medium,
            .confidence = ConfidenceLabel::High,
            .reasoning  = std::move(why),
        });
    }

    return parlays;
}

}  // namespace parlay
