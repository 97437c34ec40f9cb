/// @file src/correlation/correlation_scorer.cpp
/// @brief CorrelationScorer — team and stat-type diversity.

#include "parlay/correlation.hpp"
#include "parlay/constants.hpp"

#include <set>
#include <string>

namespace parlay {

std::size_t CorrelationScorer::distinct_teams(std::span<const Leg> legs) {
    std::set<std::string> teams;
    for (const auto& leg : legs) {
        teams.insert(leg.team_id.empty() ? std::string(to_string(leg.venue))
                                         : leg.team_id);
    }
    return teams.size();
}

std::size_t CorrelationScorer::distinct_stats(std::span<const Leg> legs) {
    std::set<StatType> stats;
    for (const auto& leg : legs) {
        stats.insert(leg.stat);
    }
    return stats.size();
}

double CorrelationScorer::score(std::span<const Leg> legs) {
    double score = 0.0;

    if (distinct_teams(legs) > 1) {
        score += constants::CORRELATION_MULTI_TEAM_BONUS;
    }

    const std::size_t stats = distinct_stats(legs);
    score += constants::CORRELATION_PER_STAT_TYPE * static_cast<double>(stats);

    // Same stat for every leg: outcomes move together.
    if (stats == 1) {
        score -= constants::CORRELATION_SINGLE_STAT_PENALTY;
    }

    return score;
}

}  // namespace parlay
