#pragma once

/// @file include/parlay/correlation.hpp
/// @brief CorrelationScorer — diversification score of a set of legs.
///
/// # Module: CorrelationScorer
///
///     score = 20·[teams > 1] + 10·|stat types| − 30·[|stat types| = 1]
///
/// Higher score = less real-world correlation between outcomes. Realistic
/// inputs land in [−20, 80]; the pricer clamps to [−30, 50] before mapping
/// the score to an SGP discount.
///
/// Legs without a team id are keyed by their venue tag, so a slate without
/// team ids still distinguishes home from away.

#include "parlay/types.hpp"

#include <cstddef>
#include <span>

namespace parlay {

class CorrelationScorer {
public:
    CorrelationScorer() = delete;

    /// Signed diversification score. Empty input scores 0.
    [[nodiscard]] static double score(std::span<const Leg> legs);

    /// Number of distinct teams among `legs`.
    [[nodiscard]] static std::size_t distinct_teams(std::span<const Leg> legs);

    /// Number of distinct normalised stat types among `legs`.
    [[nodiscard]] static std::size_t distinct_stats(std::span<const Leg> legs);
};

}  // namespace parlay
