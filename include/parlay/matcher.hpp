#pragma once

/// @file include/parlay/matcher.hpp
/// @brief PropMatcher — pairs sportsbook props with model predictions.
///
/// # Module: PropMatcher
///
/// ## Responsibility
/// For each tradable prop (both sides priced) find the prediction for the
/// same player whose normalised stat type equals the prop's, or failing that
/// is one of its components ("points" inside points + rebounds + assists),
/// and build an ungraded Leg:
///   - recommended side follows the sign of edge (0 ⇒ push)
///   - recommended odds are the odds of that side
///   - hit probability of the favoured side is
///       clamp(0.55 + min(|edge|, 10) · 0.02, 0, 1)
///     and the other side takes the complement
///
/// Props without a prediction, alternate (one-sided) lines and labels that
/// do not normalise to a StatType are dropped silently.
/// A missing prediction is the common case.
///
/// ## Guarantees
/// - Stateless; output order follows prop feed order
/// - Legs come back with grade 0 and no factors (see grade.hpp)

#include "parlay/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace parlay {

/// Display filter for the per-prop table. Unset fields match everything.
struct LegFilter {
    std::optional<std::string> team_id;
    std::optional<std::string> player_id;
    std::vector<StatType>      stats;  ///< Empty = all stat types
};

class PropMatcher {
public:
    /// Match every tradable prop to its prediction.
    [[nodiscard]] static std::vector<Leg>
    match(std::span<const PropLine>   props,
          std::span<const Prediction> predictions);

    /// Find the prediction for `player_id` whose label normalises to `stat`,
    /// else the first one contained in `stat` (see stat_contains).
    /// Within each tier the first match in feed order wins.
    [[nodiscard]] static const Prediction*
    find_prediction(std::span<const Prediction> predictions,
                    const std::string&          player_id,
                    StatType                    stat);

    /// Build a leg from a tradable prop and its prediction.
    ///
    /// # Returns
    /// `nullopt` if either side of the prop is unpriced or any numeric input
    /// is non-finite.
    [[nodiscard]] static std::optional<Leg>
    build_leg(const PropLine& prop, const Prediction& prediction,
              StatType stat);

    /// Favoured-side hit probability for a given edge.
    [[nodiscard]] static double favoured_hit_probability(double edge) noexcept;
};

/// Legs matching `filter`, in their original order.
[[nodiscard]] std::vector<Leg>
filter_legs(std::span<const Leg> legs, const LegFilter& filter);

}  // namespace parlay
