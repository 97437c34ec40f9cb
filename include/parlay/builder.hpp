#pragma once

/// @file include/parlay/builder.hpp
/// @brief ParlayBuilder — selects leg combinations for the parlay variants.
///
/// # Module: ParlayBuilder
///
/// ## Leg Selection
/// The pool is every non-push leg, ranked by |edge| descending (stable, so
/// ties keep feed order). No combination ever holds two legs with the same
/// player + stat key.
///
/// - Greedy (`diversify = false`): walk the ranked pool, take the first
///   `count` unique legs.
/// - Diversified (`diversify = true`): repeat the greedy walk from up to 5
///   rotation offsets (0..4, wrapping around the pool). Each walk that fills
///   `count` legs is scored
///
///       0.7 · mean(|edge|) + 0.3 · CorrelationScorer
///
///   and the best one wins (first offset on ties). Offsets are fixed, so the
///   same pool always yields the same combination.
///
/// ## Variants
/// | Variant       | Size | Selection   | Risk   | Confidence  |
/// |---------------|------|-------------|--------|-------------|
/// | 2leg-safe     | 2    | diversified | Low    | High        |
/// | 3leg-balanced | 3    | diversified | Medium | Medium-High |
/// | 4leg-aggro    | 4    | diversified | High   | Medium      |
/// | value-play    | ≤3   | greedy, edge > 2 only | Medium | High |
///
/// A variant that cannot be filled is left out; value play needs ≥ 2 legs.

#include "parlay/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace parlay {

class ParlayBuilder {
public:
    ParlayBuilder() = delete;

    /// Generate every variant that the leg pool can fill.
    [[nodiscard]] static std::vector<ParlayCandidate>
    build(std::span<const Leg> legs);

    /// Non-push legs ranked by strength, descending.
    [[nodiscard]] static std::vector<Leg> rank(std::span<const Leg> legs);

    /// Select up to `count` unique legs from a ranked pool.
    ///
    /// # Returns
    /// Greedy mode may return fewer than `count` legs when the pool runs
    /// out. Diversified mode returns exactly `count` legs or none.
    [[nodiscard]] static std::vector<Leg>
    select_legs(std::span<const Leg> pool, std::size_t count, bool diversify);

    /// 0.7 · mean strength + 0.3 · correlation score.
    [[nodiscard]] static double selection_score(std::span<const Leg> legs);

    /// Descriptive summary of a combination; not used for scoring.
    [[nodiscard]] static std::string reasoning(std::span<const Leg> legs);

private:
    /// One greedy walk starting at `offset`, wrapping to the front.
    static std::vector<Leg>
    walk(std::span<const Leg> pool, std::size_t count, std::size_t offset);
};

}  // namespace parlay
