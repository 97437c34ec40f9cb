#pragma once

/// @file include/parlay/grade.hpp
/// @brief GradeCalculator — contextual pick-quality grade for a single leg.
///
/// # Module: GradeCalculator
///
/// ## The Model
/// An additive score, clamped to [0, 1]:
///
///     grade = clamp(base + injury + venue + pace + competitiveness + trend, 0, 1)
///
///   base            = min(|edge|/10, 1) · {High 1.0, Medium 0.85, Low 0.70}
///   injury          = +0.08 per OUT teammate at G/F/C, capped at +0.20
///   venue           = +0.05 at home with a positive edge
///   pace            = scoring props: +0.08 (O/U ≥ 230), +0.05 (≥ 220),
///                     −0.05 (< 210); rebound/block props: +0.05 (< 210)
///   competitiveness = +0.06 if |spread| ≤ 5; −0.08 if |spread| > 12 and
///                     the player's team is the underdog
///   trend           = +0.05 hot, −0.05 cold
///
/// Every non-zero term is reported as a GradeFactor with a display label.
/// Missing context (no spread, no total, no injuries) contributes zero.
///
/// ## Guarantees
/// - Total function: never fails, output always in [0, 1]
/// - Stateless; thread-safe

#include "parlay/types.hpp"

#include <span>
#include <vector>

namespace parlay {

/// Grade plus the ordered list of contributing terms.
struct GradeResult {
    double                   grade;
    std::vector<GradeFactor> factors;
};

class GradeCalculator {
public:
    /// Grade one leg against the game context.
    [[nodiscard]] static GradeResult
    grade(const Leg& leg, const ContextSignals& context);

    /// Return copies of `legs` with grade and factors filled in.
    [[nodiscard]] static std::vector<Leg>
    grade_all(std::span<const Leg> legs, const ContextSignals& context);

    /// Display bucket for a grade.
    [[nodiscard]] static GradeTier tier(double grade) noexcept;

    [[nodiscard]] static double confidence_multiplier(Confidence c) noexcept;

    // ── Individual terms (exposed for testing) ───────────────────────────────

    [[nodiscard]] static double base_term(double edge, Confidence c) noexcept;

    /// Number of teammates ruled OUT at a primary position.
    [[nodiscard]] static int
    significant_injuries(const Leg& leg, const ContextSignals& context) noexcept;

    /// Venue from the leg's tag, falling back to team id vs context.
    [[nodiscard]] static Venue
    resolve_venue(const Leg& leg, const ContextSignals& context) noexcept;

    /// True iff the player's team is the underdog on the signed spread.
    [[nodiscard]] static bool
    is_underdog(Venue venue, double spread) noexcept;
};

}  // namespace parlay
