#pragma once

/// @file include/parlay/engine.hpp
/// @brief Engine — one-call grading and pricing for a game.
///
/// # Module: Engine
///
/// ## Responsibility
/// Orchestrate the full pipeline for one game:
///   props + predictions → PropMatcher → GradeCalculator →
///   ParlayBuilder (+ CorrelationScorer) → ParlayPricer → GameAnalysis
///
/// ## Usage
/// ```cpp
/// parlay::core::Engine engine(parlay::core::EngineConfig{.stake = 25.0});
/// GameSlate slate{props, predictions, context};
/// auto analysis = engine.analyze(slate);
/// for (const auto& p : analysis.parlays) fmt::print("{}\n", p.to_string());
/// ```
///
/// ## Guarantees
/// - Stateless between calls: every result is a function of the slate and
///   the config. `analyze` is const and safe to call concurrently.
/// - Throws `InvalidOdds` when a selected leg carries a price of 0; nothing
///   else throws.
/// - No I/O beyond optional verbose diagnostics on stderr.

#include "parlay/types.hpp"
#include "parlay/constants.hpp"

#include <vector>

namespace parlay::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Amount wagered on every generated parlay.
    double stake = constants::DEFAULT_STAKE;

    /// If true, emit per-stage counts to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Match and grade every prop of the slate (tabular view).
    [[nodiscard]] std::vector<Leg> grade_props(const GameSlate& slate) const;

    /// Grade, build and price all parlay variants.
    ///
    /// # Throws
    /// `InvalidOdds` if a selected leg's price cannot be converted.
    [[nodiscard]] GameAnalysis analyze(const GameSlate& slate) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

}  // namespace parlay::core
