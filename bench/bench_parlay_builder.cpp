/**
 * @file  bench/bench_parlay_builder.cpp
 * @brief Google Benchmark suite for leg selection, pricing and the full
 *        Engine pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Rank                 — push filter + stable sort by |edge|
 *   BM_SelectDiversified    — 5-offset rotation search, 4 legs
 *   BM_Build                — all four variants
 *   BM_CombinedOdds         — Eigen product + SGP discount
 *   BM_Analyze              — match, grade, build and price one slate
 *
 * Build (CMake):
 *   cmake -DPARLAY_BENCH=ON ..
 *   cmake --build build --target bench_parlay_builder
 *   ./build/bench_parlay_builder --benchmark_format=json
 *
 * Throughput units: items/second (legs processed).
 */

#include "benchmark/benchmark.h"

#include "parlay/builder.hpp"
#include "parlay/engine.hpp"
#include "parlay/pricer.hpp"
#include "parlay/types.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static constexpr parlay::StatType kStats[] = {
    parlay::StatType::Points, parlay::StatType::Rebounds,
    parlay::StatType::Assists, parlay::StatType::Threes,
    parlay::StatType::PointsReboundsAssists,
};

/// N legs spread over two teams and five stat types, edges in [−6, 6].
static std::vector<parlay::Leg> make_legs(std::size_t n) {
    std::vector<parlay::Leg> legs(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto& leg = legs[i];
        leg.player_id        = std::to_string(i / 5);
        leg.player_name      = "Player " + leg.player_id;
        leg.team_id          = (i / 5) % 2 == 0 ? "7" : "13";
        leg.stat             = kStats[i % 5];
        leg.edge             = -6.0 + 12.0 * static_cast<double>((i * 37) % 101) / 100.0;
        leg.strength         = std::abs(leg.edge);
        leg.recommended      = leg.edge >= 0.0 ? parlay::Side::Over : parlay::Side::Under;
        leg.recommended_odds = parlay::AmericanOdds{i % 3 == 0 ? 120 : -110};
        leg.over_hit_prob    = 0.6;
        leg.under_hit_prob   = 0.4;
    }
    return legs;
}

/// A slate whose props and predictions match one-to-one.
static parlay::GameSlate make_slate(std::size_t n) {
    static const char* kLabels[] = {"Total Points", "Total Rebounds", "Total Assists"};
    static const char* kModel[]  = {"points", "rebounds", "assists"};

    parlay::GameSlate slate;
    slate.context.home_team_id = "7";
    slate.context.away_team_id = "13";
    slate.context.spread       = -4.5;
    slate.context.over_under   = 228.5;
    for (std::size_t i = 0; i < n; ++i) {
        const std::string id = std::to_string(i / 3);
        slate.props.push_back(parlay::PropLine{
            .player_id   = id,
            .player_name = "Player " + id,
            .team_id     = (i / 3) % 2 == 0 ? "7" : "13",
            .venue       = (i / 3) % 2 == 0 ? parlay::Venue::Home : parlay::Venue::Away,
            .stat_label  = kLabels[i % 3],
            .line        = 10.5,
            .over_odds   = parlay::AmericanOdds{-115},
            .under_odds  = parlay::AmericanOdds{-105},
        });
        const double edge = -5.0 + 10.0 * static_cast<double>((i * 53) % 97) / 96.0;
        slate.predictions.push_back(parlay::Prediction{
            .athlete_id = id,
            .stat_label = kModel[i % 3],
            .predicted  = 10.5 + edge,
            .edge       = edge,
            .confidence = parlay::Confidence::High,
            .trend      = parlay::Trend::Neutral,
        });
    }
    return slate;
}

// ── Builder benchmarks ─────────────────────────────────────────────────────────

static void BM_Rank(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto legs = make_legs(n);
    for (auto _ : state) {
        auto pool = parlay::ParlayBuilder::rank(legs);
        benchmark::DoNotOptimize(pool.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Rank)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_SelectDiversified(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto pool = parlay::ParlayBuilder::rank(make_legs(n));
    for (auto _ : state) {
        auto selected = parlay::ParlayBuilder::select_legs(pool, 4, true);
        benchmark::DoNotOptimize(selected.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_SelectDiversified)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_Build(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto legs = make_legs(n);
    for (auto _ : state) {
        auto parlays = parlay::ParlayBuilder::build(legs);
        benchmark::DoNotOptimize(parlays.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Build)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

// ── Pricer benchmarks ──────────────────────────────────────────────────────────

static void BM_CombinedOdds(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto legs = make_legs(n);
    for (auto _ : state) {
        auto quote = parlay::ParlayPricer::combined_odds(legs);
        benchmark::DoNotOptimize(quote);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_CombinedOdds)->DenseRange(2, 4, 1)->Unit(benchmark::kNanosecond);

// ── Pipeline benchmark ─────────────────────────────────────────────────────────

static void BM_Analyze(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto slate = make_slate(n);
    const parlay::core::Engine engine;
    for (auto _ : state) {
        auto analysis = engine.analyze(slate);
        benchmark::DoNotOptimize(analysis.parlays.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Analyze)->RangeMultiplier(2)->Range(12, 96)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
