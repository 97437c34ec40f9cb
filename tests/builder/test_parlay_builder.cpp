/// @file tests/builder/test_parlay_builder.cpp
/// @brief Tests for leg ranking, selection and variant generation.

#include <gtest/gtest.h>
#include "parlay/builder.hpp"
#include "parlay/constants.hpp"

#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace parlay;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Leg make_leg(std::string player, std::string team, StatType stat, double edge,
                    Confidence confidence = Confidence::High) {
    Leg leg;
    leg.player_id   = player;
    leg.player_name = "Player " + player;
    leg.team_id     = std::move(team);
    leg.stat        = stat;
    leg.stat_label  = std::string(to_string(stat));
    leg.edge        = edge;
    leg.strength    = std::abs(edge);
    leg.confidence  = confidence;
    leg.recommended = edge > 0 ? Side::Over : (edge < 0 ? Side::Under : Side::Push);
    leg.over_odds = leg.under_odds = leg.recommended_odds = AmericanOdds{-110};
    return leg;
}

/// Five tradable legs across two teams plus one push.
static std::vector<Leg> sample_slate() {
    return {
        make_leg("1", "A", StatType::Points,   6.0),
        make_leg("2", "A", StatType::Points,   5.0),
        make_leg("3", "B", StatType::Rebounds, -4.0),
        make_leg("4", "B", StatType::Assists,  3.0),
        make_leg("5", "A", StatType::Threes,   2.5),
        make_leg("6", "B", StatType::Points,   0.0),
    };
}

static std::vector<std::string> player_ids(const std::vector<Leg>& legs) {
    std::vector<std::string> ids;
    for (const auto& l : legs) ids.push_back(l.player_id);
    return ids;
}

// ─── rank ────────────────────────────────────────────────────────────────────

TEST(ParlayBuilderRank, DropsPushAndSortsByStrength) {
    const auto pool = ParlayBuilder::rank(sample_slate());
    EXPECT_EQ(player_ids(pool), (std::vector<std::string>{"1", "2", "3", "4", "5"}));
}

TEST(ParlayBuilderRank, TiesKeepFeedOrder) {
    std::vector<Leg> legs{
        make_leg("1", "A", StatType::Points,   3.0),
        make_leg("2", "B", StatType::Rebounds, -3.0),
        make_leg("3", "A", StatType::Assists,  3.0),
    };
    EXPECT_EQ(player_ids(ParlayBuilder::rank(legs)),
              (std::vector<std::string>{"1", "2", "3"}));
}

// ─── select_legs ─────────────────────────────────────────────────────────────

TEST(ParlayBuilderSelect, GreedyTakesTopUniqueLegs) {
    const auto pool = ParlayBuilder::rank(sample_slate());
    EXPECT_EQ(player_ids(ParlayBuilder::select_legs(pool, 3, false)),
              (std::vector<std::string>{"1", "2", "3"}));
}

TEST(ParlayBuilderSelect, GreedyMayComeUpShort) {
    const auto pool = ParlayBuilder::rank(sample_slate());
    EXPECT_EQ(ParlayBuilder::select_legs(pool, 8, false).size(), 5u);
}

TEST(ParlayBuilderSelect, DiversifiedPicksBestRotation) {
    // Offset 1 (players 2 + 3) mixes teams and stats at a high mean edge.
    const auto pool = ParlayBuilder::rank(sample_slate());
    EXPECT_EQ(player_ids(ParlayBuilder::select_legs(pool, 2, true)),
              (std::vector<std::string>{"2", "3"}));
}

TEST(ParlayBuilderSelect, DuplicateKeysNeverShareAParlay) {
    std::vector<Leg> pool{
        make_leg("1", "A", StatType::Points,   5.0),
        make_leg("1", "A", StatType::Points,   4.5),  // alternate line, same key
        make_leg("2", "B", StatType::Rebounds, 4.0),
    };
    const auto greedy = ParlayBuilder::select_legs(pool, 2, false);
    ASSERT_EQ(greedy.size(), 2u);
    EXPECT_NE(greedy[0].key(), greedy[1].key());

    // Only two unique keys: a 3-leg diversified walk can never fill.
    EXPECT_TRUE(ParlayBuilder::select_legs(pool, 3, true).empty());
}

TEST(ParlayBuilderSelect, EmptyInputs) {
    EXPECT_TRUE(ParlayBuilder::select_legs({}, 2, true).empty());
    const auto pool = ParlayBuilder::rank(sample_slate());
    EXPECT_TRUE(ParlayBuilder::select_legs(pool, 0, false).empty());
}

// ─── selection_score ─────────────────────────────────────────────────────────

TEST(ParlayBuilderScore, WeightsEdgeAndCorrelation) {
    std::vector<Leg> legs{
        make_leg("2", "A", StatType::Points,   5.0),
        make_leg("3", "B", StatType::Rebounds, -4.0),
    };
    // 0.7 · 4.5 + 0.3 · 40
    EXPECT_NEAR(ParlayBuilder::selection_score(legs), 15.15, 1e-9);
    EXPECT_DOUBLE_EQ(ParlayBuilder::selection_score({}), 0.0);
}

// ─── build ───────────────────────────────────────────────────────────────────

TEST(ParlayBuilderBuild, AllVariantsFromDeepPool) {
    const auto parlays = ParlayBuilder::build(sample_slate());
    ASSERT_EQ(parlays.size(), 4u);

    EXPECT_EQ(parlays[0].id(), "2leg-safe");
    EXPECT_EQ(parlays[0].legs.size(), 2u);
    EXPECT_EQ(parlays[0].risk, RiskLevel::Low);
    EXPECT_EQ(parlays[0].confidence, ConfidenceLabel::High);

    EXPECT_EQ(parlays[1].id(), "3leg-balanced");
    EXPECT_EQ(parlays[1].legs.size(), 3u);
    EXPECT_EQ(parlays[1].confidence, ConfidenceLabel::MediumHigh);

    EXPECT_EQ(parlays[2].id(), "4leg-aggro");
    EXPECT_EQ(parlays[2].legs.size(), 4u);
    EXPECT_EQ(parlays[2].risk, RiskLevel::High);

    EXPECT_EQ(parlays[3].id(), "value-play");
    EXPECT_EQ(parlays[3].name(), "Value Play");
}

TEST(ParlayBuilderBuild, ValuePlayUsesPositiveEdgesAboveThreshold) {
    const auto parlays = ParlayBuilder::build(sample_slate());
    ASSERT_FALSE(parlays.empty());
    const auto& value = parlays.back();
    ASSERT_EQ(value.variant, Variant::ValuePlay);
    // Player 3 has |edge| 4 but a negative edge.
    EXPECT_EQ(player_ids(value.legs), (std::vector<std::string>{"1", "2", "4"}));
    for (const auto& leg : value.legs) {
        EXPECT_GT(leg.edge, constants::VALUE_PLAY_MIN_EDGE);
    }
}

TEST(ParlayBuilderBuild, NoPushLegInAnyVariant) {
    for (const auto& p : ParlayBuilder::build(sample_slate())) {
        for (const auto& leg : p.legs) {
            EXPECT_NE(leg.recommended, Side::Push) << p.id();
        }
    }
}

TEST(ParlayBuilderBuild, NoDuplicateKeysInAnyVariant) {
    auto legs = sample_slate();
    legs.push_back(make_leg("1", "A", StatType::Points, 5.5));
    legs.push_back(make_leg("4", "B", StatType::Assists, 3.2));

    for (const auto& p : ParlayBuilder::build(legs)) {
        std::set<std::string> keys;
        for (const auto& leg : p.legs) {
            EXPECT_TRUE(keys.insert(leg.key()).second) << p.id() << " " << leg.key();
        }
    }
}

TEST(ParlayBuilderBuild, UnfillableVariantsOmitted) {
    std::vector<Leg> legs{
        make_leg("1", "A", StatType::Points,   4.0),
        make_leg("2", "B", StatType::Rebounds, -3.0),
        make_leg("3", "A", StatType::Assists,  1.5),
        make_leg("4", "B", StatType::Points,   0.0),
    };
    const auto parlays = ParlayBuilder::build(legs);
    ASSERT_EQ(parlays.size(), 2u);
    EXPECT_EQ(parlays[0].id(), "2leg-safe");
    EXPECT_EQ(parlays[1].id(), "3leg-balanced");
}

TEST(ParlayBuilderBuild, AllPushYieldsNothing) {
    std::vector<Leg> legs{
        make_leg("1", "A", StatType::Points,   0.0),
        make_leg("2", "B", StatType::Rebounds, 0.0),
    };
    EXPECT_TRUE(ParlayBuilder::build(legs).empty());
}

TEST(ParlayBuilderBuild, Deterministic) {
    const auto a = ParlayBuilder::build(sample_slate());
    const auto b = ParlayBuilder::build(sample_slate());
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id(), b[i].id());
        EXPECT_EQ(player_ids(a[i].legs), player_ids(b[i].legs));
        EXPECT_EQ(a[i].reasoning, b[i].reasoning);
    }
}

// ─── reasoning ───────────────────────────────────────────────────────────────

TEST(ParlayBuilderReasoning, DescribesDiversifiedCombination) {
    std::vector<Leg> legs{
        make_leg("2", "A", StatType::Points,   5.0),
        make_leg("3", "B", StatType::Rebounds, -4.0),
    };
    EXPECT_EQ(ParlayBuilder::reasoning(legs),
              "This parlay has an average edge of 0.5 points over Vegas lines. "
              "Props are spread across 2 teams, reducing correlation risk. "
              "Diverse stat types provide good independence. "
              "All legs have high confidence ratings.");
}

TEST(ParlayBuilderReasoning, FlagsCorrelatedCombination) {
    std::vector<Leg> legs{
        make_leg("1", "A", StatType::Points, 5.0, Confidence::High),
        make_leg("2", "A", StatType::Points, 4.0, Confidence::Low),
        make_leg("3", "A", StatType::Points, 3.0, Confidence::Medium),
    };
    EXPECT_EQ(ParlayBuilder::reasoning(legs),
              "This parlay has an average edge of 4.0 points over Vegas lines. "
              "All props from same team - higher correlation risk. "
              "All same stat type - outcomes are correlated. "
              "1 of 3 legs have high confidence.");
}
