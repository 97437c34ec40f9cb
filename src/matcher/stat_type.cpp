/// @file src/matcher/stat_type.cpp
/// @brief Stat label normalisation.

#include "parlay/stat_type.hpp"

#include <array>
#include <cctype>
#include <string>
#include <vector>
#include <utility>

namespace parlay {

namespace {

// Stat components, combined as a bitmask.
constexpr unsigned PTS = 1u << 0;
constexpr unsigned REB = 1u << 1;
constexpr unsigned AST = 1u << 2;
constexpr unsigned STL = 1u << 3;
constexpr unsigned BLK = 1u << 4;
constexpr unsigned THR = 1u << 5;

std::vector<std::string> tokenize(std::string_view label) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : label) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool is_filler(const std::string& t) {
    static constexpr std::array<std::string_view, 7> FILLER{
        "total", "player", "field", "goals", "goal", "made", "and"};
    for (auto f : FILLER) {
        if (t == f) return true;
    }
    return false;
}

/// Component mask for one token, 0 if unknown.
unsigned token_mask(const std::string& t) {
    if (t == "points" || t == "point" || t == "pts")            return PTS;
    if (t == "rebounds" || t == "rebound" || t == "reb" ||
        t == "rebs")                                            return REB;
    if (t == "assists" || t == "assist" || t == "ast" ||
        t == "asts")                                            return AST;
    if (t == "steals" || t == "steal" || t == "stl")            return STL;
    if (t == "blocks" || t == "block" || t == "blk")            return BLK;
    if (t == "threes" || t == "three" || t == "3pm" ||
        t == "3pt" || t == "3ptm" || t == "3")                  return THR;
    if (t == "pra")                                             return PTS | REB | AST;
    if (t == "pr")                                              return PTS | REB;
    if (t == "pa")                                              return PTS | AST;
    if (t == "ra")                                              return REB | AST;
    if (t == "stocks")                                          return STL | BLK;
    return 0;
}

std::optional<StatType> from_mask(unsigned mask) noexcept {
    switch (mask) {
        case PTS:             return StatType::Points;
        case REB:             return StatType::Rebounds;
        case AST:             return StatType::Assists;
        case STL:             return StatType::Steals;
        case BLK:             return StatType::Blocks;
        case THR:             return StatType::Threes;
        case PTS | REB:       return StatType::PointsRebounds;
        case PTS | AST:       return StatType::PointsAssists;
        case REB | AST:       return StatType::ReboundsAssists;
        case PTS | REB | AST: return StatType::PointsReboundsAssists;
        case STL | BLK:       return StatType::StealsBlocks;
        default:              return std::nullopt;
    }
}

unsigned to_mask(StatType s) noexcept {
    switch (s) {
        case StatType::Points:                return PTS;
        case StatType::Rebounds:              return REB;
        case StatType::Assists:               return AST;
        case StatType::Steals:                return STL;
        case StatType::Blocks:                return BLK;
        case StatType::Threes:                return THR;
        case StatType::PointsRebounds:        return PTS | REB;
        case StatType::PointsAssists:         return PTS | AST;
        case StatType::ReboundsAssists:       return REB | AST;
        case StatType::PointsReboundsAssists: return PTS | REB | AST;
        case StatType::StealsBlocks:          return STL | BLK;
    }
    return 0;
}

}  // anonymous namespace

std::optional<StatType> parse_stat_type(std::string_view label) {
    const auto tokens = tokenize(label);
    if (tokens.empty()) {
        return std::nullopt;
    }

    unsigned mask = 0;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (is_filler(t)) {
            continue;
        }

        const unsigned m = token_mask(t);
        if (m == 0) {
            // "pointers" only appears in "three_pointers".
            if (t == "pointers" && (mask & THR) != 0) {
                continue;
            }
            return std::nullopt;
        }
        mask |= m;

        // "3-Point", "three point": the "point" belongs to the three.
        if (m == THR && i + 1 < tokens.size()) {
            const auto& next = tokens[i + 1];
            if (next == "point" || next == "pt" || next == "pointers") {
                ++i;
            }
        }
    }

    return from_mask(mask);
}

bool is_scoring_type(StatType s) noexcept {
    return (to_mask(s) & (PTS | AST)) != 0;
}

bool is_defensive_type(StatType s) noexcept {
    return (to_mask(s) & (REB | BLK)) != 0;
}

bool is_combined(StatType s) noexcept {
    const unsigned m = to_mask(s);
    return (m & (m - 1)) != 0;
}

bool stat_contains(StatType prop, StatType pred) noexcept {
    return (to_mask(pred) & ~to_mask(prop)) == 0;
}

}  // namespace parlay
