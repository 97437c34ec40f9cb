#pragma once

/// @file include/parlay/stat_type.hpp
/// @brief Normalisation of sportsbook and model stat labels to StatType.
///
/// Sportsbooks and the prediction model name the same statistic differently
/// ("Total Points" vs "points", "Total 3-Point Field Goals" vs
/// "three_pointers", "Points + Rebounds + Assists" vs "pra"). Labels are
/// lower-cased, split on non-alphanumeric characters, filler words such as
/// "total" are dropped, and the remaining tokens are mapped to stat
/// components. The component set selects the StatType.

#include "parlay/types.hpp"

#include <optional>
#include <string_view>

namespace parlay {

/// Parse a free-form stat label.
///
/// # Returns
/// `nullopt` for an empty label, an unrecognised token, or a combination of
/// components that no sportsbook market offers (e.g. points + steals).
[[nodiscard]] std::optional<StatType> parse_stat_type(std::string_view label);

/// True for props driven by scoring volume (any points or assists component).
[[nodiscard]] bool is_scoring_type(StatType s) noexcept;

/// True for props favoured by slow, defensive games (any rebounds or
/// blocks component).
[[nodiscard]] bool is_defensive_type(StatType s) noexcept;

/// True for the multi-stat markets.
[[nodiscard]] bool is_combined(StatType s) noexcept;

/// True when every component of `pred` is also a component of `prop`,
/// e.g. a "points" prediction inside a points + rebounds + assists prop.
/// Equal stat types always contain each other.
[[nodiscard]] bool stat_contains(StatType prop, StatType pred) noexcept;

}  // namespace parlay
