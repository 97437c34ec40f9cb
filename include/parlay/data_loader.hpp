#pragma once

/// @file include/parlay/data_loader.hpp
/// @brief CSV loaders for the prop, prediction, context and injury feeds.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the CLI's CSV inputs into feed records. Malformed rows are skipped
/// with a warning on stderr; the loader never fails on bad content.
///
/// ## Expected CSV Formats
/// The first non-empty, non-comment line is a header and is skipped.
/// ```
/// player_id,player_name,team_id,venue,stat_type,line,over_odds,under_odds
/// 3112335,Nikola Jokic,7,home,Total Points,27.5,-115,-105
///
/// athlete_id,stat_type,prediction,edge,confidence,recent_trend
/// 3112335,points,30.1,2.6,High,hot
///
/// home_team_id,away_team_id,spread,over_under
/// 7,13,-4.5,231.5
///
/// athlete_id,team_id,status,position
/// 4066457,7,OUT,G
/// ```
/// Empty cells mean "absent": an empty odds cell is an unoffered side, an
/// empty spread or total is a missing market, an empty trend is neutral.
///
/// ## Guarantees
/// - `load_*` return `nullopt` only when the file cannot be opened
/// - `parse_*` never throw
/// - No external state is modified

#include "parlay/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parlay::core {

class DataLoader {
public:
    DataLoader() = delete;

    [[nodiscard]] static std::optional<std::vector<PropLine>>
    load_props(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<std::vector<Prediction>>
    load_predictions(const std::string& filepath) noexcept;

    /// # Returns
    /// `nullopt` if the file cannot be opened; a default context if it has
    /// no valid data row.
    [[nodiscard]] static std::optional<ContextSignals>
    load_context(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<std::vector<InjuryEntry>>
    load_injuries(const std::string& filepath) noexcept;

    // ── String parsers (also used by tests and the fuzz target) ──────────────

    [[nodiscard]] static std::vector<PropLine>
    parse_props(std::string_view csv) noexcept;

    [[nodiscard]] static std::vector<Prediction>
    parse_predictions(std::string_view csv) noexcept;

    /// First valid data row wins.
    [[nodiscard]] static ContextSignals
    parse_context(std::string_view csv) noexcept;

    [[nodiscard]] static std::vector<InjuryEntry>
    parse_injuries(std::string_view csv) noexcept;

    // ── Field parsers ─────────────────────────────────────────────────────────

    /// Finite double, whole cell consumed.
    [[nodiscard]] static std::optional<double>
    parse_number(const std::string& cell) noexcept;

    /// Signed integer price ("+120", "-110"), whole cell consumed.
    [[nodiscard]] static std::optional<AmericanOdds>
    parse_odds(const std::string& cell) noexcept;

    /// "High" / "Medium" / "Low", case-insensitive; anything else is Low.
    [[nodiscard]] static Confidence parse_confidence(const std::string& cell) noexcept;

    /// "hot" / "cold", case-insensitive; anything else is Neutral.
    [[nodiscard]] static Trend parse_trend(const std::string& cell) noexcept;

    /// "home" / "away", case-insensitive; anything else is Unknown.
    [[nodiscard]] static Venue parse_venue(const std::string& cell) noexcept;

private:
    /// Data rows of a CSV document, split into trimmed cells.
    static std::vector<std::vector<std::string>>
    rows(std::string_view csv);

    static std::optional<std::string> read_file(const std::string& filepath);
};

}  // namespace parlay::core
