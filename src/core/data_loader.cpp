/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for the engine's input feeds.

#include "parlay/data_loader.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace parlay::core {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void warn_row(std::string_view feed, const std::vector<std::string>& row) {
    std::string joined;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) joined += ',';
        joined += row[i];
    }
    fmt::print(stderr, "Skipping malformed {} row: {}\n", feed, joined);
}

}  // anonymous namespace

// ─── Field parsers ────────────────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(const std::string& cell) noexcept {
    if (cell.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double v = std::stod(cell, &pos);
        if (pos != cell.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<AmericanOdds> DataLoader::parse_odds(const std::string& cell) noexcept {
    if (cell.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(cell, &pos);
        if (pos != cell.size()) {
            return std::nullopt;
        }
        return AmericanOdds{static_cast<std::int64_t>(v)};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Confidence DataLoader::parse_confidence(const std::string& cell) noexcept {
    const auto c = lower(cell);
    if (c == "high")   return Confidence::High;
    if (c == "medium") return Confidence::Medium;
    return Confidence::Low;
}

Trend DataLoader::parse_trend(const std::string& cell) noexcept {
    const auto t = lower(cell);
    if (t == "hot")  return Trend::Hot;
    if (t == "cold") return Trend::Cold;
    return Trend::Neutral;
}

Venue DataLoader::parse_venue(const std::string& cell) noexcept {
    const auto v = lower(cell);
    if (v == "home") return Venue::Home;
    if (v == "away") return Venue::Away;
    return Venue::Unknown;
}

// ─── DataLoader::rows ─────────────────────────────────────────────────────────

std::vector<std::vector<std::string>>
DataLoader::rows(std::string_view csv) {
    std::vector<std::vector<std::string>> out;
    std::istringstream stream{std::string(csv)};
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        std::vector<std::string> cells;
        std::istringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            cells.push_back(trim(cell));
        }
        // getline drops a trailing empty cell ("a,b,").
        if (line.back() == ',') {
            cells.emplace_back();
        }
        out.push_back(std::move(cells));
    }

    return out;
}

// ─── Feed parsers ─────────────────────────────────────────────────────────────

std::vector<PropLine> DataLoader::parse_props(std::string_view csv) noexcept {
    std::vector<PropLine> props;
    try {
        for (const auto& r : rows(csv)) {
            if (r.size() != 8 || r[0].empty() || r[4].empty()) {
                warn_row("prop", r);
                continue;
            }
            const auto line = parse_number(r[5]);
            const auto over = parse_odds(r[6]);
            const auto under = parse_odds(r[7]);
            // A non-empty odds cell must parse; an empty one is an unoffered side.
            if (!line || (!r[6].empty() && !over) || (!r[7].empty() && !under)) {
                warn_row("prop", r);
                continue;
            }
            props.push_back(PropLine{
                .player_id   = r[0],
                .player_name = r[1],
                .team_id     = r[2],
                .venue       = parse_venue(r[3]),
                .stat_label  = r[4],
                .line        = *line,
                .over_odds   = over,
                .under_odds  = under,
            });
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Prop feed truncated: {}\n", e.what());
    }
    return props;
}

std::vector<Prediction> DataLoader::parse_predictions(std::string_view csv) noexcept {
    std::vector<Prediction> preds;
    try {
        for (const auto& r : rows(csv)) {
            if ((r.size() != 5 && r.size() != 6) || r[0].empty() || r[1].empty()) {
                warn_row("prediction", r);
                continue;
            }
            const auto predicted = parse_number(r[2]);
            const auto edge = parse_number(r[3]);
            if (!predicted || !edge) {
                warn_row("prediction", r);
                continue;
            }
            preds.push_back(Prediction{
                .athlete_id = r[0],
                .stat_label = r[1],
                .predicted  = *predicted,
                .edge       = *edge,
                .confidence = parse_confidence(r[4]),
                .trend      = r.size() == 6 ? parse_trend(r[5]) : Trend::Neutral,
            });
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Prediction feed truncated: {}\n", e.what());
    }
    return preds;
}

ContextSignals DataLoader::parse_context(std::string_view csv) noexcept {
    ContextSignals ctx;
    try {
        for (const auto& r : rows(csv)) {
            if (r.size() != 4) {
                warn_row("context", r);
                continue;
            }
            // Present-but-garbled markets are rejected rather than dropped.
            const auto spread = parse_number(r[2]);
            const auto total = parse_number(r[3]);
            if ((!r[2].empty() && !spread) || (!r[3].empty() && !total)) {
                warn_row("context", r);
                continue;
            }
            ctx.home_team_id = r[0];
            ctx.away_team_id = r[1];
            ctx.spread       = spread;
            ctx.over_under   = total;
            break;
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Context feed truncated: {}\n", e.what());
    }
    return ctx;
}

std::vector<InjuryEntry> DataLoader::parse_injuries(std::string_view csv) noexcept {
    std::vector<InjuryEntry> injuries;
    try {
        for (const auto& r : rows(csv)) {
            if (r.size() != 4 || r[0].empty()) {
                warn_row("injury", r);
                continue;
            }
            injuries.push_back(InjuryEntry{
                .athlete_id = r[0],
                .team_id    = r[1],
                .status     = r[2],
                .position   = r[3],
            });
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Injury feed truncated: {}\n", e.what());
    }
    return injuries;
}

// ─── File loaders ─────────────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::optional<std::vector<PropLine>>
DataLoader::load_props(const std::string& filepath) noexcept {
    try {
        auto text = read_file(filepath);
        if (!text) return std::nullopt;
        return parse_props(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<Prediction>>
DataLoader::load_predictions(const std::string& filepath) noexcept {
    try {
        auto text = read_file(filepath);
        if (!text) return std::nullopt;
        return parse_predictions(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<ContextSignals>
DataLoader::load_context(const std::string& filepath) noexcept {
    try {
        auto text = read_file(filepath);
        if (!text) return std::nullopt;
        return parse_context(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<InjuryEntry>>
DataLoader::load_injuries(const std::string& filepath) noexcept {
    try {
        auto text = read_file(filepath);
        if (!text) return std::nullopt;
        return parse_injuries(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace parlay::core
