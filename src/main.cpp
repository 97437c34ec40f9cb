/// @file src/main.cpp
/// @brief parlay CLI entry point.
///
/// Usage:
///   parlay --props <csv> --predictions <csv> [--context <csv>]
///          [--injuries <csv>] [--stake <amount>] [--verbose]
///          [--team <id>] [--player <id>] [--stat <label>]...
///   parlay --help

#include "parlay/data_loader.hpp"
#include "parlay/engine.hpp"
#include "parlay/grade.hpp"
#include "parlay/matcher.hpp"
#include "parlay/odds.hpp"
#include "parlay/stat_type.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  parlay --props <csv> --predictions <csv> [options]\n"
        "\n"
        "Options:\n"
        "  --context <csv>    home_team_id,away_team_id,spread,over_under\n"
        "  --injuries <csv>   athlete_id,team_id,status,position\n"
        "  --stake <amount>   Bet amount per parlay (default 10, minimum 1)\n"
        "  --verbose          Per-stage diagnostics on stderr\n"
        "  --team <id>        Show only this team's props in the table\n"
        "  --player <id>      Show only this player's props in the table\n"
        "  --stat <label>     Show only this stat type (repeatable)\n"
        "  --help             Show this help\n"
        "\n"
        "CSV formats (header required):\n"
        "  props:       player_id,player_name,team_id,venue,stat_type,line,over_odds,under_odds\n"
        "  predictions: athlete_id,stat_type,prediction,edge,confidence,recent_trend\n"
    );
}

struct Options {
    std::string props_path;
    std::string predictions_path;
    std::optional<std::string> context_path;
    std::optional<std::string> injuries_path;
    double stake   = parlay::constants::DEFAULT_STAKE;
    bool   verbose = false;
    parlay::LegFilter filter;
};

/// Load every feed named on the command line into a slate.
/// Returns nullopt (after reporting) if a required file cannot be read.
std::optional<parlay::GameSlate> load_slate(const Options& opts) {
    using parlay::core::DataLoader;

    parlay::GameSlate slate;

    auto props = DataLoader::load_props(opts.props_path);
    if (!props) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.props_path);
        return std::nullopt;
    }
    slate.props = std::move(*props);

    auto preds = DataLoader::load_predictions(opts.predictions_path);
    if (!preds) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.predictions_path);
        return std::nullopt;
    }
    slate.predictions = std::move(*preds);

    if (opts.context_path) {
        auto ctx = DataLoader::load_context(*opts.context_path);
        if (!ctx) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.context_path);
            return std::nullopt;
        }
        slate.context = std::move(*ctx);
    }

    if (opts.injuries_path) {
        auto injuries = DataLoader::load_injuries(*opts.injuries_path);
        if (!injuries) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.injuries_path);
            return std::nullopt;
        }
        slate.context.injuries = std::move(*injuries);
    }

    return slate;
}

/// Grade, build and price; print the prop table and parlay cards.
/// Returns 0 on success, 1 on error.
int run(const Options& opts) {
    auto slate = load_slate(opts);
    if (!slate) {
        return 1;
    }

    fmt::print("Loaded {} props and {} predictions\n",
               slate->props.size(), slate->predictions.size());

    parlay::core::Engine engine(parlay::core::EngineConfig{
        .stake   = opts.stake,
        .verbose = opts.verbose,
    });

    parlay::GameAnalysis analysis;
    try {
        analysis = engine.analyze(*slate);
    } catch (const parlay::InvalidOdds& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    fmt::print("\n{:<24} {:<24} {:>6} {:>6} {:>6}  {:<5} {:>5}  {}\n",
               "Player", "Prop", "Line", "Pred", "Edge", "Pick", "Odds", "Grade");
    for (const auto& leg : parlay::filter_legs(analysis.legs, opts.filter)) {
        fmt::print("{}  {}\n", leg.to_string(),
                   parlay::to_string(parlay::GradeCalculator::tier(leg.grade)));
        for (const auto& f : leg.factors) {
            fmt::print("    · {}\n", f.label);
        }
    }

    if (analysis.parlays.empty()) {
        fmt::print("\nNot enough graded legs to build a parlay.\n");
        return 0;
    }

    fmt::print("\n");
    for (const auto& p : analysis.parlays) {
        fmt::print("{}\n", p.to_string());
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            print_usage();
            return 1;
        }
        const std::string value(argv[++i]);

        if (arg == "--props") {
            opts.props_path = value;
        } else if (arg == "--predictions") {
            opts.predictions_path = value;
        } else if (arg == "--context") {
            opts.context_path = value;
        } else if (arg == "--injuries") {
            opts.injuries_path = value;
        } else if (arg == "--team") {
            opts.filter.team_id = value;
        } else if (arg == "--player") {
            opts.filter.player_id = value;
        } else if (arg == "--stat") {
            auto stat = parlay::parse_stat_type(value);
            if (!stat) {
                fmt::print(stderr, "Error: unknown stat type '{}'\n", value);
                return 1;
            }
            opts.filter.stats.push_back(*stat);
        } else if (arg == "--stake") {
            auto stake = parlay::core::DataLoader::parse_number(value);
            if (!stake) {
                fmt::print(stderr, "Error: invalid stake '{}'\n", value);
                return 1;
            }
            opts.stake = std::max(*stake, parlay::constants::MIN_STAKE);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    if (opts.props_path.empty() || opts.predictions_path.empty()) {
        fmt::print(stderr, "Error: --props and --predictions are required\n");
        print_usage();
        return 1;
    }

    return run(opts);
}
