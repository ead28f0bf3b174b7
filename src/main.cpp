/// @file src/main.cpp
/// @brief votecast CLI entry point.
///
/// Usage:
///   votecast --forecast <csv_file> --year <Y> [options]   Forecast from CSV history
///   votecast --help                                      Print usage

#include "votecast/data_loader.hpp"
#include "votecast/memory_store.hpp"
#include "votecast/narrative.hpp"
#include "votecast/orchestrator.hpp"

#include "core/text_detail.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  votecast --forecast <csv_file> --year <Y> [options]\n"
        "  votecast --help\n"
        "\n"
        "Options:\n"
        "  --position <P>        Restrict history to one contested position\n"
        "  --state <S>           Restrict history to one region code\n"
        "  --years <a,b,c>       Explicit history years (default: Y-4, Y-8, Y-12)\n"
        "  --param <key=value>   Override a model parameter (repeatable)\n"
        "  --seed <N>            Fix the random seed\n"
        "  --verbose             Trace per-party forecasts to stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  year,party,region,position,total_votes,candidate_count\n"
    );
}

std::optional<std::vector<int>> parse_years(std::string_view text) {
    std::vector<int> years;
    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto year  = votecast::detail::parse_full<int>(text.substr(0, comma));
        if (!year) return std::nullopt;
        years.push_back(*year);
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
    }
    if (years.empty()) return std::nullopt;
    return years;
}

struct Args {
    std::string                               csv_path;
    votecast::engine::RunRequest              request;
    votecast::engine::OrchestratorConfig      config;
};

std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    bool have_year = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view key(argv[i]);

        if (key == "--verbose") {
            args.config.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", key);
            return std::nullopt;
        }
        const std::string_view val(argv[++i]);

        if (key == "--forecast") {
            args.csv_path = std::string(val);
        } else if (key == "--year") {
            const auto y = votecast::detail::parse_full<int>(val);
            if (!y) {
                fmt::print(stderr, "Error: invalid year '{}'\n", val);
                return std::nullopt;
            }
            args.request.target_year = *y;
            have_year = true;
        } else if (key == "--position") {
            args.request.target_position = std::string(val);
        } else if (key == "--state") {
            args.request.target_state = std::string(val);
        } else if (key == "--years") {
            args.request.historical_years = parse_years(val);
            if (!args.request.historical_years) {
                fmt::print(stderr, "Error: invalid year list '{}'\n", val);
                return std::nullopt;
            }
        } else if (key == "--param") {
            if (!args.request.parameters.apply_assignment(val)) {
                fmt::print(stderr, "Error: invalid parameter override '{}'\n", val);
                return std::nullopt;
            }
        } else if (key == "--seed") {
            const auto s = votecast::detail::parse_full<std::uint64_t>(val);
            if (!s) {
                fmt::print(stderr, "Error: invalid seed '{}'\n", val);
                return std::nullopt;
            }
            args.config.seed = *s;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }

    if (args.csv_path.empty() || !have_year) {
        fmt::print(stderr, "Error: --forecast <csv_file> and --year <Y> are required\n");
        return std::nullopt;
    }
    return args;
}

/// Load history, run one forecast through the background worker and print
/// the stored outcome. Returns 0 on success, 1 on error.
int run_forecast(const Args& args) {
    auto rows = votecast::core::DataLoader::load_csv(args.csv_path);
    if (!rows) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", args.csv_path);
        return 1;
    }
    if (rows->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", args.csv_path);
        return 1;
    }
    fmt::print("Loaded {} rows from '{}'\n", rows->size(), args.csv_path);

    votecast::core::InMemoryHistoricalSource           history(std::move(*rows));
    votecast::core::InMemoryForecastStore              store;
    votecast::narrative::UnavailableNarrativeGenerator narrator;

    votecast::engine::ForecastOrchestrator orchestrator(history, store, narrator, args.config);

    const auto problems = args.request.parameters.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            fmt::print(stderr, "Error: {}\n", p);
        }
        return 1;
    }

    const auto pending = orchestrator.launch(votecast::engine::LaunchRequest{
        .name = fmt::format("Forecast {}", args.request.target_year),
        .run  = args.request,
    });
    fmt::print("Run {} queued ({})\n", pending.id, votecast::to_string(pending.status));

    orchestrator.wait_idle();

    const auto summary = orchestrator.summary(pending.id);
    if (!summary) {
        fmt::print(stderr, "Error: run {} disappeared from the store\n", pending.id);
        return 1;
    }

    const auto& run = summary->run;
    fmt::print("Run {} {}\n", run.id, votecast::to_string(run.status));
    if (run.status != votecast::RunStatus::Completed) {
        return 1;
    }

    fmt::print("\nParameters: {}\n", run.model_parameters ? run.model_parameters->to_string() : "");
    fmt::print("\nParty forecasts for {}:\n", run.target_year);
    for (const auto& p : summary->top_parties) {
        fmt::print("  {}\n", p.to_string());
    }

    fmt::print("\nSwing regions ({}):\n", summary->swing_regions.size());
    for (const auto& r : summary->swing_regions) {
        fmt::print("  {}\n", r.to_string());
    }

    fmt::print("\n{}\n", run.narrative.value_or(""));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    return run_forecast(*args);
}
