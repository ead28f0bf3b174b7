/// @file src/narrative/narrative.cpp
/// @brief Narrative prompts and fallback text.

#include "votecast/narrative.hpp"
#include "votecast/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace votecast::narrative {

namespace {

template <typename T>
[[nodiscard]] std::span<const T> head(std::span<const T> items, std::size_t n) noexcept {
    return items.first(std::min(n, items.size()));
}

}  // namespace

// ─── build_prompt ─────────────────────────────────────────────────────────────

std::string build_prompt(const ForecastRun& run,
                         std::span<const ForecastResultRecord> parties,
                         std::span<const SwingRegionRecord> regions,
                         std::size_t top_parties,
                         std::size_t top_regions) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "You are a political analyst specialising in election forecasts.\n"
        "Based on the following forecast data for {}, write a concise "
        "narrative analysis (3-4 paragraphs).\n\n",
        run.target_year);

    fmt::format_to(it, "Party forecasts (top {}):\n", top_parties);
    for (const auto& p : head(parties, top_parties)) {
        fmt::format_to(it, "- {}: {:.1f}% (CI: {:.1f}% - {:.1f}%), trend: {}\n",
                       p.entity_name,
                       p.predicted_vote_share,
                       p.vote_share_lower,
                       p.vote_share_upper,
                       to_string(p.trend_direction));
    }

    fmt::format_to(it, "\nSwing regions:\n");
    for (const auto& r : head(regions, top_regions)) {
        fmt::format_to(it, "- {}: margin {:.2f}% between {} and {}, volatility {:.4f}\n",
                       r.region_name,
                       r.margin_percent,
                       r.leading_entity,
                       r.challenging_entity,
                       r.volatility_score);
    }

    fmt::format_to(it,
        "\nPosition: {}\n"
        "State: {}\n\n"
        "Provide insight on:\n"
        "1. Overall competitive landscape\n"
        "2. Main risks and uncertainties\n"
        "3. Regions decisive for the outcome\n"
        "4. Strategic recommendations\n",
        run.target_position.value_or("General"),
        run.target_state.value_or("National"));

    return out;
}

// ─── build_scenario_prompt ────────────────────────────────────────────────────

std::string build_scenario_prompt(const scenario::Scenario& sc,
                                  std::span<const ForecastResultRecord> parties,
                                  std::size_t top_parties) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "Election forecast analysis for {}:\n"
        "Scenario: {}\n"
        "Based on historical data from {}\n"
        "{}\n\n"
        "Leading parties:\n",
        sc.target_year,
        sc.name,
        sc.base_year,
        sc.state ? fmt::format("State: {}", *sc.state) : std::string("National scope"));

    std::size_t rank = 1;
    for (const auto& p : head(parties, top_parties)) {
        fmt::format_to(it, "{}. {}: {:.1f}% (CI: {:.1f}%-{:.1f}%)\n",
                       rank++,
                       p.entity_name,
                       p.predicted_vote_share,
                       p.vote_share_lower,
                       p.vote_share_upper);
    }

    if (!sc.polls.empty()) {
        fmt::format_to(it, "\nPolling data incorporated:\n");
        for (const auto& poll : sc.polls) {
            fmt::format_to(it, "- {}: {}% ({})\n",
                           poll.party,
                           poll.percent,
                           poll.source.empty() ? "poll" : poll.source);
        }
    }

    if (!sc.external_factors.empty()) {
        fmt::format_to(it, "\nExternal factors considered:\n");
        for (const auto& f : sc.external_factors) {
            fmt::format_to(it, "- {}: {} impact (magnitude {}/10)\n",
                           f.factor,
                           f.impact == scenario::FactorImpact::Positive ? "positive" : "negative",
                           f.magnitude);
        }
    }

    fmt::format_to(it,
        "\nWrite a 2-3 paragraph narrative analysis of these forecasts, "
        "considering the historical context and the scenario's factors.\n");
    return out;
}

// ─── scenario_fallback ────────────────────────────────────────────────────────

std::string scenario_fallback(const scenario::Scenario& sc,
                              std::span<const ForecastResultRecord> parties) {
    std::string leaders;
    for (const auto& p : head(parties, 3)) {
        if (!leaders.empty()) leaders += ", ";
        leaders += fmt::format("{} ({:.1f}%)", p.entity_name, p.predicted_vote_share);
    }
    return fmt::format("Forecast for {} based on scenario \"{}\". Top 3 parties: {}.",
                       sc.target_year, sc.name, leaders);
}

// ─── UnavailableNarrativeGenerator ────────────────────────────────────────────

std::string UnavailableNarrativeGenerator::generate(const std::string& /*prompt*/) {
    throw NarrativeUnavailableError("no narrative service configured");
}

}  // namespace votecast::narrative
