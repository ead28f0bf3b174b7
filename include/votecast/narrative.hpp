#pragma once

/// @file include/votecast/narrative.hpp
/// @brief Prompt construction and fallbacks for the narrative service.
///
/// The narrative is decoration: if the service throws or returns nothing the
/// run still completes, with a fixed fallback sentence in its place.

#include "votecast/collaborators.hpp"
#include "votecast/constants.hpp"
#include "votecast/scenario.hpp"
#include "votecast/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace votecast::narrative {

inline constexpr std::string_view FALLBACK_NARRATIVE =
    "Unable to generate a narrative analysis. "
    "Please refer to the quantitative data.";

/// Prompt summarising the top parties and swing regions of a run.
[[nodiscard]] std::string
build_prompt(const ForecastRun& run,
             std::span<const ForecastResultRecord> parties,
             std::span<const SwingRegionRecord> regions,
             std::size_t top_parties = constants::NARRATIVE_TOP_PARTIES,
             std::size_t top_regions = constants::NARRATIVE_TOP_REGIONS);

[[nodiscard]] std::string
build_scenario_prompt(const scenario::Scenario& scenario,
                      std::span<const ForecastResultRecord> parties,
                      std::size_t top_parties = constants::NARRATIVE_TOP_PARTIES);

/// "Forecast for <year> based on scenario "<name>". Top 3 parties: ..."
[[nodiscard]] std::string
scenario_fallback(const scenario::Scenario& scenario,
                  std::span<const ForecastResultRecord> parties);

/// Generator for deployments without a text service: always throws
/// NarrativeUnavailableError, so callers fall back.
class UnavailableNarrativeGenerator final : public NarrativeGenerator {
public:
    [[nodiscard]] std::string generate(const std::string& prompt) override;
};

}  // namespace votecast::narrative
