#pragma once

/// @file include/votecast/scenario.hpp
/// @brief What-if scenarios layered on top of the historical trends.
///
/// # Module: Scenario Forecasting
///
/// ## Adjustments (applied to a copy of the trend map)
/// - Polls:      last_share = last_share·(1 − w) + poll·w
/// - Party:      last_share += delta
/// - External:   multiplier = max(0.1, multiplier + 0.1 · Σ ±magnitude/100)
///
/// ## Simulation
/// Each party is simulated from its (adjusted) last share with spread
/// volatility · multiplier and its slope as a one-period trend offset. Means,
/// lower and upper bounds are then rescaled by 100 / Σ means so the predicted
/// shares sum to 100 (factor 1 when Σ means is 0).

#include "votecast/constants.hpp"
#include "votecast/parameters.hpp"
#include "votecast/trend.hpp"
#include "votecast/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace votecast::scenario {

struct Poll {
    std::string party;
    double      percent;
    std::string source;
};

enum class FactorImpact { Positive, Negative };

struct ExternalFactor {
    std::string  factor;
    FactorImpact impact;
    double       magnitude;  ///< 0–10 scale
};

struct Scenario {
    std::int64_t                  id = 0;
    std::string                   name;
    int                           base_year   = 0;
    int                           target_year = 0;
    std::optional<std::string>    state;
    std::optional<std::string>    position;
    std::vector<Poll>             polls;
    double                        polling_weight = constants::DEFAULT_POLLING_WEIGHT;
    std::map<std::string, double> party_adjustments;  ///< party → share delta
    std::vector<ExternalFactor>   external_factors;
    ModelParameters               parameters{};
};

/// [base, base−4, base−8], keeping years ≥ EARLIEST_HISTORY_YEAR.
[[nodiscard]] std::vector<int> history_years(int base_year);

/// Copy of `trends` with polls and party adjustments folded into each
/// party's last observed share. Parties without observations are untouched.
[[nodiscard]] trend::TrendMap apply_adjustments(const trend::TrendMap& trends,
                                                const Scenario& scenario);

[[nodiscard]] double adjusted_volatility_multiplier(
    double base_multiplier,
    std::span<const ExternalFactor> factors) noexcept;

class ScenarioForecaster {
public:
    ScenarioForecaster(ModelParameters params, std::uint64_t run_seed);

    /// Normalised, descending-share forecasts for the adjusted trends.
    [[nodiscard]] std::vector<ForecastResultRecord>
    generate(const trend::TrendMap& adjusted_trends,
             double volatility_multiplier) const;

private:
    ModelParameters params_;
    std::uint64_t   run_seed_;
};

}  // namespace votecast::scenario
