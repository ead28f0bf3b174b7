/// @file src/scenario/scenario.cpp
/// @brief Scenario adjustments and normalised scenario forecasts.

#include "votecast/scenario.hpp"
#include "votecast/forecast.hpp"
#include "votecast/monte_carlo.hpp"

#include <algorithm>

namespace votecast::scenario {

// ─── history_years ────────────────────────────────────────────────────────────

std::vector<int> history_years(int base_year) {
    std::vector<int> years;
    for (int k = 0; k < constants::DEFAULT_HISTORY_CYCLES; ++k) {
        const int y = base_year - k * constants::ELECTION_CYCLE_YEARS;
        if (y >= constants::EARLIEST_HISTORY_YEAR) {
            years.push_back(y);
        }
    }
    return years;
}

// ─── apply_adjustments ────────────────────────────────────────────────────────

trend::TrendMap apply_adjustments(const trend::TrendMap& trends,
                                  const Scenario& scenario) {
    trend::TrendMap adjusted = trends;

    for (const auto& poll : scenario.polls) {
        const auto it = adjusted.find(poll.party);
        if (it == adjusted.end() || it->second.historical_votes.empty()) {
            continue;
        }
        double& last = it->second.historical_votes.back().share;
        last = last * (1.0 - scenario.polling_weight) + poll.percent * scenario.polling_weight;
    }

    for (const auto& [party, delta] : scenario.party_adjustments) {
        const auto it = adjusted.find(party);
        if (it == adjusted.end() || it->second.historical_votes.empty()) {
            continue;
        }
        it->second.historical_votes.back().share += delta;
    }

    return adjusted;
}

// ─── adjusted_volatility_multiplier ───────────────────────────────────────────

double adjusted_volatility_multiplier(double base_multiplier,
                                      std::span<const ExternalFactor> factors) noexcept {
    if (factors.empty()) {
        return base_multiplier;
    }
    double net = 0.0;
    for (const auto& f : factors) {
        const double signed_magnitude =
            f.impact == FactorImpact::Positive ? f.magnitude : -f.magnitude;
        net += signed_magnitude / 100.0;
    }
    return std::max(constants::MIN_SCENARIO_VOLATILITY_MULTIPLIER,
                    base_multiplier + net * constants::EXTERNAL_FACTOR_SCALE);
}

// ─── ScenarioForecaster ───────────────────────────────────────────────────────

ScenarioForecaster::ScenarioForecaster(ModelParameters params, std::uint64_t run_seed)
    : params_(std::move(params)),
      run_seed_(run_seed) {}

std::vector<ForecastResultRecord>
ScenarioForecaster::generate(const trend::TrendMap& adjusted_trends,
                             double volatility_multiplier) const {
    using forecast::ForecastGenerator;

    std::vector<ForecastResultRecord> results;
    double total_share = 0.0;

    for (const auto& [party, trend] : adjusted_trends) {
        if (trend.historical_votes.empty()) {
            continue;
        }

        simulation::MonteCarloSimulator simulator(
            ForecastGenerator::party_seed(run_seed_, party));
        const auto sim = simulator.run(simulation::SimulationInput{
            .base_value       = trend.historical_votes.back().share,
            .volatility       = trend.volatility * volatility_multiplier,
            .trend_adjustment = trend.trend_slope,
            .iterations       = params_.monte_carlo_iterations,
            .confidence_level = params_.confidence_level,
        });

        total_share += sim.mean;
        const auto direction = ForecastGenerator::classify(
            trend.trend_slope, constants::SCENARIO_TREND_DIRECTION_THRESHOLD);
        results.push_back(
            ForecastGenerator::make_record(trend, sim, direction, params_.trend_weight));
    }

    const double factor = total_share > 0.0 ? 100.0 / total_share : 1.0;
    for (auto& r : results) {
        r.predicted_vote_share *= factor;
        r.vote_share_lower     *= factor;
        r.vote_share_upper     *= factor;
    }

    std::stable_sort(results.begin(), results.end(), ForecastGenerator::by_share_descending);
    return results;
}

}  // namespace votecast::scenario
