/// @file src/forecast/forecast_generator.cpp
/// @brief ForecastGenerator — trend projection + Monte Carlo per party.

#include "votecast/forecast.hpp"

#include <algorithm>
#include <cmath>

namespace votecast::forecast {

namespace {

/// SplitMix64 finaliser: decorrelates nearby seeds.
[[nodiscard]] std::uint64_t mix64(std::uint64_t z) noexcept {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

ForecastGenerator::ForecastGenerator(ModelParameters params, std::uint64_t run_seed)
    : params_(std::move(params)),
      run_seed_(run_seed) {}

// ─── generate ─────────────────────────────────────────────────────────────────

std::vector<ForecastResultRecord>
ForecastGenerator::generate(const trend::TrendMap& trends, int target_year) const {
    std::vector<ForecastResultRecord> results;
    results.reserve(trends.size());

    for (const auto& [party, trend] : trends) {
        auto record = forecast_party(trend, target_year);
        if (record) {
            results.push_back(std::move(*record));
        }
    }

    std::stable_sort(results.begin(), results.end(), by_share_descending);
    return results;
}

// ─── forecast_party ───────────────────────────────────────────────────────────

std::optional<ForecastResultRecord>
ForecastGenerator::forecast_party(const PartyTrendData& trend, int target_year) const {
    if (trend.historical_votes.empty()) {
        return std::nullopt;
    }

    const VotePoint& last = trend.historical_votes.back();
    const int years_delta = target_year - last.year;

    const double projection =
        last.share + trend.trend_slope * static_cast<double>(years_delta);
    const double spread =
        horizon_volatility(trend.volatility, params_.volatility_multiplier, years_delta);

    simulation::MonteCarloSimulator simulator(party_seed(run_seed_, trend.party));
    const auto sim = simulator.run(simulation::SimulationInput{
        .base_value       = projection,
        .volatility       = spread,
        .trend_adjustment = 0.0,
        .iterations       = params_.monte_carlo_iterations,
        .confidence_level = params_.confidence_level,
    });

    return make_record(trend, sim, classify(trend.trend_slope), params_.trend_weight);
}

// ─── classify ─────────────────────────────────────────────────────────────────

TrendDirection ForecastGenerator::classify(double slope, double threshold) noexcept {
    if (slope > threshold)  return TrendDirection::Rising;
    if (slope < -threshold) return TrendDirection::Falling;
    return TrendDirection::Stable;
}

// ─── confidence ───────────────────────────────────────────────────────────────

double ForecastGenerator::confidence(const MonteCarloResult& sim) noexcept {
    if (sim.mean == 0.0 || !std::isfinite(sim.mean)) {
        return constants::MIN_CONFIDENCE;
    }
    const double cv  = sim.standard_deviation / sim.mean;
    const double raw = 1.0 - cv * constants::CONFIDENCE_DISPERSION_WEIGHT;
    if (!std::isfinite(raw)) {
        return constants::MIN_CONFIDENCE;
    }
    return std::clamp(raw, constants::MIN_CONFIDENCE, constants::MAX_CONFIDENCE);
}

// ─── horizon_volatility ───────────────────────────────────────────────────────

double ForecastGenerator::horizon_volatility(double volatility,
                                             double multiplier,
                                             int years_delta) noexcept {
    if (years_delta <= 0) {
        return 0.0;
    }
    return volatility * multiplier * std::sqrt(static_cast<double>(years_delta));
}

// ─── party_seed ───────────────────────────────────────────────────────────────

std::uint64_t ForecastGenerator::party_seed(std::uint64_t run_seed,
                                            std::string_view party) noexcept {
    // FNV-1a over the party name, folded into the run seed.
    std::uint64_t h = 0xCBF29CE484222325ULL;
    for (const char c : party) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001B3ULL;
    }
    return mix64(run_seed ^ mix64(h));
}

// ─── influence_factors ────────────────────────────────────────────────────────

std::vector<InfluenceFactor>
ForecastGenerator::influence_factors(const PartyTrendData& trend,
                                     TrendDirection direction,
                                     double trend_weight) {
    return {
        InfluenceFactor{
            .factor = "historical trend",
            .weight = trend_weight,
            .impact = std::string(to_string(direction)),
        },
        InfluenceFactor{
            .factor = "volatility",
            .weight = constants::SECONDARY_FACTOR_WEIGHT,
            .impact = trend.volatility > constants::HIGH_VOLATILITY_IMPACT ? "high" : "medium",
        },
        InfluenceFactor{
            .factor = "growth rate",
            .weight = constants::SECONDARY_FACTOR_WEIGHT,
            .impact = trend.avg_growth_rate > 0.0 ? "positive" : "negative",
        },
    };
}

// ─── make_record ──────────────────────────────────────────────────────────────

ForecastResultRecord ForecastGenerator::make_record(const PartyTrendData& trend,
                                                    const MonteCarloResult& sim,
                                                    TrendDirection direction,
                                                    double trend_weight) {
    ForecastResultRecord rec;
    rec.result_type          = "party";
    rec.entity_name          = trend.party;
    rec.predicted_vote_share = sim.mean;
    rec.vote_share_lower     = sim.lower;
    rec.vote_share_upper     = sim.upper;
    rec.trend_direction      = direction;
    rec.trend_strength       = std::abs(trend.trend_slope);
    rec.confidence           = confidence(sim);
    rec.influence_factors    = influence_factors(trend, direction, trend_weight);

    rec.historical_trend.years.reserve(trend.historical_votes.size());
    rec.historical_trend.vote_shares.reserve(trend.historical_votes.size());
    for (const auto& p : trend.historical_votes) {
        rec.historical_trend.years.push_back(p.year);
        rec.historical_trend.vote_shares.push_back(p.share);
    }

    return rec;
}

bool ForecastGenerator::by_share_descending(const ForecastResultRecord& a,
                                            const ForecastResultRecord& b) noexcept {
    return a.predicted_vote_share > b.predicted_vote_share;
}

}  // namespace votecast::forecast
