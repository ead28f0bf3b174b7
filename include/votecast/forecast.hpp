#pragma once

/// @file include/votecast/forecast.hpp
/// @brief ForecastGenerator — one ranked vote-share forecast per party.
///
/// # Module: Forecast Generator
///
/// ## Pipeline (per party)
/// 1. Last observed (year, share).
/// 2. years_delta      = target_year − last_year
/// 3. projection       = last_share + slope · years_delta
/// 4. σ_horizon        = volatility · volatility_multiplier · √years_delta
///                       (0 when years_delta ≤ 0)
/// 5. MonteCarloSimulator(projection, σ_horizon, 0, iterations, confidence)
/// 6. direction        = rising  if slope >  0.5
///                       falling if slope < −0.5
///                       stable  otherwise
/// 7. confidence       = max(0.3, 1 − (σ_sim / mean_sim) · 0.5), ≤ 1;
///                       0.3 when mean_sim is 0
///
/// Uncertainty grows with the square root of the horizon (random-walk
/// diffusion of the share).
///
/// ## Random Streams
/// Each party simulates on its own generator seeded from the run seed and the
/// party name, so its draws do not depend on which other parties are present
/// or on the order they are processed in.
///
/// ## Guarantees
/// - Parties with no observations are skipped, not reported as errors
/// - Output is sorted by predicted_vote_share, descending
/// - confidence ∈ [0.3, 1]

#include "votecast/monte_carlo.hpp"
#include "votecast/parameters.hpp"
#include "votecast/trend.hpp"
#include "votecast/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace votecast::forecast {

class ForecastGenerator {
public:
    ForecastGenerator(ModelParameters params, std::uint64_t run_seed);

    [[nodiscard]] std::vector<ForecastResultRecord>
    generate(const trend::TrendMap& trends, int target_year) const;

    /// Forecast a single party. `nullopt` if it has no observations.
    [[nodiscard]] std::optional<ForecastResultRecord>
    forecast_party(const PartyTrendData& trend, int target_year) const;

    [[nodiscard]] const ModelParameters& parameters() const noexcept { return params_; }

    // ── Building blocks (also used by scenario runs) ─────────────────────────

    [[nodiscard]] static TrendDirection
    classify(double slope,
             double threshold = constants::TREND_DIRECTION_THRESHOLD) noexcept;

    [[nodiscard]] static double confidence(const MonteCarloResult& sim) noexcept;

    [[nodiscard]] static double horizon_volatility(double volatility,
                                                   double multiplier,
                                                   int years_delta) noexcept;

    /// Seed of the party's private random stream.
    [[nodiscard]] static std::uint64_t party_seed(std::uint64_t run_seed,
                                                  std::string_view party) noexcept;

    /// Always three entries: historical trend, then volatility, then growth rate.
    [[nodiscard]] static std::vector<InfluenceFactor>
    influence_factors(const PartyTrendData& trend,
                      TrendDirection direction,
                      double trend_weight);

    /// Assemble a record from a trend and its simulation summary.
    [[nodiscard]] static ForecastResultRecord
    make_record(const PartyTrendData& trend,
                const MonteCarloResult& sim,
                TrendDirection direction,
                double trend_weight);

    [[nodiscard]] static bool by_share_descending(const ForecastResultRecord& a,
                                                  const ForecastResultRecord& b) noexcept;

private:
    ModelParameters params_;
    std::uint64_t   run_seed_;
};

}  // namespace votecast::forecast
