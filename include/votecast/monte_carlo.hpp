#pragma once

/// @file include/votecast/monte_carlo.hpp
/// @brief MonteCarloSimulator — normal draws around a projected vote share.
///
/// # Module: Monte Carlo Simulator
///
/// ## Algorithm
/// For each of `iterations` draws:
///
///   z      = √(−2·ln u₁) · cos(2π·u₂)          u₁ ∈ (0,1], u₂ ∈ [0,1)
///   sample = clamp(base + adjustment + z·σ, 0, max_vote_share)
///
/// The samples are sorted ascending, then
///
///   mean   = Σ samples / n
///   median = samples[⌊n/2⌋]
///   lower  = samples[⌊n·(1−c)/2⌋]
///   upper  = samples[⌊n·(1−(1−c)/2)⌋]
///   stddev = sample standard deviation (n−1)
///
/// The median takes the upper-middle element for even n rather than the
/// average of the two middle elements. Downstream consumers depend on the
/// exact values, so this is kept.
///
/// Bound indices are clamped to n−1 so c → 1 or tiny n never index past the
/// end.
///
/// ## Guarantees
/// - samples.size() == iterations
/// - every sample ∈ [0, max_vote_share]
/// - lower ≤ median ≤ upper
/// - Deterministic for a given seed
/// - iterations == 0 yields an empty, all-zero result

#include "votecast/constants.hpp"
#include "votecast/types.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace votecast::simulation {

struct SimulationInput {
    double      base_value;                ///< Projected share (percent)
    double      volatility;                ///< Spread σ of the normal draws
    double      trend_adjustment = 0.0;    ///< Additive offset
    std::size_t iterations       = constants::DEFAULT_MONTE_CARLO_ITERATIONS;
    double      confidence_level = constants::DEFAULT_CONFIDENCE_LEVEL;
    double      max_vote_share   = constants::MAX_VOTE_SHARE;
};

class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(std::uint64_t seed) noexcept;

    [[nodiscard]] MonteCarloResult run(const SimulationInput& input);

    /// One Box–Muller standard-normal variate.
    [[nodiscard]] double standard_normal() noexcept;

    /// Sort `samples` and extract the summary statistics.
    [[nodiscard]] static MonteCarloResult
    summarize(std::vector<double> samples, double confidence_level);

    [[nodiscard]] static std::size_t
    lower_index(std::size_t n, double confidence_level) noexcept;

    [[nodiscard]] static std::size_t
    upper_index(std::size_t n, double confidence_level) noexcept;

private:
    std::mt19937_64                        engine_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

}  // namespace votecast::simulation
