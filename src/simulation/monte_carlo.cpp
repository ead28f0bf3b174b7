/// @file src/simulation/monte_carlo.cpp
/// @brief MonteCarloSimulator — Box–Muller draws and percentile extraction.

#include "votecast/monte_carlo.hpp"
#include "votecast/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace votecast::simulation {

// ─── Constructor ──────────────────────────────────────────────────────────────

MonteCarloSimulator::MonteCarloSimulator(std::uint64_t seed) noexcept
    : engine_(seed) {}

// ─── standard_normal ──────────────────────────────────────────────────────────

double MonteCarloSimulator::standard_normal() noexcept {
    // u1 ∈ (0, 1] keeps ln(u1) finite.
    const double u1 = 1.0 - uniform_(engine_);
    const double u2 = uniform_(engine_);
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
}

// ─── run ──────────────────────────────────────────────────────────────────────

MonteCarloResult MonteCarloSimulator::run(const SimulationInput& input) {
    const double centre = input.base_value + input.trend_adjustment;
    const double cap    = std::max(constants::MIN_VOTE_SHARE, input.max_vote_share);

    std::vector<double> samples;
    samples.reserve(input.iterations);

    for (std::size_t i = 0; i < input.iterations; ++i) {
        const double draw = centre + standard_normal() * input.volatility;
        // NaN draws (non-finite inputs) fall to the floor.
        const double clamped = std::isnan(draw)
            ? constants::MIN_VOTE_SHARE
            : std::clamp(draw, constants::MIN_VOTE_SHARE, cap);
        samples.push_back(clamped);
    }

    return summarize(std::move(samples), input.confidence_level);
}

// ─── summarize ────────────────────────────────────────────────────────────────

MonteCarloResult MonteCarloSimulator::summarize(std::vector<double> samples,
                                                double confidence_level) {
    MonteCarloResult out;
    if (samples.empty()) {
        return out;
    }

    std::sort(samples.begin(), samples.end());

    const std::size_t n = samples.size();
    out.mean               = stats::mean(samples);
    out.median             = samples[n / 2];
    out.lower              = samples[lower_index(n, confidence_level)];
    out.upper              = samples[upper_index(n, confidence_level)];
    out.standard_deviation = stats::sample_stddev(samples, out.mean);
    out.samples            = std::move(samples);
    return out;
}

// ─── Bound indices ────────────────────────────────────────────────────────────

namespace {

/// Confidence levels outside [0, 1] (or NaN) would break lower ≤ median ≤ upper.
[[nodiscard]] double clamp_level(double c) noexcept {
    if (std::isnan(c)) return constants::DEFAULT_CONFIDENCE_LEVEL;
    return std::clamp(c, 0.0, 1.0);
}

}  // namespace

std::size_t MonteCarloSimulator::lower_index(std::size_t n,
                                             double confidence_level) noexcept {
    if (n == 0) return 0;
    const double c   = clamp_level(confidence_level);
    const double raw = std::floor(static_cast<double>(n) * ((1.0 - c) / 2.0));
    if (!(raw > 0.0)) return 0;
    return std::min(static_cast<std::size_t>(raw), n - 1);
}

std::size_t MonteCarloSimulator::upper_index(std::size_t n,
                                             double confidence_level) noexcept {
    if (n == 0) return 0;
    const double c   = clamp_level(confidence_level);
    const double raw = std::floor(static_cast<double>(n) * (1.0 - (1.0 - c) / 2.0));
    if (!(raw > 0.0)) return 0;
    return std::min(static_cast<std::size_t>(raw), n - 1);
}

}  // namespace votecast::simulation
