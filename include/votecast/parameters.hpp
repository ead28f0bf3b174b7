#pragma once

/// @file include/votecast/parameters.hpp
/// @brief ModelParameters — the tunable knobs of a forecast run.
///
/// # Recognised Keys
/// | key                      | default | consumed by                         |
/// |--------------------------|---------|-------------------------------------|
/// | monte_carlo_iterations   | 10000   | MonteCarloSimulator                 |
/// | confidence_level         | 0.95    | MonteCarloSimulator bounds          |
/// | historical_weight_decay  | 0.85    | nothing (carried for later use)     |
/// | sentiment_weight         | 0.15    | nothing (carried for later use)     |
/// | trend_weight             | 0.4     | "historical trend" factor weight    |
/// | volatility_multiplier    | 1.2     | simulation spread, swing magnitude  |
///
/// The effective parameter set is stored on the ForecastRun when the run
/// completes, so every persisted result can be traced to its inputs.

#include "votecast/constants.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace votecast {

struct ModelParameters {
    std::size_t monte_carlo_iterations  = constants::DEFAULT_MONTE_CARLO_ITERATIONS;
    double      confidence_level        = constants::DEFAULT_CONFIDENCE_LEVEL;
    double      historical_weight_decay = constants::DEFAULT_HISTORICAL_WEIGHT_DECAY;
    double      sentiment_weight        = constants::DEFAULT_SENTIMENT_WEIGHT;
    double      trend_weight            = constants::DEFAULT_TREND_WEIGHT;
    double      volatility_multiplier   = constants::DEFAULT_VOLATILITY_MULTIPLIER;

    /// Set one parameter from its textual `key` and `value`.
    ///
    /// # Returns
    /// `false` if the key is unknown or the value does not parse completely;
    /// the parameter set is left untouched in that case.
    [[nodiscard]] bool apply_override(std::string_view key,
                                      std::string_view value) noexcept;

    /// Parse a `key=value` pair and forward to apply_override().
    [[nodiscard]] bool apply_assignment(std::string_view assignment) noexcept;

    /// Human-readable problems with the current values. Empty when valid.
    ///
    /// Checked: iterations ≥ 1, confidence_level ∈ (0, 1), volatility
    /// multiplier finite and ≥ 0, all weights finite.
    [[nodiscard]] std::vector<std::string> validate() const;

    /// Single-line `key=value` rendering, in table order.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ModelParameters&, const ModelParameters&) = default;
};

}  // namespace votecast
