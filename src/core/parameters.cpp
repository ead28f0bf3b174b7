/// @file src/core/parameters.cpp
/// @brief ModelParameters parsing, validation and rendering.

#include "votecast/parameters.hpp"

#include "text_detail.hpp"

#include <fmt/format.h>

#include <cmath>

namespace votecast {

using detail::parse_full;
using detail::trim;

// ─── apply_override ───────────────────────────────────────────────────────────

bool ModelParameters::apply_override(std::string_view key,
                                     std::string_view value) noexcept {
    key   = trim(key);
    value = trim(value);

    if (key == "monte_carlo_iterations") {
        const auto v = parse_full<std::size_t>(value);
        if (!v) return false;
        monte_carlo_iterations = *v;
        return true;
    }

    double* target = nullptr;
    if      (key == "confidence_level")        target = &confidence_level;
    else if (key == "historical_weight_decay") target = &historical_weight_decay;
    else if (key == "sentiment_weight")        target = &sentiment_weight;
    else if (key == "trend_weight")            target = &trend_weight;
    else if (key == "volatility_multiplier")   target = &volatility_multiplier;

    if (target == nullptr) return false;

    const auto v = parse_full<double>(value);
    if (!v) return false;
    *target = *v;
    return true;
}

bool ModelParameters::apply_assignment(std::string_view assignment) noexcept {
    const auto eq = assignment.find('=');
    if (eq == std::string_view::npos) return false;
    return apply_override(assignment.substr(0, eq), assignment.substr(eq + 1));
}

// ─── validate ─────────────────────────────────────────────────────────────────

std::vector<std::string> ModelParameters::validate() const {
    std::vector<std::string> problems;

    if (monte_carlo_iterations == 0) {
        problems.emplace_back("monte_carlo_iterations must be at least 1");
    }
    if (!std::isfinite(confidence_level) ||
        confidence_level <= 0.0 || confidence_level >= 1.0) {
        problems.push_back(fmt::format(
            "confidence_level must lie in (0, 1), got {}", confidence_level));
    }
    if (!std::isfinite(volatility_multiplier) || volatility_multiplier < 0.0) {
        problems.push_back(fmt::format(
            "volatility_multiplier must be finite and non-negative, got {}",
            volatility_multiplier));
    }
    if (!std::isfinite(historical_weight_decay) ||
        !std::isfinite(sentiment_weight) ||
        !std::isfinite(trend_weight)) {
        problems.emplace_back("weights must be finite");
    }

    return problems;
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string ModelParameters::to_string() const {
    return fmt::format(
        "monte_carlo_iterations={} confidence_level={} historical_weight_decay={} "
        "sentiment_weight={} trend_weight={} volatility_multiplier={}",
        monte_carlo_iterations,
        confidence_level,
        historical_weight_decay,
        sentiment_weight,
        trend_weight,
        volatility_multiplier);
}

}  // namespace votecast
