#pragma once

#include <cstddef>

/// @file include/votecast/constants.hpp
/// @brief Model defaults and classification thresholds for votecast.
///
/// Every threshold that drives a classification lives here so that it can be
/// referenced by name from both the implementation and the tests.

namespace votecast::constants {

// ─── Model Parameter Defaults ─────────────────────────────────────────────────

/// Monte Carlo draws per party.
static constexpr std::size_t DEFAULT_MONTE_CARLO_ITERATIONS = 10000;

/// Coverage of the [lower, upper] interval taken from the sorted samples.
static constexpr double DEFAULT_CONFIDENCE_LEVEL = 0.95;

/// Carried on the parameter set; no formula consumes it yet.
static constexpr double DEFAULT_HISTORICAL_WEIGHT_DECAY = 0.85;

/// Carried on the parameter set; no formula consumes it yet.
static constexpr double DEFAULT_SENTIMENT_WEIGHT = 0.15;

/// Descriptive weight attached to the "historical trend" influence factor.
static constexpr double DEFAULT_TREND_WEIGHT = 0.4;

/// Scales historical volatility into simulation spread and swing magnitude.
static constexpr double DEFAULT_VOLATILITY_MULTIPLIER = 1.2;

// ─── Vote Share Bounds ────────────────────────────────────────────────────────

/// Simulated shares are clamped into [MIN_VOTE_SHARE, MAX_VOTE_SHARE].
static constexpr double MIN_VOTE_SHARE = 0.0;
static constexpr double MAX_VOTE_SHARE = 100.0;

// ─── History Window ───────────────────────────────────────────────────────────

/// Spacing between comparable general elections.
static constexpr int ELECTION_CYCLE_YEARS = 4;

/// Number of past cycles used when the caller gives no explicit year list.
static constexpr int DEFAULT_HISTORY_CYCLES = 3;

/// Earliest election year with usable per-party tallies.
static constexpr int EARLIEST_HISTORY_YEAR = 2002;

// ─── Trend Classification ─────────────────────────────────────────────────────

/// |slope| in share points per year above which a trend is rising/falling.
static constexpr double TREND_DIRECTION_THRESHOLD = 0.5;

/// Scenario runs classify direction against a much finer slope.
static constexpr double SCENARIO_TREND_DIRECTION_THRESHOLD = 0.01;

/// Lower bound of the forecast confidence score.
static constexpr double MIN_CONFIDENCE = 0.3;

/// Upper bound of the forecast confidence score.
static constexpr double MAX_CONFIDENCE = 1.0;

/// Weight of the coefficient of variation in the confidence score.
static constexpr double CONFIDENCE_DISPERSION_WEIGHT = 0.5;

/// Fixed descriptive weight of the volatility and growth influence factors.
static constexpr double SECONDARY_FACTOR_WEIGHT = 0.2;

/// Party volatility above which its influence is reported as "high".
static constexpr double HIGH_VOLATILITY_IMPACT = 5.0;

// ─── Swing Region Classification ──────────────────────────────────────────────

/// A region can only swing when the leader's margin (percent) is below this.
static constexpr double SWING_MARGIN_THRESHOLD = 10.0;

/// ...and the contenders' mean volatility is above this.
static constexpr double SWING_VOLATILITY_THRESHOLD = 2.0;

/// Margin (percent) below which "tight margin" is a high-impact factor.
static constexpr double TIGHT_MARGIN_HIGH_IMPACT = 5.0;

/// Mean volatility above which "high historical volatility" is high-impact.
static constexpr double SWING_VOLATILITY_HIGH_IMPACT = 5.0;

/// Divisor normalising mean volatility in the outcome-uncertainty score.
static constexpr double UNCERTAINTY_VOLATILITY_SCALE = 5.0;

// ─── Scenarios ────────────────────────────────────────────────────────────────

/// Default blend weight of poll results into the last observed share.
static constexpr double DEFAULT_POLLING_WEIGHT = 0.30;

/// Floor of the volatility multiplier after external-factor adjustment.
static constexpr double MIN_SCENARIO_VOLATILITY_MULTIPLIER = 0.1;

/// Scale applied to the net external-factor impact on the multiplier.
static constexpr double EXTERNAL_FACTOR_SCALE = 0.1;

// ─── Reporting ────────────────────────────────────────────────────────────────

static constexpr std::size_t NARRATIVE_TOP_PARTIES = 5;
static constexpr std::size_t NARRATIVE_TOP_REGIONS = 3;
static constexpr std::size_t SUMMARY_TOP_PARTIES   = 10;

}  // namespace votecast::constants
