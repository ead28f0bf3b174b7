#pragma once

/// @file include/votecast/types.hpp
/// @brief Shared value types for the votecast forecasting engine.
///
/// Inputs (HistoricalDataPoint) are produced by the historical-data source and
/// consumed read-only. Intermediate values (PartyTrendData, MonteCarloResult)
/// live for one forecast run. Outputs (ForecastResultRecord,
/// SwingRegionRecord, ForecastRun) are handed to the ForecastStore.

#include "votecast/parameters.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace votecast {

using RunId     = std::int64_t;
using Timestamp = std::chrono::system_clock::time_point;

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// One party's tally for one election year within the queried scope.
struct HistoricalDataPoint {
    int                        year;
    std::string                party;
    std::optional<std::string> region;    ///< Federative-unit code, if known
    std::optional<std::string> position;  ///< Office contested, if known
    std::int64_t               total_votes     = 0;
    std::int64_t               candidate_count = 0;
};

// ─── Trend Analysis ───────────────────────────────────────────────────────────

/// A party's votes in one year, with its share of that year's total.
struct VotePoint {
    int          year;
    std::int64_t votes;
    double       share;  ///< Percent, in [0, 100]
};

struct PartyTrendData {
    std::string            party;
    std::vector<VotePoint> historical_votes;  ///< Ascending by year
    double                 trend_slope     = 0.0;  ///< Share points per year
    double                 volatility      = 0.0;  ///< Sample stddev of shares
    double                 avg_growth_rate = 0.0;  ///< Mean relative change
};

// ─── Simulation ───────────────────────────────────────────────────────────────

struct MonteCarloResult {
    std::vector<double> samples;  ///< Ascending
    double mean               = 0.0;
    double median             = 0.0;
    double lower              = 0.0;
    double upper              = 0.0;
    double standard_deviation = 0.0;
};

// ─── Forecast Output ──────────────────────────────────────────────────────────

enum class TrendDirection { Rising, Falling, Stable };

[[nodiscard]] std::string_view to_string(TrendDirection d) noexcept;

struct InfluenceFactor {
    std::string factor;
    double      weight;
    std::string impact;
};

struct HistoricalTrend {
    std::vector<int>    years;
    std::vector<double> vote_shares;
};

struct ForecastResultRecord {
    std::int64_t    id     = 0;  ///< Assigned by the store
    RunId           run_id = 0;
    std::string     result_type = "party";
    std::string     entity_name;
    double          predicted_vote_share = 0.0;
    double          vote_share_lower     = 0.0;
    double          vote_share_upper     = 0.0;
    HistoricalTrend historical_trend;
    TrendDirection  trend_direction = TrendDirection::Stable;
    double          trend_strength  = 0.0;
    double          confidence      = 0.0;
    std::vector<InfluenceFactor> influence_factors;

    /// One-line report: name, share, interval, direction, confidence.
    [[nodiscard]] std::string to_string() const;
};

struct KeyFactor {
    std::string factor;
    std::string impact;
};

struct SwingRegionRecord {
    std::int64_t               id     = 0;  ///< Assigned by the store
    RunId                      run_id = 0;
    std::string                region;
    std::string                region_name;
    std::optional<std::string> position;
    double                     margin_percent   = 0.0;
    std::int64_t               margin_votes     = 0;
    double                     volatility_score = 0.0;
    double                     swing_magnitude  = 0.0;
    std::string                leading_entity;
    std::string                challenging_entity;
    /// Sentiment is not wired into the engine; always "0".
    std::string                sentiment_balance = "0";
    double                     recent_trend_shift = 0.0;
    double                     outcome_uncertainty = 0.0;
    std::vector<KeyFactor>     key_factors;

    [[nodiscard]] std::string to_string() const;
};

// ─── Forecast Run ─────────────────────────────────────────────────────────────

enum class RunStatus { Pending, Running, Completed, Failed };

[[nodiscard]] std::string_view to_string(RunStatus s) noexcept;

struct ForecastRun {
    RunId                          id = 0;
    std::string                    name;
    std::string                    description;
    int                            target_year = 0;
    std::optional<std::string>     target_position;
    std::optional<std::string>     target_state;
    RunStatus                      status = RunStatus::Pending;
    std::optional<Timestamp>       started_at;
    std::optional<Timestamp>       completed_at;
    std::size_t                    total_simulations = 0;
    std::vector<int>               historical_years_used;
    std::optional<ModelParameters> model_parameters;
    std::optional<std::string>     narrative;
};

/// What a completed run hands back to its caller.
struct ForecastSummary {
    std::vector<ForecastResultRecord> party_results;
    std::vector<SwingRegionRecord>    swing_regions;
    std::string                       narrative;
};

}  // namespace votecast
