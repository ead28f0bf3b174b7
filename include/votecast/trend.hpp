#pragma once

/// @file include/votecast/trend.hpp
/// @brief TrendAnalyzer — slope, volatility and growth of a party's share.
///
/// # Module: Trend Analyzer
///
/// ## Formulae
/// For a series of n (year, share) points:
///
///   slope      = (n·Σxy − Σx·Σy) / (n·Σx² − (Σx)²)        x = year, y = share
///   volatility = √( Σ(y − ȳ)² / (n − 1) )
///   growth     = mean over i of (y[i] − y[i−1]) / y[i−1],  skipping y[i−1] = 0
///
/// ## Edge Cases
/// - n < 2: slope, volatility and growth are all 0
/// - Degenerate regression (all points in one year): the NaN/Inf slope is
///   clamped to 0
/// - Every prior share zero: growth is 0
///
/// ## Guarantees
/// - Never throws on numeric input; degenerate cases return neutral values
/// - trend_slope is always finite

#include "votecast/aggregator.hpp"
#include "votecast/types.hpp"

#include <map>
#include <span>
#include <string>
#include <vector>

namespace votecast::trend {

using TrendMap = std::map<std::string, PartyTrendData>;

class TrendAnalyzer {
public:
    /// Analyse every party present in `points`.
    [[nodiscard]] static TrendMap
    analyze(std::span<const HistoricalDataPoint> points);

    /// Analyse precomputed share series (one entry per party).
    [[nodiscard]] static TrendMap
    analyze(const history::ShareSeries& series);

    /// Build the trend record for one party. `series` is sorted by year
    /// (stable) before any statistic is taken.
    [[nodiscard]] static PartyTrendData
    analyze_party(std::string party, std::vector<VotePoint> series);

    [[nodiscard]] static double slope(std::span<const VotePoint> series) noexcept;
    [[nodiscard]] static double volatility(std::span<const VotePoint> series) noexcept;
    [[nodiscard]] static double average_growth_rate(std::span<const VotePoint> series) noexcept;
};

}  // namespace votecast::trend
