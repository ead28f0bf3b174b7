#pragma once

/// @file include/votecast/aggregator.hpp
/// @brief HistoricalDataAggregator — groups flat tallies by party, year, region.
///
/// # Module: Historical Data Aggregator
///
/// ## Responsibility
/// Turn the flat list of HistoricalDataPoint rows returned by the data source
/// into the groupings the analysis stages need:
///   - per party, its rows ordered by year
///   - per year, the total votes across every party in the input
///   - per region, its rows (rows without a region are skipped)
///
/// ## Share Normalisation
///   share = party_votes / year_total × 100     (0 when year_total == 0)
///
/// The year total is taken over *all* parties in the input, so the shares of
/// one year sum to 100 only if the input holds every party for that year.
///
/// ## Guarantees
/// - Pure: inputs are never modified, results are fresh values
/// - Stable: rows of one party in the same year keep their input order
/// - Empty input produces empty groupings

#include "votecast/types.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace votecast::history {

using PartyRows  = std::map<std::string, std::vector<HistoricalDataPoint>>;
using RegionRows = std::map<std::string, std::vector<HistoricalDataPoint>>;
using YearTotals = std::map<int, std::int64_t>;
using ShareSeries = std::map<std::string, std::vector<VotePoint>>;

/// Result of grouping one input set.
struct GroupedHistory {
    PartyRows  by_party;     ///< Each list ascending by year
    YearTotals year_totals;  ///< Sum of total_votes per year, all parties
};

class HistoricalDataAggregator {
public:
    [[nodiscard]] static GroupedHistory
    group(std::span<const HistoricalDataPoint> points);

    /// Per-party share series, ascending by year.
    [[nodiscard]] static ShareSeries
    share_series(const GroupedHistory& grouped);

    /// Convenience: group() followed by share_series().
    [[nodiscard]] static ShareSeries
    share_series(std::span<const HistoricalDataPoint> points);

    [[nodiscard]] static RegionRows
    group_by_region(std::span<const HistoricalDataPoint> points);

    /// votes / year_total × 100, or 0 for a zero (or negative) total.
    [[nodiscard]] static double share_of(std::int64_t votes,
                                         std::int64_t year_total) noexcept;
};

}  // namespace votecast::history
