/// @file src/history/aggregator.cpp
/// @brief HistoricalDataAggregator — party, year and region groupings.

#include "votecast/aggregator.hpp"

#include <algorithm>

namespace votecast::history {

// ─── group ────────────────────────────────────────────────────────────────────

GroupedHistory
HistoricalDataAggregator::group(std::span<const HistoricalDataPoint> points) {
    GroupedHistory out;

    for (const auto& p : points) {
        out.by_party[p.party].push_back(p);
        out.year_totals[p.year] += p.total_votes;
    }

    for (auto& [party, rows] : out.by_party) {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const HistoricalDataPoint& a, const HistoricalDataPoint& b) {
                             return a.year < b.year;
                         });
    }

    return out;
}

// ─── share_series ─────────────────────────────────────────────────────────────

ShareSeries HistoricalDataAggregator::share_series(const GroupedHistory& grouped) {
    ShareSeries out;

    for (const auto& [party, rows] : grouped.by_party) {
        std::vector<VotePoint> series;
        series.reserve(rows.size());

        for (const auto& row : rows) {
            const auto total = grouped.year_totals.find(row.year);
            const std::int64_t year_total =
                total != grouped.year_totals.end() ? total->second : 0;

            series.push_back(VotePoint{
                .year  = row.year,
                .votes = row.total_votes,
                .share = share_of(row.total_votes, year_total),
            });
        }

        out.emplace(party, std::move(series));
    }

    return out;
}

ShareSeries
HistoricalDataAggregator::share_series(std::span<const HistoricalDataPoint> points) {
    return share_series(group(points));
}

// ─── group_by_region ──────────────────────────────────────────────────────────

RegionRows
HistoricalDataAggregator::group_by_region(std::span<const HistoricalDataPoint> points) {
    RegionRows out;
    for (const auto& p : points) {
        if (!p.region || p.region->empty()) {
            continue;
        }
        out[*p.region].push_back(p);
    }
    return out;
}

// ─── share_of ─────────────────────────────────────────────────────────────────

double HistoricalDataAggregator::share_of(std::int64_t votes,
                                          std::int64_t year_total) noexcept {
    if (year_total <= 0) {
        return 0.0;
    }
    return static_cast<double>(votes) / static_cast<double>(year_total) * 100.0;
}

}  // namespace votecast::history
