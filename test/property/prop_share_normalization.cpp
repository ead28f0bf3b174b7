/**
 * @file  prop_share_normalization.cpp
 * @brief Property: ∀ tallies of one year: Σ share = 100 (or 0 when Σ votes = 0)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_share_normalization
 *
 * Each party's share is its votes over the year total, so the shares of a
 * complete year partition 100. A year with no votes at all maps every
 * party to 0 instead of dividing by zero.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "votecast/aggregator.hpp"

using namespace votecast;
using namespace votecast::history;

int main() {
    rc::check(
        "share_normalization: shares of one year sum to 100",
        [] {
            const auto votes = *rc::gen::container<std::vector<std::int64_t>>(
                rc::gen::inRange<std::int64_t>(0, 10'000'000));
            RC_PRE(!votes.empty());

            std::vector<HistoricalDataPoint> rows;
            std::int64_t total = 0;
            for (std::size_t i = 0; i < votes.size(); ++i) {
                rows.push_back(HistoricalDataPoint{
                    .year        = 2022,
                    .party       = "P" + std::to_string(i),
                    .total_votes = votes[i],
                });
                total += votes[i];
            }

            double sum = 0.0;
            for (const auto& [party, series] : HistoricalDataAggregator::share_series(rows)) {
                for (const auto& p : series) {
                    RC_ASSERT(p.share >= 0.0);
                    RC_ASSERT(p.share <= 100.0 + 1e-9);
                    sum += p.share;
                }
            }

            if (total == 0) {
                RC_ASSERT(sum == 0.0);
            } else {
                RC_ASSERT(std::abs(sum - 100.0) < 1e-6);
            }
        }
    );

    return 0;
}
