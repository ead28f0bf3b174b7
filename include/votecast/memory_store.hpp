#pragma once

/// @file include/votecast/memory_store.hpp
/// @brief In-process implementations of the data source and the store.
///
/// Used by the CLI and the tests. Both are internally synchronised: the
/// orchestrator's background worker writes while callers poll.

#include "votecast/collaborators.hpp"
#include "votecast/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace votecast::core {

/// Serves a fixed list of rows, filtered per query.
///
/// A row matches when its year is in the query's year set. A requested
/// position must equal the row's position, a requested state its region.
class InMemoryHistoricalSource final : public HistoricalDataSource {
public:
    explicit InMemoryHistoricalSource(std::vector<HistoricalDataPoint> rows);

    [[nodiscard]] std::vector<HistoricalDataPoint>
    historical_votes_by_party(const HistoryQuery& query) override;

    /// Number of queries answered so far.
    [[nodiscard]] std::size_t query_count() const;

private:
    std::vector<HistoricalDataPoint> rows_;
    mutable std::mutex               mutex_;
    std::size_t                      queries_ = 0;
};

class InMemoryForecastStore final : public ForecastStore {
public:
    [[nodiscard]] ForecastRun
    create_forecast_run(const NewForecastRun& run) override;

    [[nodiscard]] std::optional<ForecastRun> get_forecast_run(RunId id) override;

    /// Unknown ids are ignored.
    void update_forecast_run(RunId id, const RunUpdate& update) override;

    [[nodiscard]] std::vector<ForecastResultRecord>
    create_forecast_results(std::vector<ForecastResultRecord> records) override;

    [[nodiscard]] std::vector<SwingRegionRecord>
    create_swing_regions(std::vector<SwingRegionRecord> records) override;

    /// Insertion order.
    [[nodiscard]] std::vector<ForecastResultRecord>
    get_forecast_results(RunId run_id) override;

    [[nodiscard]] std::vector<SwingRegionRecord>
    get_swing_regions(RunId run_id) override;

private:
    mutable std::mutex                 mutex_;
    std::map<RunId, ForecastRun>       runs_;
    std::vector<ForecastResultRecord>  results_;
    std::vector<SwingRegionRecord>     regions_;
    RunId                              next_run_id_    = 1;
    std::int64_t                       next_result_id_ = 1;
    std::int64_t                       next_region_id_ = 1;
};

}  // namespace votecast::core
