/// @file src/core/memory_store.cpp
/// @brief In-memory HistoricalDataSource and ForecastStore.

#include "votecast/memory_store.hpp"

#include <algorithm>
#include <iterator>

namespace votecast::core {

// ─── InMemoryHistoricalSource ─────────────────────────────────────────────────

InMemoryHistoricalSource::InMemoryHistoricalSource(std::vector<HistoricalDataPoint> rows)
    : rows_(std::move(rows)) {}

std::vector<HistoricalDataPoint>
InMemoryHistoricalSource::historical_votes_by_party(const HistoryQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++queries_;

    std::vector<HistoricalDataPoint> out;
    for (const auto& row : rows_) {
        if (std::find(query.years.begin(), query.years.end(), row.year) == query.years.end()) {
            continue;
        }
        if (query.position && row.position != query.position) {
            continue;
        }
        if (query.state && row.region != query.state) {
            continue;
        }
        out.push_back(row);
    }
    return out;
}

std::size_t InMemoryHistoricalSource::query_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_;
}

// ─── InMemoryForecastStore — runs ─────────────────────────────────────────────

ForecastRun InMemoryForecastStore::create_forecast_run(const NewForecastRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);

    ForecastRun row;
    row.id              = next_run_id_++;
    row.name            = run.name;
    row.description     = run.description;
    row.target_year     = run.target_year;
    row.target_position = run.target_position;
    row.target_state    = run.target_state;
    row.status          = RunStatus::Pending;

    runs_.emplace(row.id, row);
    return row;
}

std::optional<ForecastRun> InMemoryForecastStore::get_forecast_run(RunId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = runs_.find(id);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryForecastStore::update_forecast_run(RunId id, const RunUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = runs_.find(id);
    if (it == runs_.end()) {
        return;
    }

    ForecastRun& run = it->second;
    if (update.status)                run.status                = *update.status;
    if (update.started_at)            run.started_at            = update.started_at;
    if (update.completed_at)          run.completed_at          = update.completed_at;
    if (update.total_simulations)     run.total_simulations     = *update.total_simulations;
    if (update.historical_years_used) run.historical_years_used = *update.historical_years_used;
    if (update.model_parameters)      run.model_parameters      = update.model_parameters;
    if (update.narrative)             run.narrative             = update.narrative;
}

// ─── InMemoryForecastStore — results ──────────────────────────────────────────

std::vector<ForecastResultRecord>
InMemoryForecastStore::create_forecast_results(std::vector<ForecastResultRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& r : records) {
        r.id = next_result_id_++;
        results_.push_back(r);
    }
    return records;
}

std::vector<SwingRegionRecord>
InMemoryForecastStore::create_swing_regions(std::vector<SwingRegionRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& r : records) {
        r.id = next_region_id_++;
        regions_.push_back(r);
    }
    return records;
}

std::vector<ForecastResultRecord> InMemoryForecastStore::get_forecast_results(RunId run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ForecastResultRecord> out;
    std::copy_if(results_.begin(), results_.end(), std::back_inserter(out),
                 [run_id](const ForecastResultRecord& r) { return r.run_id == run_id; });
    return out;
}

std::vector<SwingRegionRecord> InMemoryForecastStore::get_swing_regions(RunId run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SwingRegionRecord> out;
    std::copy_if(regions_.begin(), regions_.end(), std::back_inserter(out),
                 [run_id](const SwingRegionRecord& r) { return r.run_id == run_id; });
    return out;
}

}  // namespace votecast::core
