#pragma once

/// @file include/votecast/collaborators.hpp
/// @brief Interfaces of the services the orchestrator depends on.
///
/// The engine never constructs these itself; concrete instances are injected
/// into ForecastOrchestrator so production adapters and test fakes are
/// interchangeable.

#include "votecast/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace votecast {

// ─── Historical Data ──────────────────────────────────────────────────────────

struct HistoryQuery {
    std::vector<int>           years;
    std::optional<std::string> position;
    std::optional<std::string> state;
};

class HistoricalDataSource {
public:
    virtual ~HistoricalDataSource() = default;

    /// Per-party tallies for the requested years and scope. Returns an empty
    /// list, not an error, when nothing matches.
    [[nodiscard]] virtual std::vector<HistoricalDataPoint>
    historical_votes_by_party(const HistoryQuery& query) = 0;
};

// ─── Narrative ────────────────────────────────────────────────────────────────

class NarrativeGenerator {
public:
    virtual ~NarrativeGenerator() = default;

    /// Free-text analysis for `prompt`. May throw on service failure.
    [[nodiscard]] virtual std::string generate(const std::string& prompt) = 0;
};

// ─── Persistence ──────────────────────────────────────────────────────────────

struct NewForecastRun {
    std::string                name;
    std::string                description;
    int                        target_year = 0;
    std::optional<std::string> target_position;
    std::optional<std::string> target_state;
};

/// Partial update: only engaged fields are written.
struct RunUpdate {
    std::optional<RunStatus>        status;
    std::optional<Timestamp>        started_at;
    std::optional<Timestamp>        completed_at;
    std::optional<std::size_t>      total_simulations;
    std::optional<std::vector<int>> historical_years_used;
    std::optional<ModelParameters>  model_parameters;
    std::optional<std::string>      narrative;
};

class ForecastStore {
public:
    virtual ~ForecastStore() = default;

    /// Persist a new run in `pending` and return it with its id.
    [[nodiscard]] virtual ForecastRun
    create_forecast_run(const NewForecastRun& run) = 0;

    [[nodiscard]] virtual std::optional<ForecastRun>
    get_forecast_run(RunId id) = 0;

    virtual void update_forecast_run(RunId id, const RunUpdate& update) = 0;

    [[nodiscard]] virtual std::vector<ForecastResultRecord>
    create_forecast_results(std::vector<ForecastResultRecord> records) = 0;

    [[nodiscard]] virtual std::vector<SwingRegionRecord>
    create_swing_regions(std::vector<SwingRegionRecord> records) = 0;

    [[nodiscard]] virtual std::vector<ForecastResultRecord>
    get_forecast_results(RunId run_id) = 0;

    [[nodiscard]] virtual std::vector<SwingRegionRecord>
    get_swing_regions(RunId run_id) = 0;
};

}  // namespace votecast
