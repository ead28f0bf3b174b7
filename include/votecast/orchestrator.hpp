#pragma once

/// @file include/votecast/orchestrator.hpp
/// @brief ForecastOrchestrator — runs the forecast pipeline and its lifecycle.
///
/// # Module: Forecast Orchestrator
///
/// ## Pipeline
///   HistoricalDataSource → HistoricalDataAggregator → TrendAnalyzer →
///   ForecastGenerator (MonteCarloSimulator per party) → SwingRegionDetector →
///   NarrativeGenerator → ForecastStore
///
/// ## Run Lifecycle
///   pending ──run()──▶ running ──▶ completed
///                               └─▶ failed
///
/// - pending:   created by the caller (or by launch())
/// - running:   started_at set, history requested
/// - failed:    no history (DataInsufficiencyError) or a store failure;
///              completed_at set, exception rethrown
/// - completed: results persisted; completed_at, total_simulations,
///              historical_years_used, model_parameters and narrative set
///
/// ## Usage
/// ```cpp
/// ForecastOrchestrator orch(history, store, narrator);
/// auto run = orch.launch({.name = "2026 mayors", .run = {.target_year = 2026}});
/// // ... later
/// auto status = store.get_forecast_run(run.id)->status;
/// ```
///
/// ## Error Handling
/// - Narrative failures are logged and replaced by FALLBACK_NARRATIVE
/// - Data insufficiency and store failures propagate to the caller of run();
///   for launch()ed runs they are logged and visible only as status=failed
/// - Invalid parameters throw from launch() itself; no run is created
/// - No retries and no rollback of partially persisted output

#include "votecast/collaborators.hpp"
#include "votecast/errors.hpp"
#include "votecast/parameters.hpp"
#include "votecast/run_queue.hpp"
#include "votecast/scenario.hpp"
#include "votecast/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace votecast::engine {

struct OrchestratorConfig {
    /// Fixed base seed for reproducible runs. Drawn from std::random_device
    /// when unset.
    std::optional<std::uint64_t> seed;

    std::size_t narrative_top_parties = constants::NARRATIVE_TOP_PARTIES;
    std::size_t narrative_top_regions = constants::NARRATIVE_TOP_REGIONS;
    std::size_t summary_top_parties   = constants::SUMMARY_TOP_PARTIES;

    /// If true, emit per-party forecast lines to stderr.
    bool verbose = false;
};

struct RunRequest {
    int                             target_year = 0;
    std::optional<std::string>      target_position;
    std::optional<std::string>      target_state;
    std::optional<std::vector<int>> historical_years;  ///< Default window when unset
    ModelParameters                 parameters{};
};

struct LaunchRequest {
    std::string name;
    std::string description;
    RunRequest  run;
};

/// Stored view of a run: the run row, its best parties and its swing regions.
struct RunSummary {
    ForecastRun                       run;
    std::vector<ForecastResultRecord> top_parties;
    std::vector<SwingRegionRecord>    swing_regions;
};

class ForecastOrchestrator {
public:
    ForecastOrchestrator(HistoricalDataSource& history,
                         ForecastStore& store,
                         NarrativeGenerator& narrator,
                         OrchestratorConfig config = OrchestratorConfig{});

    ForecastOrchestrator(const ForecastOrchestrator&)            = delete;
    ForecastOrchestrator& operator=(const ForecastOrchestrator&) = delete;

    /// Execute the pending run `run_id` synchronously.
    ///
    /// # Throws
    /// - InvalidParametersError before any status change
    /// - RunNotFoundError if the store has no such run
    /// - DataInsufficiencyError when no history matches (run → failed)
    /// - whatever the store throws on write (run → failed when possible)
    ForecastSummary run(RunId run_id, const RunRequest& request);

    /// Execute a scenario forecast for the pending run `run_id`.
    /// Same lifecycle and error contract as run().
    ForecastSummary run_scenario(RunId run_id, const scenario::Scenario& scenario);

    /// Create a pending run and queue it on the background worker.
    /// Returns the pending run immediately; poll the store for progress.
    /// Throws InvalidParametersError, creating no run, when the request's
    /// parameters fail validation.
    ForecastRun launch(const LaunchRequest& request);

    /// Stored run with its first `summary_top_parties` party results and all
    /// swing regions. `nullopt` for an unknown run.
    [[nodiscard]] std::optional<RunSummary> summary(RunId run_id);

    /// Block until every launched run has finished.
    void wait_idle();

    /// [target−4, target−8, target−12], keeping years ≥ 2002.
    [[nodiscard]] static std::vector<int> default_history_years(int target_year);

private:
    /// Seed of the random streams of one run.
    [[nodiscard]] std::uint64_t run_seed(RunId run_id) const noexcept;

    /// Move the run to running and return the stored row.
    ForecastRun begin(RunId run_id);

    /// Mark the run failed with a completion time. Never throws.
    void mark_failed(RunId run_id) noexcept;

    /// Ask the narrator; fall back to `fallback` on error or empty output.
    std::string narrate(const std::string& prompt, const std::string& fallback);

    /// Persist outputs and complete the run.
    ForecastSummary finish(RunId run_id,
                           std::vector<ForecastResultRecord> parties,
                           std::vector<SwingRegionRecord> regions,
                           std::string narrative,
                           const std::vector<int>& years,
                           const ModelParameters& params);

    HistoricalDataSource& history_;
    ForecastStore&        store_;
    NarrativeGenerator&   narrator_;
    OrchestratorConfig    config_;
    std::uint64_t         base_seed_;
    RunQueue              queue_;  ///< Last member: joined before the rest is destroyed
};

}  // namespace votecast::engine
