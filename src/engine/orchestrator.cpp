/// @file src/engine/orchestrator.cpp
/// @brief ForecastOrchestrator — pipeline sequencing and run lifecycle.

#include "votecast/orchestrator.hpp"
#include "votecast/forecast.hpp"
#include "votecast/narrative.hpp"
#include "votecast/swing.hpp"
#include "votecast/trend.hpp"

#include <fmt/core.h>

#include <chrono>
#include <exception>
#include <random>

namespace votecast::engine {

namespace {

[[nodiscard]] Timestamp now() noexcept {
    return std::chrono::system_clock::now();
}

[[nodiscard]] std::uint64_t draw_seed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

void require_valid(const ModelParameters& params) {
    const auto problems = params.validate();
    if (problems.empty()) {
        return;
    }
    std::string msg = "invalid model parameters:";
    for (const auto& p : problems) {
        msg += " ";
        msg += p;
        msg += ";";
    }
    throw InvalidParametersError(msg);
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

ForecastOrchestrator::ForecastOrchestrator(HistoricalDataSource& history,
                                           ForecastStore& store,
                                           NarrativeGenerator& narrator,
                                           OrchestratorConfig config)
    : history_(history),
      store_(store),
      narrator_(narrator),
      config_(std::move(config)),
      base_seed_(config_.seed ? *config_.seed : draw_seed()) {}

// ─── default_history_years ────────────────────────────────────────────────────

std::vector<int> ForecastOrchestrator::default_history_years(int target_year) {
    std::vector<int> years;
    for (int k = 1; k <= constants::DEFAULT_HISTORY_CYCLES; ++k) {
        const int y = target_year - k * constants::ELECTION_CYCLE_YEARS;
        if (y >= constants::EARLIEST_HISTORY_YEAR) {
            years.push_back(y);
        }
    }
    return years;
}

// ─── run ──────────────────────────────────────────────────────────────────────

ForecastSummary ForecastOrchestrator::run(RunId run_id, const RunRequest& request) {
    const ModelParameters& params = request.parameters;
    require_valid(params);

    const ForecastRun stored = begin(run_id);

    const std::vector<int> years = request.historical_years
        ? *request.historical_years
        : default_history_years(request.target_year);

    std::vector<HistoricalDataPoint> history;
    try {
        history = history_.historical_votes_by_party(HistoryQuery{
            .years    = years,
            .position = request.target_position,
            .state    = request.target_state,
        });
    } catch (const std::exception& e) {
        fmt::print(stderr, "[orchestrator] run {}: history query failed: {}\n",
                   run_id, e.what());
        mark_failed(run_id);
        throw;
    }

    if (history.empty()) {
        mark_failed(run_id);
        throw DataInsufficiencyError(run_id);
    }

    const auto trends = trend::TrendAnalyzer::analyze(history);

    const forecast::ForecastGenerator generator(params, run_seed(run_id));
    auto parties = generator.generate(trends, request.target_year);

    const swing::SwingRegionDetector detector(params.volatility_multiplier);
    auto regions = detector.detect(history, trends);

    if (config_.verbose) {
        for (const auto& p : parties) {
            fmt::print(stderr, "[orchestrator] run {}: {}\n", run_id, p.to_string());
        }
    }

    // The narrative describes the run as requested, which may differ from
    // what the caller stored on the pending row.
    ForecastRun described = stored;
    described.target_year     = request.target_year;
    described.target_position = request.target_position;
    described.target_state    = request.target_state;

    std::string text = narrate(
        narrative::build_prompt(described, parties, regions,
                                config_.narrative_top_parties,
                                config_.narrative_top_regions),
        std::string(narrative::FALLBACK_NARRATIVE));

    return finish(run_id, std::move(parties), std::move(regions),
                  std::move(text), years, params);
}

// ─── run_scenario ─────────────────────────────────────────────────────────────

ForecastSummary ForecastOrchestrator::run_scenario(RunId run_id,
                                                   const scenario::Scenario& sc) {
    ModelParameters params = sc.parameters;
    require_valid(params);

    begin(run_id);

    const std::vector<int> years = scenario::history_years(sc.base_year);

    std::vector<HistoricalDataPoint> history;
    try {
        history = history_.historical_votes_by_party(HistoryQuery{
            .years    = years,
            .position = sc.position,
            .state    = sc.state,
        });
    } catch (const std::exception& e) {
        fmt::print(stderr, "[orchestrator] scenario run {}: history query failed: {}\n",
                   run_id, e.what());
        mark_failed(run_id);
        throw;
    }

    if (history.empty()) {
        mark_failed(run_id);
        throw DataInsufficiencyError(run_id);
    }

    const auto trends   = trend::TrendAnalyzer::analyze(history);
    const auto adjusted = scenario::apply_adjustments(trends, sc);

    params.volatility_multiplier = scenario::adjusted_volatility_multiplier(
        params.volatility_multiplier, sc.external_factors);

    const scenario::ScenarioForecaster forecaster(params, run_seed(run_id));
    auto parties = forecaster.generate(adjusted, params.volatility_multiplier);

    const swing::SwingRegionDetector detector(params.volatility_multiplier);
    auto regions = detector.detect(history, trends);

    std::string text = narrate(
        narrative::build_scenario_prompt(sc, parties, config_.narrative_top_parties),
        narrative::scenario_fallback(sc, parties));

    return finish(run_id, std::move(parties), std::move(regions),
                  std::move(text), years, params);
}

// ─── launch ───────────────────────────────────────────────────────────────────

ForecastRun ForecastOrchestrator::launch(const LaunchRequest& request) {
    // The worker would reject these before begin(), leaving the run pending.
    require_valid(request.run.parameters);

    ForecastRun created = store_.create_forecast_run(NewForecastRun{
        .name            = request.name,
        .description     = request.description,
        .target_year     = request.run.target_year,
        .target_position = request.run.target_position,
        .target_state    = request.run.target_state,
    });

    const RunId id = created.id;
    queue_.submit([this, id, run_request = request.run] {
        try {
            (void)run(id, run_request);
        } catch (const std::exception& e) {
            fmt::print(stderr, "[orchestrator] forecast run {} failed: {}\n", id, e.what());
        }
    });

    return created;
}

// ─── summary ──────────────────────────────────────────────────────────────────

std::optional<RunSummary> ForecastOrchestrator::summary(RunId run_id) {
    auto stored = store_.get_forecast_run(run_id);
    if (!stored) {
        return std::nullopt;
    }

    auto results = store_.get_forecast_results(run_id);
    std::vector<ForecastResultRecord> parties;
    for (auto& r : results) {
        if (parties.size() >= config_.summary_top_parties) break;
        if (r.result_type == "party") {
            parties.push_back(std::move(r));
        }
    }

    return RunSummary{
        .run           = std::move(*stored),
        .top_parties   = std::move(parties),
        .swing_regions = store_.get_swing_regions(run_id),
    };
}

void ForecastOrchestrator::wait_idle() {
    queue_.wait_idle();
}

// ─── Private helpers ──────────────────────────────────────────────────────────

std::uint64_t ForecastOrchestrator::run_seed(RunId run_id) const noexcept {
    return base_seed_ ^ (static_cast<std::uint64_t>(run_id) * 0x9E3779B97F4A7C15ULL);
}

ForecastRun ForecastOrchestrator::begin(RunId run_id) {
    auto stored = store_.get_forecast_run(run_id);
    if (!stored) {
        throw RunNotFoundError(run_id);
    }

    const Timestamp started = now();
    store_.update_forecast_run(run_id, RunUpdate{
        .status     = RunStatus::Running,
        .started_at = started,
    });

    stored->status     = RunStatus::Running;
    stored->started_at = started;
    return *stored;
}

void ForecastOrchestrator::mark_failed(RunId run_id) noexcept {
    try {
        store_.update_forecast_run(run_id, RunUpdate{
            .status       = RunStatus::Failed,
            .completed_at = now(),
        });
    } catch (const std::exception& e) {
        fmt::print(stderr, "[orchestrator] run {}: could not record failure: {}\n",
                   run_id, e.what());
    }
}

std::string ForecastOrchestrator::narrate(const std::string& prompt,
                                          const std::string& fallback) {
    try {
        std::string text = narrator_.generate(prompt);
        if (!text.empty()) {
            return text;
        }
        fmt::print(stderr, "[orchestrator] narrative service returned no content\n");
    } catch (const std::exception& e) {
        fmt::print(stderr, "[orchestrator] narrative generation failed: {}\n", e.what());
    }
    return fallback;
}

ForecastSummary ForecastOrchestrator::finish(RunId run_id,
                                             std::vector<ForecastResultRecord> parties,
                                             std::vector<SwingRegionRecord> regions,
                                             std::string narrative,
                                             const std::vector<int>& years,
                                             const ModelParameters& params) {
    for (auto& p : parties) p.run_id = run_id;
    for (auto& r : regions) r.run_id = run_id;

    ForecastSummary out;
    try {
        out.party_results = store_.create_forecast_results(std::move(parties));
        out.swing_regions = store_.create_swing_regions(std::move(regions));

        store_.update_forecast_run(run_id, RunUpdate{
            .status                = RunStatus::Completed,
            .completed_at          = now(),
            .total_simulations     = params.monte_carlo_iterations,
            .historical_years_used = years,
            .model_parameters      = params,
            .narrative             = narrative,
        });
    } catch (const std::exception& e) {
        fmt::print(stderr, "[orchestrator] run {}: persistence failed: {}\n",
                   run_id, e.what());
        mark_failed(run_id);
        throw;
    }

    out.narrative = std::move(narrative);
    return out;
}

}  // namespace votecast::engine
