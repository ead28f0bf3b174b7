/// @file tests/integration/test_orchestrator.cpp
/// @brief End-to-end tests for ForecastOrchestrator over in-memory collaborators.
///
/// These tests exercise the complete run path:
///   history query → TrendAnalyzer → ForecastGenerator → SwingRegionDetector →
///   narrative → store, plus the run lifecycle (pending → running →
///   completed | failed) and the background launcher.

#include "votecast/errors.hpp"
#include "votecast/memory_store.hpp"
#include "votecast/narrative.hpp"
#include "votecast/orchestrator.hpp"

#include <gtest/gtest.h>

#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

using namespace votecast;
using namespace votecast::core;
using namespace votecast::engine;

// ─── Fakes and fixtures ───────────────────────────────────────────────────────

namespace {

/// Two parties, two regions, three cycles. São Paulo ends close and
/// volatile; Rio de Janeiro stays a comfortable lead.
std::vector<HistoricalDataPoint> sample_history() {
    std::vector<HistoricalDataPoint> rows;
    auto add = [&rows](int year, const char* party, const char* region, std::int64_t votes) {
        rows.push_back(HistoricalDataPoint{
            .year            = year,
            .party           = party,
            .region          = std::string(region),
            .position        = std::string("governor"),
            .total_votes     = votes,
            .candidate_count = 1,
        });
    };
    add(2014, "A", "SP", 3000); add(2014, "B", "SP", 6000);
    add(2018, "A", "SP", 4000); add(2018, "B", "SP", 5000);
    add(2022, "A", "SP", 5200); add(2022, "B", "SP", 5000);
    add(2014, "A", "RJ", 2000); add(2014, "B", "RJ", 1000);
    add(2018, "A", "RJ", 2000); add(2018, "B", "RJ", 1000);
    add(2022, "A", "RJ", 2000); add(2022, "B", "RJ", 1000);
    return rows;
}

class RecordingNarrator final : public NarrativeGenerator {
public:
    explicit RecordingNarrator(std::string reply) : reply_(std::move(reply)) {}

    std::string generate(const std::string& prompt) override {
        prompts.push_back(prompt);
        return reply_;
    }

    std::vector<std::string> prompts;

private:
    std::string reply_;
};

class ThrowingHistory final : public HistoricalDataSource {
public:
    std::vector<HistoricalDataPoint> historical_votes_by_party(const HistoryQuery&) override {
        throw std::runtime_error("database unavailable");
    }
};

/// Delegates to an in-memory store but refuses result writes.
class FailingResultsStore final : public ForecastStore {
public:
    ForecastRun create_forecast_run(const NewForecastRun& run) override {
        return inner.create_forecast_run(run);
    }
    std::optional<ForecastRun> get_forecast_run(RunId id) override {
        return inner.get_forecast_run(id);
    }
    void update_forecast_run(RunId id, const RunUpdate& update) override {
        inner.update_forecast_run(id, update);
    }
    std::vector<ForecastResultRecord>
    create_forecast_results(std::vector<ForecastResultRecord>) override {
        throw std::runtime_error("disk full");
    }
    std::vector<SwingRegionRecord>
    create_swing_regions(std::vector<SwingRegionRecord> records) override {
        return inner.create_swing_regions(std::move(records));
    }
    std::vector<ForecastResultRecord> get_forecast_results(RunId run_id) override {
        return inner.get_forecast_results(run_id);
    }
    std::vector<SwingRegionRecord> get_swing_regions(RunId run_id) override {
        return inner.get_swing_regions(run_id);
    }

    InMemoryForecastStore inner;
};

RunRequest small_request(int target_year = 2026) {
    RunRequest req;
    req.target_year = target_year;
    req.parameters.monte_carlo_iterations = 2000;
    return req;
}

OrchestratorConfig seeded(std::uint64_t seed = 42) {
    OrchestratorConfig cfg;
    cfg.seed = seed;
    return cfg;
}

}  // namespace

// ─── Synchronous runs ─────────────────────────────────────────────────────────

TEST(ForecastOrchestrator, CompletedRunRecordsEverything) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("A close race.");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.name = "gov 2026", .target_year = 2026});
    const auto req = small_request();
    const auto out = orch.run(run.id, req);

    EXPECT_EQ(out.party_results.size(), 2u);
    EXPECT_FALSE(out.swing_regions.empty());
    EXPECT_EQ(out.narrative, "A close race.");

    const auto stored = store.get_forecast_run(run.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, RunStatus::Completed);
    EXPECT_TRUE(stored->started_at.has_value());
    ASSERT_TRUE(stored->completed_at.has_value());
    EXPECT_GE(*stored->completed_at, *stored->started_at);
    EXPECT_EQ(stored->total_simulations, 2000u);
    EXPECT_EQ(stored->historical_years_used, (std::vector<int>{2022, 2018, 2014}));
    ASSERT_TRUE(stored->model_parameters.has_value());
    EXPECT_EQ(*stored->model_parameters, req.parameters);
    EXPECT_EQ(stored->narrative, std::optional<std::string>("A close race."));

    const auto results = store.get_forecast_results(run.id);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_EQ(r.run_id, run.id);
        EXPECT_NE(r.id, 0);
    }
    for (const auto& r : store.get_swing_regions(run.id)) {
        EXPECT_EQ(r.run_id, run.id);
    }
}

TEST(ForecastOrchestrator, SaoPauloFlaggedAsSwing) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    const auto out = orch.run(run.id, small_request());
    ASSERT_EQ(out.swing_regions.size(), 1u);
    EXPECT_EQ(out.swing_regions[0].region, "SP");
    EXPECT_EQ(out.swing_regions[0].leading_entity, "A");
}

TEST(ForecastOrchestrator, PromptDescribesRequestedScope) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    auto req = small_request();
    req.target_position = "governor";
    (void)orch.run(run.id, req);

    ASSERT_EQ(narrator.prompts.size(), 1u);
    EXPECT_NE(narrator.prompts[0].find("2026"), std::string::npos);
    EXPECT_NE(narrator.prompts[0].find("Position: governor"), std::string::npos);
    EXPECT_NE(narrator.prompts[0].find("State: National"), std::string::npos);
}

TEST(ForecastOrchestrator, EmptyHistoryFailsRun) {
    InMemoryHistoricalSource history(std::vector<HistoricalDataPoint>{});
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("unused");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    try {
        (void)orch.run(run.id, small_request());
        FAIL() << "expected DataInsufficiencyError";
    } catch (const DataInsufficiencyError& e) {
        EXPECT_EQ(e.run_id(), run.id);
    }

    const auto stored = store.get_forecast_run(run.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, RunStatus::Failed);
    EXPECT_TRUE(stored->completed_at.has_value());
    EXPECT_TRUE(store.get_forecast_results(run.id).empty());
    EXPECT_TRUE(narrator.prompts.empty());
}

TEST(ForecastOrchestrator, HistoryQueryFailurePropagates) {
    ThrowingHistory       history;
    InMemoryForecastStore store;
    RecordingNarrator     narrator("unused");
    ForecastOrchestrator  orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    EXPECT_THROW((void)orch.run(run.id, small_request()), std::runtime_error);
    EXPECT_EQ(store.get_forecast_run(run.id)->status, RunStatus::Failed);
}

TEST(ForecastOrchestrator, UnknownRunThrows) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("unused");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    EXPECT_THROW((void)orch.run(404, small_request()), RunNotFoundError);
    EXPECT_EQ(history.query_count(), 0u);
}

TEST(ForecastOrchestrator, InvalidParametersRejectedBeforeStart) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("unused");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    auto req = small_request();
    req.parameters.confidence_level = 1.5;

    EXPECT_THROW((void)orch.run(run.id, req), InvalidParametersError);
    EXPECT_EQ(store.get_forecast_run(run.id)->status, RunStatus::Pending);
    EXPECT_EQ(history.query_count(), 0u);
}

TEST(ForecastOrchestrator, NarrativeFailureUsesFallback) {
    InMemoryHistoricalSource                 history(sample_history());
    InMemoryForecastStore                    store;
    narrative::UnavailableNarrativeGenerator narrator;
    ForecastOrchestrator                     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    const auto out = orch.run(run.id, small_request());

    EXPECT_EQ(out.narrative, narrative::FALLBACK_NARRATIVE);
    EXPECT_EQ(store.get_forecast_run(run.id)->status, RunStatus::Completed);
}

TEST(ForecastOrchestrator, EmptyNarrativeUsesFallback) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    EXPECT_EQ(orch.run(run.id, small_request()).narrative, narrative::FALLBACK_NARRATIVE);
}

TEST(ForecastOrchestrator, PersistenceFailureFailsRun) {
    InMemoryHistoricalSource history(sample_history());
    FailingResultsStore      store;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    EXPECT_THROW((void)orch.run(run.id, small_request()), std::runtime_error);
    EXPECT_EQ(store.get_forecast_run(run.id)->status, RunStatus::Failed);
}

TEST(ForecastOrchestrator, SameSeedSameForecast) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    s1;
    InMemoryForecastStore    s2;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     o1(history, s1, narrator, seeded(7));
    ForecastOrchestrator     o2(history, s2, narrator, seeded(7));

    const auto r1 = s1.create_forecast_run({.target_year = 2026});
    const auto r2 = s2.create_forecast_run({.target_year = 2026});
    const auto a = o1.run(r1.id, small_request());
    const auto b = o2.run(r2.id, small_request());

    ASSERT_EQ(a.party_results.size(), b.party_results.size());
    for (std::size_t i = 0; i < a.party_results.size(); ++i) {
        EXPECT_EQ(a.party_results[i].entity_name, b.party_results[i].entity_name);
        EXPECT_DOUBLE_EQ(a.party_results[i].predicted_vote_share,
                         b.party_results[i].predicted_vote_share);
    }
}

TEST(ForecastOrchestrator, ExplicitHistoryYearsOverrideWindow) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    auto req = small_request();
    req.historical_years = std::vector<int>{2018, 2022};
    (void)orch.run(run.id, req);

    EXPECT_EQ(store.get_forecast_run(run.id)->historical_years_used,
              (std::vector<int>{2018, 2022}));
}

TEST(ForecastOrchestrator, DefaultWindowStopsAtEarliestYear) {
    EXPECT_EQ(ForecastOrchestrator::default_history_years(2026),
              (std::vector<int>{2022, 2018, 2014}));
    EXPECT_EQ(ForecastOrchestrator::default_history_years(2010),
              (std::vector<int>{2006, 2002}));
}

// ─── Background launcher ──────────────────────────────────────────────────────

TEST(ForecastOrchestrator, LaunchReturnsPendingThenCompletes) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("done");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto pending = orch.launch({.name = "bg", .run = small_request()});
    EXPECT_EQ(pending.status, RunStatus::Pending);
    EXPECT_EQ(pending.name, "bg");

    orch.wait_idle();

    const auto summary = orch.summary(pending.id);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->run.status, RunStatus::Completed);
    EXPECT_EQ(summary->top_parties.size(), 2u);
    EXPECT_FALSE(summary->swing_regions.empty());
}

TEST(ForecastOrchestrator, LaunchedFailureObservedThroughStatus) {
    InMemoryHistoricalSource history(std::vector<HistoricalDataPoint>{});
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("unused");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto pending = orch.launch({.name = "empty", .run = small_request()});
    orch.wait_idle();
    EXPECT_EQ(store.get_forecast_run(pending.id)->status, RunStatus::Failed);
}

TEST(ForecastOrchestrator, LaunchRejectsInvalidParametersWithoutCreatingRun) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("unused");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    auto req = small_request();
    req.parameters.confidence_level = 1.5;

    EXPECT_THROW((void)orch.launch({.name = "bad", .run = req}), InvalidParametersError);
    orch.wait_idle();

    // The next run takes the first id, so nothing was created for the rejected one.
    const auto next = store.create_forecast_run({.target_year = 2026});
    EXPECT_EQ(next.id, 1);
    EXPECT_EQ(history.query_count(), 0u);
    EXPECT_TRUE(narrator.prompts.empty());
}

TEST(ForecastOrchestrator, SummaryCapsPartyCount) {
    std::vector<HistoricalDataPoint> rows;
    for (int p = 0; p < 14; ++p) {
        for (int year : {2014, 2018, 2022}) {
            rows.push_back({.year = year, .party = "P" + std::to_string(p),
                            .total_votes = 100 + p * 10 + (year - 2014)});
        }
    }
    InMemoryHistoricalSource history(std::move(rows));
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("ok");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    const auto run = store.create_forecast_run({.target_year = 2026});
    EXPECT_EQ(orch.run(run.id, small_request()).party_results.size(), 14u);

    const auto summary = orch.summary(run.id);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->top_parties.size(), 10u);
    EXPECT_FALSE(orch.summary(999).has_value());
}

// ─── Scenario runs ────────────────────────────────────────────────────────────

TEST(ForecastOrchestrator, ScenarioRunNormalisesShares) {
    InMemoryHistoricalSource history(sample_history());
    InMemoryForecastStore    store;
    RecordingNarrator        narrator("");
    ForecastOrchestrator     orch(history, store, narrator, seeded());

    scenario::Scenario sc;
    sc.name        = "Polls tighten";
    sc.base_year   = 2022;
    sc.target_year = 2026;
    sc.polls.push_back({.party = "B", .percent = 55.0, .source = "Quaest"});
    sc.external_factors.push_back(
        {.factor = "economy", .impact = scenario::FactorImpact::Negative, .magnitude = 5.0});
    sc.parameters.monte_carlo_iterations = 2000;

    const auto run = store.create_forecast_run({.name = sc.name, .target_year = 2026});
    const auto out = orch.run_scenario(run.id, sc);

    const double total = std::accumulate(
        out.party_results.begin(), out.party_results.end(), 0.0,
        [](double acc, const ForecastResultRecord& r) { return acc + r.predicted_vote_share; });
    EXPECT_NEAR(total, 100.0, 1e-9);

    // Empty narrative falls back to the scenario sentence.
    EXPECT_EQ(out.narrative.rfind("Forecast for 2026 based on scenario \"Polls tighten\"", 0), 0u);

    const auto stored = store.get_forecast_run(run.id);
    EXPECT_EQ(stored->status, RunStatus::Completed);
    EXPECT_EQ(stored->historical_years_used, (std::vector<int>{2022, 2018, 2014}));
    ASSERT_TRUE(stored->model_parameters.has_value());
    EXPECT_NEAR(stored->model_parameters->volatility_multiplier, 1.2 - 0.005, 1e-12);
}
