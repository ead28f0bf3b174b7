/// @file tests/scenario/test_scenario.cpp
/// @brief Unit tests for scenario adjustments and ScenarioForecaster.

#include <gtest/gtest.h>
#include "votecast/scenario.hpp"

#include <algorithm>
#include <vector>

using namespace votecast;
using namespace votecast::scenario;

namespace {

PartyTrendData party(std::string name, std::vector<double> shares,
                     double slope = 0.0, double volatility = 1.0) {
    PartyTrendData t;
    t.party = std::move(name);
    int year = 2014;
    for (double s : shares) {
        t.historical_votes.push_back(VotePoint{.year = year, .votes = 0, .share = s});
        year += 4;
    }
    t.trend_slope = slope;
    t.volatility  = volatility;
    return t;
}

}  // namespace

// ─── history_years ────────────────────────────────────────────────────────────

TEST(Scenario, HistoryYearsIncludeBaseYear) {
    EXPECT_EQ(history_years(2022), (std::vector<int>{2022, 2018, 2014}));
}

TEST(Scenario, HistoryYearsStopAtEarliestYear) {
    EXPECT_EQ(history_years(2006), (std::vector<int>{2006, 2002}));
    EXPECT_TRUE(history_years(1998).empty());
}

// ─── apply_adjustments ────────────────────────────────────────────────────────

TEST(Scenario, PollBlendsIntoLatestShare) {
    trend::TrendMap trends;
    trends["A"] = party("A", {35.0, 40.0});

    Scenario sc;
    sc.polls.push_back(Poll{.party = "A", .percent = 50.0, .source = "Datafolha"});

    const auto adjusted = apply_adjustments(trends, sc);
    // 40 · 0.7 + 50 · 0.3 = 43
    EXPECT_NEAR(adjusted.at("A").historical_votes.back().share, 43.0, 1e-12);
    EXPECT_DOUBLE_EQ(adjusted.at("A").historical_votes.front().share, 35.0);
    // Input untouched.
    EXPECT_DOUBLE_EQ(trends.at("A").historical_votes.back().share, 40.0);
}

TEST(Scenario, PartyAdjustmentAppliedAfterPolls) {
    trend::TrendMap trends;
    trends["A"] = party("A", {40.0});

    Scenario sc;
    sc.polling_weight = 0.5;
    sc.polls.push_back(Poll{.party = "A", .percent = 50.0, .source = ""});
    sc.party_adjustments["A"] = -3.0;

    const auto adjusted = apply_adjustments(trends, sc);
    EXPECT_NEAR(adjusted.at("A").historical_votes.back().share, 42.0, 1e-12);
}

TEST(Scenario, UnknownPartiesIgnored) {
    trend::TrendMap trends;
    trends["A"] = party("A", {40.0});

    Scenario sc;
    sc.polls.push_back(Poll{.party = "Ghost", .percent = 90.0, .source = ""});
    sc.party_adjustments["Ghost"] = 10.0;

    const auto adjusted = apply_adjustments(trends, sc);
    EXPECT_EQ(adjusted.size(), 1u);
    EXPECT_DOUBLE_EQ(adjusted.at("A").historical_votes.back().share, 40.0);
}

// ─── adjusted_volatility_multiplier ───────────────────────────────────────────

TEST(Scenario, ExternalFactorsNudgeMultiplier) {
    const std::vector<ExternalFactor> factors{
        {.factor = "economy",  .impact = FactorImpact::Positive, .magnitude = 10.0},
        {.factor = "scandal",  .impact = FactorImpact::Negative, .magnitude = 4.0},
    };
    // 1.2 + (0.10 − 0.04) · 0.1 = 1.206
    EXPECT_NEAR(adjusted_volatility_multiplier(1.2, factors), 1.206, 1e-12);
}

TEST(Scenario, MultiplierFloor) {
    const std::vector<ExternalFactor> factors{
        {.factor = "crisis", .impact = FactorImpact::Negative, .magnitude = 10.0},
    };
    EXPECT_DOUBLE_EQ(adjusted_volatility_multiplier(0.05, factors), 0.1);
}

TEST(Scenario, NoFactorsKeepsBase) {
    EXPECT_DOUBLE_EQ(adjusted_volatility_multiplier(1.2, {}), 1.2);
}

// ─── ScenarioForecaster ───────────────────────────────────────────────────────

TEST(ScenarioForecaster, SharesNormalisedToHundred) {
    trend::TrendMap trends;
    trends["A"] = party("A", {30.0, 32.0}, 0.5, 2.0);
    trends["B"] = party("B", {25.0, 24.0}, -0.25, 2.0);
    trends["C"] = party("C", {10.0, 11.0}, 0.25, 1.0);

    ModelParameters params;
    params.monte_carlo_iterations = 2000;
    const ScenarioForecaster forecaster(params, 11);
    const auto results = forecaster.generate(trends, 1.2);
    ASSERT_EQ(results.size(), 3u);

    double sum = 0.0;
    for (const auto& r : results) {
        sum += r.predicted_vote_share;
        EXPECT_LE(r.vote_share_lower, r.predicted_vote_share);
        EXPECT_GE(r.vote_share_upper, r.predicted_vote_share);
    }
    EXPECT_NEAR(sum, 100.0, 1e-9);
    EXPECT_TRUE(std::is_sorted(results.begin(), results.end(),
        [](const ForecastResultRecord& a, const ForecastResultRecord& b) {
            return a.predicted_vote_share > b.predicted_vote_share;
        }));
    EXPECT_EQ(results[0].entity_name, "A");
}

TEST(ScenarioForecaster, FinerDirectionThreshold) {
    trend::TrendMap trends;
    trends["A"] = party("A", {30.0}, 0.02, 0.0);
    trends["B"] = party("B", {30.0}, -0.02, 0.0);
    trends["C"] = party("C", {30.0}, 0.005, 0.0);

    const ScenarioForecaster forecaster(ModelParameters{}, 1);
    const auto results = forecaster.generate(trends, 1.0);
    for (const auto& r : results) {
        if (r.entity_name == "A") EXPECT_EQ(r.trend_direction, TrendDirection::Rising);
        if (r.entity_name == "B") EXPECT_EQ(r.trend_direction, TrendDirection::Falling);
        if (r.entity_name == "C") EXPECT_EQ(r.trend_direction, TrendDirection::Stable);
    }
}

TEST(ScenarioForecaster, AllZeroSharesLeftUnscaled) {
    trend::TrendMap trends;
    trends["A"] = party("A", {0.0}, 0.0, 0.0);
    trends["B"] = party("B", {0.0}, 0.0, 0.0);

    const ScenarioForecaster forecaster(ModelParameters{}, 1);
    for (const auto& r : forecaster.generate(trends, 1.0)) {
        EXPECT_DOUBLE_EQ(r.predicted_vote_share, 0.0);
    }
}
