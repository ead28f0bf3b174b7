/// @file src/swing/swing_detector.cpp
/// @brief SwingRegionDetector — margin/volatility gates per region.

#include "votecast/swing.hpp"
#include "votecast/aggregator.hpp"

#include <algorithm>
#include <cstdint>

namespace votecast::swing {

namespace {

[[nodiscard]] const PartyTrendData* find_trend(const trend::TrendMap& trends,
                                               const std::string& party) noexcept {
    const auto it = trends.find(party);
    return it != trends.end() ? &it->second : nullptr;
}

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

SwingRegionDetector::SwingRegionDetector(double volatility_multiplier) noexcept
    : volatility_multiplier_(volatility_multiplier) {}

// ─── detect ───────────────────────────────────────────────────────────────────

std::vector<SwingRegionRecord>
SwingRegionDetector::detect(std::span<const HistoricalDataPoint> points,
                            const trend::TrendMap& trends) const {
    std::vector<SwingRegionRecord> out;

    const auto regions = history::HistoricalDataAggregator::group_by_region(points);
    for (const auto& [region, rows] : regions) {
        auto rec = evaluate_region(region, rows, trends);
        if (rec) {
            out.push_back(std::move(*rec));
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const SwingRegionRecord& a, const SwingRegionRecord& b) {
                         return a.volatility_score > b.volatility_score;
                     });
    return out;
}

// ─── evaluate_region ──────────────────────────────────────────────────────────

std::optional<SwingRegionRecord>
SwingRegionDetector::evaluate_region(const std::string& region,
                                     std::span<const HistoricalDataPoint> rows,
                                     const trend::TrendMap& trends) const {
    if (rows.empty()) {
        return std::nullopt;
    }

    const int latest = std::max_element(rows.begin(), rows.end(),
                                        [](const auto& a, const auto& b) {
                                            return a.year < b.year;
                                        })->year;

    std::vector<HistoricalDataPoint> recent;
    for (const auto& r : rows) {
        if (r.year == latest) {
            recent.push_back(r);
        }
    }
    if (recent.size() < 2) {
        return std::nullopt;
    }

    std::stable_sort(recent.begin(), recent.end(),
                     [](const HistoricalDataPoint& a, const HistoricalDataPoint& b) {
                         return a.total_votes > b.total_votes;
                     });

    const auto& leader     = recent[0];
    const auto& challenger = recent[1];

    std::int64_t region_total = 0;
    for (const auto& r : recent) {
        region_total += r.total_votes;
    }

    const std::int64_t lead_votes = leader.total_votes - challenger.total_votes;
    const double margin = region_total > 0
        ? static_cast<double>(lead_votes) / static_cast<double>(region_total) * 100.0
        : 0.0;

    const PartyTrendData* leader_trend     = find_trend(trends, leader.party);
    const PartyTrendData* challenger_trend = find_trend(trends, challenger.party);

    const double leader_vol     = leader_trend     ? leader_trend->volatility     : 0.0;
    const double challenger_vol = challenger_trend ? challenger_trend->volatility : 0.0;
    const double avg_volatility = (leader_vol + challenger_vol) / 2.0;

    if (!is_swing(margin, avg_volatility)) {
        return std::nullopt;
    }

    const double leader_slope     = leader_trend     ? leader_trend->trend_slope     : 0.0;
    const double challenger_slope = challenger_trend ? challenger_trend->trend_slope : 0.0;
    const double shift = challenger_slope - leader_slope;

    SwingRegionRecord rec;
    rec.region              = region;
    rec.region_name         = region_display_name(region);
    rec.position            = leader.position;
    rec.margin_percent      = margin;
    rec.margin_votes        = lead_votes;
    rec.volatility_score    = avg_volatility;
    rec.swing_magnitude     = avg_volatility * volatility_multiplier_;
    rec.leading_entity      = leader.party;
    rec.challenging_entity  = challenger.party;
    rec.recent_trend_shift  = shift;
    rec.outcome_uncertainty = outcome_uncertainty(margin, avg_volatility);
    rec.key_factors         = key_factors(margin, avg_volatility, shift);
    return rec;
}

// ─── Classification helpers ───────────────────────────────────────────────────

bool SwingRegionDetector::is_swing(double margin_percent, double avg_volatility) noexcept {
    return margin_percent < constants::SWING_MARGIN_THRESHOLD &&
           avg_volatility > constants::SWING_VOLATILITY_THRESHOLD;
}

double SwingRegionDetector::outcome_uncertainty(double margin_percent,
                                                double avg_volatility) noexcept {
    const double closeness =
        (constants::SWING_MARGIN_THRESHOLD - margin_percent) / constants::SWING_MARGIN_THRESHOLD;
    return std::min(1.0, closeness * avg_volatility / constants::UNCERTAINTY_VOLATILITY_SCALE);
}

std::vector<KeyFactor> SwingRegionDetector::key_factors(double margin_percent,
                                                        double avg_volatility,
                                                        double trend_shift) {
    std::vector<KeyFactor> factors{
        KeyFactor{
            .factor = "tight margin",
            .impact = margin_percent < constants::TIGHT_MARGIN_HIGH_IMPACT ? "high" : "medium",
        },
        KeyFactor{
            .factor = "high historical volatility",
            .impact = avg_volatility > constants::SWING_VOLATILITY_HIGH_IMPACT ? "high" : "medium",
        },
    };
    if (trend_shift > 0.0) {
        factors.push_back(KeyFactor{.factor = "challenger ascending", .impact = "high"});
    }
    return factors;
}

}  // namespace votecast::swing
