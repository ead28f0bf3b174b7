/// @file src/trend/trend_analyzer.cpp
/// @brief TrendAnalyzer — OLS slope, sample volatility, mean growth rate.

#include "votecast/trend.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace votecast::trend {

namespace {

using ShareMap = Eigen::Map<const Eigen::VectorXd, Eigen::Unaligned, Eigen::InnerStride<>>;

static_assert(sizeof(VotePoint) % sizeof(double) == 0,
              "share column must be addressable with a whole-double stride");

/// Strided view of the `share` column; no copy is made.
[[nodiscard]] ShareMap shares_of(std::span<const VotePoint> series) noexcept {
    return ShareMap(&series.front().share,
                    static_cast<Eigen::Index>(series.size()),
                    Eigen::InnerStride<>(sizeof(VotePoint) / sizeof(double)));
}

}  // namespace

// ─── analyze ──────────────────────────────────────────────────────────────────

TrendMap TrendAnalyzer::analyze(std::span<const HistoricalDataPoint> points) {
    return analyze(history::HistoricalDataAggregator::share_series(points));
}

TrendMap TrendAnalyzer::analyze(const history::ShareSeries& series) {
    TrendMap out;
    for (const auto& [party, points] : series) {
        out.emplace(party, analyze_party(party, points));
    }
    return out;
}

PartyTrendData TrendAnalyzer::analyze_party(std::string party,
                                            std::vector<VotePoint> series) {
    std::stable_sort(series.begin(), series.end(),
                     [](const VotePoint& a, const VotePoint& b) { return a.year < b.year; });

    PartyTrendData out;
    out.trend_slope     = slope(series);
    out.volatility      = volatility(series);
    out.avg_growth_rate = average_growth_rate(series);
    out.party            = std::move(party);
    out.historical_votes = std::move(series);
    return out;
}

// ─── slope ────────────────────────────────────────────────────────────────────

double TrendAnalyzer::slope(std::span<const VotePoint> series) noexcept {
    const std::size_t n = series.size();
    if (n < 2) {
        return 0.0;
    }

    const double nd = static_cast<double>(n);
    const double sum_y = shares_of(series).sum();
    double sum_x  = 0.0;
    double sum_xy = 0.0;
    double sum_x2 = 0.0;
    for (const auto& p : series) {
        const double x = static_cast<double>(p.year);
        sum_x  += x;
        sum_xy += x * p.share;
        sum_x2 += x * x;
    }

    // (nΣxy − ΣxΣy) / (nΣx² − (Σx)²); zero denominator when every point
    // shares one year.
    const double b = (nd * sum_xy - sum_x * sum_y) / (nd * sum_x2 - sum_x * sum_x);
    return std::isfinite(b) ? b : 0.0;
}

// ─── volatility ───────────────────────────────────────────────────────────────

double TrendAnalyzer::volatility(std::span<const VotePoint> series) noexcept {
    if (series.size() < 2) {
        return 0.0;
    }
    // √( Σ(y − ȳ)² / (n − 1) ) over the share column in place.
    const ShareMap shares = shares_of(series);
    const double sq_sum = (shares.array() - shares.mean()).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(series.size() - 1));
}

// ─── average_growth_rate ──────────────────────────────────────────────────────

double TrendAnalyzer::average_growth_rate(std::span<const VotePoint> series) noexcept {
    double sum   = 0.0;
    std::size_t count = 0;

    for (std::size_t i = 1; i < series.size(); ++i) {
        const double prev = series[i - 1].share;
        if (prev > 0.0) {
            sum += (series[i].share - prev) / prev;
            ++count;
        }
    }

    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

}  // namespace votecast::trend
