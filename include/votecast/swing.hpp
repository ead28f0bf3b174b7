#pragma once

/// @file include/votecast/swing.hpp
/// @brief SwingRegionDetector — flags regions whose outcome is contested.
///
/// # Module: Swing Region Detector
///
/// ## Per Region
/// Only rows from the region's most recent year are considered, sorted by
/// votes descending. With fewer than two parties the region is skipped.
///
///   margin         = (leader − challenger) / region_total × 100
///   avg_volatility = (σ_leader + σ_challenger) / 2       (missing trend → 0)
///
/// A region is a swing region iff
///
///   margin < SWING_MARGIN_THRESHOLD  AND  avg_volatility > SWING_VOLATILITY_THRESHOLD
///
/// For swing regions:
///   swing_magnitude     = avg_volatility · volatility_multiplier
///   recent_trend_shift  = slope_challenger − slope_leader
///   outcome_uncertainty = min(1, (10 − margin)/10 · avg_volatility/5)
///
/// ## Key Factors
/// - "tight margin"                 high if margin < 5, else medium
/// - "high historical volatility"   high if avg_volatility > 5, else medium
/// - "challenger ascending"         high, only when recent_trend_shift > 0
///
/// ## Guarantees
/// - Output sorted by volatility_score, descending
/// - Rows without a region never contribute

#include "votecast/constants.hpp"
#include "votecast/trend.hpp"
#include "votecast/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace votecast::swing {

/// Display name of a federative-unit code ("SP" → "São Paulo").
/// Unknown codes are returned unchanged.
[[nodiscard]] std::string region_display_name(std::string_view code);

class SwingRegionDetector {
public:
    explicit SwingRegionDetector(
        double volatility_multiplier = constants::DEFAULT_VOLATILITY_MULTIPLIER) noexcept;

    [[nodiscard]] std::vector<SwingRegionRecord>
    detect(std::span<const HistoricalDataPoint> points,
           const trend::TrendMap& trends) const;

    /// Evaluate one region's rows. `nullopt` when the region has fewer than
    /// two parties in its latest year or does not pass the swing gates.
    [[nodiscard]] std::optional<SwingRegionRecord>
    evaluate_region(const std::string& region,
                    std::span<const HistoricalDataPoint> rows,
                    const trend::TrendMap& trends) const;

    [[nodiscard]] static bool is_swing(double margin_percent,
                                       double avg_volatility) noexcept;

    [[nodiscard]] static double outcome_uncertainty(double margin_percent,
                                                    double avg_volatility) noexcept;

    [[nodiscard]] static std::vector<KeyFactor>
    key_factors(double margin_percent, double avg_volatility, double trend_shift);

private:
    double volatility_multiplier_;
};

}  // namespace votecast::swing
