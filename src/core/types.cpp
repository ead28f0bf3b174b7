/// @file src/core/types.cpp
/// @brief String renderings of the shared value types.

#include "votecast/types.hpp"

#include <fmt/format.h>

namespace votecast {

std::string_view to_string(TrendDirection d) noexcept {
    switch (d) {
        case TrendDirection::Rising:  return "rising";
        case TrendDirection::Falling: return "falling";
        case TrendDirection::Stable:  return "stable";
    }
    return "stable";
}

std::string_view to_string(RunStatus s) noexcept {
    switch (s) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
    }
    return "pending";
}

std::string ForecastResultRecord::to_string() const {
    return fmt::format(
        "{:<12} {:7.2f}%  [{:6.2f}% – {:6.2f}%]  {:<7}  strength={:.4f}  confidence={:.4f}",
        entity_name,
        predicted_vote_share,
        vote_share_lower,
        vote_share_upper,
        votecast::to_string(trend_direction),
        trend_strength,
        confidence);
}

std::string SwingRegionRecord::to_string() const {
    return fmt::format(
        "{:<20} margin={:5.2f}% ({} votes)  {} vs {}  volatility={:.4f}  "
        "swing={:.2f}  uncertainty={:.4f}",
        region_name,
        margin_percent,
        margin_votes,
        leading_entity,
        challenging_entity,
        volatility_score,
        swing_magnitude,
        outcome_uncertainty);
}

}  // namespace votecast
