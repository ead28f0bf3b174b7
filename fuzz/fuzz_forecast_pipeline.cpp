/**
 * @file  fuzz_forecast_pipeline.cpp
 * @brief libFuzzer target for CSV → trends → forecast → swing detection
 *
 * Build:
 *   cmake -DVOTECAST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_forecast_pipeline
 *
 * Run for 60 seconds:
 *   ./fuzz_forecast_pipeline -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every trend statistic is finite.
 *   3. Every party forecast satisfies
 *      0 ≤ lower ≤ upper ≤ 100 and 0.3 ≤ confidence ≤ 1.
 *   4. Every swing region has margin < 10 and volatility > 2.
 *
 * Fuzzer strategy:
 *   The input is parsed as CSV, so most mutations produce a handful of
 *   valid rows with extreme vote counts, repeated years, single-party
 *   regions and zero-vote years. Iterations are kept small so each
 *   execution stays cheap.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "votecast/data_loader.hpp"
#include "votecast/forecast.hpp"
#include "votecast/swing.hpp"
#include "votecast/trend.hpp"

using namespace votecast;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto rows = core::DataLoader::parse_csv_string(input);
    if (rows.empty()) {
        return 0;
    }

    const auto trends = trend::TrendAnalyzer::analyze(rows);
    for (const auto& [party, t] : trends) {
        // Invariant 2
        assert(std::isfinite(t.trend_slope));
        assert(std::isfinite(t.volatility));
        assert(std::isfinite(t.avg_growth_rate));
    }

    ModelParameters params;
    params.monte_carlo_iterations = 64;

    const forecast::ForecastGenerator generator(params, size);
    for (const auto& r : generator.generate(trends, 2030)) {
        // Invariant 3
        assert(r.vote_share_lower >= 0.0);
        assert(r.vote_share_lower <= r.vote_share_upper);
        assert(r.vote_share_upper <= 100.0);
        assert(r.confidence >= 0.3 && r.confidence <= 1.0);
    }

    const swing::SwingRegionDetector detector(params.volatility_multiplier);
    for (const auto& region : detector.detect(rows, trends)) {
        // Invariant 4
        assert(region.margin_percent < 10.0);
        assert(region.volatility_score > 2.0);
        assert(region.outcome_uncertainty <= 1.0);
    }

    return 0;
}
