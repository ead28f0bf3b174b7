#pragma once

/// @file include/votecast/statistics.hpp
/// @brief Descriptive statistics shared by TrendAnalyzer and the simulator.
///
/// Thin wrappers over Eigen reductions on a non-owning Map of the input, so
/// no copy is made of large sample sets.
///
/// ## Edge Cases
/// - mean of an empty span: 0.0
/// - sample_stddev with fewer than 2 values: 0.0

#include <span>

namespace votecast::stats {

[[nodiscard]] double mean(std::span<const double> values) noexcept;

/// Bessel-corrected (n−1) standard deviation.
[[nodiscard]] double sample_stddev(std::span<const double> values) noexcept;

/// Same as above with a precomputed mean.
[[nodiscard]] double sample_stddev(std::span<const double> values,
                                   double mean_value) noexcept;

}  // namespace votecast::stats
