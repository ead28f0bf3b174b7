/// @file src/stats/statistics.cpp
/// @brief Mean and sample standard deviation over Eigen maps.

#include "votecast/statistics.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace votecast::stats {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVectorMap as_vector(std::span<const double> values) noexcept {
    return ConstVectorMap(values.data(), static_cast<Eigen::Index>(values.size()));
}

}  // namespace

double mean(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    return as_vector(values).mean();
}

double sample_stddev(std::span<const double> values) noexcept {
    return sample_stddev(values, mean(values));
}

double sample_stddev(std::span<const double> values, double mean_value) noexcept {
    if (values.size() < 2) {
        return 0.0;
    }
    // Σ(x − μ)² / (n − 1)
    const double sq_sum =
        (as_vector(values).array() - mean_value).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace votecast::stats
