#pragma once

/// @file include/votecast/errors.hpp
/// @brief Exceptions that cross the orchestrator boundary.
///
/// The numeric core never throws: degenerate inputs collapse to neutral
/// values. Only conditions the caller must act on are raised, all derived
/// from ForecastError so a single handler can catch them.

#include "votecast/types.hpp"

#include <stdexcept>
#include <string>

namespace votecast {

class ForecastError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No historical rows matched the requested year window and scope.
class DataInsufficiencyError : public ForecastError {
public:
    explicit DataInsufficiencyError(RunId run_id)
        : ForecastError("insufficient historical data for forecast run "
                        + std::to_string(run_id)),
          run_id_(run_id) {}

    [[nodiscard]] RunId run_id() const noexcept { return run_id_; }

private:
    RunId run_id_;
};

/// The store has no run with the requested id.
class RunNotFoundError : public ForecastError {
public:
    explicit RunNotFoundError(RunId run_id)
        : ForecastError("forecast run " + std::to_string(run_id) + " not found"),
          run_id_(run_id) {}

    [[nodiscard]] RunId run_id() const noexcept { return run_id_; }

private:
    RunId run_id_;
};

/// ModelParameters::validate() reported at least one problem.
class InvalidParametersError : public ForecastError {
public:
    using ForecastError::ForecastError;
};

/// Raised by narrative generators that have no backing service.
class NarrativeUnavailableError : public ForecastError {
public:
    using ForecastError::ForecastError;
};

}  // namespace votecast
