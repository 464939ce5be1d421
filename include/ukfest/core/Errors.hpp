#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ukfest {

// Root of every error raised by the estimation core.
class EstimationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Covariance could not be repaired to a positive-definite matrix.
class NumericalError : public EstimationError {
public:
  using EstimationError::EstimationError;
};

// A single model evaluation failed, e.g. the solver did not converge for a sigma point.
class ModelDivergenceError : public EstimationError {
public:
  using EstimationError::EstimationError;
};

// Innovation covariance is not invertible within tolerance. Fatal to the run.
class SingularCovarianceError : public EstimationError {
public:
  using EstimationError::EstimationError;
};

// Invalid construction-time configuration or a dimension mismatch at the boundary.
class ConfigurationError : public EstimationError {
public:
  using EstimationError::EstimationError;
};

// Tick timestamps that are not strictly increasing.
class SequenceError : public EstimationError {
public:
  using EstimationError::EstimationError;
};

// Tick-level failure raised when any sigma point diverged during the forecast.
class ForecastFailure : public EstimationError {
public:
  ForecastFailure(const std::string& reason, std::size_t sigmaPointIndex)
      : EstimationError(reason), sigmaPointIndex(sigmaPointIndex) {}

  ForecastFailure(const ForecastFailure& failure, std::size_t tickIndex, double timestamp)
      : EstimationError(failure.what()),
        sigmaPointIndex(failure.sigmaPointIndex),
        tickIndex(tickIndex),
        timestamp(timestamp),
        hasTickContext(true) {}

  std::size_t pointIndex() const { return sigmaPointIndex; }
  std::size_t tick() const { return tickIndex; }
  double time() const { return timestamp; }
  bool hasContext() const { return hasTickContext; }

private:
  std::size_t sigmaPointIndex = 0;
  std::size_t tickIndex = 0;
  double timestamp = 0.0;
  bool hasTickContext = false;
};

} // namespace ukfest
