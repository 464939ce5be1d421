#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ukfest/core/Types.hpp"
#include "ukfest/data/Tick.hpp"

namespace ukfest {

enum class TickStatus_e {
  kSuccess,
  kForecastFailure
};

// Filter estimate after a single tick.
struct TickResult_t {
  std::size_t tickIndex = 0;
  double time = 0.0;
  TickStatus_e status = TickStatus_e::kSuccess;
  std::string failureReason;
  Vector posteriorMean;
  Matrix posteriorCovariance;
  std::vector<bool> constraintActive;
  Vector predictedMeasurement;
  Vector innovation;
  // Normalized innovation squared.
  double nis = 0.0;

  bool succeeded() const { return status == TickStatus_e::kSuccess; }
  bool anyConstraintActive() const;
};

// Sequential estimator driven once per tick.
class IFilter {
public:
  virtual ~IFilter() = default;
  // Throws ForecastFailure with tick context when the forecast diverged; state is then unchanged.
  virtual TickResult_t step(const Tick_t& tick, std::size_t tickIndex) = 0;
  virtual Vector mean() const = 0;
  virtual Matrix covariance() const = 0;
};

} // namespace ukfest
