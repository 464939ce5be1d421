#pragma once

#include <cstddef>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// Running innovation statistics of a filter run (no truth required).
class PerformanceMetrics {
public:
  void update(const Vector& innovation, double nis, double runtimeMs);

  double lastInnovationNorm() const { return lastInnovationNormValue; }
  double lastNis() const { return lastNisValue; }
  double lastRuntimeMs() const { return lastRuntimeMsValue; }
  std::size_t samples() const { return sampleCount; }

  double meanAbsInnovation() const;
  // Root mean square over every innovation component of every tick.
  double innovationRms() const;
  // Expected to approach the measurement dimension for a consistent filter.
  double meanNis() const;
  double meanRuntimeMs() const;

private:
  double sumAbsInnovation = 0.0;
  double sumSqInnovation = 0.0;
  double sumNis = 0.0;
  double sumRuntimeMs = 0.0;
  double lastInnovationNormValue = 0.0;
  double lastNisValue = 0.0;
  double lastRuntimeMsValue = 0.0;
  std::size_t sampleCount = 0;
  std::size_t componentCount = 0;
};

} // namespace ukfest
