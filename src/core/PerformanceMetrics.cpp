#include "ukfest/core/PerformanceMetrics.hpp"

#include <cmath>

namespace ukfest {

void PerformanceMetrics::update(const Vector& innovation, double nis, double runtimeMs) {
  lastInnovationNormValue = innovation.norm();
  lastNisValue = nis;
  lastRuntimeMsValue = runtimeMs;

  sumAbsInnovation += innovation.cwiseAbs().sum();
  sumSqInnovation += innovation.squaredNorm();
  sumNis += nis;
  sumRuntimeMs += runtimeMs;
  componentCount += static_cast<std::size_t>(innovation.size());
  ++sampleCount;
}

double PerformanceMetrics::meanAbsInnovation() const {
  if (componentCount == 0) {
    return 0.0;
  }
  return sumAbsInnovation / static_cast<double>(componentCount);
}

double PerformanceMetrics::innovationRms() const {
  if (componentCount == 0) {
    return 0.0;
  }
  return std::sqrt(sumSqInnovation / static_cast<double>(componentCount));
}

double PerformanceMetrics::meanNis() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return sumNis / static_cast<double>(sampleCount);
}

double PerformanceMetrics::meanRuntimeMs() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return sumRuntimeMs / static_cast<double>(sampleCount);
}

} // namespace ukfest
