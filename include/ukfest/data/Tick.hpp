#pragma once

#include <optional>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// One sample of the estimation time series.
struct Tick_t {
  double time = 0.0;
  // Step from the previous tick to this one.
  double dt = 0.0;
  Vector inputs;
  Vector measurement;
  // Overrides the configured measurement noise for this tick only.
  std::optional<Matrix> measurementNoise;
};

} // namespace ukfest
