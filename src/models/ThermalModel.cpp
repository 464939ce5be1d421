#include "ukfest/models/ThermalModel.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"

namespace ukfest {

ModelStep_t ThermalModel::advance(const Vector& state, const Vector& parameters, const Vector& inputs, double dt) {
  const double tau = parameters(0);
  const double gain = parameters(1);
  if (!(tau > 0.0)) {
    throw ModelDivergenceError(fmt::format("time constant must be positive, got {}", tau));
  }
  if (inputs.size() < 1 || inputs.size() > 2) {
    throw ConfigurationError(fmt::format("ThermalModel expects 1 or 2 inputs, got {}", inputs.size()));
  }
  if (dt < 0.0) {
    throw ModelDivergenceError(fmt::format("negative step {}", dt));
  }
  const double inlet = inputs(0);
  const double heat = inputs.size() > 1 ? inputs(1) : 0.0;
  auto derivative = [&](double temperature) { return (inlet - temperature) / tau + gain * heat; };

  const double required = std::ceil(dt / (kMaxStepFraction * tau));
  if (!(required <= kMaxSubsteps)) {
    throw ModelDivergenceError(fmt::format("step {} needs {} sub-steps for tau {}", dt, required, tau));
  }
  const int substeps = std::max(1, static_cast<int>(required));
  const double h = dt / substeps;
  double temperature = state(0);
  for (int i = 0; i < substeps; ++i) {
    const double k1 = derivative(temperature);
    const double k2 = derivative(temperature + 0.5 * h * k1);
    const double k3 = derivative(temperature + 0.5 * h * k2);
    const double k4 = derivative(temperature + h * k3);
    temperature += h / 6.0 * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
  }
  if (!std::isfinite(temperature)) {
    throw ModelDivergenceError("integration produced a non-finite temperature");
  }

  ModelStep_t step;
  step.nextState = Vector::Constant(1, temperature);
  step.outputs = step.nextState;
  return step;
}

std::optional<Vector> ThermalModel::observe(const Vector& state, const Vector& /*parameters*/, const Vector& /*inputs*/) {
  return Vector(state);
}

} // namespace ukfest
