#pragma once

#include "ukfest/core/Model.hpp"

namespace ukfest {

// Lumped first-order thermal mass:
//   dT/dt = (T_in - T) / tau + k q
// State T, parameters [tau, k], inputs [T_in, q] (q optional), output T.
// Integrated with classic RK4 using sub-steps no longer than tau / 100, which keeps the
// step error below 1e-9 of the transient.
class ThermalModel : public IModel {
public:
  static constexpr double kMaxStepFraction = 0.01;
  static constexpr int kMaxSubsteps = 100000;

  std::size_t stateDimension() const override { return 1; }
  std::size_t parameterDimension() const override { return 2; }
  std::size_t outputDimension() const override { return 1; }

  ModelStep_t advance(const Vector& state, const Vector& parameters, const Vector& inputs, double dt) override;
  std::optional<Vector> observe(const Vector& state, const Vector& parameters, const Vector& inputs) override;
};

} // namespace ukfest
