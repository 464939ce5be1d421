#pragma once

#include "ukfest/core/Model.hpp"

namespace ukfest {

// Scalar growth x' = a x with unknown rate a, measured directly (y = x).
class GrowthModel : public IModel {
public:
  std::size_t stateDimension() const override { return 1; }
  std::size_t parameterDimension() const override { return 1; }
  std::size_t outputDimension() const override { return 1; }

  ModelStep_t advance(const Vector& state, const Vector& parameters, const Vector& inputs, double dt) override;
  std::optional<Vector> observe(const Vector& state, const Vector& parameters, const Vector& inputs) override;
};

} // namespace ukfest
