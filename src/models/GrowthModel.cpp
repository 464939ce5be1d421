#include "ukfest/models/GrowthModel.hpp"

namespace ukfest {

ModelStep_t GrowthModel::advance(const Vector& state, const Vector& parameters, const Vector& /*inputs*/, double /*dt*/) {
  ModelStep_t step;
  step.nextState = Vector::Constant(1, parameters(0) * state(0));
  step.outputs = step.nextState;
  return step;
}

std::optional<Vector> GrowthModel::observe(const Vector& state, const Vector& /*parameters*/, const Vector& /*inputs*/) {
  return Vector(state);
}

} // namespace ukfest
