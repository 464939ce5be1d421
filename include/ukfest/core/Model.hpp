#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// Result of advancing a model by one time step.
struct ModelStep_t {
  Vector outputs;
  Vector nextState;
};

// Black-box dynamic system seen by the filter.
//
// Every call receives the full state and parameter vectors; implementations must not carry
// results from one call into the next, so that one instance can serve any sigma point.
// A call that cannot produce a result (solver failure, unphysical parameters) throws
// ModelDivergenceError.
class IModel {
public:
  virtual ~IModel() = default;

  virtual std::size_t stateDimension() const = 0;
  virtual std::size_t parameterDimension() const = 0;
  virtual std::size_t outputDimension() const = 0;

  virtual ModelStep_t advance(const Vector& state, const Vector& parameters, const Vector& inputs, double dt) = 0;

  // Measurement model decoupled from the dynamics. Models that only report outputs from
  // advance() return std::nullopt.
  virtual std::optional<Vector> observe(const Vector& /*state*/,
                                        const Vector& /*parameters*/,
                                        const Vector& /*inputs*/) {
    return std::nullopt;
  }
};

// Creates a fresh, independent model instance.
using ModelFactory = std::function<std::unique_ptr<IModel>()>;

} // namespace ukfest
