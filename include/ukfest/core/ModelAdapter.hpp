#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "ukfest/core/Model.hpp"

namespace ukfest {

// Sigma points advanced through the model, column i belonging to input column i.
struct AdvancedPoints_t {
  Matrix points;
  Matrix outputs;
};

// Uniform access to the model for augmented vectors [state; parameters].
//
// Owns one model instance per worker. advanceAll() evaluates the columns of a sigma-point
// matrix on up to |workers| threads; worker w only touches instance w, and each result is
// written to the column of its input point.
class ModelAdapter {
public:
  ModelAdapter(ModelFactory factory,
               std::size_t numStates,
               std::size_t numParameters,
               std::size_t workers = 1,
               std::vector<std::size_t> measuredOutputs = {});

  std::size_t workers() const { return instances.size(); }
  std::size_t augmentedDimension() const { return stateCount + parameterCount; }
  std::size_t measurementDimension() const;

  // Advances one augmented point; parameters are carried over unchanged.
  // Throws ModelDivergenceError on failure or non-finite results.
  ModelStep_t advance(const Vector& point, const Vector& inputs, double dt);

  // Measured outputs of the model's decoupled observation function. Throws
  // ConfigurationError when the model has none.
  Vector observe(const Vector& point, const Vector& inputs);

  // Throws ForecastFailure naming the lowest failing column when any point diverged.
  AdvancedPoints_t advanceAll(const Matrix& points, const Vector& inputs, double dt);
  Matrix observeAll(const Matrix& points, const Vector& inputs);

private:
  ModelStep_t advanceWith(IModel& model, const Vector& point, const Vector& inputs, double dt) const;
  Vector observeWith(IModel& model, const Vector& point, const Vector& inputs) const;
  Vector selectMeasured(const Vector& outputs) const;

  template <typename Fn>
  void runColumns(Eigen::Index columns, Fn&& evaluate);

  std::vector<std::unique_ptr<IModel>> instances;
  std::size_t stateCount = 0;
  std::size_t parameterCount = 0;
  std::size_t modelOutputs = 0;
  std::vector<std::size_t> measured;
};

} // namespace ukfest
