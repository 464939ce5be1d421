#pragma once

#include "ukfest/core/Model.hpp"

namespace ukfest {

// Discrete linear system x' = A x + B u, y = C x' + D u. No estimated parameters.
class LinearModel : public IModel {
public:
  LinearModel(Matrix A, Matrix B, Matrix C, Matrix D);

  std::size_t stateDimension() const override { return static_cast<std::size_t>(A.rows()); }
  std::size_t parameterDimension() const override { return 0; }
  std::size_t outputDimension() const override { return static_cast<std::size_t>(C.rows()); }

  ModelStep_t advance(const Vector& state, const Vector& parameters, const Vector& inputs, double dt) override;
  std::optional<Vector> observe(const Vector& state, const Vector& parameters, const Vector& inputs) override;

private:
  Vector feedthrough(const Matrix& gain, const Vector& inputs) const;

  Matrix A;
  Matrix B;
  Matrix C;
  Matrix D;
};

} // namespace ukfest
