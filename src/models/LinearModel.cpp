#include "ukfest/models/LinearModel.hpp"

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"

namespace ukfest {

LinearModel::LinearModel(Matrix AInput, Matrix BInput, Matrix CInput, Matrix DInput)
    : A(std::move(AInput)), B(std::move(BInput)), C(std::move(CInput)), D(std::move(DInput)) {
  const Eigen::Index n = A.rows();
  if (n == 0 || A.cols() != n) {
    throw ConfigurationError(fmt::format("LinearModel: A must be square and non-empty, got {}x{}", A.rows(), A.cols()));
  }
  if (C.cols() != n || C.rows() == 0) {
    throw ConfigurationError(fmt::format("LinearModel: C must be m x {}, got {}x{}", n, C.rows(), C.cols()));
  }
  if (B.size() == 0) {
    B = Matrix::Zero(n, 0);
  }
  if (B.rows() != n) {
    throw ConfigurationError(fmt::format("LinearModel: B must have {} rows, got {}", n, B.rows()));
  }
  if (D.size() == 0) {
    D = Matrix::Zero(C.rows(), B.cols());
  }
  if (D.rows() != C.rows() || D.cols() != B.cols()) {
    throw ConfigurationError(
        fmt::format("LinearModel: D must be {}x{}, got {}x{}", C.rows(), B.cols(), D.rows(), D.cols()));
  }
}

Vector LinearModel::feedthrough(const Matrix& gain, const Vector& inputs) const {
  if (gain.cols() == 0) {
    return Vector::Zero(gain.rows());
  }
  if (inputs.size() != gain.cols()) {
    throw ConfigurationError(fmt::format("LinearModel: expected {} inputs, got {}", gain.cols(), inputs.size()));
  }
  return gain * inputs;
}

ModelStep_t LinearModel::advance(const Vector& state, const Vector& /*parameters*/, const Vector& inputs, double /*dt*/) {
  ModelStep_t step;
  step.nextState = A * state + feedthrough(B, inputs);
  step.outputs = C * step.nextState + feedthrough(D, inputs);
  return step;
}

std::optional<Vector> LinearModel::observe(const Vector& state, const Vector& /*parameters*/, const Vector& inputs) {
  return Vector(C * state + feedthrough(D, inputs));
}

} // namespace ukfest
