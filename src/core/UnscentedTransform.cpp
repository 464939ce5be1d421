#include "ukfest/core/UnscentedTransform.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/Logger.hpp"

namespace ukfest {

SigmaWeights_t computeSigmaWeights(std::size_t dimension, double alpha, double beta, double kappa) {
  const double nd = static_cast<double>(dimension);
  const double lambda = alpha * alpha * (nd + kappa) - nd;
  const double scale = nd + lambda;
  const Eigen::Index count = static_cast<Eigen::Index>(2 * dimension + 1);

  SigmaWeights_t weights;
  weights.lambda = lambda;
  weights.mean = Vector::Constant(count, 1.0 / (2.0 * scale));
  weights.covariance = weights.mean;
  weights.mean(0) = lambda / scale;
  weights.covariance(0) = weights.mean(0) + (1.0 - alpha * alpha + beta);
  return weights;
}

Matrix repairedCholesky(const Matrix& covariance, int* attemptsUsed) {
  if (covariance.rows() != covariance.cols()) {
    throw NumericalError(fmt::format("Covariance is not square ({}x{})", covariance.rows(), covariance.cols()));
  }
  if (!covariance.allFinite()) {
    throw NumericalError("Covariance contains non-finite entries");
  }
  const Matrix symmetric = 0.5 * (covariance + covariance.transpose());
  const double diagScale = std::max(1.0, symmetric.diagonal().cwiseAbs().mean());
  const Matrix identity = Matrix::Identity(symmetric.rows(), symmetric.cols());

  double jitter = 0.0;
  for (int attempt = 0; attempt <= UnscentedTransform::kMaxRepairAttempts; ++attempt) {
    Eigen::LLT<Matrix> llt(symmetric + jitter * identity);
    if (llt.info() == Eigen::Success) {
      if (attemptsUsed) {
        *attemptsUsed = attempt;
      }
      if (attempt > 0) {
        if (auto logger = Logger::GetClass("UnscentedTransform")) {
          logger->warn("Covariance repaired with diagonal jitter {:.3e} after {} attempts", jitter, attempt);
        }
      }
      return llt.matrixL();
    }
    jitter = (attempt == 0) ? UnscentedTransform::kInitialJitter * diagScale : jitter * 10.0;
  }
  throw NumericalError(fmt::format("Covariance is not positive definite after {} repair attempts (jitter {:.3e})",
                                   UnscentedTransform::kMaxRepairAttempts,
                                   jitter / 10.0));
}

Matrix nearestPositiveSemidefinite(const Matrix& covariance) {
  const Matrix symmetric = 0.5 * (covariance + covariance.transpose());
  Eigen::SelfAdjointEigenSolver<Matrix> solver(symmetric);
  if (solver.info() != Eigen::Success) {
    throw NumericalError("Eigen-decomposition of the covariance failed");
  }
  const Vector eigenvalues = solver.eigenvalues();
  if (eigenvalues.minCoeff() >= 0.0) {
    return symmetric;
  }
  const Vector clipped = eigenvalues.cwiseMax(0.0);
  const Matrix& vectors = solver.eigenvectors();
  Matrix repaired = vectors * clipped.asDiagonal() * vectors.transpose();
  return 0.5 * (repaired + repaired.transpose());
}

UnscentedTransform::UnscentedTransform(std::size_t dimension, UkfTuning_t tuning)
    : n(dimension), params(tuning) {
  if (n == 0) {
    throw ConfigurationError("Unscented transform needs at least one dimension");
  }
  const double nd = static_cast<double>(n);
  kappaValue = params.kappa.value_or(3.0 - nd);
  if (!std::isfinite(params.alpha) || params.alpha == 0.0) {
    throw ConfigurationError(fmt::format("UKF alpha must be finite and non-zero, got {}", params.alpha));
  }
  if (!std::isfinite(params.beta) || !std::isfinite(kappaValue)) {
    throw ConfigurationError("UKF beta and kappa must be finite");
  }
  if (nd + kappaValue <= 0.0) {
    throw ConfigurationError(
        fmt::format("UKF requires n + kappa > 0 (n = {}, kappa = {})", n, kappaValue));
  }
  sigmaWeights = computeSigmaWeights(n, params.alpha, params.beta, kappaValue);
  if (!sigmaWeights.mean.allFinite() || !sigmaWeights.covariance.allFinite()) {
    throw ConfigurationError("UKF tuning produces non-finite sigma weights");
  }
}

SigmaPointSet_t UnscentedTransform::generate(const Vector& mean, const Matrix& covariance) const {
  const Eigen::Index dim = static_cast<Eigen::Index>(n);
  if (mean.size() != dim || covariance.rows() != dim || covariance.cols() != dim) {
    throw ConfigurationError(fmt::format("Sigma point generation expects dimension {}, got mean {} covariance {}x{}",
                                         n,
                                         mean.size(),
                                         covariance.rows(),
                                         covariance.cols()));
  }
  const Matrix factor = std::sqrt(static_cast<double>(n) + sigmaWeights.lambda) * repairedCholesky(covariance);

  SigmaPointSet_t set;
  set.weights = sigmaWeights;
  set.points.resize(dim, 2 * dim + 1);
  set.points.col(0) = mean;
  for (Eigen::Index i = 0; i < dim; ++i) {
    set.points.col(i + 1) = mean + factor.col(i);
    set.points.col(i + 1 + dim) = mean - factor.col(i);
  }
  return set;
}

Vector UnscentedTransform::weightedMean(const Matrix& points) const {
  if (points.cols() != static_cast<Eigen::Index>(numPoints())) {
    throw ConfigurationError(fmt::format("Expected {} sigma points, got {}", numPoints(), points.cols()));
  }
  return points * sigmaWeights.mean;
}

Matrix UnscentedTransform::weightedCovariance(const Matrix& points, const Vector& mean) const {
  return crossCovariance(points, mean, points, mean);
}

Matrix UnscentedTransform::crossCovariance(const Matrix& xPoints,
                                           const Vector& xMean,
                                           const Matrix& yPoints,
                                           const Vector& yMean) const {
  const Eigen::Index count = static_cast<Eigen::Index>(numPoints());
  if (xPoints.cols() != count || yPoints.cols() != count) {
    throw ConfigurationError(fmt::format("Expected {} sigma points, got {} and {}", count, xPoints.cols(), yPoints.cols()));
  }
  const Matrix dx = xPoints.colwise() - xMean;
  const Matrix dy = yPoints.colwise() - yMean;
  return dx * sigmaWeights.covariance.asDiagonal() * dy.transpose();
}

GaussianMoments_t UnscentedTransform::recombine(const Matrix& points) const {
  GaussianMoments_t moments;
  moments.mean = weightedMean(points);
  moments.covariance = weightedCovariance(points, moments.mean);
  return moments;
}

} // namespace ukfest
