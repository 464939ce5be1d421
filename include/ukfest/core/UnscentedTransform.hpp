#pragma once

#include <cstddef>
#include <optional>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// Scaling parameters of the unscented transform.
//
// lambda = alpha^2 (n + kappa) - n. When kappa is not set, 3 - n is used.
struct UkfTuning_t {
  double alpha = 0.5773502691896258;
  double beta = 2.0;
  std::optional<double> kappa;
};

// Weights for an n-dimensional transform, 2n+1 entries each.
struct SigmaWeights_t {
  Vector mean;
  Vector covariance;
  double lambda = 0.0;
};

// Columns are sigma points: 0 is the mean, 1..n add and n+1..2n subtract the scaled factor columns.
struct SigmaPointSet_t {
  Matrix points;
  SigmaWeights_t weights;
};

struct GaussianMoments_t {
  Vector mean;
  Matrix covariance;
};

class UnscentedTransform {
public:
  static constexpr int kMaxRepairAttempts = 8;
  static constexpr double kInitialJitter = 1e-9;

  // Throws ConfigurationError when alpha is zero or not finite, or n + kappa <= 0.
  UnscentedTransform(std::size_t dimension, UkfTuning_t tuning);

  std::size_t dimension() const { return n; }
  std::size_t numPoints() const { return 2 * n + 1; }
  const UkfTuning_t& tuning() const { return params; }
  double kappa() const { return kappaValue; }
  const SigmaWeights_t& weights() const { return sigmaWeights; }

  SigmaPointSet_t generate(const Vector& mean, const Matrix& covariance) const;

  // Weighted mean and covariance of the columns of |points|.
  GaussianMoments_t recombine(const Matrix& points) const;
  Vector weightedMean(const Matrix& points) const;
  Matrix weightedCovariance(const Matrix& points, const Vector& mean) const;
  Matrix crossCovariance(const Matrix& xPoints, const Vector& xMean, const Matrix& yPoints, const Vector& yMean) const;

private:
  std::size_t n = 0;
  UkfTuning_t params;
  double kappaValue = 0.0;
  SigmaWeights_t sigmaWeights;
};

SigmaWeights_t computeSigmaWeights(std::size_t dimension, double alpha, double beta, double kappa);

// Lower Cholesky factor of |covariance|. Symmetrizes first, then retries with diagonal
// jitter kInitialJitter * max(1, mean|diag|), growing tenfold per attempt. Throws
// NumericalError after kMaxRepairAttempts.
Matrix repairedCholesky(const Matrix& covariance, int* attemptsUsed = nullptr);

// Symmetrizes and clips negative eigenvalues to zero.
Matrix nearestPositiveSemidefinite(const Matrix& covariance);

} // namespace ukfest
