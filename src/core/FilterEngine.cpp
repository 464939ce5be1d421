#include "ukfest/core/FilterEngine.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/Logger.hpp"

namespace ukfest {

namespace {

constexpr std::size_t kLogEvery = 50;

// Returns the phase to kIdle however the step ends.
class PhaseGuard {
public:
  explicit PhaseGuard(FilterPhase_e& phase) : phase(phase) {}
  ~PhaseGuard() { phase = FilterPhase_e::kIdle; }
  PhaseGuard(const PhaseGuard&) = delete;
  PhaseGuard& operator=(const PhaseGuard&) = delete;

private:
  FilterPhase_e& phase;
};

void requireSquare(const Matrix& matrix, Eigen::Index dim, const char* what) {
  if (matrix.rows() != dim || matrix.cols() != dim) {
    throw ConfigurationError(fmt::format("{} must be {}x{}, got {}x{}", what, dim, dim, matrix.rows(), matrix.cols()));
  }
  if (!matrix.allFinite()) {
    throw ConfigurationError(fmt::format("{} contains non-finite entries", what));
  }
  const double scale = std::max(1.0, matrix.cwiseAbs().maxCoeff());
  if ((matrix - matrix.transpose()).cwiseAbs().maxCoeff() > 1e-9 * scale) {
    throw ConfigurationError(fmt::format("{} must be symmetric", what));
  }
}

// Noise covariances are added as given, so they must already be positive semidefinite.
void requireNoiseCovariance(const Matrix& matrix, Eigen::Index dim, const char* what) {
  requireSquare(matrix, dim, what);
  if (dim == 0) {
    return;
  }
  Eigen::SelfAdjointEigenSolver<Matrix> solver(matrix, Eigen::EigenvaluesOnly);
  if (solver.info() != Eigen::Success) {
    throw ConfigurationError(fmt::format("{} eigenvalues could not be computed", what));
  }
  const double minEigenvalue = solver.eigenvalues().minCoeff();
  const double scale = std::max(1.0, matrix.cwiseAbs().maxCoeff());
  if (minEigenvalue < -1e-12 * scale) {
    throw ConfigurationError(
        fmt::format("{} must be positive semidefinite, smallest eigenvalue {:.3e}", what, minEigenvalue));
  }
}

} // namespace

bool TickResult_t::anyConstraintActive() const {
  return std::any_of(constraintActive.begin(), constraintActive.end(), [](bool active) { return active; });
}

FilterEngine::FilterEngine(FilterConfig_t config, ModelFactory modelFactory)
    : cfg(std::move(config)),
      augmented(cfg.entries),
      unscented(augmented.size(), cfg.tuning),
      adapter(std::move(modelFactory), augmented.numStates(), augmented.numParameters(), cfg.workers, cfg.measuredOutputs) {
  const Eigen::Index n = static_cast<Eigen::Index>(augmented.size());
  const Eigen::Index m = static_cast<Eigen::Index>(adapter.measurementDimension());
  if (m == 0) {
    throw ConfigurationError("Filter needs at least one measured output");
  }
  requireSquare(cfg.initialCovariance, n, "Initial covariance");
  requireNoiseCovariance(cfg.processNoise, n, "Process noise covariance");
  requireNoiseCovariance(cfg.measurementNoise, m, "Measurement noise covariance");

  meanVector = augmented.values();
  covarianceMatrix = 0.5 * (cfg.initialCovariance + cfg.initialCovariance.transpose());
  // Fails early with NumericalError instead of on the first tick.
  repairedCholesky(covarianceMatrix);

  if (auto logger = Logger::GetClass("FilterEngine")) {
    logger->info("FilterEngine: {} states, {} parameters, {} measured outputs, {} sigma points",
                 augmented.numStates(),
                 augmented.numParameters(),
                 m,
                 unscented.numPoints());
    logger->info("FilterEngine: alpha {:.4f} beta {:.4f} kappa {:.4f} lambda {:.4f} mode {}",
                 cfg.tuning.alpha,
                 cfg.tuning.beta,
                 unscented.kappa(),
                 unscented.weights().lambda,
                 cfg.measurementMode == MeasurementMode_e::kRedraw ? "redraw" : "reuse");
  }
}

void FilterEngine::validateTick(const Tick_t& tick) const {
  const Eigen::Index m = static_cast<Eigen::Index>(adapter.measurementDimension());
  if (tick.measurement.size() != m) {
    throw ConfigurationError(
        fmt::format("Tick at t={} has {} measurements, filter expects {}", tick.time, tick.measurement.size(), m));
  }
  if (!tick.measurement.allFinite()) {
    throw ConfigurationError(fmt::format("Tick at t={} has non-finite measurements", tick.time));
  }
  if (tick.measurementNoise) {
    requireNoiseCovariance(*tick.measurementNoise, m, "Tick measurement noise covariance");
  }
}

void FilterEngine::projectColumns(Matrix& points) const {
  for (Eigen::Index col = 0; col < points.cols(); ++col) {
    Vector point = points.col(col);
    augmented.project(point);
    points.col(col) = point;
  }
}

FilterEngine::Forecast_t FilterEngine::forecast(const Tick_t& tick) {
  SigmaPointSet_t sigma = unscented.generate(meanVector, covarianceMatrix);
  if (cfg.projectSigmaPoints) {
    projectColumns(sigma.points);
  }

  AdvancedPoints_t advanced = adapter.advanceAll(sigma.points, tick.inputs, tick.dt);

  Forecast_t result;
  result.mean = unscented.weightedMean(advanced.points);
  result.covariance = unscented.weightedCovariance(advanced.points, result.mean) + cfg.processNoise;
  result.statePoints = std::move(advanced.points);
  result.outputPoints = std::move(advanced.outputs);
  return result;
}

void FilterEngine::predictMeasurement(const Tick_t& tick, Forecast_t& forecast) {
  if (cfg.measurementMode == MeasurementMode_e::kReuseForecast) {
    return;
  }
  SigmaPointSet_t redrawn = unscented.generate(forecast.mean, forecast.covariance);
  if (cfg.projectSigmaPoints) {
    projectColumns(redrawn.points);
  }
  forecast.outputPoints = adapter.observeAll(redrawn.points, tick.inputs);
  forecast.statePoints = std::move(redrawn.points);
}

TickResult_t FilterEngine::step(const Tick_t& tick, std::size_t tickIndex) {
  validateTick(tick);
  PhaseGuard guard(currentPhase);
  auto logger = Logger::GetClass("FilterEngine");

  currentPhase = FilterPhase_e::kForecasting;
  Forecast_t predicted;
  try {
    predicted = forecast(tick);
    predictMeasurement(tick, predicted);
  } catch (const ForecastFailure& failure) {
    if (logger) {
      logger->warn("FilterEngine: tick {} t={:.6f} forecast failed: {}", tickIndex, tick.time, failure.what());
    }
    throw ForecastFailure(failure, tickIndex, tick.time);
  }

  currentPhase = FilterPhase_e::kUpdating;
  const Matrix& noise = tick.measurementNoise ? *tick.measurementNoise : cfg.measurementNoise;
  const Vector zPred = unscented.weightedMean(predicted.outputPoints);
  const Matrix innovationCov = unscented.weightedCovariance(predicted.outputPoints, zPred) + noise;
  const Matrix crossCov = unscented.crossCovariance(predicted.statePoints, predicted.mean, predicted.outputPoints, zPred);

  Eigen::FullPivLU<Matrix> lu(innovationCov);
  const double rcond = lu.rcond();
  if (!lu.isInvertible() || !std::isfinite(rcond) || rcond < kMinReciprocalCondition) {
    if (logger) {
      logger->error("FilterEngine: tick {} t={:.6f} innovation covariance is singular (rcond {:.3e})",
                    tickIndex,
                    tick.time,
                    rcond);
    }
    throw SingularCovarianceError(fmt::format(
        "Innovation covariance is singular at tick {} t={} (rcond {:.3e})", tickIndex, tick.time, rcond));
  }

  // K = Pxy S^-1, solved as S K^T = Pxy^T since S is symmetric.
  const Matrix gain = lu.solve(crossCov.transpose()).transpose();
  const Vector innovation = tick.measurement - zPred;

  Vector posteriorMean = predicted.mean + gain * innovation;
  Matrix posteriorCov = nearestPositiveSemidefinite(predicted.covariance - gain * innovationCov * gain.transpose());
  std::vector<bool> active = augmented.project(posteriorMean);

  TickResult_t result;
  result.tickIndex = tickIndex;
  result.time = tick.time;
  result.status = TickStatus_e::kSuccess;
  result.predictedMeasurement = zPred;
  result.innovation = innovation;
  result.nis = innovation.dot(lu.solve(innovation));
  result.posteriorMean = posteriorMean;
  result.posteriorCovariance = posteriorCov;
  result.constraintActive = active;

  meanVector = std::move(posteriorMean);
  covarianceMatrix = std::move(posteriorCov);
  augmented.setValues(meanVector);
  ++tickCount;

  if (logger) {
    if (result.anyConstraintActive()) {
      for (std::size_t i = 0; i < active.size(); ++i) {
        if (active[i]) {
          logger->debug("FilterEngine: tick {} clamped '{}' to {:.6g}",
                        tickIndex,
                        augmented.entry(i).name,
                        augmented.entry(i).value);
        }
      }
    }
    if ((tickIndex % kLogEvery) == 0) {
      logger->debug("FilterEngine: tick {} t={:.6f} dt={:.6f} |innovation| {:.3e} nis {:.3e} |K| {:.3e} trace(P) {:.3e}",
                    tickIndex,
                    tick.time,
                    tick.dt,
                    innovation.norm(),
                    result.nis,
                    gain.norm(),
                    covarianceMatrix.trace());
    }
  }
  return result;
}

} // namespace ukfest
