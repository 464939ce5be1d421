#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/FilterEngine.hpp"
#include "ukfest/models/GrowthModel.hpp"
#include "ukfest/models/LinearModel.hpp"

namespace ukfest {

// Scalar random walk whose evaluations fail above a threshold.
class FragileModel final : public IModel {
public:
  explicit FragileModel(double limit) : limit(limit) {}

  std::size_t stateDimension() const override { return 1; }
  std::size_t parameterDimension() const override { return 0; }
  std::size_t outputDimension() const override { return 1; }

  ModelStep_t advance(const Vector& state, const Vector& /*parameters*/, const Vector& /*inputs*/, double /*dt*/) override {
    if (state(0) > limit) {
      throw ModelDivergenceError("state above limit");
    }
    return ModelStep_t{state, state};
  }

private:
  double limit;
};

// Random walk that remembers the smallest state it was evaluated at.
class RecordingModel final : public IModel {
public:
  explicit RecordingModel(std::shared_ptr<double> lowest) : lowest(std::move(lowest)) {}

  std::size_t stateDimension() const override { return 1; }
  std::size_t parameterDimension() const override { return 0; }
  std::size_t outputDimension() const override { return 1; }

  ModelStep_t advance(const Vector& state, const Vector& /*parameters*/, const Vector& /*inputs*/, double /*dt*/) override {
    *lowest = std::min(*lowest, state(0));
    return ModelStep_t{state, state};
  }

private:
  std::shared_ptr<double> lowest;
};

} // namespace ukfest

namespace {

ukfest::StateEntry_t makeEntry(const std::string& name, ukfest::EntryKind_e kind, double value) {
  ukfest::StateEntry_t entry;
  entry.name = name;
  entry.kind = kind;
  entry.value = value;
  return entry;
}

ukfest::Matrix scalar(double value) {
  return ukfest::Matrix::Constant(1, 1, value);
}

ukfest::ModelFactory randomWalkFactory() {
  return []() {
    return std::make_unique<ukfest::LinearModel>(scalar(1.0), ukfest::Matrix(), scalar(1.0), ukfest::Matrix());
  };
}

ukfest::FilterConfig_t randomWalkConfig(double x0, double p0, double q, double r) {
  ukfest::FilterConfig_t config;
  config.entries = {makeEntry("x", ukfest::EntryKind_e::kState, x0)};
  config.initialCovariance = scalar(p0);
  config.processNoise = scalar(q);
  config.measurementNoise = scalar(r);
  return config;
}

ukfest::Tick_t makeTick(double time, double measurement) {
  ukfest::Tick_t tick;
  tick.time = time;
  tick.dt = 1.0;
  tick.measurement = ukfest::Vector::Constant(1, measurement);
  return tick;
}

ukfest::FilterConfig_t growthConfig(std::size_t workers) {
  ukfest::FilterConfig_t config;
  config.entries = {makeEntry("x", ukfest::EntryKind_e::kState, 1.0),
                    makeEntry("a", ukfest::EntryKind_e::kParameter, 0.9)};
  config.initialCovariance = 0.01 * ukfest::Matrix::Identity(2, 2);
  config.processNoise = 1e-4 * ukfest::Matrix::Identity(2, 2);
  config.measurementNoise = scalar(1e-2);
  config.workers = workers;
  return config;
}

ukfest::ModelFactory growthFactory() {
  return []() { return std::make_unique<ukfest::GrowthModel>(); };
}

} // namespace

TEST(FilterEngineTests, NoiselessLinearStepReturnsMeasurement) {
  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.0), randomWalkFactory());

  const ukfest::TickResult_t result = engine.step(makeTick(1.0, 3.0), 0);

  ASSERT_TRUE(result.succeeded());
  EXPECT_NEAR(result.posteriorMean(0), 3.0, 1e-9);
  EXPECT_NEAR(result.posteriorCovariance(0, 0), 0.0, 1e-9);
  EXPECT_NEAR(result.predictedMeasurement(0), 1.0, 1e-12);
  EXPECT_NEAR(result.innovation(0), 2.0, 1e-12);
  EXPECT_NEAR(result.nis, 4.0, 1e-9);
  EXPECT_NEAR(engine.state().entry(0).value, 3.0, 1e-9);
  EXPECT_EQ(engine.ticksProcessed(), 1u);
  EXPECT_EQ(engine.phase(), ukfest::FilterPhase_e::kIdle);
}

TEST(FilterEngineTests, ReuseModeMatchesKalmanRecursionWithoutProcessNoise) {
  const double r = 0.1;
  ukfest::FilterEngine engine(randomWalkConfig(0.0, 1.0, 0.0, r), randomWalkFactory());

  double x = 0.0;
  double p = 1.0;
  const std::vector<double> measurements = {0.4, 0.9, 1.1, 0.7, 1.3, 1.0, 0.8, 1.2};
  for (std::size_t k = 0; k < measurements.size(); ++k) {
    const double gain = p / (p + r);
    x += gain * (measurements[k] - x);
    p = (1.0 - gain) * p;

    const ukfest::TickResult_t result = engine.step(makeTick(static_cast<double>(k + 1), measurements[k]), k);
    EXPECT_NEAR(result.posteriorMean(0), x, 1e-9) << "tick " << k;
    EXPECT_NEAR(result.posteriorCovariance(0, 0), p, 1e-9) << "tick " << k;
  }
}

TEST(FilterEngineTests, RedrawModeMatchesKalmanRecursionWithProcessNoise) {
  const double q = 0.01;
  const double r = 0.1;
  ukfest::FilterConfig_t config = randomWalkConfig(0.0, 1.0, q, r);
  config.measurementMode = ukfest::MeasurementMode_e::kRedraw;
  ukfest::FilterEngine engine(config, randomWalkFactory());

  double x = 0.0;
  double p = 1.0;
  const std::vector<double> measurements = {0.4, 0.9, 1.1, 0.7, 1.3, 1.0, 0.8, 1.2};
  for (std::size_t k = 0; k < measurements.size(); ++k) {
    const double predicted = p + q;
    const double gain = predicted / (predicted + r);
    x += gain * (measurements[k] - x);
    p = (1.0 - gain) * predicted;

    const ukfest::TickResult_t result = engine.step(makeTick(static_cast<double>(k + 1), measurements[k]), k);
    EXPECT_NEAR(result.posteriorMean(0), x, 1e-9) << "tick " << k;
    EXPECT_NEAR(result.posteriorCovariance(0, 0), p, 1e-9) << "tick " << k;
  }
}

TEST(FilterEngineTests, ClampsPosteriorOntoBounds) {
  ukfest::FilterConfig_t config = randomWalkConfig(5.0, 100.0, 0.0, 1e-6);
  config.entries[0].lowerBound = 0.0;
  config.entries[0].upperBound = 10.0;
  ukfest::FilterEngine engine(config, randomWalkFactory());

  const ukfest::TickResult_t result = engine.step(makeTick(1.0, -2.0), 0);

  EXPECT_NEAR(result.posteriorMean(0), 0.0, 1e-12);
  ASSERT_EQ(result.constraintActive.size(), 1u);
  EXPECT_TRUE(result.constraintActive[0]);
  EXPECT_TRUE(result.anyConstraintActive());
  EXPECT_NEAR(engine.mean()(0), 0.0, 1e-12);
  EXPECT_NEAR(engine.state().entry(0).value, 0.0, 1e-12);
  EXPECT_GE(engine.covariance()(0, 0), 0.0);
}

TEST(FilterEngineTests, ProjectsSigmaPointsWhenEnabled) {
  auto lowest = std::make_shared<double>(1e9);
  ukfest::ModelFactory factory = [lowest]() { return std::make_unique<ukfest::RecordingModel>(lowest); };
  ukfest::FilterConfig_t config = randomWalkConfig(1.0, 1.0, 0.0, 1.0);
  config.entries[0].lowerBound = 0.5;

  // Default tuning with n = 1 spreads the points to 1 +/- 1.
  ukfest::FilterEngine unprojected(config, factory);
  unprojected.step(makeTick(1.0, 1.0), 0);
  EXPECT_NEAR(*lowest, 0.0, 1e-12);

  *lowest = 1e9;
  config.projectSigmaPoints = true;
  ukfest::FilterEngine projected(config, factory);
  projected.step(makeTick(1.0, 1.0), 0);
  EXPECT_NEAR(*lowest, 0.5, 1e-12);
}

TEST(FilterEngineTests, DivergentSigmaPointLeavesEstimateUnchanged) {
  ukfest::ModelFactory factory = []() { return std::make_unique<ukfest::FragileModel>(1.5); };
  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.1), factory);
  const ukfest::Vector meanBefore = engine.mean();
  const ukfest::Matrix covarianceBefore = engine.covariance();

  try {
    engine.step(makeTick(7.0, 1.0), 3);
    FAIL() << "Expected ForecastFailure";
  } catch (const ukfest::ForecastFailure& failure) {
    EXPECT_EQ(failure.pointIndex(), 1u);
    EXPECT_TRUE(failure.hasContext());
    EXPECT_EQ(failure.tick(), 3u);
    EXPECT_NEAR(failure.time(), 7.0, 1e-12);
  }

  EXPECT_TRUE(engine.mean().isApprox(meanBefore));
  EXPECT_TRUE(engine.covariance().isApprox(covarianceBefore));
  EXPECT_EQ(engine.ticksProcessed(), 0u);
  EXPECT_EQ(engine.phase(), ukfest::FilterPhase_e::kIdle);
}

TEST(FilterEngineTests, SingularInnovationCovarianceIsFatal) {
  // Output does not depend on the state and carries no noise.
  ukfest::ModelFactory factory = []() {
    return std::make_unique<ukfest::LinearModel>(scalar(1.0), ukfest::Matrix(), scalar(0.0), ukfest::Matrix());
  };
  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.0), factory);

  EXPECT_THROW(engine.step(makeTick(1.0, 0.0), 0), ukfest::SingularCovarianceError);
  EXPECT_NEAR(engine.mean()(0), 1.0, 1e-12);
  EXPECT_EQ(engine.phase(), ukfest::FilterPhase_e::kIdle);
}

TEST(FilterEngineTests, RecoversGrowthRate) {
  ukfest::FilterEngine engine(growthConfig(1), growthFactory());
  ASSERT_EQ(engine.state().indexOf("a"), 1u);

  for (int t = 1; t <= 50; ++t) {
    engine.step(makeTick(static_cast<double>(t), std::pow(0.95, t)), static_cast<std::size_t>(t - 1));
  }

  EXPECT_NEAR(engine.mean()(1), 0.95, 0.01);
  EXPECT_NEAR(engine.mean()(0), std::pow(0.95, 50), 0.01);
}

TEST(FilterEngineTests, WorkerCountDoesNotChangeResult) {
  ukfest::FilterEngine sequential(growthConfig(1), growthFactory());
  ukfest::FilterEngine parallel(growthConfig(4), growthFactory());

  for (int t = 1; t <= 20; ++t) {
    const ukfest::Tick_t tick = makeTick(static_cast<double>(t), std::pow(0.95, t));
    sequential.step(tick, static_cast<std::size_t>(t - 1));
    parallel.step(tick, static_cast<std::size_t>(t - 1));
  }

  for (Eigen::Index i = 0; i < 2; ++i) {
    EXPECT_DOUBLE_EQ(sequential.mean()(i), parallel.mean()(i));
    for (Eigen::Index j = 0; j < 2; ++j) {
      EXPECT_DOUBLE_EQ(sequential.covariance()(i, j), parallel.covariance()(i, j));
    }
  }
}

TEST(FilterEngineTests, TickNoiseOverridesConfiguredNoise) {
  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.1), randomWalkFactory());
  ukfest::Tick_t tick = makeTick(1.0, 100.0);
  tick.measurementNoise = scalar(1e12);

  const ukfest::TickResult_t result = engine.step(tick, 0);
  EXPECT_NEAR(result.posteriorMean(0), 1.0, 1e-6);
  EXPECT_NEAR(result.posteriorCovariance(0, 0), 1.0, 1e-6);
}

TEST(FilterEngineTests, MeasuresSelectedOutputs) {
  ukfest::Matrix c(2, 1);
  c << 1.0, 2.0;
  ukfest::ModelFactory factory = [c]() {
    return std::make_unique<ukfest::LinearModel>(scalar(1.0), ukfest::Matrix(), c, ukfest::Matrix());
  };
  ukfest::FilterConfig_t config = randomWalkConfig(1.0, 1.0, 0.0, 0.0);
  config.measuredOutputs = {1};
  ukfest::FilterEngine engine(config, factory);
  ASSERT_EQ(engine.measurementDimension(), 1u);

  // Pyy = 4, Pxy = 2, so the gain is 0.5.
  const ukfest::TickResult_t result = engine.step(makeTick(1.0, 4.0), 0);
  EXPECT_NEAR(result.predictedMeasurement(0), 2.0, 1e-12);
  EXPECT_NEAR(result.posteriorMean(0), 2.0, 1e-9);
}

TEST(FilterEngineTests, RedrawModeRequiresObservationFunction) {
  ukfest::ModelFactory factory = []() { return std::make_unique<ukfest::FragileModel>(1e9); };
  ukfest::FilterConfig_t config = randomWalkConfig(1.0, 1.0, 0.0, 0.1);
  config.measurementMode = ukfest::MeasurementMode_e::kRedraw;
  ukfest::FilterEngine engine(config, factory);

  EXPECT_THROW(engine.step(makeTick(1.0, 1.0), 0), ukfest::ConfigurationError);
  EXPECT_EQ(engine.ticksProcessed(), 0u);
}

TEST(FilterEngineTests, RejectsInvalidConfiguration) {
  ukfest::FilterConfig_t wrongSize = randomWalkConfig(1.0, 1.0, 0.0, 0.1);
  wrongSize.initialCovariance = ukfest::Matrix::Identity(2, 2);
  EXPECT_THROW((ukfest::FilterEngine{wrongSize, randomWalkFactory()}), ukfest::ConfigurationError);

  ukfest::FilterConfig_t asymmetric = growthConfig(1);
  asymmetric.processNoise(0, 1) = 0.5;
  EXPECT_THROW((ukfest::FilterEngine{asymmetric, growthFactory()}), ukfest::ConfigurationError);

  ukfest::FilterConfig_t parameterFirst = growthConfig(1);
  std::swap(parameterFirst.entries[0], parameterFirst.entries[1]);
  EXPECT_THROW((ukfest::FilterEngine{parameterFirst, growthFactory()}), ukfest::ConfigurationError);

  // Growth model has a parameter the configuration does not estimate.
  EXPECT_THROW(ukfest::FilterEngine(randomWalkConfig(1.0, 1.0, 0.0, 0.1), growthFactory()), ukfest::ConfigurationError);

  ukfest::FilterConfig_t indefinite = growthConfig(1);
  indefinite.initialCovariance << 1.0, 2.0, 2.0, 1.0;
  EXPECT_THROW((ukfest::FilterEngine{indefinite, growthFactory()}), ukfest::NumericalError);
}

TEST(FilterEngineTests, RejectsIndefiniteNoiseCovariances) {
  EXPECT_THROW(ukfest::FilterEngine(randomWalkConfig(1.0, 1.0, -1.0, 0.1), randomWalkFactory()),
               ukfest::ConfigurationError);
  EXPECT_THROW(ukfest::FilterEngine(randomWalkConfig(1.0, 1.0, 0.0, -0.1), randomWalkFactory()),
               ukfest::ConfigurationError);

  // Symmetric with a non-negative diagonal, but eigenvalues 3e-4 and -1e-4.
  ukfest::FilterConfig_t coupled = growthConfig(1);
  coupled.processNoise << 1e-4, 2e-4, 2e-4, 1e-4;
  EXPECT_THROW((ukfest::FilterEngine{coupled, growthFactory()}), ukfest::ConfigurationError);

  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.1), randomWalkFactory());
  ukfest::Tick_t tick = makeTick(1.0, 2.0);
  tick.measurementNoise = scalar(-0.5);
  EXPECT_THROW(engine.step(tick, 0), ukfest::ConfigurationError);
  EXPECT_EQ(engine.ticksProcessed(), 0u);
  EXPECT_NEAR(engine.mean()(0), 1.0, 1e-12);
}

TEST(FilterEngineTests, RejectsMismatchedTick) {
  ukfest::FilterEngine engine(randomWalkConfig(1.0, 1.0, 0.0, 0.1), randomWalkFactory());
  ukfest::Tick_t tick = makeTick(1.0, 1.0);
  tick.measurement = ukfest::Vector::Zero(2);
  EXPECT_THROW(engine.step(tick, 0), ukfest::ConfigurationError);

  tick = makeTick(1.0, std::nan(""));
  EXPECT_THROW(engine.step(tick, 0), ukfest::ConfigurationError);
  EXPECT_EQ(engine.ticksProcessed(), 0u);
}
