#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "ukfest/core/AugmentedState.hpp"
#include "ukfest/core/Filter.hpp"
#include "ukfest/core/ModelAdapter.hpp"
#include "ukfest/core/UnscentedTransform.hpp"

namespace ukfest {

// Source of the measurement sigma points.
enum class MeasurementMode_e {
  // Outputs returned by advance() for the forecast sigma points.
  kReuseForecast,
  // Fresh sigma points drawn from the predicted distribution, passed through IModel::observe().
  kRedraw
};

enum class FilterPhase_e {
  kIdle,
  kForecasting,
  kUpdating
};

// Construction-time configuration of a FilterEngine.
struct FilterConfig_t {
  std::vector<StateEntry_t> entries;
  Matrix initialCovariance;
  Matrix processNoise;
  Matrix measurementNoise;
  UkfTuning_t tuning;
  MeasurementMode_e measurementMode = MeasurementMode_e::kReuseForecast;
  std::size_t workers = 1;
  std::vector<std::size_t> measuredOutputs;
  // Clamp every sigma point onto the entry bounds before it reaches the model.
  bool projectSigmaPoints = false;
};

// Unscented Kalman filter over an augmented state of model states and parameters.
class FilterEngine : public IFilter {
public:
  static constexpr double kMinReciprocalCondition = 1e-12;

  FilterEngine(FilterConfig_t config, ModelFactory modelFactory);

  TickResult_t step(const Tick_t& tick, std::size_t tickIndex) override;
  Vector mean() const override { return meanVector; }
  Matrix covariance() const override { return covarianceMatrix; }

  FilterPhase_e phase() const { return currentPhase; }
  const AugmentedState& state() const { return augmented; }
  const UnscentedTransform& transform() const { return unscented; }
  const FilterConfig_t& config() const { return cfg; }
  std::size_t ticksProcessed() const { return tickCount; }
  std::size_t measurementDimension() const { return adapter.measurementDimension(); }

private:
  struct Forecast_t {
    Matrix statePoints;
    Matrix outputPoints;
    Vector mean;
    Matrix covariance;
  };

  Forecast_t forecast(const Tick_t& tick);
  void predictMeasurement(const Tick_t& tick, Forecast_t& forecast);
  void projectColumns(Matrix& points) const;
  void validateTick(const Tick_t& tick) const;

  FilterConfig_t cfg;
  AugmentedState augmented;
  UnscentedTransform unscented;
  ModelAdapter adapter;
  Vector meanVector;
  Matrix covarianceMatrix;
  FilterPhase_e currentPhase = FilterPhase_e::kIdle;
  std::size_t tickCount = 0;
};

} // namespace ukfest
