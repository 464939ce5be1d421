#include "ukfest/core/ModelAdapter.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/Logger.hpp"
#include "ukfest/core/WorkerThreads.hpp"

namespace ukfest {

ModelAdapter::ModelAdapter(ModelFactory factory,
                           std::size_t numStates,
                           std::size_t numParameters,
                           std::size_t workers,
                           std::vector<std::size_t> measuredOutputs)
    : stateCount(numStates), parameterCount(numParameters), measured(std::move(measuredOutputs)) {
  if (!factory) {
    throw ConfigurationError("ModelAdapter requires a model factory");
  }
  const std::size_t poolSize = std::max<std::size_t>(workers, 1);
  instances.reserve(poolSize);
  for (std::size_t i = 0; i < poolSize; ++i) {
    std::unique_ptr<IModel> model = factory();
    if (!model) {
      throw ConfigurationError("Model factory returned no instance");
    }
    if (model->stateDimension() != stateCount || model->parameterDimension() != parameterCount) {
      throw ConfigurationError(fmt::format("Model has {} states and {} parameters, filter estimates {} and {}",
                                           model->stateDimension(),
                                           model->parameterDimension(),
                                           stateCount,
                                           parameterCount));
    }
    instances.push_back(std::move(model));
  }
  modelOutputs = instances.front()->outputDimension();
  for (std::size_t index : measured) {
    if (index >= modelOutputs) {
      throw ConfigurationError(
          fmt::format("Measured output index {} out of range, model has {} outputs", index, modelOutputs));
    }
  }
  if (auto logger = Logger::GetClass("ModelAdapter")) {
    logger->info("ModelAdapter: {} workers, {} states, {} parameters, {} of {} outputs measured",
                 instances.size(),
                 stateCount,
                 parameterCount,
                 measurementDimension(),
                 modelOutputs);
  }
}

std::size_t ModelAdapter::measurementDimension() const {
  return measured.empty() ? modelOutputs : measured.size();
}

Vector ModelAdapter::selectMeasured(const Vector& outputs) const {
  if (static_cast<std::size_t>(outputs.size()) != modelOutputs) {
    throw ConfigurationError(fmt::format("Model returned {} outputs, declared {}", outputs.size(), modelOutputs));
  }
  if (measured.empty()) {
    return outputs;
  }
  Vector selected(static_cast<Eigen::Index>(measured.size()));
  for (std::size_t i = 0; i < measured.size(); ++i) {
    selected(static_cast<Eigen::Index>(i)) = outputs(static_cast<Eigen::Index>(measured[i]));
  }
  return selected;
}

ModelStep_t ModelAdapter::advanceWith(IModel& model, const Vector& point, const Vector& inputs, double dt) const {
  if (static_cast<std::size_t>(point.size()) != augmentedDimension()) {
    throw ConfigurationError(
        fmt::format("Augmented point has size {}, expected {}", point.size(), augmentedDimension()));
  }
  const Eigen::Index ns = static_cast<Eigen::Index>(stateCount);
  const Eigen::Index np = static_cast<Eigen::Index>(parameterCount);
  const Vector parameters = point.tail(np);
  ModelStep_t step = model.advance(point.head(ns), parameters, inputs, dt);
  if (step.nextState.size() != ns) {
    throw ConfigurationError(fmt::format("Model returned state of size {}, expected {}", step.nextState.size(), ns));
  }
  if (!step.nextState.allFinite() || !step.outputs.allFinite()) {
    throw ModelDivergenceError("model produced non-finite values");
  }

  ModelStep_t augmented;
  augmented.outputs = selectMeasured(step.outputs);
  augmented.nextState.resize(ns + np);
  augmented.nextState << step.nextState, parameters;
  return augmented;
}

Vector ModelAdapter::observeWith(IModel& model, const Vector& point, const Vector& inputs) const {
  const Eigen::Index ns = static_cast<Eigen::Index>(stateCount);
  const Eigen::Index np = static_cast<Eigen::Index>(parameterCount);
  std::optional<Vector> outputs = model.observe(point.head(ns), point.tail(np), inputs);
  if (!outputs) {
    throw ConfigurationError("Model does not provide an observation function");
  }
  if (!outputs->allFinite()) {
    throw ModelDivergenceError("observation produced non-finite values");
  }
  return selectMeasured(*outputs);
}

ModelStep_t ModelAdapter::advance(const Vector& point, const Vector& inputs, double dt) {
  return advanceWith(*instances.front(), point, inputs, dt);
}

Vector ModelAdapter::observe(const Vector& point, const Vector& inputs) {
  return observeWith(*instances.front(), point, inputs);
}

template <typename Fn>
void ModelAdapter::runColumns(Eigen::Index columns, Fn&& evaluate) {
  const std::size_t total = static_cast<std::size_t>(columns);
  const std::size_t workerCount = std::min(instances.size(), total);
  std::vector<std::string> failures(total);
  std::vector<char> failed(total, 0);
  std::vector<std::exception_ptr> errors(workerCount);

  auto work = [&](std::size_t worker) {
    try {
      for (std::size_t col = worker; col < total; col += workerCount) {
        try {
          evaluate(*instances[worker], static_cast<Eigen::Index>(col));
        } catch (const ModelDivergenceError& ex) {
          failed[col] = 1;
          failures[col] = ex.what();
        }
      }
    } catch (...) {
      errors[worker] = std::current_exception();
    }
  };

  if (workerCount <= 1) {
    work(0);
  } else {
    WorkerThreads threads;
    threads.reserve(workerCount - 1);
    for (std::size_t w = 1; w < workerCount; ++w) {
      threads.spawn(work, w);
    }
    work(0);
    threads.joinAll();
  }

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  const auto firstFailure = std::find(failed.begin(), failed.end(), 1);
  if (firstFailure != failed.end()) {
    const std::size_t index = static_cast<std::size_t>(firstFailure - failed.begin());
    const auto count = std::count(failed.begin(), failed.end(), 1);
    if (auto logger = Logger::GetClass("ModelAdapter")) {
      logger->warn("ModelAdapter: {} of {} sigma points diverged, first {}: {}", count, total, index, failures[index]);
    }
    throw ForecastFailure(fmt::format("sigma point {} diverged: {}", index, failures[index]), index);
  }
}

AdvancedPoints_t ModelAdapter::advanceAll(const Matrix& points, const Vector& inputs, double dt) {
  AdvancedPoints_t result;
  result.points.resize(points.rows(), points.cols());
  result.outputs.resize(static_cast<Eigen::Index>(measurementDimension()), points.cols());
  runColumns(points.cols(), [&](IModel& model, Eigen::Index col) {
    ModelStep_t step = advanceWith(model, points.col(col), inputs, dt);
    result.points.col(col) = step.nextState;
    result.outputs.col(col) = step.outputs;
  });
  return result;
}

Matrix ModelAdapter::observeAll(const Matrix& points, const Vector& inputs) {
  Matrix outputs(static_cast<Eigen::Index>(measurementDimension()), points.cols());
  runColumns(points.cols(), [&](IModel& model, Eigen::Index col) {
    outputs.col(col) = observeWith(model, points.col(col), inputs);
  });
  return outputs;
}

} // namespace ukfest
