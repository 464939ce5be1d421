#include "ukfest/models/ModelFactory.hpp"

#include <memory>
#include <string>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/JsonConfig.hpp"
#include "ukfest/core/Logger.hpp"
#include "ukfest/models/GrowthModel.hpp"
#include "ukfest/models/LinearModel.hpp"
#include "ukfest/models/ThermalModel.hpp"

namespace ukfest {

namespace {

Matrix optionalMatrix(const nlohmann::json& node, const std::string& key) {
  auto it = node.find(key);
  if (it == node.end()) {
    return Matrix();
  }
  return parseMatrix(*it, "model." + key);
}

} // namespace

ModelFactory createModelFactory(const nlohmann::json& modelNode) {
  const std::string type = getString(modelNode, "type", "");

  if (type == "linear") {
    const Matrix A = optionalMatrix(modelNode, "A");
    const Matrix B = optionalMatrix(modelNode, "B");
    const Matrix C = optionalMatrix(modelNode, "C");
    const Matrix D = optionalMatrix(modelNode, "D");
    // Validates the matrices once here rather than inside every worker.
    LinearModel probe(A, B, C, D);
    if (auto logger = Logger::Get()) {
      logger->info("ModelFactory: linear model with {} states and {} outputs.", probe.stateDimension(), probe.outputDimension());
    }
    return [A, B, C, D]() { return std::make_unique<LinearModel>(A, B, C, D); };
  }
  if (type == "growth") {
    if (auto logger = Logger::Get()) {
      logger->info("ModelFactory: growth model.");
    }
    return []() { return std::make_unique<GrowthModel>(); };
  }
  if (type == "thermal") {
    if (auto logger = Logger::Get()) {
      logger->info("ModelFactory: thermal model.");
    }
    return []() { return std::make_unique<ThermalModel>(); };
  }

  if (auto logger = Logger::Get()) {
    logger->error("ModelFactory: unknown model type '{}'.", type);
  }
  throw ConfigurationError("Unknown model type '" + type + "'");
}

} // namespace ukfest
