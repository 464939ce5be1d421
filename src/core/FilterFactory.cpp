#include "ukfest/core/FilterFactory.hpp"

#include <cmath>
#include <string>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/JsonConfig.hpp"
#include "ukfest/core/Logger.hpp"

namespace ukfest {

namespace {

MeasurementMode_e parseMeasurementMode(const std::string& value) {
  if (value == "redraw") {
    return MeasurementMode_e::kRedraw;
  }
  if (value != "reuse") {
    if (auto logger = Logger::Get()) {
      logger->warn("FilterFactory: unknown measurementMode '{}', using 'reuse'.", value);
    }
  }
  return MeasurementMode_e::kReuseForecast;
}

void appendEntries(const nlohmann::json& node, EntryKind_e kind, FilterConfig_t& config, std::vector<double>& variances) {
  if (node.is_null()) {
    return;
  }
  const char* block = kind == EntryKind_e::kState ? "states" : "parameters";
  if (!node.is_array()) {
    throw ConfigurationError(fmt::format("filter.{} must be an array", block));
  }
  for (const auto& item : node) {
    StateEntry_t entry;
    entry.kind = kind;
    entry.name = getString(item, "name", "");
    auto valueIt = item.is_object() ? item.find("value") : item.end();
    if (!item.is_object() || valueIt == item.end() || !valueIt->is_number()) {
      throw ConfigurationError(fmt::format("filter.{} entry '{}' needs a numeric value", block, entry.name));
    }
    entry.value = valueIt->get<double>();
    entry.lowerBound = getOptionalDouble(item, "min");
    entry.upperBound = getOptionalDouble(item, "max");
    const double stddev = getDouble(item, "stddev", 1.0);
    if (!(stddev >= 0.0) || !std::isfinite(stddev)) {
      throw ConfigurationError(fmt::format("filter.{} entry '{}' has invalid stddev {}", block, entry.name, stddev));
    }
    variances.push_back(stddev * stddev);
    config.entries.push_back(std::move(entry));
  }
}

} // namespace

FilterConfig_t parseFilterConfig(const nlohmann::json& filterNode) {
  if (!filterNode.is_object()) {
    throw ConfigurationError("filter configuration must be an object");
  }
  FilterConfig_t config;
  std::vector<double> variances;
  appendEntries(filterNode.value("states", nlohmann::json{}), EntryKind_e::kState, config, variances);
  appendEntries(filterNode.value("parameters", nlohmann::json{}), EntryKind_e::kParameter, config, variances);
  if (config.entries.empty()) {
    throw ConfigurationError("filter needs at least one state or parameter to estimate");
  }

  const Eigen::Index n = static_cast<Eigen::Index>(config.entries.size());
  Vector diagonal(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    diagonal(i) = variances[static_cast<std::size_t>(i)];
  }
  const Matrix defaultCovariance(diagonal.asDiagonal());

  auto covIt = filterNode.find("initialCovariance");
  config.initialCovariance = covIt != filterNode.end() ? parseCovariance(*covIt, "filter.initialCovariance") : defaultCovariance;
  auto processIt = filterNode.find("processNoise");
  config.processNoise = processIt != filterNode.end() ? parseCovariance(*processIt, "filter.processNoise") : defaultCovariance;
  auto measurementIt = filterNode.find("measurementNoise");
  if (measurementIt != filterNode.end()) {
    config.measurementNoise = parseCovariance(*measurementIt, "filter.measurementNoise");
  }

  const nlohmann::json ukfNode = filterNode.value("ukf", nlohmann::json::object());
  config.tuning.alpha = getDouble(ukfNode, "alpha", config.tuning.alpha);
  config.tuning.beta = getDouble(ukfNode, "beta", config.tuning.beta);
  config.tuning.kappa = getOptionalDouble(ukfNode, "kappa");

  config.measurementMode = parseMeasurementMode(getString(filterNode, "measurementMode", "reuse"));
  const int workers = getInt(filterNode, "workers", 1);
  if (workers < 1) {
    throw ConfigurationError(fmt::format("filter.workers must be at least 1, got {}", workers));
  }
  config.workers = static_cast<std::size_t>(workers);
  config.projectSigmaPoints = getBool(filterNode, "projectSigmaPoints", false);

  auto outputsIt = filterNode.find("measuredOutputs");
  if (outputsIt != filterNode.end()) {
    if (!outputsIt->is_array()) {
      throw ConfigurationError("filter.measuredOutputs must be an array of output indices");
    }
    for (const auto& index : *outputsIt) {
      if (!index.is_number_integer() || index.get<long long>() < 0) {
        throw ConfigurationError("filter.measuredOutputs must contain non-negative integers");
      }
      config.measuredOutputs.push_back(static_cast<std::size_t>(index.get<long long>()));
    }
  }
  return config;
}

std::shared_ptr<FilterEngine> createFilterEngine(const nlohmann::json& filterNode, ModelFactory modelFactory) {
  if (!modelFactory) {
    if (auto logger = Logger::Get()) {
      logger->error("FilterFactory: a filter requires a model.");
    }
    throw ConfigurationError("FilterFactory: a filter requires a model");
  }
  FilterConfig_t config = parseFilterConfig(filterNode);
  if (config.measurementNoise.size() == 0) {
    std::size_t outputs = config.measuredOutputs.size();
    if (outputs == 0) {
      auto probe = modelFactory();
      if (!probe) {
        throw ConfigurationError("Model factory returned no instance");
      }
      outputs = probe->outputDimension();
    }
    config.measurementNoise = Matrix::Identity(static_cast<Eigen::Index>(outputs), static_cast<Eigen::Index>(outputs));
    if (auto logger = Logger::Get()) {
      logger->warn("FilterFactory: no measurementNoise given, using unit variance for {} outputs.", outputs);
    }
  }
  if (auto logger = Logger::Get()) {
    logger->info("FilterFactory: creating UKF with {} entries and {} workers.", config.entries.size(), config.workers);
  }
  return std::make_shared<FilterEngine>(std::move(config), std::move(modelFactory));
}

} // namespace ukfest
