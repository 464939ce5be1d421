#include <fmt/core.h>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/FilterFactory.hpp"
#include "ukfest/core/JsonConfig.hpp"
#include "ukfest/core/Logger.hpp"
#include "ukfest/data/AsciiTickSource.hpp"
#include "ukfest/models/ModelFactory.hpp"
#include "ukfest/pipeline/Sequencer.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string datasetPath;
  std::string onFailure;
  std::string logLevel;
  int workers = 0;
  bool showHelp = false;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/growth.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--dataset" && i + 1 < argc) {
      options.datasetPath = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      options.workers = std::atoi(argv[++i]);
    } else if (arg == "--on-failure" && i + 1 < argc) {
      options.onFailure = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      options.logLevel = argv[++i];
    }
  }
  return options;
}

nlohmann::json loadJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ukfest::ConfigurationError("Failed to open config file: " + path);
  }
  nlohmann::json config;
  file >> config;
  return config;
}

void applyLoggingConfig(const nlohmann::json& config) {
  const nlohmann::json loggingNode = config.value("logging", nlohmann::json::object());
  ukfest::LoggingConfig_t logging;
  logging.enabled = loggingNode.value("enabled", true);
  logging.level = ukfest::Logger::ParseLevel(loggingNode.value("level", "info"));
  const auto fileNode = loggingNode.value("file", nlohmann::json::object());
  logging.file.enabled = fileNode.value("enabled", false);
  logging.file.path = fileNode.value("path", "logs/ukfest.log");
  logging.file.maxSizeBytes = fileNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  logging.file.maxFiles = fileNode.value("maxFiles", static_cast<std::size_t>(3));
  const auto classNode = loggingNode.value("classLogs", nlohmann::json::object());
  logging.classLogs.enabled = classNode.value("enabled", false);
  logging.classLogs.directory = classNode.value("directory", "logs/classes");
  logging.classLogs.maxSizeBytes = classNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  logging.classLogs.maxFiles = classNode.value("maxFiles", static_cast<std::size_t>(3));
  ukfest::Logger::Configure(logging);
}

ukfest::SequencerOptions_t parseSequencerOptions(const nlohmann::json& config, const CliOptions_t& cli) {
  const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());
  const nlohmann::json sequencerNode = config.value("sequencer", nlohmann::json::object());
  ukfest::SequencerOptions_t options;
  options.maxTicks = datasetNode.value("maxTicks", static_cast<std::size_t>(0));
  options.startTime = ukfest::getOptionalDouble(datasetNode, "startTime");
  options.stopTime = ukfest::getOptionalDouble(datasetNode, "stopTime");
  std::string policy = ukfest::getString(sequencerNode, "onForecastFailure", "abort");
  if (!cli.onFailure.empty()) {
    policy = cli.onFailure;
  }
  options.onForecastFailure = policy == "skip" ? ukfest::FailurePolicy_e::kSkip : ukfest::FailurePolicy_e::kAbort;
  return options;
}

int run(const CliOptions_t& cliOptions) {
  nlohmann::json config = loadJson(cliOptions.configPath);
  applyLoggingConfig(config);
  if (!cliOptions.logLevel.empty()) {
    ukfest::Logger::SetLevel(ukfest::Logger::ParseLevel(cliOptions.logLevel));
  }
  auto logger = ukfest::Logger::Get();
  if (logger) {
    logger->info("ukfest_cli using config: {}", cliOptions.configPath);
  }

  const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());
  std::string datasetPath = datasetNode.value("path", "data/growth.asc");
  if (!cliOptions.datasetPath.empty()) {
    datasetPath = cliOptions.datasetPath;
  }
  const std::size_t numInputs = datasetNode.value("inputs", static_cast<std::size_t>(0));
  const std::size_t numOutputs = datasetNode.value("outputs", static_cast<std::size_t>(1));

  ukfest::ModelFactory modelFactory = ukfest::createModelFactory(config.value("model", nlohmann::json::object()));

  nlohmann::json filterNode = config.value("filter", nlohmann::json::object());
  if (cliOptions.workers > 0) {
    filterNode["workers"] = cliOptions.workers;
  }
  auto filter = ukfest::createFilterEngine(filterNode, modelFactory);

  auto source = std::make_shared<ukfest::AsciiTickSource>(datasetPath, numInputs, numOutputs);
  if (!source->good()) {
    if (logger) {
      logger->error("Failed to open dataset: {}", datasetPath);
    } else {
      fmt::print(stderr, "Failed to open dataset: {}\n", datasetPath);
    }
    return 1;
  }

  ukfest::Sequencer sequencer(source, filter, parseSequencerOptions(config, cliOptions));
  const ukfest::RunSummary_t summary = sequencer.run();

  const ukfest::Vector mean = filter->mean();
  const ukfest::Matrix covariance = filter->covariance();
  fmt::print("ticks {} ok {} failed {} constrained {}\n",
             summary.ticks,
             summary.succeeded,
             summary.failed,
             summary.constrainedTicks);
  for (std::size_t i = 0; i < filter->state().size(); ++i) {
    const auto& entry = filter->state().entry(i);
    const Eigen::Index k = static_cast<Eigen::Index>(i);
    fmt::print("{:<16} {:>14.6g} +/- {:.3g}\n", entry.name, mean(k), std::sqrt(covariance(k, k)));
  }
  const ukfest::PerformanceMetrics& metrics = sequencer.metrics();
  fmt::print("innovation mean |e| {:.4e} rms {:.4e} mean NIS {:.3f} mean step {:.3f} ms\n",
             metrics.meanAbsInnovation(),
             metrics.innovationRms(),
             metrics.meanNis(),
             metrics.meanRuntimeMs());
  if (logger) {
    logger->info("ukfest_cli done");
  }
  ukfest::Logger::Flush();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  ukfest::Logger::Initialize();
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("Usage: ukfest_cli [--config <path>] [--dataset <path>] [--workers <n>] [--on-failure <abort|skip>] [--log-level <level>]\n");
    return 0;
  }
  try {
    return run(cliOptions);
  } catch (const ukfest::EstimationError& ex) {
    if (auto logger = ukfest::Logger::Get()) {
      logger->error("ukfest_cli failed: {}", ex.what());
    } else {
      fmt::print(stderr, "ukfest_cli failed: {}\n", ex.what());
    }
    return 1;
  } catch (const nlohmann::json::exception& ex) {
    fmt::print(stderr, "ukfest_cli: malformed config: {}\n", ex.what());
    return 1;
  }
}
