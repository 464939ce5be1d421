#include "ukfest/data/AsciiTickSource.hpp"

#include <cmath>
#include <sstream>

#include "ukfest/core/Logger.hpp"

namespace ukfest {

AsciiTickSource::AsciiTickSource(const std::string& path, std::size_t numInputs, std::size_t numOutputs)
    : fileStream(path), sourcePath(path), inputCount(numInputs), outputCount(numOutputs) {
  if (auto logger = Logger::GetClass("AsciiTickSource")) {
    logger->info("AsciiTickSource opening {} ({} inputs, {} outputs)", path, inputCount, outputCount);
  }
}

bool AsciiTickSource::good() const {
  return fileStream.good();
}

bool AsciiTickSource::next(Tick_t& out) {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    std::istringstream iss(line);
    double time = 0.0;
    Vector inputs(static_cast<Eigen::Index>(inputCount));
    Vector measurement(static_cast<Eigen::Index>(outputCount));
    bool ok = static_cast<bool>(iss >> time);
    for (Eigen::Index i = 0; ok && i < inputs.size(); ++i) {
      ok = static_cast<bool>(iss >> inputs(i));
    }
    for (Eigen::Index i = 0; ok && i < measurement.size(); ++i) {
      ok = static_cast<bool>(iss >> measurement(i));
    }
    std::string trailing;
    if (ok && (iss >> trailing)) {
      ok = false;
    }
    if (!ok || !std::isfinite(time) || !inputs.allFinite() || !measurement.allFinite()) {
      ++invalidLineCount;
      if (auto logger = Logger::GetClass("AsciiTickSource")) {
        logger->warn("Skipping invalid line {} of {} ({} errors so far).", lineNumber, sourcePath, invalidLineCount);
      }
      continue;
    }

    out = Tick_t{};
    out.time = time;
    out.inputs = std::move(inputs);
    out.measurement = std::move(measurement);
    return true;
  }
  return false;
}

} // namespace ukfest
