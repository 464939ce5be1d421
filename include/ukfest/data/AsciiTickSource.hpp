#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "ukfest/data/DataSource.hpp"

namespace ukfest {

// Reads whitespace-separated rows "time u_1 .. u_k y_1 .. y_m" and yields them as ticks.
// Blank lines and lines starting with '#' are ignored; malformed rows are skipped and counted.
class AsciiTickSource : public ITickSource {
public:
  AsciiTickSource(const std::string& path, std::size_t numInputs, std::size_t numOutputs);

  bool next(Tick_t& out) override;
  bool good() const;
  std::size_t invalidLines() const { return invalidLineCount; }

private:
  std::ifstream fileStream;
  std::string sourcePath;
  std::size_t inputCount = 0;
  std::size_t outputCount = 0;
  std::size_t lineNumber = 0;
  std::size_t invalidLineCount = 0;
};

} // namespace ukfest
