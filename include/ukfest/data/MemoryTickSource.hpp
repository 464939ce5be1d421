#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "ukfest/data/DataSource.hpp"

namespace ukfest {

// Replays ticks held in memory.
class MemoryTickSource : public ITickSource {
public:
  explicit MemoryTickSource(std::vector<Tick_t> ticks) : ticks(std::move(ticks)) {}

  bool next(Tick_t& out) override {
    if (cursor >= ticks.size()) {
      return false;
    }
    out = ticks[cursor++];
    return true;
  }

  std::size_t consumed() const { return cursor; }

private:
  std::vector<Tick_t> ticks;
  std::size_t cursor = 0;
};

} // namespace ukfest
