#pragma once

#include "ukfest/data/Tick.hpp"

namespace ukfest {

// Streaming tick source interface.
class ITickSource {
public:
  virtual ~ITickSource() = default;
  virtual bool next(Tick_t& out) = 0;
};

} // namespace ukfest
