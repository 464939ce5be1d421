#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// Which block of the augmented vector an entry belongs to.
enum class EntryKind_e {
  kState,
  kParameter
};

// One scalar of the augmented vector with its optional bounds.
struct StateEntry_t {
  std::string name;
  EntryKind_e kind = EntryKind_e::kState;
  double value = 0.0;
  std::optional<double> lowerBound;
  std::optional<double> upperBound;

  bool constrained() const { return lowerBound.has_value() || upperBound.has_value(); }
};

// Concatenation of estimated model states followed by estimated parameters.
//
// Every kState entry must precede every kParameter entry; construction throws
// ConfigurationError otherwise. The index of a name never changes afterwards.
class AugmentedState {
public:
  AugmentedState() = default;
  explicit AugmentedState(std::vector<StateEntry_t> entries);

  std::size_t size() const { return entryList.size(); }
  std::size_t numStates() const { return stateCount; }
  std::size_t numParameters() const { return entryList.size() - stateCount; }

  const std::vector<StateEntry_t>& entries() const { return entryList; }
  const StateEntry_t& entry(std::size_t index) const;
  std::size_t indexOf(const std::string& name) const;

  Vector values() const;
  Vector stateBlock() const;
  Vector parameterBlock() const;
  void setValues(const Vector& values);

  // Sets or replaces the bounds of a named entry.
  void setBounds(const std::string& name, std::optional<double> lower, std::optional<double> upper);

  // Clamps bounded entries of |point| in place. Returns one flag per entry, true where
  // the value was moved onto a bound.
  std::vector<bool> project(Vector& point) const;

private:
  std::vector<StateEntry_t> entryList;
  std::size_t stateCount = 0;
};

} // namespace ukfest
