#include "ukfest/core/AugmentedState.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"

namespace ukfest {

namespace {

void validateBounds(const std::string& name, const std::optional<double>& lower, const std::optional<double>& upper) {
  if (lower && !std::isfinite(*lower)) {
    throw ConfigurationError(fmt::format("Entry '{}' has a non-finite lower bound", name));
  }
  if (upper && !std::isfinite(*upper)) {
    throw ConfigurationError(fmt::format("Entry '{}' has a non-finite upper bound", name));
  }
  if (lower && upper && *lower > *upper) {
    throw ConfigurationError(
        fmt::format("Entry '{}' has lower bound {} above upper bound {}", name, *lower, *upper));
  }
}

} // namespace

AugmentedState::AugmentedState(std::vector<StateEntry_t> entries) : entryList(std::move(entries)) {
  const auto isState = [](const StateEntry_t& entry) { return entry.kind == EntryKind_e::kState; };
  if (!std::is_partitioned(entryList.begin(), entryList.end(), isState)) {
    const auto misplaced = std::find_if(
        std::find_if_not(entryList.begin(), entryList.end(), isState), entryList.end(), isState);
    throw ConfigurationError(
        fmt::format("State entry '{}' is listed after the first parameter entry", misplaced->name));
  }
  stateCount = static_cast<std::size_t>(std::count_if(entryList.begin(), entryList.end(), isState));

  std::unordered_set<std::string> names;
  for (const auto& entry : entryList) {
    if (entry.name.empty()) {
      throw ConfigurationError("Augmented state entries must be named");
    }
    if (!names.insert(entry.name).second) {
      throw ConfigurationError(fmt::format("Duplicate augmented state entry '{}'", entry.name));
    }
    if (!std::isfinite(entry.value)) {
      throw ConfigurationError(fmt::format("Entry '{}' has a non-finite initial value", entry.name));
    }
    validateBounds(entry.name, entry.lowerBound, entry.upperBound);
  }
}

const StateEntry_t& AugmentedState::entry(std::size_t index) const {
  if (index >= entryList.size()) {
    throw std::out_of_range(fmt::format("Augmented state index {} out of range ({})", index, entryList.size()));
  }
  return entryList[index];
}

std::size_t AugmentedState::indexOf(const std::string& name) const {
  for (std::size_t i = 0; i < entryList.size(); ++i) {
    if (entryList[i].name == name) {
      return i;
    }
  }
  throw ConfigurationError(fmt::format("Unknown augmented state entry '{}'", name));
}

Vector AugmentedState::values() const {
  Vector out(static_cast<Eigen::Index>(entryList.size()));
  for (std::size_t i = 0; i < entryList.size(); ++i) {
    out(static_cast<Eigen::Index>(i)) = entryList[i].value;
  }
  return out;
}

Vector AugmentedState::stateBlock() const {
  return values().head(static_cast<Eigen::Index>(stateCount));
}

Vector AugmentedState::parameterBlock() const {
  return values().tail(static_cast<Eigen::Index>(numParameters()));
}

void AugmentedState::setValues(const Vector& values) {
  if (static_cast<std::size_t>(values.size()) != entryList.size()) {
    throw ConfigurationError(
        fmt::format("Augmented state expects {} values, got {}", entryList.size(), values.size()));
  }
  for (std::size_t i = 0; i < entryList.size(); ++i) {
    entryList[i].value = values(static_cast<Eigen::Index>(i));
  }
}

void AugmentedState::setBounds(const std::string& name, std::optional<double> lower, std::optional<double> upper) {
  validateBounds(name, lower, upper);
  StateEntry_t& target = entryList[indexOf(name)];
  target.lowerBound = lower;
  target.upperBound = upper;
}

std::vector<bool> AugmentedState::project(Vector& point) const {
  if (static_cast<std::size_t>(point.size()) != entryList.size()) {
    throw ConfigurationError(
        fmt::format("Cannot project a vector of size {} onto {} entries", point.size(), entryList.size()));
  }
  std::vector<bool> active(entryList.size(), false);
  for (std::size_t i = 0; i < entryList.size(); ++i) {
    const StateEntry_t& e = entryList[i];
    double& value = point(static_cast<Eigen::Index>(i));
    if (e.upperBound && value > *e.upperBound) {
      value = *e.upperBound;
      active[i] = true;
    }
    if (e.lowerBound && value < *e.lowerBound) {
      value = *e.lowerBound;
      active[i] = true;
    }
  }
  return active;
}

} // namespace ukfest
