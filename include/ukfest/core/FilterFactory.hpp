#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "ukfest/core/FilterEngine.hpp"

namespace ukfest {

// Reads the "filter" node of a configuration document.
FilterConfig_t parseFilterConfig(const nlohmann::json& filterNode);

// Creates a filter engine from the "filter" node. A missing measurement noise defaults to
// unit variance per measured output.
std::shared_ptr<FilterEngine> createFilterEngine(const nlohmann::json& filterNode, ModelFactory modelFactory);

} // namespace ukfest
