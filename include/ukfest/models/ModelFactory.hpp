#pragma once

#include <nlohmann/json.hpp>

#include "ukfest/core/Model.hpp"

namespace ukfest {

// Builds a factory for the model named by modelNode["type"]: "linear", "growth" or "thermal".
// Throws ConfigurationError for unknown types or malformed matrices.
ModelFactory createModelFactory(const nlohmann::json& modelNode);

} // namespace ukfest
