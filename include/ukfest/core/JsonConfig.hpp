#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ukfest/core/Types.hpp"

namespace ukfest {

// Lenient accessors: a missing key or a value of the wrong type yields |fallback|.
std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback);
int getInt(const nlohmann::json& node, const std::string& key, int fallback);
double getDouble(const nlohmann::json& node, const std::string& key, double fallback);
bool getBool(const nlohmann::json& node, const std::string& key, bool fallback);
std::optional<double> getOptionalDouble(const nlohmann::json& node, const std::string& key);

// Strict parsers; malformed arrays throw ConfigurationError naming |what|.
Vector parseVector(const nlohmann::json& node, const std::string& what);
Matrix parseMatrix(const nlohmann::json& node, const std::string& what);

// Accepts a flat array (diagonal variances) or an array of rows (full matrix).
Matrix parseCovariance(const nlohmann::json& node, const std::string& what);

} // namespace ukfest
