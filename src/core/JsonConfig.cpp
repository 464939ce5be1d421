#include "ukfest/core/JsonConfig.hpp"

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"

namespace ukfest {

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

int getInt(const nlohmann::json& node, const std::string& key, int fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number_integer()) {
    return fallback;
  }
  return it->get<int>();
}

double getDouble(const nlohmann::json& node, const std::string& key, double fallback) {
  return getOptionalDouble(node, key).value_or(fallback);
}

bool getBool(const nlohmann::json& node, const std::string& key, bool fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::optional<double> getOptionalDouble(const nlohmann::json& node, const std::string& key) {
  if (!node.is_object()) {
    return std::nullopt;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

Vector parseVector(const nlohmann::json& node, const std::string& what) {
  if (!node.is_array()) {
    throw ConfigurationError(fmt::format("{} must be an array of numbers", what));
  }
  Vector value(static_cast<Eigen::Index>(node.size()));
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (!node[i].is_number()) {
      throw ConfigurationError(fmt::format("{}[{}] is not a number", what, i));
    }
    value(static_cast<Eigen::Index>(i)) = node[i].get<double>();
  }
  return value;
}

Matrix parseMatrix(const nlohmann::json& node, const std::string& what) {
  if (!node.is_array()) {
    throw ConfigurationError(fmt::format("{} must be an array of rows", what));
  }
  const Eigen::Index rows = static_cast<Eigen::Index>(node.size());
  const Eigen::Index cols = rows > 0 && node[0].is_array() ? static_cast<Eigen::Index>(node[0].size()) : 0;
  Matrix value = Matrix::Zero(rows, cols);
  for (Eigen::Index r = 0; r < rows; ++r) {
    const nlohmann::json& row = node[static_cast<std::size_t>(r)];
    if (!row.is_array() || static_cast<Eigen::Index>(row.size()) != cols) {
      throw ConfigurationError(fmt::format("{} row {} must have {} entries", what, r, cols));
    }
    for (Eigen::Index c = 0; c < cols; ++c) {
      const nlohmann::json& cell = row[static_cast<std::size_t>(c)];
      if (!cell.is_number()) {
        throw ConfigurationError(fmt::format("{}[{}][{}] is not a number", what, r, c));
      }
      value(r, c) = cell.get<double>();
    }
  }
  return value;
}

Matrix parseCovariance(const nlohmann::json& node, const std::string& what) {
  if (node.is_array() && !node.empty() && node[0].is_array()) {
    return parseMatrix(node, what);
  }
  const Vector variances = parseVector(node, what);
  if ((variances.array() < 0.0).any()) {
    throw ConfigurationError(fmt::format("{} has negative variances", what));
  }
  return Matrix(variances.asDiagonal());
}

} // namespace ukfest
