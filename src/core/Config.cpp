#include "wifitrack/core/Config.hpp"

#include <fstream>
#include <limits>

#include <fmt/format.h>

#include "wifitrack/core/Errors.hpp"

namespace wifitrack {

namespace {

int getInt(const nlohmann::json& node, const std::string& key, int fallback, int minimum) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw ConfigInvalidError(fmt::format("'{}' must be an integer", key));
  }
  const auto value = it->get<long long>();
  if (value < minimum || value > std::numeric_limits<int>::max()) {
    throw ConfigInvalidError(fmt::format("'{}' must be >= {}, got {}", key, minimum, value));
  }
  return static_cast<int>(value);
}

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigInvalidError(fmt::format("'{}' must be a string", key));
  }
  return it->get<std::string>();
}

} // namespace

RunConfig_t parseRunConfig(const nlohmann::json& config) {
  if (!config.is_object()) {
    throw ConfigInvalidError("configuration must be a JSON object");
  }
  RunConfig_t result;

  auto instantIt = config.find("instant_scan");
  if (instantIt == config.end()) {
    throw ConfigInvalidError("missing required key 'instant_scan'");
  }
  if (!instantIt->is_boolean()) {
    throw ConfigInvalidError("'instant_scan' must be a boolean");
  }
  result.instantScan = instantIt->get<bool>();

  result.startAfterDuration = getInt(config, "start_after_duration", result.startAfterDuration, 0);
  result.scanDuration = getInt(config, "scan_duration", result.scanDuration, 0);
  result.threshold = getInt(config, "threshold", result.threshold, 1);
  result.scanInterval = getInt(config, "scan_interval", result.scanInterval, 1);
  result.scanTimeout = getInt(config, "scan_timeout", result.scanTimeout, 1);
  result.interfaceName = getString(config, "interface", result.interfaceName);
  result.ouiPath = getString(config, "oui_path", result.ouiPath);
  result.instantOutput = getString(config, "instant_output", result.instantOutput);
  result.scheduledOutput = getString(config, "scheduled_output", result.scheduledOutput);

  if (result.ouiPath.empty()) {
    throw ConfigInvalidError("'oui_path' must not be empty");
  }
  if (result.instantOutput.empty() || result.scheduledOutput.empty()) {
    throw ConfigInvalidError("report output paths must not be empty");
  }
  return result;
}

nlohmann::json loadJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigInvalidError("failed to open config file: " + path);
  }
  try {
    nlohmann::json config;
    file >> config;
    return config;
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigInvalidError(fmt::format("failed to parse config file {}: {}", path, ex.what()));
  }
}

RunConfig_t loadRunConfig(const std::string& path) {
  return parseRunConfig(loadJson(path));
}

} // namespace wifitrack
