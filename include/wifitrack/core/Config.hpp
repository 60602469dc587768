#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace wifitrack {

struct RunConfig_t {
  bool instantScan = false;
  int startAfterDuration = 0;
  int scanDuration = 60;
  // Silence threshold in seconds; gaps strictly above it split intervals.
  int threshold = 5;
  int scanInterval = 5;
  int scanTimeout = 15;
  std::string interfaceName;
  std::string ouiPath = "data/oui.csv";
  std::string instantOutput = "wifi_instantdata.json";
  std::string scheduledOutput = "wifi_scheduleddata.json";
};

// Throws ConfigInvalidError naming the offending key.
RunConfig_t parseRunConfig(const nlohmann::json& config);

// Reads and parses a JSON document. Throws ConfigInvalidError.
nlohmann::json loadJson(const std::string& path);

RunConfig_t loadRunConfig(const std::string& path);

} // namespace wifitrack
