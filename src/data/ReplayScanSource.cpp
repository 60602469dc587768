#include "wifitrack/data/ReplayScanSource.hpp"

#include <nlohmann/json.hpp>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"

namespace wifitrack {

namespace {

Sighting_t parseDevice(const nlohmann::json& node) {
  Sighting_t sighting;
  sighting.deviceId = normalizeDeviceId(node.at("mac").get<std::string>());
  sighting.attributes.ssid = node.value("ssid", "");
  sighting.attributes.channel = node.value("channel", 0);
  sighting.attributes.signal = node.value("signal", 0);
  sighting.attributes.security = node.value("security", "");
  return sighting;
}

} // namespace

ReplayScanSource::ReplayScanSource(const std::string& pathInput)
    : path(pathInput), fileStream(pathInput) {
  if (!fileStream.is_open()) {
    throw ScanUnavailableError("failed to open replay file: " + path);
  }
  if (auto logger = Logger::GetClass("ReplayScanSource")) {
    logger->info("ReplayScanSource opening {}", path);
  }
}

bool ReplayScanSource::next(Snapshot_t& out) {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      const nlohmann::json node = nlohmann::json::parse(line);
      Snapshot_t snapshot;
      snapshot.time = node.at("time").get<double>();
      for (const auto& deviceNode : node.value("devices", nlohmann::json::array())) {
        snapshot.sightings.push_back(parseDevice(deviceNode));
      }
      out = std::move(snapshot);
      return true;
    } catch (const nlohmann::json::exception& ex) {
      ++invalidLineCount;
      if (auto logger = Logger::GetClass("ReplayScanSource")) {
        logger->warn("Skipping invalid replay line {} in {}: {}", lineNumber, path, ex.what());
      }
    }
  }
  if (fileStream.bad()) {
    throw ScanUnavailableError("failed reading replay file: " + path);
  }
  return false;
}

} // namespace wifitrack
