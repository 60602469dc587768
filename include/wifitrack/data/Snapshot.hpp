#pragma once

#include <string>
#include <vector>

#include "wifitrack/core/Types.hpp"

namespace wifitrack {

// Per-sighting metadata. Carried through the tracker without interpretation.
struct DeviceAttributes_t {
  std::string ssid;
  int channel = 0;
  // Signal quality as reported by the scan backend (nmcli: 0-100).
  int signal = 0;
  // Raw security description; empty or "--" means open.
  std::string security;
};

struct Sighting_t {
  std::string deviceId;
  DeviceAttributes_t attributes;
};

// Devices visible during one scan, stamped with a single observation time.
struct Snapshot_t {
  Timestamp time = 0.0;
  std::vector<Sighting_t> sightings;
};

// Trimmed, lowercased identifier so "AA:BB:.." and "aa:bb:.." are one device.
std::string normalizeDeviceId(const std::string& deviceId);

} // namespace wifitrack
