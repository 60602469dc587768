#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "wifitrack/data/ScanSource.hpp"

namespace wifitrack {

// Replays recorded snapshots, one JSON object per line:
//   {"time": 12.0, "devices": [{"mac": "..", "ssid": "..", "channel": 6,
//                               "signal": 70, "security": "WPA2"}]}
class ReplayScanSource : public IScanSource {
public:
  explicit ReplayScanSource(const std::string& path);

  bool next(Snapshot_t& out) override;

  std::size_t invalidLines() const { return invalidLineCount; }

private:
  std::string path;
  std::ifstream fileStream;
  std::size_t lineNumber = 0;
  std::size_t invalidLineCount = 0;
};

} // namespace wifitrack
