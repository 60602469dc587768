#include "wifitrack/data/Snapshot.hpp"

#include <algorithm>
#include <cctype>

namespace wifitrack {

std::string normalizeDeviceId(const std::string& deviceId) {
  const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(deviceId.begin(), deviceId.end(), isSpace);
  auto last = std::find_if_not(deviceId.rbegin(), deviceId.rend(), isSpace).base();
  if (first >= last) {
    return {};
  }
  std::string normalized(first, last);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

} // namespace wifitrack
