#pragma once

#include <memory>
#include <string>
#include <vector>

#include "wifitrack/core/Clock.hpp"
#include "wifitrack/data/ScanSource.hpp"

namespace wifitrack {

// Splits one line of `nmcli -t` output on unescaped ':' and resolves the
// "\:" and "\\" escapes inside each field.
std::vector<std::string> splitNmcliFields(const std::string& line);

// Parses BSSID,SSID,CHAN,SIGNAL,SECURITY terse output into a snapshot.
Snapshot_t parseNmcliTerse(const std::string& output, Timestamp time);

// Scans through NetworkManager's CLI. Every call triggers a rescan and is
// bounded by `timeoutSeconds`. A non-empty `command` replaces the nmcli
// invocation; it must print the same terse listing.
class NmcliScanSource : public IScanSource {
public:
  NmcliScanSource(std::shared_ptr<IClock> clock,
                  std::string interfaceName,
                  int timeoutSeconds,
                  std::string command = {});

  bool next(Snapshot_t& out) override;

  const std::string& command() const { return commandLine; }

private:
  std::shared_ptr<IClock> clock;
  std::string interfaceName;
  int timeoutSeconds = 15;
  std::string commandLine;
};

} // namespace wifitrack
