#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wifitrack/data/Snapshot.hpp"
#include "wifitrack/tracking/PresenceTracker.hpp"
#include "wifitrack/vendor/VendorResolver.hpp"

namespace wifitrack {

// Reports keep insertion order so keys read "1", "2", ..., "10".
using Report = nlohmann::ordered_json;

// Replaces quote characters that break downstream consumers with spaces.
std::string sanitize(const std::string& value);

// "Open" for an empty or "--" security field, otherwise "Secured".
std::string classifySecurity(const std::string& security);

// "3-10,25-40": whole seconds relative to `origin`.
std::string formatDurations(const std::vector<PresenceInterval_t>& intervals, Timestamp origin);

// Builds the persisted report shape from tracker output and scan metadata.
class ReportAssembler {
public:
  explicit ReportAssembler(std::shared_ptr<const IVendorResolver> resolver);

  // One entry per device, in order of its first closed interval.
  Report assembleScheduled(const std::vector<PresenceRecord_t>& records, Timestamp origin) const;

  // One entry per sighting of a single scan; durations are left empty.
  Report assembleInstant(const Snapshot_t& snapshot) const;

private:
  Report makeEntry(const std::string& deviceId, const DeviceAttributes_t& attributes) const;

  std::shared_ptr<const IVendorResolver> resolver;
};

// Writes the report as pretty JSON. Throws PersistenceFailureError.
void writeReport(const Report& report, const std::string& path);

} // namespace wifitrack
