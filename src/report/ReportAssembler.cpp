#include "wifitrack/report/ReportAssembler.hpp"

#include <cmath>
#include <fstream>
#include <unordered_map>

#include <fmt/format.h>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"

namespace wifitrack {

namespace {

long long wholeSeconds(Timestamp value, Timestamp origin) {
  const double offset = value - origin;
  if (offset <= 0.0) {
    return 0;
  }
  return static_cast<long long>(std::floor(offset));
}

} // namespace

std::string sanitize(const std::string& value) {
  std::string result = value;
  for (char& c : result) {
    if (c == '\'' || c == '`' || c == '"') {
      c = ' ';
    }
  }
  return result;
}

std::string classifySecurity(const std::string& security) {
  if (security.empty() || security == "--") {
    return "Open";
  }
  return "Secured";
}

std::string formatDurations(const std::vector<PresenceInterval_t>& intervals, Timestamp origin) {
  std::string result;
  for (const PresenceInterval_t& interval : intervals) {
    if (!result.empty()) {
      result += ',';
    }
    result += fmt::format("{}-{}", wholeSeconds(interval.start, origin), wholeSeconds(interval.end, origin));
  }
  return result;
}

ReportAssembler::ReportAssembler(std::shared_ptr<const IVendorResolver> resolverInput)
    : resolver(std::move(resolverInput)) {}

Report ReportAssembler::makeEntry(const std::string& deviceId, const DeviceAttributes_t& attributes) const {
  const std::string manufacturer = resolver ? resolver->resolve(deviceId) : std::string(kUnknownVendor);
  Report entry = Report::object();
  entry["ssid"] = sanitize(attributes.ssid);
  entry["mac"] = deviceId;
  entry["manufacturer"] = sanitize(manufacturer);
  entry["network_security"] = classifySecurity(attributes.security);
  entry["channel"] = attributes.channel;
  entry["signal"] = attributes.signal;
  return entry;
}

Report ReportAssembler::assembleScheduled(const std::vector<PresenceRecord_t>& records, Timestamp origin) const {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<const PresenceRecord_t*>> byDevice;
  for (const PresenceRecord_t& record : records) {
    auto& bucket = byDevice[record.interval.deviceId];
    if (bucket.empty()) {
      order.push_back(record.interval.deviceId);
    }
    bucket.push_back(&record);
  }

  Report report = Report::object();
  int id = 1;
  for (const std::string& deviceId : order) {
    const auto& bucket = byDevice.at(deviceId);
    std::vector<PresenceInterval_t> intervals;
    Report durations = Report::array();
    Seconds total = 0.0;
    for (const PresenceRecord_t* record : bucket) {
      intervals.push_back(record->interval);
      durations.push_back(record->interval.duration());
      total += record->interval.duration();
    }

    Report entry = makeEntry(deviceId, bucket.back()->attributes);
    entry["wifi_durations"] = formatDurations(intervals, origin);
    entry["durations"] = std::move(durations);
    entry["total_duration"] = total;
    report[std::to_string(id++)] = std::move(entry);
  }

  if (auto logger = Logger::GetClass("ReportAssembler")) {
    logger->info("Scheduled report: {} devices from {} intervals", order.size(), records.size());
  }
  return report;
}

Report ReportAssembler::assembleInstant(const Snapshot_t& snapshot) const {
  Report report = Report::object();
  int id = 1;
  for (const Sighting_t& sighting : snapshot.sightings) {
    Report entry = makeEntry(normalizeDeviceId(sighting.deviceId), sighting.attributes);
    entry["wifi_durations"] = "";
    report[std::to_string(id++)] = std::move(entry);
  }
  return report;
}

void writeReport(const Report& report, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw PersistenceFailureError("failed to open report file: " + path);
  }
  file << report.dump(4) << '\n';
  file.flush();
  if (!file) {
    throw PersistenceFailureError("failed to write report file: " + path);
  }
  if (auto logger = Logger::GetClass("ReportAssembler")) {
    logger->info("Report written to {}", path);
  }
}

} // namespace wifitrack
