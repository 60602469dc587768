#include "wifitrack/tracking/PresenceTracker.hpp"

#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"

namespace wifitrack {

void PresenceTracker::ingest(const Snapshot_t& snapshot, Seconds threshold) {
  if (!(threshold > 0.0)) {
    throw PreconditionError(fmt::format("silence threshold must be positive, got {}", threshold));
  }
  if (hasIngested && snapshot.time < lastIngestTime) {
    throw PreconditionError(fmt::format("snapshot time {:.3f} precedes previous snapshot {:.3f}",
                                        snapshot.time, lastIngestTime));
  }

  const Timestamp t = snapshot.time;
  auto logger = Logger::GetClass("PresenceTracker");
  SnapshotDiff_t current;
  std::unordered_set<std::string> seenNow;
  std::vector<std::string> snapshotIds;
  snapshotIds.reserve(snapshot.sightings.size());

  for (const Sighting_t& sighting : snapshot.sightings) {
    const std::string id = normalizeDeviceId(sighting.deviceId);
    if (id.empty()) {
      if (logger) {
        logger->warn("Ignoring sighting without identifier at {:.3f}", t);
      }
      continue;
    }
    // Repeated device within one snapshot: attributes only, last write wins.
    if (!seenNow.insert(id).second) {
      devices[id].attributes = sighting.attributes;
      continue;
    }
    snapshotIds.push_back(id);

    auto it = devices.find(id);
    if (it == devices.end()) {
      DeviceState_t state;
      state.openStart = t;
      state.lastSeen = t;
      state.open = true;
      state.attributes = sighting.attributes;
      devices.emplace(id, std::move(state));
      deviceOrder.push_back(id);
      current.appeared.push_back(id);
      continue;
    }

    DeviceState_t& state = it->second;
    if (!state.open) {
      state.openStart = t;
      state.open = true;
      current.appeared.push_back(id);
    } else if (t - state.lastSeen > threshold) {
      if (logger) {
        logger->debug("{} silent for {:.3f}s (threshold {:.3f}s)", id, t - state.lastSeen, threshold);
      }
      close(id, state);
      state.openStart = t;
      state.open = true;
      current.appeared.push_back(id);
    } else {
      current.continued.push_back(id);
    }
    state.lastSeen = t;
    state.attributes = sighting.attributes;
  }

  for (const std::string& id : previousSnapshot) {
    if (seenNow.count(id) == 0) {
      current.departed.push_back(id);
    }
  }

  previousSnapshot = std::move(snapshotIds);
  diff = std::move(current);
  lastIngestTime = t;
  hasIngested = true;
  finalized = false;

  if (logger) {
    logger->trace("Snapshot {:.3f}: {} appeared, {} continued, {} departed", t,
                  diff.appeared.size(), diff.continued.size(), diff.departed.size());
  }
}

std::vector<PresenceRecord_t> PresenceTracker::finalize(Timestamp now) {
  std::size_t trailing = 0;
  for (const std::string& id : deviceOrder) {
    DeviceState_t& state = devices.at(id);
    if (state.open) {
      close(id, state);
      ++trailing;
    }
  }
  if (trailing > 0 || !finalized) {
    if (auto logger = Logger::GetClass("PresenceTracker")) {
      logger->info("Finalized at {:.3f}: {} trailing spans closed, {} intervals over {} devices",
                   now, trailing, closed.size(), devices.size());
    }
  }
  finalized = true;

  std::vector<PresenceRecord_t> records;
  records.reserve(closed.size());
  for (const PresenceInterval_t& interval : closed) {
    PresenceRecord_t record;
    record.interval = interval;
    record.attributes = devices.at(interval.deviceId).attributes;
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<PresenceInterval_t> PresenceTracker::intervalsFor(const std::string& deviceId) const {
  const std::string id = normalizeDeviceId(deviceId);
  std::vector<PresenceInterval_t> result;
  for (const PresenceInterval_t& interval : closed) {
    if (interval.deviceId == id) {
      result.push_back(interval);
    }
  }
  return result;
}

bool PresenceTracker::isOpen(const std::string& deviceId) const {
  const DeviceState_t* state = find(deviceId);
  return state != nullptr && state->open;
}

std::optional<Timestamp> PresenceTracker::openStart(const std::string& deviceId) const {
  const DeviceState_t* state = find(deviceId);
  if (state == nullptr || !state->open) {
    return std::nullopt;
  }
  return state->openStart;
}

std::optional<Timestamp> PresenceTracker::lastSeen(const std::string& deviceId) const {
  const DeviceState_t* state = find(deviceId);
  if (state == nullptr) {
    return std::nullopt;
  }
  return state->lastSeen;
}

std::optional<DeviceAttributes_t> PresenceTracker::latestAttributes(const std::string& deviceId) const {
  const DeviceState_t* state = find(deviceId);
  if (state == nullptr) {
    return std::nullopt;
  }
  return state->attributes;
}

Seconds PresenceTracker::totalPresence(const std::string& deviceId) const {
  const std::string id = normalizeDeviceId(deviceId);
  Seconds total = 0.0;
  for (const PresenceInterval_t& interval : closed) {
    if (interval.deviceId == id) {
      total += interval.duration();
    }
  }
  const DeviceState_t* state = find(id);
  if (state != nullptr && state->open) {
    total += state->lastSeen - state->openStart;
  }
  return total;
}

std::size_t PresenceTracker::openCount() const {
  std::size_t count = 0;
  for (const auto& entry : devices) {
    if (entry.second.open) {
      ++count;
    }
  }
  return count;
}

void PresenceTracker::reset() {
  devices.clear();
  deviceOrder.clear();
  closed.clear();
  previousSnapshot.clear();
  diff = SnapshotDiff_t{};
  lastIngestTime = 0.0;
  hasIngested = false;
  finalized = false;
}

const PresenceTracker::DeviceState_t* PresenceTracker::find(const std::string& deviceId) const {
  auto it = devices.find(normalizeDeviceId(deviceId));
  if (it == devices.end()) {
    return nullptr;
  }
  return &it->second;
}

void PresenceTracker::close(const std::string& deviceId, DeviceState_t& state) {
  closed.push_back(PresenceInterval_t{deviceId, state.openStart, state.lastSeen});
  state.open = false;
  if (auto logger = Logger::GetClass("PresenceTracker")) {
    logger->debug("Closed {} [{:.3f}, {:.3f}]", deviceId, state.openStart, state.lastSeen);
  }
}

} // namespace wifitrack
