#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wifitrack/core/Types.hpp"
#include "wifitrack/data/Snapshot.hpp"

namespace wifitrack {

// Span during which a device was seen at least once every <= threshold seconds.
struct PresenceInterval_t {
  std::string deviceId;
  Timestamp start = 0.0;
  Timestamp end = 0.0;

  Seconds duration() const { return end - start; }
};

inline bool operator==(const PresenceInterval_t& lhs, const PresenceInterval_t& rhs) {
  return lhs.deviceId == rhs.deviceId && lhs.start == rhs.start && lhs.end == rhs.end;
}

// Closed interval joined with the device's most recent attributes.
struct PresenceRecord_t {
  PresenceInterval_t interval;
  DeviceAttributes_t attributes;
};

// What changed between the previous snapshot and the latest one.
struct SnapshotDiff_t {
  // First sighting, or reappearance after the previous span was closed.
  std::vector<std::string> appeared;
  std::vector<std::string> continued;
  // In the previous snapshot but missing from the latest one.
  std::vector<std::string> departed;
};

// Turns a stream of snapshots into closed presence intervals per device.
//
// Each device is Unseen until its first sighting, then Open. A sighting after
// more than `threshold` seconds of silence closes the open span at the last
// observation and opens a new one. finalize() closes every open span, again at
// its last observation, never at the finalize time.
//
// Not thread-safe: calls must be serialized, and snapshot times must be
// non-decreasing.
class PresenceTracker {
public:
  // Throws PreconditionError for threshold <= 0 or a snapshot older than the
  // previously ingested one. State is untouched when it throws.
  void ingest(const Snapshot_t& snapshot, Seconds threshold);

  // Closes all open spans and returns every closed interval in closure order.
  // Calling it again without new snapshots returns the same sequence.
  std::vector<PresenceRecord_t> finalize(Timestamp now);

  const std::vector<PresenceInterval_t>& closedIntervals() const { return closed; }
  std::vector<PresenceInterval_t> intervalsFor(const std::string& deviceId) const;

  bool isOpen(const std::string& deviceId) const;
  std::optional<Timestamp> openStart(const std::string& deviceId) const;
  std::optional<Timestamp> lastSeen(const std::string& deviceId) const;
  std::optional<DeviceAttributes_t> latestAttributes(const std::string& deviceId) const;

  // Closed durations plus the open span so far.
  Seconds totalPresence(const std::string& deviceId) const;

  std::size_t deviceCount() const { return devices.size(); }
  std::size_t openCount() const;
  bool isFinalized() const { return finalized; }
  const SnapshotDiff_t& lastDiff() const { return diff; }

  void reset();

private:
  struct DeviceState_t {
    Timestamp openStart = 0.0;
    Timestamp lastSeen = 0.0;
    bool open = false;
    DeviceAttributes_t attributes;
  };

  const DeviceState_t* find(const std::string& deviceId) const;
  void close(const std::string& deviceId, DeviceState_t& state);

  std::unordered_map<std::string, DeviceState_t> devices;
  // First-sighting order; keeps finalize() output deterministic.
  std::vector<std::string> deviceOrder;
  std::vector<PresenceInterval_t> closed;
  std::vector<std::string> previousSnapshot;
  SnapshotDiff_t diff;
  Timestamp lastIngestTime = 0.0;
  bool hasIngested = false;
  bool finalized = false;
};

} // namespace wifitrack
