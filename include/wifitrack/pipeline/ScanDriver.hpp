#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include "wifitrack/core/Clock.hpp"
#include "wifitrack/data/ScanSource.hpp"
#include "wifitrack/tracking/PresenceTracker.hpp"

namespace wifitrack {

struct DriverOptions_t {
  Seconds threshold = 5.0;
  // Cadence of scan ticks; 0 scans back to back.
  Seconds scanInterval = 5.0;
  // 0 runs until stopped or the source is exhausted.
  Seconds scanDuration = 60.0;
  Seconds startAfter = 0.0;
  // 0 means no limit.
  std::size_t maxScans = 0;
};

struct RunResult_t {
  std::vector<PresenceRecord_t> records;
  // Time of the first snapshot, or the run start when none was taken.
  Timestamp origin = 0.0;
  std::size_t scanCount = 0;
  bool stoppedEarly = false;
};

// Samples the scan source on a fixed cadence and feeds the tracker. All
// ingest calls happen on the thread that calls run().
class ScanDriver {
public:
  ScanDriver(std::shared_ptr<IScanSource> source,
             std::shared_ptr<IClock> clock,
             DriverOptions_t options);

  // Single acquisition for instant mode. Throws ScanUnavailableError.
  Snapshot_t runInstant();

  // Delayed mode. The tracker is finalized before returning, also when a
  // stop was requested. Any wifitrack::Error raised while sampling is
  // rethrown after finalizing. The driver can run again afterwards.
  RunResult_t run();

  // Ends the current run, or the next one when no run is in progress.
  // Safe to call from a signal handler or another thread.
  void requestStop() { stopFlag.store(true); }
  bool stopRequested() const { return stopFlag.load(); }

  const PresenceTracker& tracker() const { return presenceTracker; }

private:
  // Countdown and sampling loop; run() owns finalizing.
  void sample(RunResult_t& result);

  // Returns false when interrupted by a stop request.
  bool waitUntil(Timestamp deadline);

  std::shared_ptr<IScanSource> source;
  std::shared_ptr<IClock> clock;
  DriverOptions_t options;
  PresenceTracker presenceTracker;
  std::atomic<bool> stopFlag{false};
};

} // namespace wifitrack
