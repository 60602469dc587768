#include "wifitrack/pipeline/ScanDriver.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"

namespace wifitrack {

namespace {

constexpr Seconds kStopPollSlice = 0.125;

} // namespace

ScanDriver::ScanDriver(std::shared_ptr<IScanSource> sourceInput,
                       std::shared_ptr<IClock> clockInput,
                       DriverOptions_t optionsInput)
    : source(std::move(sourceInput)),
      clock(std::move(clockInput)),
      options(optionsInput) {
  if (!source || !clock) {
    throw PreconditionError("ScanDriver requires a scan source and a clock");
  }
  if (!(options.threshold > 0.0)) {
    throw PreconditionError(fmt::format("silence threshold must be positive, got {}", options.threshold));
  }
  if (options.scanInterval < 0.0 || options.scanDuration < 0.0 || options.startAfter < 0.0) {
    throw PreconditionError("scan interval, duration and start delay must not be negative");
  }
  if (auto logger = Logger::GetClass("ScanDriver")) {
    logger->info("ScanDriver created threshold {}s interval {}s duration {}s maxScans {}",
                 options.threshold, options.scanInterval, options.scanDuration,
                 options.maxScans == 0 ? -1 : static_cast<int>(options.maxScans));
  }
}

Snapshot_t ScanDriver::runInstant() {
  Snapshot_t snapshot;
  if (!source->next(snapshot)) {
    throw ScanUnavailableError("scan source produced no snapshot");
  }
  if (auto logger = Logger::GetClass("ScanDriver")) {
    logger->info("Instant scan found {} networks", snapshot.sightings.size());
  }
  return snapshot;
}

RunResult_t ScanDriver::run() {
  auto logger = Logger::GetClass("ScanDriver");
  presenceTracker.reset();
  RunResult_t result;

  try {
    sample(result);
  } catch (const Error& ex) {
    if (logger) {
      logger->error("Run aborted after {} scans: {} ({})", result.scanCount, ex.what(), toString(ex.kind()));
    }
    presenceTracker.finalize(clock->now());
    stopFlag.store(false);
    throw;
  }

  result.stoppedEarly = stopRequested();
  // A stop ends only the current run.
  stopFlag.store(false);
  if (logger && result.stoppedEarly) {
    logger->warn("Scan stopped early after {} scans", result.scanCount);
  }
  result.records = presenceTracker.finalize(clock->now());
  if (logger) {
    logger->info("ScanDriver completed after {} scans, {} intervals", result.scanCount, result.records.size());
  }
  return result;
}

void ScanDriver::sample(RunResult_t& result) {
  auto logger = Logger::GetClass("ScanDriver");
  const int countdown = static_cast<int>(std::ceil(options.startAfter));
  for (int remaining = countdown; remaining > 0 && !stopRequested(); --remaining) {
    if (logger) {
      logger->info("Scan starts in {} seconds", remaining);
    }
    waitUntil(clock->now() + 1.0);
  }

  const Timestamp runStart = clock->now();
  result.origin = runStart;
  if (logger && !stopRequested()) {
    if (options.scanDuration > 0.0) {
      logger->info("Scan started, it will last for {} seconds", options.scanDuration);
    } else {
      logger->info("Scan started, running until stopped");
    }
  }

  const Timestamp runEnd = runStart + options.scanDuration;
  Timestamp nextTick = runStart;
  bool hasOrigin = false;
  while (!stopRequested()) {
    if (options.scanDuration > 0.0 && clock->now() >= runEnd) {
      break;
    }
    if (options.maxScans > 0 && result.scanCount >= options.maxScans) {
      if (logger) {
        logger->info("ScanDriver: reached max scans {}", options.maxScans);
      }
      break;
    }

    Snapshot_t snapshot;
    if (!source->next(snapshot)) {
      if (logger) {
        logger->info("ScanDriver: scan source exhausted");
      }
      break;
    }
    if (!hasOrigin) {
      result.origin = snapshot.time;
      hasOrigin = true;
    }

    presenceTracker.ingest(snapshot, options.threshold);
    ++result.scanCount;
    if (logger) {
      const SnapshotDiff_t& diff = presenceTracker.lastDiff();
      logger->debug("Scan {} at {:.3f}: {} networks, {} appeared, {} departed", result.scanCount,
                    snapshot.time, snapshot.sightings.size(), diff.appeared.size(), diff.departed.size());
    }

    if (options.scanInterval <= 0.0) {
      continue;
    }
    nextTick += options.scanInterval;
    const Timestamp now = clock->now();
    if (now > nextTick) {
      const double missed = std::ceil((now - nextTick) / options.scanInterval);
      nextTick += missed * options.scanInterval;
      if (logger) {
        logger->warn("Scan overran the interval, skipping {} ticks", static_cast<int>(missed));
      }
    }
    const Timestamp deadline = options.scanDuration > 0.0 ? std::min(nextTick, runEnd) : nextTick;
    if (!waitUntil(deadline)) {
      break;
    }
  }
}

bool ScanDriver::waitUntil(Timestamp deadline) {
  while (!stopRequested()) {
    const Seconds remaining = deadline - clock->now();
    if (remaining <= 0.0) {
      return true;
    }
    clock->sleepFor(std::min(kStopPollSlice, remaining));
  }
  return false;
}

} // namespace wifitrack
