#pragma once

#include "wifitrack/pipeline/ScanDriver.hpp"

namespace wifitrack {

// Routes SIGINT and SIGTERM to ScanDriver::requestStop() while alive, then
// restores the default dispositions. One guard at a time.
class ScopedStopSignals {
public:
  explicit ScopedStopSignals(ScanDriver& driver);
  ~ScopedStopSignals();

  ScopedStopSignals(const ScopedStopSignals&) = delete;
  ScopedStopSignals& operator=(const ScopedStopSignals&) = delete;
};

} // namespace wifitrack
