#include "wifitrack/pipeline/StopSignals.hpp"

#include <atomic>
#include <csignal>

namespace wifitrack {

namespace {

std::atomic<ScanDriver*> gActiveDriver{nullptr};
static_assert(std::atomic<ScanDriver*>::is_always_lock_free,
              "signal handler requires a lock-free driver pointer");
static_assert(std::atomic<bool>::is_always_lock_free,
              "ScanDriver::requestStop must be async-signal-safe");

void handleStopSignal(int /*signal*/) {
  if (ScanDriver* driver = gActiveDriver.load()) {
    driver->requestStop();
  }
}

} // namespace

ScopedStopSignals::ScopedStopSignals(ScanDriver& driver) {
  gActiveDriver.store(&driver);
  std::signal(SIGINT, handleStopSignal);
  std::signal(SIGTERM, handleStopSignal);
}

ScopedStopSignals::~ScopedStopSignals() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  gActiveDriver.store(nullptr);
}

} // namespace wifitrack
