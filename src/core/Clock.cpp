#include "wifitrack/core/Clock.hpp"

#include <thread>

namespace wifitrack {

SteadyClock::SteadyClock() : origin(std::chrono::steady_clock::now()) {}

Timestamp SteadyClock::now() const {
  const auto elapsed = std::chrono::steady_clock::now() - origin;
  return std::chrono::duration<double>(elapsed).count();
}

void SteadyClock::sleepFor(Seconds duration) {
  if (duration <= 0.0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::duration<double>(duration));
}

} // namespace wifitrack
