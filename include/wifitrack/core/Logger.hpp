#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace wifitrack {

struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/wifitrack.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// One rotating file per component name, e.g. logs/classes/PresenceTracker.log.
struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/classes";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// Process-wide "wifitrack" logger. The level and enabled flag outlive sink
// reconfiguration and apply to per-class loggers as well. Get() and GetClass()
// return nullptr while logging is disabled.
class Logger {
 public:
  static void Initialize();
  static std::shared_ptr<spdlog::logger> Get();
  // Falls back to the process logger when class sinks are off or fail to open.
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetEnabled(bool enabled);
  static bool IsEnabled();
  static void SetLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum GetLevel();
  static spdlog::level::level_enum ParseLevel(const std::string& value);
  static void ConfigureFileSink(const FileSinkConfig_t& config);
  static void ConfigureClassSink(const ClassSinkConfig_t& config);
};

} // namespace wifitrack
