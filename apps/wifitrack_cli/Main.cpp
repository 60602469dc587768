#include <fmt/core.h>

#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "wifitrack/core/Clock.hpp"
#include "wifitrack/core/Config.hpp"
#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"
#include "wifitrack/data/NmcliScanSource.hpp"
#include "wifitrack/data/ReplayScanSource.hpp"
#include "wifitrack/pipeline/ScanDriver.hpp"
#include "wifitrack/pipeline/StopSignals.hpp"
#include "wifitrack/report/ReportAssembler.hpp"
#include "wifitrack/vendor/VendorResolver.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string replayPath;
  std::string interfaceName;
  bool showHelp = false;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/default.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--replay" && i + 1 < argc) {
      options.replayPath = argv[++i];
    } else if (arg == "--interface" && i + 1 < argc) {
      options.interfaceName = argv[++i];
    } else if (auto logger = wifitrack::Logger::Get()) {
      logger->warn("Ignoring unknown argument '{}'", arg);
    }
  }
  return options;
}

void applyLoggingConfig(const nlohmann::json& config) {
  const nlohmann::json loggingNode = config.value("logging", nlohmann::json::object());
  const bool enabled = loggingNode.value("enabled", true);
  const std::string level = loggingNode.value("level", "info");
  const auto fileNode = loggingNode.value("file", nlohmann::json::object());
  wifitrack::FileSinkConfig_t fileConfig;
  fileConfig.enabled = fileNode.value("enabled", false);
  fileConfig.path = fileNode.value("path", "logs/wifitrack.log");
  fileConfig.maxSizeBytes = fileNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  fileConfig.maxFiles = fileNode.value("maxFiles", static_cast<std::size_t>(3));
  wifitrack::Logger::ConfigureFileSink(fileConfig);
  const auto classNode = loggingNode.value("classLogs", nlohmann::json::object());
  wifitrack::ClassSinkConfig_t classConfig;
  classConfig.enabled = classNode.value("enabled", false);
  classConfig.directory = classNode.value("directory", "logs/classes");
  classConfig.maxSizeBytes = classNode.value("maxSizeBytes", static_cast<std::size_t>(5 * 1024 * 1024));
  classConfig.maxFiles = classNode.value("maxFiles", static_cast<std::size_t>(3));
  wifitrack::Logger::ConfigureClassSink(classConfig);
  wifitrack::Logger::SetEnabled(enabled);
  wifitrack::Logger::SetLevel(wifitrack::Logger::ParseLevel(level));
}

void publish(const wifitrack::Report& report, const std::string& path) {
  fmt::print("{}\n", report.dump(4));
  wifitrack::writeReport(report, path);
}

int run(const CliOptions_t& cliOptions) {
  const nlohmann::json config = wifitrack::loadJson(cliOptions.configPath);
  try {
    applyLoggingConfig(config);
  } catch (const nlohmann::json::exception& ex) {
    throw wifitrack::ConfigInvalidError(std::string("invalid logging section: ") + ex.what());
  }
  wifitrack::RunConfig_t runConfig = wifitrack::parseRunConfig(config);
  if (!cliOptions.interfaceName.empty()) {
    runConfig.interfaceName = cliOptions.interfaceName;
  }
  if (auto logger = wifitrack::Logger::Get()) {
    logger->info("wifitrack_cli using config: {}", cliOptions.configPath);
  }

  auto clock = std::make_shared<wifitrack::SteadyClock>();
  wifitrack::DriverOptions_t driverOptions;
  driverOptions.threshold = runConfig.threshold;
  driverOptions.scanInterval = runConfig.scanInterval;
  driverOptions.scanDuration = runConfig.scanDuration;
  driverOptions.startAfter = runConfig.startAfterDuration;

  std::shared_ptr<wifitrack::IScanSource> source;
  if (!cliOptions.replayPath.empty()) {
    source = std::make_shared<wifitrack::ReplayScanSource>(cliOptions.replayPath);
    // Recorded timestamps drive the tracker; replay as fast as possible.
    driverOptions.scanInterval = 0.0;
    driverOptions.scanDuration = 0.0;
    driverOptions.startAfter = 0.0;
  } else {
    source = std::make_shared<wifitrack::NmcliScanSource>(clock, runConfig.interfaceName, runConfig.scanTimeout);
  }

  auto resolver = std::make_shared<wifitrack::OuiVendorResolver>(runConfig.ouiPath);
  const wifitrack::ReportAssembler assembler(resolver);
  wifitrack::ScanDriver driver(source, clock, driverOptions);

  if (runConfig.instantScan) {
    if (auto logger = wifitrack::Logger::Get()) {
      logger->info("Scan was set to be instant, starting scan");
    }
    const wifitrack::Snapshot_t snapshot = driver.runInstant();
    const wifitrack::Report report = assembler.assembleInstant(snapshot);
    publish(report, runConfig.instantOutput);
    return report.empty() ? 1 : 0;
  }

  if (auto logger = wifitrack::Logger::Get()) {
    logger->info("Scan was set to be delayed");
  }
  wifitrack::RunResult_t result;
  {
    const wifitrack::ScopedStopSignals stopSignals(driver);
    result = driver.run();
  }
  if (result.stoppedEarly) {
    if (auto logger = wifitrack::Logger::Get()) {
      logger->warn("Scan interrupted, reporting {} intervals collected so far", result.records.size());
    }
  }

  const wifitrack::Report report = assembler.assembleScheduled(result.records, result.origin);
  publish(report, runConfig.scheduledOutput);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  wifitrack::Logger::Initialize();
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("Usage: wifitrack_cli [--config <path>] [--replay <scans.jsonl>] [--interface <name>]\n");
    return 0;
  }

  try {
    const int status = run(cliOptions);
    if (auto logger = wifitrack::Logger::Get()) {
      if (status == 0) {
        logger->info("WiFi scan completed successfully.");
      } else {
        logger->info("No data was processed.");
      }
    }
    return status;
  } catch (const wifitrack::Error& ex) {
    if (auto logger = wifitrack::Logger::Get()) {
      logger->error("{} error: {}", wifitrack::toString(ex.kind()), ex.what());
    } else {
      fmt::print(stderr, "{} error: {}\n", wifitrack::toString(ex.kind()), ex.what());
    }
    return wifitrack::exitCode(ex.kind());
  }
}
