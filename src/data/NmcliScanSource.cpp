#include "wifitrack/data/NmcliScanSource.hpp"

#include <array>
#include <cstdio>
#include <sstream>
#include <stdexcept>

#include <sys/wait.h>

#include <fmt/format.h>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/core/Logger.hpp"

namespace wifitrack {

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr std::size_t kFieldCount = 5;

bool parseInt(const std::string& text, int& value) {
  if (text.empty()) {
    value = 0;
    return true;
  }
  try {
    std::size_t consumed = 0;
    value = std::stoi(text, &consumed);
    return consumed == text.size();
  } catch (const std::logic_error&) {
    return false;
  }
}

std::string shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

} // namespace

std::vector<std::string> splitNmcliFields(const std::string& line) {
  std::vector<std::string> fields(1);
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\\' && i + 1 < line.size()) {
      fields.back() += line[++i];
    } else if (c == ':') {
      fields.emplace_back();
    } else {
      fields.back() += c;
    }
  }
  return fields;
}

Snapshot_t parseNmcliTerse(const std::string& output, Timestamp time) {
  Snapshot_t snapshot;
  snapshot.time = time;

  std::istringstream stream(output);
  std::string line;
  std::size_t lineNumber = 0;
  while (std::getline(stream, line)) {
    ++lineNumber;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const std::vector<std::string> fields = splitNmcliFields(line);
    Sighting_t sighting;
    if (fields.size() != kFieldCount || !parseInt(fields[2], sighting.attributes.channel) ||
        !parseInt(fields[3], sighting.attributes.signal)) {
      if (auto logger = Logger::GetClass("NmcliScanSource")) {
        logger->warn("Skipping malformed nmcli line {}: '{}'", lineNumber, line);
      }
      continue;
    }
    sighting.deviceId = normalizeDeviceId(fields[0]);
    if (sighting.deviceId.empty()) {
      continue;
    }
    sighting.attributes.ssid = fields[1];
    sighting.attributes.security = fields[4];
    snapshot.sightings.push_back(std::move(sighting));
  }
  return snapshot;
}

NmcliScanSource::NmcliScanSource(std::shared_ptr<IClock> clockInput,
                                 std::string interfaceNameInput,
                                 int timeoutSecondsInput,
                                 std::string command)
    : clock(std::move(clockInput)),
      interfaceName(std::move(interfaceNameInput)),
      timeoutSeconds(timeoutSecondsInput),
      commandLine(std::move(command)) {
  if (!clock) {
    throw PreconditionError("NmcliScanSource requires a clock");
  }
  if (timeoutSeconds <= 0) {
    throw PreconditionError(fmt::format("scan timeout must be positive, got {}", timeoutSeconds));
  }
  if (commandLine.empty()) {
    commandLine = fmt::format(
        "timeout -k 1 {} nmcli -t -f BSSID,SSID,CHAN,SIGNAL,SECURITY device wifi list --rescan yes",
        timeoutSeconds);
    if (!interfaceName.empty()) {
      commandLine += " ifname " + shellQuote(interfaceName);
    }
  }
  if (auto logger = Logger::GetClass("NmcliScanSource")) {
    logger->info("NmcliScanSource using '{}'", commandLine);
  }
}

bool NmcliScanSource::next(Snapshot_t& out) {
  FILE* pipe = popen(commandLine.c_str(), "r");
  if (pipe == nullptr) {
    throw ScanUnavailableError("failed to launch scan command: " + commandLine);
  }

  std::string output;
  std::array<char, 4096> buffer{};
  std::size_t count = 0;
  while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), count);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    throw ScanUnavailableError("failed to collect nmcli status");
  }
  if (!WIFEXITED(status)) {
    throw ScanUnavailableError("scan command terminated abnormally");
  }
  const int exitStatus = WEXITSTATUS(status);
  if (exitStatus == kTimeoutExitCode) {
    throw ScanUnavailableError(fmt::format("wifi scan timed out after {}s", timeoutSeconds));
  }
  if (exitStatus != 0) {
    throw ScanUnavailableError(fmt::format("scan command exited with status {}", exitStatus));
  }

  out = parseNmcliTerse(output, clock->now());
  if (auto logger = Logger::GetClass("NmcliScanSource")) {
    logger->debug("Scan at {:.3f} returned {} networks", out.time, out.sightings.size());
  }
  return true;
}

} // namespace wifitrack
