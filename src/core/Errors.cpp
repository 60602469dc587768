#include "wifitrack/core/Errors.hpp"

namespace wifitrack {

const char* toString(ErrorKind_e kind) {
  switch (kind) {
    case ErrorKind_e::kScanUnavailable:
      return "ScanUnavailable";
    case ErrorKind_e::kConfigInvalid:
      return "ConfigInvalid";
    case ErrorKind_e::kPersistenceFailure:
      return "PersistenceFailure";
    case ErrorKind_e::kPrecondition:
      return "Precondition";
  }
  return "Unknown";
}

int exitCode(ErrorKind_e kind) {
  switch (kind) {
    case ErrorKind_e::kScanUnavailable:
      return 2;
    case ErrorKind_e::kConfigInvalid:
      return 3;
    case ErrorKind_e::kPersistenceFailure:
      return 4;
    case ErrorKind_e::kPrecondition:
      return 5;
  }
  return 1;
}

Error::Error(ErrorKind_e kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind) {}

} // namespace wifitrack
