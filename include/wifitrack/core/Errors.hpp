#pragma once

#include <stdexcept>
#include <string>

namespace wifitrack {

enum class ErrorKind_e {
  kScanUnavailable,
  kConfigInvalid,
  kPersistenceFailure,
  kPrecondition
};

const char* toString(ErrorKind_e kind);

// Process exit code reported by the CLI for each error kind.
int exitCode(ErrorKind_e kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind_e kind, const std::string& message);

  ErrorKind_e kind() const { return errorKind; }

private:
  ErrorKind_e errorKind;
};

class ScanUnavailableError : public Error {
public:
  explicit ScanUnavailableError(const std::string& message)
      : Error(ErrorKind_e::kScanUnavailable, message) {}
};

class ConfigInvalidError : public Error {
public:
  explicit ConfigInvalidError(const std::string& message)
      : Error(ErrorKind_e::kConfigInvalid, message) {}
};

class PersistenceFailureError : public Error {
public:
  explicit PersistenceFailureError(const std::string& message)
      : Error(ErrorKind_e::kPersistenceFailure, message) {}
};

// Caller broke a tracker precondition (non-positive threshold, time going backwards).
class PreconditionError : public Error {
public:
  explicit PreconditionError(const std::string& message)
      : Error(ErrorKind_e::kPrecondition, message) {}
};

} // namespace wifitrack
