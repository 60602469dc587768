#pragma once

#include "wifitrack/data/Snapshot.hpp"

namespace wifitrack {

// Produces one snapshot per call. Returns false once exhausted; acquisition
// failures throw ScanUnavailableError.
class IScanSource {
public:
  virtual ~IScanSource() = default;
  virtual bool next(Snapshot_t& out) = 0;
};

} // namespace wifitrack
