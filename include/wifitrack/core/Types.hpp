#pragma once

namespace wifitrack {
// Seconds on a monotonic timeline.
using Timestamp = double;
using Seconds = double;
} // namespace wifitrack
