#pragma once

namespace stallwatch::core::errors {

// Process-exit contract for the `stallwatch` CLI.
//
// - 0 success, no stall observed
// - 1 generic command failure
// - 2 usage/argument failure
// - 30 the demo run observed at least one blocked-thread detection
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kStallDetected = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace stallwatch::core::errors
