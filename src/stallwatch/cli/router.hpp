#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stallwatch::cli {

// Options of `stallwatch demo`. The demo runs a task loop on the main thread,
// lets it idle for `healthy_ms`, then posts one task that sleeps `block_ms`.
struct DemoOptions {
  std::chrono::milliseconds threshold{1'000};
  std::optional<std::chrono::milliseconds> inspection_interval;
  std::chrono::milliseconds start_delay{0};
  std::chrono::milliseconds healthy{300};
  std::chrono::milliseconds block{1'500};
  std::chrono::milliseconds duration{3'000};
  bool json = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses `demo` arguments. Unknown flags, missing values and non-integer
// durations are usage errors. Range checks are left to the detector so
// configuration errors surface with its messages.
bool ParseDemoOptions(const std::vector<std::string_view>& args, DemoOptions& options,
                      std::string& error);

// Runs the demo and returns an exit code (30 when a stall was detected).
int ExecuteDemo(const DemoOptions& options);

// Routes `stallwatch` subcommands:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error
//   30 => demo observed a blocked monitored context
int Dispatch(int argc, char** argv);

} // namespace stallwatch::cli
