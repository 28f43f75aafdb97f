#pragma once

#include "detector/capabilities.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace stallwatch::detector {

// Active when any of the exemptions is active. Evaluation stops at the first
// active one, in list order. An empty list is never active.
class CombinedDetectionExemption final : public IDetectionExemption {
public:
  explicit CombinedDetectionExemption(std::vector<std::shared_ptr<IDetectionExemption>> exemptions);

  bool IsExemptionActive() const override;

private:
  std::vector<std::shared_ptr<IDetectionExemption>> exemptions_;
};

// Active while a tracer (gdb, lldb, strace) is attached to this process, so
// breakpoints do not produce blocked-thread reports.
class DebuggerAttachedExemption final : public IDetectionExemption {
public:
  DebuggerAttachedExemption() = default;

  // Reads the given status file instead of `/proc/self/status`.
  explicit DebuggerAttachedExemption(std::filesystem::path status_path);

  bool IsExemptionActive() const override;

private:
  std::filesystem::path status_path_ = "/proc/self/status";
};

// Returns the `TracerPid:` value from `/proc/<pid>/status` text, or nullopt
// when the field is missing or malformed.
std::optional<pid_t> ParseTracerPid(std::string_view status_text);

} // namespace stallwatch::detector
