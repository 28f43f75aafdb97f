#pragma once

#include "detector/capabilities.hpp"
#include "detector/stack_sampler.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace stallwatch::detector {

// Immutable snapshot of one thread at detection time.
struct ThreadInfo {
  std::string name;
  std::string group_name;
  std::int64_t id = 0;
  int priority = 0;

  // Innermost frame first. Empty when the thread could not be sampled.
  std::vector<std::string> stack_trace;
};

// Copies the identity of `thread` into `info` and samples its stack.
// Unless kCaptured is returned, `info.stack_trace` is empty and `error` says
// why; callers drop such snapshots.
CaptureStatus CaptureThreadInfo(const ThreadRef& thread, StackSampler& sampler, ThreadInfo& info,
                                std::string& error);

// One-line heading, e.g. `Stack trace of thread 'main' (id: 42, group: 'default').`
std::string Describe(const ThreadInfo& info);

// Heading followed by one indented `at <frame>` line per frame.
std::string ToString(const ThreadInfo& info);
std::string ToJson(const ThreadInfo& info);

std::ostream& operator<<(std::ostream& out, const ThreadInfo& info);

} // namespace stallwatch::detector
