#pragma once

#include "detector/thread_info.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace stallwatch::detector {

// One detection: how long the monitored context was blocked (as measured by
// the inspection accumulator) and the stacks of the threads selected by the
// thread provider, in provider order. Never mutated after construction.
struct BlockedThreadEvent {
  BlockedThreadEvent(std::chrono::milliseconds blocked_duration,
                     std::vector<ThreadInfo> thread_infos);

  const std::chrono::milliseconds blocked_duration;
  const std::vector<ThreadInfo> thread_infos;
};

// Summary line, e.g. `The monitored thread was blocked for at least 1000 ms (2 threads captured).`
std::string Describe(const BlockedThreadEvent& event);

// Summary line followed by every thread snapshot.
std::string ToString(const BlockedThreadEvent& event);

// Single-line JSON document:
// {"blocked_ms":1000,"threads":[{"name":...,"stack_trace":[...]},...]}
std::string ToJson(const BlockedThreadEvent& event);

std::ostream& operator<<(std::ostream& out, const BlockedThreadEvent& event);

} // namespace stallwatch::detector
