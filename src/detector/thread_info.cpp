#include "detector/thread_info.hpp"

#include "core/json_utils.hpp"

#include <sstream>

namespace stallwatch::detector {

CaptureStatus CaptureThreadInfo(const ThreadRef& thread, StackSampler& sampler, ThreadInfo& info,
                                std::string& error) {
  info.name = thread.name;
  info.group_name = thread.group_name;
  info.id = static_cast<std::int64_t>(thread.tid);
  info.priority = thread.priority;

  const CaptureStatus status = sampler.Capture(thread.tid, info.stack_trace, error);
  if (status != CaptureStatus::kCaptured) {
    info.stack_trace.clear();
  }
  return status;
}

std::string Describe(const ThreadInfo& info) {
  std::ostringstream out;
  out << "Stack trace of thread '" << info.name << "' (id: " << info.id << ", group: '"
      << info.group_name << "').";
  return out.str();
}

std::string ToString(const ThreadInfo& info) {
  std::ostringstream out;
  out << info;
  return out.str();
}

std::string ToJson(const ThreadInfo& info) {
  std::ostringstream out;
  out << "{\"name\":";
  core::WriteJsonString(out, info.name);
  out << ",\"group\":";
  core::WriteJsonString(out, info.group_name);
  out << ",\"id\":" << info.id << ",\"priority\":" << info.priority << ",\"stack_trace\":";
  core::WriteJsonStringArray(out, info.stack_trace);
  out << '}';
  return out.str();
}

std::ostream& operator<<(std::ostream& out, const ThreadInfo& info) {
  out << Describe(info);
  for (const auto& frame : info.stack_trace) {
    out << "\n    at " << frame;
  }
  return out;
}

} // namespace stallwatch::detector
