#include "detector/blocked_thread_event.hpp"

#include <sstream>
#include <utility>

namespace stallwatch::detector {

BlockedThreadEvent::BlockedThreadEvent(std::chrono::milliseconds blocked_duration,
                                       std::vector<ThreadInfo> thread_infos)
    : blocked_duration(blocked_duration), thread_infos(std::move(thread_infos)) {}

std::string Describe(const BlockedThreadEvent& event) {
  std::ostringstream out;
  out << "The monitored thread was blocked for at least " << event.blocked_duration.count()
      << " ms (" << event.thread_infos.size()
      << (event.thread_infos.size() == 1U ? " thread" : " threads") << " captured).";
  return out.str();
}

std::string ToString(const BlockedThreadEvent& event) {
  std::ostringstream out;
  out << event;
  return out.str();
}

std::string ToJson(const BlockedThreadEvent& event) {
  std::ostringstream out;
  out << "{\"blocked_ms\":" << event.blocked_duration.count() << ",\"threads\":[";
  bool first = true;
  for (const auto& info : event.thread_infos) {
    if (!first) {
      out << ',';
    }
    out << ToJson(info);
    first = false;
  }
  out << "]}";
  return out.str();
}

std::ostream& operator<<(std::ostream& out, const BlockedThreadEvent& event) {
  out << Describe(event);
  for (const auto& info : event.thread_infos) {
    out << '\n' << info;
  }
  return out;
}

} // namespace stallwatch::detector
