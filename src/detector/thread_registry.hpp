#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace stallwatch::detector {

// Group assigned to every worker thread created by the detector.
inline constexpr std::string_view kLibraryThreadGroup = "stallwatch";

// Group reported for threads that never registered a tag.
inline constexpr std::string_view kDefaultThreadGroup = "default";

struct ThreadTag {
  std::string name;
  std::string group_name;
  bool background = false;
};

// Kernel thread id of the calling thread.
pid_t CurrentThreadId();

// Process-wide map from kernel tid to caller-supplied tag.
//
// The thread providers join this with `/proc/self/task` so filters can tell
// library workers and background helpers apart from application threads.
class ThreadRegistry {
public:
  static ThreadRegistry& Instance();

  ThreadRegistry(const ThreadRegistry&) = delete;
  ThreadRegistry& operator=(const ThreadRegistry&) = delete;

  void Register(pid_t tid, ThreadTag tag);
  void Unregister(pid_t tid);
  std::optional<ThreadTag> Lookup(pid_t tid) const;

private:
  ThreadRegistry() = default;

  mutable std::mutex mu_;
  std::map<pid_t, ThreadTag> tags_;
};

// Tags the calling thread for the lifetime of this object. Also sets the
// kernel thread name when `tag.name` is not empty.
class ScopedThreadTag {
public:
  explicit ScopedThreadTag(ThreadTag tag);
  ~ScopedThreadTag();

  ScopedThreadTag(const ScopedThreadTag&) = delete;
  ScopedThreadTag& operator=(const ScopedThreadTag&) = delete;

private:
  pid_t tid_ = 0;
};

} // namespace stallwatch::detector
