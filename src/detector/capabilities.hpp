#pragma once

#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace stallwatch::detector {

class BlockedThreadDetector;
struct BlockedThreadEvent;

// Identity and metadata of one live thread, as seen when the thread list was
// enumerated. The thread may exit at any point after this was produced.
struct ThreadRef {
  pid_t tid = 0;
  std::string name;
  std::string group_name;

  // Scheduling nice value (lower means higher priority).
  int priority = 0;

  // True for threads registered as background helpers (library workers, pools
  // that should never appear in a report by default).
  bool background = false;
};

// Submits work onto the monitored context (UI loop, event loop, worker pool).
//
// Contract:
// - enqueue only; must not run `task` inline on the calling thread
// - may drop the task only when the monitored context is permanently gone
class ITaskPoster {
public:
  virtual ~ITaskPoster() = default;

  virtual void Post(std::function<void()> task) = 0;
};

// Returns the threads to snapshot when a blocked context is reported. The
// returned order is kept in the final event.
class IThreadProvider {
public:
  virtual ~IThreadProvider() = default;

  virtual bool ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) = 0;
};

class IThreadFilter {
public:
  virtual ~IThreadFilter() = default;

  virtual bool IsAllowed(const ThreadRef& thread) const = 0;
};

// Runtime condition under which blocking must not be reported (for example a
// debugger holding the process). Read once per inspection tick from the
// inspector thread.
class IDetectionExemption {
public:
  virtual ~IDetectionExemption() = default;

  virtual bool IsExemptionActive() const = 0;
};

// Receives detection events on the detector's reporter thread. A slow listener
// delays later reports but never inspection.
class IBlockedThreadListener {
public:
  virtual ~IBlockedThreadListener() = default;

  virtual void OnBlockedThreadDetected(BlockedThreadDetector& detector,
                                       const BlockedThreadEvent& event) = 0;
};

} // namespace stallwatch::detector
