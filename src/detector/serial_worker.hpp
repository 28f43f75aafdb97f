#pragma once

#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace stallwatch::detector {

// Handle for a periodic task scheduled on a `SerialWorker`.
class ScheduledTask {
public:
  // Prevents future runs. A run that already started is not interrupted.
  void Cancel() {
    cancelled_.store(true);
  }

  bool cancelled() const {
    return cancelled_.load();
  }

private:
  std::atomic<bool> cancelled_{false};
};

// One background thread executing submitted and scheduled tasks strictly one
// at a time.
//
// Contract:
// - tasks due at the same time run in submission order
// - periodic tasks use fixed-delay semantics: the next run is due `delay`
//   after the previous run finished
// - an exception escaping a task is logged and does not stop the worker; a
//   periodic task that throws is still rescheduled
// - the worker thread is tagged in the `ThreadRegistry` with the library group
class SerialWorker {
public:
  using Task = std::function<void()>;

  SerialWorker(std::string thread_name, std::shared_ptr<core::logging::Logger> logger);
  ~SerialWorker();

  SerialWorker(const SerialWorker&) = delete;
  SerialWorker& operator=(const SerialWorker&) = delete;

  // Queues `task` to run as soon as the worker is free. Ignored after Shutdown.
  void Submit(Task task);

  // Runs `task` first after `initial_delay`, then `delay` after each run
  // completes, until the returned handle is cancelled. Returns nullptr after
  // Shutdown.
  std::shared_ptr<ScheduledTask> ScheduleWithFixedDelay(Task task,
                                                        std::chrono::milliseconds initial_delay,
                                                        std::chrono::milliseconds delay);

  // Runs the tasks that are already due, then stops and joins the thread.
  // Pending delayed and periodic runs are discarded. Safe to call repeatedly,
  // but never from a task running on this worker.
  void Shutdown();

  const std::string& name() const {
    return name_;
  }

  struct Snapshot {
    std::uint64_t tasks_run = 0;
    std::uint64_t tasks_failed = 0;
    std::size_t tasks_pending = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Clock::time_point due{};
    std::uint64_t seq = 0;
    Task task;
    std::shared_ptr<ScheduledTask> handle;
    std::chrono::milliseconds delay{0};
  };

  struct EntryLater {
    bool operator()(const Entry& lhs, const Entry& rhs) const {
      if (lhs.due != rhs.due) {
        return lhs.due > rhs.due;
      }
      return lhs.seq > rhs.seq;
    }
  };

  void Run();
  void Enqueue(Entry entry);
  void Execute(Entry& entry);

  std::string name_;
  std::shared_ptr<core::logging::Logger> logger_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::priority_queue<Entry, std::vector<Entry>, EntryLater> queue_;
  std::uint64_t next_seq_ = 0;
  bool stopping_ = false;
  std::uint64_t tasks_run_ = 0;
  std::uint64_t tasks_failed_ = 0;

  std::thread thread_;
};

} // namespace stallwatch::detector
