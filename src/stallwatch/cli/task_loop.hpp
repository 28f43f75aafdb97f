#pragma once

#include "detector/capabilities.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace stallwatch::cli {

// Minimal single-consumer task loop used as the monitored context of the demo
// command. Any thread may post; tasks run on the thread calling RunUntil.
class TaskLoop {
public:
  void Post(std::function<void()> task);

  // Runs posted tasks on the calling thread until `deadline` passes. A task
  // that blocks past the deadline is not interrupted. Returns the number of
  // tasks executed.
  std::size_t RunUntil(std::chrono::steady_clock::time_point deadline);

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
};

class TaskLoopPoster final : public detector::ITaskPoster {
public:
  explicit TaskLoopPoster(std::shared_ptr<TaskLoop> loop);

  void Post(std::function<void()> task) override;

private:
  std::shared_ptr<TaskLoop> loop_;
};

} // namespace stallwatch::cli
