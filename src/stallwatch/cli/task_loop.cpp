#include "stallwatch/cli/task_loop.hpp"

#include <utility>

namespace stallwatch::cli {

void TaskLoop::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::size_t TaskLoop::RunUntil(std::chrono::steady_clock::time_point deadline) {
  std::size_t executed = 0;
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (!cv_.wait_until(lock, deadline, [this] { return !tasks_.empty(); })) {
        return executed;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    task();
    ++executed;
  }
}

TaskLoopPoster::TaskLoopPoster(std::shared_ptr<TaskLoop> loop) : loop_(std::move(loop)) {}

void TaskLoopPoster::Post(std::function<void()> task) {
  loop_->Post(std::move(task));
}

} // namespace stallwatch::cli
