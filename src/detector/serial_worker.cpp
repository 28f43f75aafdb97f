#include "detector/serial_worker.hpp"

#include "detector/thread_registry.hpp"

#include <exception>
#include <utility>

namespace stallwatch::detector {

SerialWorker::SerialWorker(std::string thread_name, std::shared_ptr<core::logging::Logger> logger)
    : name_(std::move(thread_name)), logger_(std::move(logger)) {
  thread_ = std::thread(&SerialWorker::Run, this);
}

SerialWorker::~SerialWorker() {
  Shutdown();
}

void SerialWorker::Submit(Task task) {
  Entry entry;
  entry.due = Clock::now();
  entry.task = std::move(task);
  Enqueue(std::move(entry));
}

std::shared_ptr<ScheduledTask> SerialWorker::ScheduleWithFixedDelay(
    Task task, std::chrono::milliseconds initial_delay, std::chrono::milliseconds delay) {
  auto handle = std::make_shared<ScheduledTask>();

  Entry entry;
  entry.due = Clock::now() + initial_delay;
  entry.task = std::move(task);
  entry.handle = handle;
  entry.delay = delay;

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return nullptr;
    }
    entry.seq = next_seq_++;
    queue_.push(std::move(entry));
  }
  cv_.notify_all();
  return handle;
}

void SerialWorker::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
}

SerialWorker::Snapshot SerialWorker::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .tasks_run = tasks_run_,
      .tasks_failed = tasks_failed_,
      .tasks_pending = queue_.size(),
  };
}

void SerialWorker::Enqueue(Entry entry) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return;
    }
    entry.seq = next_seq_++;
    queue_.push(std::move(entry));
  }
  cv_.notify_all();
}

void SerialWorker::Run() {
  const ScopedThreadTag tag({
      .name = name_,
      .group_name = std::string(kLibraryThreadGroup),
      .background = true,
  });

  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    if (queue_.empty()) {
      if (stopping_) {
        break;
      }
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      continue;
    }

    const Clock::time_point due = queue_.top().due;
    if (due > Clock::now()) {
      // Delayed and periodic runs that are not due yet are dropped on shutdown.
      if (stopping_) {
        break;
      }
      cv_.wait_until(lock, due);
      continue;
    }

    Entry entry = queue_.top();
    queue_.pop();
    if (entry.handle != nullptr && entry.handle->cancelled()) {
      continue;
    }

    lock.unlock();
    Execute(entry);
    lock.lock();

    if (entry.handle != nullptr && !entry.handle->cancelled() && !stopping_) {
      entry.due = Clock::now() + entry.delay;
      entry.seq = next_seq_++;
      queue_.push(std::move(entry));
    }
  }
}

void SerialWorker::Execute(Entry& entry) {
  bool failed = false;
  try {
    entry.task();
  } catch (const std::exception& ex) {
    failed = true;
    if (logger_ != nullptr) {
      logger_->Error("background task failed", {{"worker", name_}, {"error", ex.what()}});
    }
  } catch (...) {
    failed = true;
    if (logger_ != nullptr) {
      logger_->Error("background task failed", {{"worker", name_}, {"error", "non-standard exception"}});
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  ++tasks_run_;
  if (failed) {
    ++tasks_failed_;
  }
}

} // namespace stallwatch::detector
