#include "detector/thread_providers.hpp"

#include "detector/thread_registry.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <sys/resource.h>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace stallwatch::detector {

namespace {

std::optional<pid_t> ParseTid(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  pid_t tid = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), tid);
  if (ec != std::errc() || ptr != text.data() + text.size() || tid <= 0) {
    return std::nullopt;
  }
  return tid;
}

// getpriority() takes a tid for PRIO_PROCESS on Linux and reports the
// per-thread nice value. -1 is a valid result, so errno tells failures apart.
int ReadNiceValue(pid_t tid) {
  errno = 0;
  const int nice_value = getpriority(PRIO_PROCESS, static_cast<id_t>(tid));
  if (nice_value == -1 && errno != 0) {
    return 0;
  }
  return nice_value;
}

std::optional<ThreadRef> DescribeThreadIn(const fs::path& task_dir, pid_t tid) {
  std::ifstream comm(task_dir / std::to_string(tid) / "comm");
  if (!comm) {
    return std::nullopt;
  }
  std::string kernel_name;
  std::getline(comm, kernel_name);
  if (!comm && !comm.eof()) {
    return std::nullopt;
  }

  ThreadRef ref;
  ref.tid = tid;
  ref.priority = ReadNiceValue(tid);
  if (const auto tag = ThreadRegistry::Instance().Lookup(tid); tag.has_value()) {
    ref.name = tag->name.empty() ? kernel_name : tag->name;
    ref.group_name = tag->group_name.empty() ? std::string(kDefaultThreadGroup) : tag->group_name;
    ref.background = tag->background;
  } else {
    ref.name = kernel_name;
    ref.group_name = std::string(kDefaultThreadGroup);
  }
  return ref;
}

} // namespace

ActiveThreadProvider::ActiveThreadProvider(fs::path task_dir) : task_dir_(std::move(task_dir)) {}

bool ActiveThreadProvider::ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) {
  threads.clear();
  error.clear();

  std::error_code ec;
  fs::directory_iterator it(task_dir_, ec);
  if (ec) {
    error = "unable to enumerate threads in " + task_dir_.string() + ": " + ec.message();
    return false;
  }

  std::vector<pid_t> tids;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (const auto tid = ParseTid(it->path().filename().string()); tid.has_value()) {
      tids.push_back(tid.value());
    }
  }
  if (ec) {
    error = "thread enumeration failed in " + task_dir_.string() + ": " + ec.message();
    return false;
  }
  std::sort(tids.begin(), tids.end());

  threads.reserve(tids.size());
  for (const pid_t tid : tids) {
    // Threads may exit between listing and reading their metadata.
    if (auto ref = DescribeThreadIn(task_dir_, tid); ref.has_value()) {
      threads.push_back(std::move(ref.value()));
    }
  }
  return true;
}

FilteredThreadProvider::FilteredThreadProvider(std::shared_ptr<IThreadFilter> filter)
    : filter_(std::move(filter)) {}

bool FilteredThreadProvider::ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) {
  std::vector<ThreadRef> active;
  if (!ActiveThreadProvider::ProvideThreads(active, error)) {
    threads.clear();
    return false;
  }

  threads.clear();
  threads.reserve(active.size());
  for (auto& thread : active) {
    if (filter_ == nullptr || filter_->IsAllowed(thread)) {
      threads.push_back(std::move(thread));
    }
  }
  return true;
}

PredefinedThreadProvider::PredefinedThreadProvider(std::vector<ThreadRef> threads)
    : threads_(std::move(threads)) {}

bool PredefinedThreadProvider::ProvideThreads(std::vector<ThreadRef>& threads,
                                              std::string& error) {
  error.clear();
  threads = threads_;
  return true;
}

std::optional<ThreadRef> DescribeThread(pid_t tid) {
  return DescribeThreadIn("/proc/self/task", tid);
}

} // namespace stallwatch::detector
