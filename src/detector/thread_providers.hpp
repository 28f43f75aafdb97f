#pragma once

#include "detector/capabilities.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace stallwatch::detector {

// Every live thread of this process, sorted by kernel tid ascending.
//
// Threads come from `/proc/self/task`. Names and groups come from the
// `ThreadRegistry` when the thread registered a tag, otherwise from the kernel
// thread name and `kDefaultThreadGroup`. A thread that exits while its metadata
// is read is left out.
class ActiveThreadProvider : public IThreadProvider {
public:
  ActiveThreadProvider() = default;

  // Enumerates `task_dir` instead of `/proc/self/task`.
  explicit ActiveThreadProvider(std::filesystem::path task_dir);

  bool ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) override;

private:
  std::filesystem::path task_dir_ = "/proc/self/task";
};

// Live threads narrowed by a filter; provider order is kept.
class FilteredThreadProvider final : public ActiveThreadProvider {
public:
  explicit FilteredThreadProvider(std::shared_ptr<IThreadFilter> filter);

  bool ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) override;

private:
  std::shared_ptr<IThreadFilter> filter_;
};

// Always returns the same threads, in the given order.
class PredefinedThreadProvider final : public IThreadProvider {
public:
  explicit PredefinedThreadProvider(std::vector<ThreadRef> threads);

  bool ProvideThreads(std::vector<ThreadRef>& threads, std::string& error) override;

private:
  std::vector<ThreadRef> threads_;
};

// Builds a `ThreadRef` for one thread of this process, or nullopt when the
// thread no longer exists.
std::optional<ThreadRef> DescribeThread(pid_t tid);

} // namespace stallwatch::detector
