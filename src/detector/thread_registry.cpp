#include "detector/thread_registry.hpp"

#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <utility>

namespace stallwatch::detector {

namespace {

// Linux limits thread names to 15 characters plus the terminator.
constexpr std::size_t kMaxKernelThreadName = 15U;

} // namespace

pid_t CurrentThreadId() {
  return static_cast<pid_t>(::syscall(SYS_gettid));
}

ThreadRegistry& ThreadRegistry::Instance() {
  static ThreadRegistry registry;
  return registry;
}

void ThreadRegistry::Register(pid_t tid, ThreadTag tag) {
  std::lock_guard<std::mutex> lock(mu_);
  tags_[tid] = std::move(tag);
}

void ThreadRegistry::Unregister(pid_t tid) {
  std::lock_guard<std::mutex> lock(mu_);
  tags_.erase(tid);
}

std::optional<ThreadTag> ThreadRegistry::Lookup(pid_t tid) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = tags_.find(tid);
  if (it == tags_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ScopedThreadTag::ScopedThreadTag(ThreadTag tag) : tid_(CurrentThreadId()) {
  if (!tag.name.empty()) {
    const std::string kernel_name = tag.name.substr(0, kMaxKernelThreadName);
    // Naming is cosmetic (shows up in /proc and debuggers); the registry tag
    // is what the filters rely on.
    (void)pthread_setname_np(pthread_self(), kernel_name.c_str());
  }
  ThreadRegistry::Instance().Register(tid_, std::move(tag));
}

ScopedThreadTag::~ScopedThreadTag() {
  ThreadRegistry::Instance().Unregister(tid_);
}

} // namespace stallwatch::detector
