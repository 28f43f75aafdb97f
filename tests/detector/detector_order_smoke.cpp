#include "detector/blocked_thread_detector.hpp"
#include "detector/thread_filters.hpp"
#include "detector/thread_providers.hpp"
#include "detector/thread_registry.hpp"

#include "../common/assertions.hpp"
#include "../common/fake_capabilities.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using std::chrono::milliseconds;
using stallwatch::detector::ThreadRef;
using stallwatch::tests::common::Fail;

namespace {

// A tagged thread that waits until released, so its stack can be sampled.
class ParkedThread {
public:
  explicit ParkedThread(std::string name) {
    thread_ = std::thread([this, name = std::move(name)] {
      const stallwatch::detector::ScopedThreadTag tag({.name = name, .group_name = "parked"});
      std::unique_lock<std::mutex> lock(mu_);
      tid_ = stallwatch::detector::CurrentThreadId();
      cv_.notify_all();
      cv_.wait(lock, [this] { return released_; });
    });

    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return tid_ != 0; });
  }

  ~ParkedThread() {
    Release();
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      released_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  pid_t tid() const {
    return tid_;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  pid_t tid_ = 0;
  bool released_ = false;
  std::thread thread_;
};

ThreadRef MustDescribe(pid_t tid) {
  const auto ref = stallwatch::detector::DescribeThread(tid);
  if (!ref.has_value()) {
    Fail("thread " + std::to_string(tid) + " is missing from /proc/self/task");
  }
  return ref.value();
}

void ReportKeepsProviderOrderAndDropsExitedThreads() {
  ParkedThread zeta("parked-zeta");
  ParkedThread alpha("parked-alpha");

  ParkedThread gone("parked-gone");
  const ThreadRef gone_ref = MustDescribe(gone.tid());
  gone.Release();

  // Deliberately not sorted by name or tid.
  const std::vector<ThreadRef> threads = {MustDescribe(zeta.tid()), gone_ref,
                                          MustDescribe(alpha.tid())};

  auto poster = std::make_shared<stallwatch::tests::common::ManualPoster>();
  auto listener = std::make_shared<stallwatch::tests::common::RecordingListener>();

  stallwatch::detector::DetectorDependencies dependencies;
  dependencies.poster = poster;
  dependencies.thread_provider =
      std::make_shared<stallwatch::detector::PredefinedThreadProvider>(threads);
  dependencies.listener = listener;

  std::string error;
  auto detector = stallwatch::detector::BlockedThreadDetector::Create(
      std::move(dependencies),
      stallwatch::detector::DetectorOptions{.threshold = milliseconds(100),
                                            .inspection_interval = milliseconds(100)},
      error);
  if (detector == nullptr) {
    Fail("detector creation failed: " + error);
  }

  detector->DebugInspectOnce();
  detector->DebugInspectOnce();
  if (!listener->WaitForEvents(1U, milliseconds(5'000))) {
    Fail("no report delivered");
  }

  const auto event = listener->events().front();
  if (event.thread_names != std::vector<std::string>{"parked-zeta", "parked-alpha"}) {
    std::cerr << "unexpected thread order:";
    for (const auto& name : event.thread_names) {
      std::cerr << ' ' << name;
    }
    std::cerr << '\n';
    std::abort();
  }
  for (const std::size_t frames : event.frame_counts) {
    if (frames == 0U) {
      Fail("every reported thread should carry frames");
    }
  }
  stallwatch::tests::common::AssertContains(event.text, "group: 'parked'");
  stallwatch::tests::common::AssertContains(event.text, "(2 threads captured)");
  if (detector->DebugSnapshot().threads_omitted != 0U) {
    Fail("an exited thread is dropped, not counted as a failed capture");
  }
}

void DefaultProviderHidesLibraryWorkers() {
  ParkedThread app("parked-app");

  auto listener = std::make_shared<stallwatch::tests::common::RecordingListener>();

  stallwatch::detector::DetectorDependencies dependencies;
  dependencies.poster = std::make_shared<stallwatch::tests::common::ManualPoster>();
  dependencies.thread_provider = std::make_shared<stallwatch::detector::FilteredThreadProvider>(
      std::make_shared<stallwatch::detector::BackgroundThreadFilter>());
  dependencies.listener = listener;

  std::string error;
  auto detector = stallwatch::detector::BlockedThreadDetector::Create(
      std::move(dependencies),
      stallwatch::detector::DetectorOptions{.threshold = milliseconds(100),
                                            .inspection_interval = milliseconds(100)},
      error);
  if (detector == nullptr) {
    Fail("detector creation failed: " + error);
  }

  detector->DebugInspectOnce();
  detector->DebugInspectOnce();
  if (!listener->WaitForEvents(1U, milliseconds(5'000))) {
    Fail("no report delivered");
  }

  const auto event = listener->events().front();
  stallwatch::tests::common::AssertContains(event.text, "'parked-app'");
  stallwatch::tests::common::AssertNotContains(event.text, "sw-inspector");
  stallwatch::tests::common::AssertNotContains(event.text, "sw-reporter");

  // Live threads are enumerated by ascending tid.
  for (std::size_t i = 1; i < event.thread_ids.size(); ++i) {
    if (event.thread_ids[i - 1U] >= event.thread_ids[i]) {
      Fail("active threads should be reported in ascending tid order");
    }
  }
}

} // namespace

int main() {
  ReportKeepsProviderOrderAndDropsExitedThreads();
  DefaultProviderHidesLibraryWorkers();
  return 0;
}
