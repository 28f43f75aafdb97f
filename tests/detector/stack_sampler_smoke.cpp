#include "detector/stack_sampler.hpp"
#include "detector/thread_registry.hpp"

#include "../common/assertions.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <pthread.h>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using std::chrono::milliseconds;
using stallwatch::detector::CaptureStatus;
using stallwatch::detector::StackSampler;
using stallwatch::tests::common::Fail;

// External linkage so the symbol is exported and shows up by name in frames.
__attribute__((noinline)) void StallwatchSmokeParkedBody(std::atomic<pid_t>& tid,
                                                         std::atomic<bool>& release) {
  tid.store(stallwatch::detector::CurrentThreadId());
  while (!release.load()) {
    std::this_thread::sleep_for(milliseconds(1));
  }
}

namespace {

bool AnyFrameContains(const std::vector<std::string>& frames, std::string_view needle) {
  for (const auto& frame : frames) {
    if (frame.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void WaitForTid(const std::atomic<pid_t>& tid) {
  if (!stallwatch::tests::common::WaitUntil([&] { return tid.load() != 0; },
                                            milliseconds(5'000))) {
    Fail("helper thread did not start");
  }
}

void CapturesCallingThread() {
  std::vector<std::string> frames;
  std::string error;
  if (StackSampler::Instance().Capture(stallwatch::detector::CurrentThreadId(), frames, error) !=
      CaptureStatus::kCaptured) {
    Fail("capturing the calling thread failed: " + error);
  }
  if (frames.empty()) {
    Fail("calling thread stack should not be empty");
  }
  if (!AnyFrameContains(frames, "main")) {
    Fail("calling thread stack should reach main");
  }
}

void CapturesParkedThreadByName() {
  std::atomic<pid_t> tid{0};
  std::atomic<bool> release{false};
  std::thread parked([&] { StallwatchSmokeParkedBody(tid, release); });
  WaitForTid(tid);

  const auto before = StackSampler::Instance().DebugSnapshot();
  std::vector<std::string> frames;
  std::string error;
  const CaptureStatus status = StackSampler::Instance().Capture(tid.load(), frames, error);
  release.store(true);
  parked.join();

  if (status != CaptureStatus::kCaptured) {
    Fail("capturing a parked thread failed: " + error);
  }
  if (!AnyFrameContains(frames, "StallwatchSmokeParkedBody")) {
    Fail("parked thread stack should contain its body function");
  }
  const auto after = StackSampler::Instance().DebugSnapshot();
  if (after.captures_completed != before.captures_completed + 1U) {
    Fail("completed capture was not counted");
  }
}

void ExitedThreadIsReportedGone() {
  std::atomic<pid_t> tid{0};
  std::thread short_lived([&] { tid.store(stallwatch::detector::CurrentThreadId()); });
  short_lived.join();

  const auto before = StackSampler::Instance().DebugSnapshot();
  std::vector<std::string> frames;
  std::string error;
  if (StackSampler::Instance().Capture(tid.load(), frames, error) != CaptureStatus::kThreadGone) {
    Fail("capturing an exited thread should report it gone");
  }
  if (!frames.empty()) {
    Fail("failed capture should leave frames empty");
  }
  stallwatch::tests::common::AssertContains(error, "no longer exists");
  if (StackSampler::Instance().DebugSnapshot().threads_gone != before.threads_gone + 1U) {
    Fail("exited thread was not counted");
  }
}

void ThreadBlockingSignalFailsWithoutWaiting() {
  std::atomic<pid_t> tid{0};
  std::atomic<bool> release{false};
  std::thread deaf([&] {
    // Blocks every real-time signal so the capture request could never be handled.
    sigset_t blocked;
    sigemptyset(&blocked);
    for (int signo = SIGRTMIN; signo <= SIGRTMAX; ++signo) {
      sigaddset(&blocked, signo);
    }
    pthread_sigmask(SIG_BLOCK, &blocked, nullptr);
    StallwatchSmokeParkedBody(tid, release);
  });
  WaitForTid(tid);

  StackSampler& sampler = StackSampler::Instance();
  const milliseconds previous_timeout = sampler.timeout();
  sampler.SetTimeout(milliseconds(2'000));

  const auto before = sampler.DebugSnapshot();
  std::vector<std::string> frames;
  std::string error;
  const auto started = std::chrono::steady_clock::now();
  const CaptureStatus status = sampler.Capture(tid.load(), frames, error);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  sampler.SetTimeout(previous_timeout);

  if (status != CaptureStatus::kFailed) {
    Fail("capture of a thread blocking the signal should fail");
  }
  if (!frames.empty()) {
    Fail("failed capture should leave frames empty");
  }
  stallwatch::tests::common::AssertContains(error, "blocks the stack capture signal");
  if (elapsed >= milliseconds(1'000)) {
    Fail("blocked signal should be detected without waiting for the timeout");
  }
  const auto after = sampler.DebugSnapshot();
  if (after.signal_blocked != before.signal_blocked + 1U) {
    Fail("blocked signal was not counted");
  }
  if (after.captures_timed_out != before.captures_timed_out) {
    Fail("blocked signal should not count as a timeout");
  }

  // The slot must be free again: the next capture of a responsive thread works.
  release.store(true);
  deaf.join();
  std::atomic<pid_t> next_tid{0};
  std::atomic<bool> next_release{false};
  std::thread parked([&] { StallwatchSmokeParkedBody(next_tid, next_release); });
  WaitForTid(next_tid);
  const CaptureStatus next_status = sampler.Capture(next_tid.load(), frames, error);
  next_release.store(true);
  parked.join();
  if (next_status != CaptureStatus::kCaptured) {
    Fail("capture after a blocked thread failed: " + error);
  }
}

void RepeatedCapturesKeepThreadsApart() {
  std::atomic<pid_t> first_tid{0};
  std::atomic<pid_t> second_tid{0};
  std::atomic<bool> release{false};
  std::thread first([&] { StallwatchSmokeParkedBody(first_tid, release); });
  std::thread second([&] { StallwatchSmokeParkedBody(second_tid, release); });
  WaitForTid(first_tid);
  WaitForTid(second_tid);

  // Alternating targets: each result must come from the thread it was asked of.
  std::string failure;
  for (int round = 0; round < 50 && failure.empty(); ++round) {
    const pid_t target = (round % 2 == 0) ? first_tid.load() : second_tid.load();
    std::vector<std::string> frames;
    std::string error;
    if (StackSampler::Instance().Capture(target, frames, error) != CaptureStatus::kCaptured) {
      failure = "capture round " + std::to_string(round) + " failed: " + error;
    } else if (!AnyFrameContains(frames, "StallwatchSmokeParkedBody")) {
      failure = "capture round " + std::to_string(round) + " returned a foreign stack";
    }
  }
  release.store(true);
  first.join();
  second.join();
  if (!failure.empty()) {
    Fail(failure);
  }
}

void RejectsInvalidThreadId() {
  std::vector<std::string> frames;
  std::string error;
  if (StackSampler::Instance().Capture(0, frames, error) != CaptureStatus::kFailed) {
    Fail("tid 0 should be rejected");
  }
  stallwatch::tests::common::AssertContains(error, "invalid thread id");
}

} // namespace

int main() {
  CapturesCallingThread();
  CapturesParkedThreadByName();
  ExitedThreadIsReportedGone();
  ThreadBlockingSignalFailsWithoutWaiting();
  RepeatedCapturesKeepThreadsApart();
  RejectsInvalidThreadId();
  return 0;
}
