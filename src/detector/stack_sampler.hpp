#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace stallwatch::detector {

enum class CaptureStatus {
  kCaptured,
  // The thread exited; not an error for reports.
  kThreadGone,
  // The thread is alive but its stack could not be read (signal blocked, no
  // answer within the timeout, handler not installable).
  kFailed,
};

const char* ToString(CaptureStatus status);

// Request/claim protocol of the process-wide capture slot.
//
// One 64-bit word holds the request sequence, the target tid and the phase, so
// the signal handler matches a request with a single load and claims it with a
// single compare-exchange. A handler that observed an older request can never
// claim a newer one, and the sampler never publishes a new request while a
// handler is still writing.
//
// Observe, Claim and Complete are lock-free and async-signal-safe.
class CaptureSlotState {
public:
  enum class Phase : std::uint64_t {
    kIdle = 0,
    kRequested = 1,
    kWriting = 2,
    kDone = 3,
  };

  static std::uint64_t Pack(std::uint32_t seq, pid_t tid, Phase phase);

  // Sampler side. The slot must be idle.
  void Publish(std::uint32_t seq, pid_t tid);

  // Handler side: read the current word once, then try to claim it for the
  // calling thread. Claim fails when the word is not a request for `self` or
  // when the request changed since `observed` was read.
  std::uint64_t Observe() const;
  bool Claim(std::uint64_t observed, pid_t self);
  void Complete(std::uint64_t claimed);

  bool IsDone(std::uint32_t seq, pid_t tid) const;

  // Withdraws an unanswered request. Returns true when no handler claimed it
  // and the slot is idle again. Returns false when a handler had claimed it;
  // the call first waits until that handler completed, so the result is usable.
  bool Withdraw(std::uint32_t seq, pid_t tid);

  // Back to idle after a completed request was read.
  void Reset();

private:
  std::atomic<std::uint64_t> word_{0};
};

// Captures the call stack of any thread in this process.
//
// A foreign thread is interrupted with a real-time signal whose handler records
// raw return addresses with `backtrace()`; symbolization happens afterwards on
// the caller's thread. Captures are serialized because the handler writes into
// one process-wide slot. Threads that block the capture signal are reported as
// failed right away instead of waiting for the timeout.
//
// Contract:
// - kCaptured: `frames` holds at least one frame, innermost first.
// - otherwise `frames` is empty and `error` explains why.
class StackSampler {
public:
  static StackSampler& Instance();

  StackSampler(const StackSampler&) = delete;
  StackSampler& operator=(const StackSampler&) = delete;

  CaptureStatus Capture(pid_t tid, std::vector<std::string>& frames, std::string& error);

  void SetTimeout(std::chrono::milliseconds timeout);
  std::chrono::milliseconds timeout() const;

  // Signal used to interrupt sampled threads.
  static int CaptureSignal();

  struct Snapshot {
    std::uint64_t captures_requested = 0;
    std::uint64_t captures_completed = 0;
    std::uint64_t captures_timed_out = 0;
    std::uint64_t signal_blocked = 0;
    std::uint64_t threads_gone = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  StackSampler() = default;

  bool EnsureHandlerInstalled(std::string& error);

  mutable std::mutex mu_;
  bool handler_installed_ = false;
  std::uint32_t next_seq_ = 0;
  std::chrono::milliseconds timeout_{250};
  Snapshot stats_;
};

// Returns the 64-bit signal mask stored under `key` (`SigBlk:`, `SigIgn:`...)
// in `/proc/<pid>/task/<tid>/status` text, or nullopt when missing or malformed.
std::optional<std::uint64_t> ParseSignalMask(std::string_view status_text, std::string_view key);

// Turns raw `backtrace()` addresses into readable frames (demangled function
// name plus offset when a symbol is known, module and address otherwise).
std::vector<std::string> SymbolizeFrames(void* const* addresses, int depth);

// Extracts and demangles the function part of one `backtrace_symbols` line,
// e.g. `./app(_ZN3foo3barEv+0x1c) [0x55d1]` -> `foo::bar()+0x1c`. Lines without
// a symbol are returned unchanged.
std::string FormatSymbolLine(const std::string& line);

} // namespace stallwatch::detector
