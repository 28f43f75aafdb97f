#include "detector/stack_sampler.hpp"

#include "detector/thread_registry.hpp"

#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>
#include <execinfo.h>
#include <fstream>
#include <iterator>
#include <sys/syscall.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace stallwatch::detector {

namespace {

constexpr int kMaxFrames = 64;

// Frames of the handler itself and of the kernel signal trampoline.
constexpr int kHandlerFrames = 2;

constexpr std::uint64_t kPhaseMask = 0x3U;
constexpr std::uint64_t kTidMask = 0x3fffffffU;

// Written by the signal handler on the target thread after it claimed the
// current request, read by the sampler once the request is done.
CaptureSlotState g_state;
std::atomic<int> g_depth{0};
void* g_frames[kMaxFrames] = {};

void HandleCaptureSignal(int /*signo*/, siginfo_t* /*info*/, void* /*context*/) {
  const int saved_errno = errno;
  const auto self = static_cast<pid_t>(::syscall(SYS_gettid));
  const std::uint64_t observed = g_state.Observe();
  if (g_state.Claim(observed, self)) {
    // backtrace() was already called once outside the handler, so the
    // unwinder library is loaded and no allocation happens here.
    g_depth.store(backtrace(g_frames, kMaxFrames), std::memory_order_relaxed);
    g_state.Complete(observed);
  }
  errno = saved_errno;
}

// kFailed with `error` set when the signal is blocked, kThreadGone when the
// task entry is missing, kCaptured when the signal can be delivered.
CaptureStatus CheckSignalDeliverable(pid_t tid, int signal_number, std::string& error) {
  std::ifstream input("/proc/self/task/" + std::to_string(tid) + "/status");
  if (!input) {
    error = "thread " + std::to_string(tid) + " no longer exists";
    return CaptureStatus::kThreadGone;
  }
  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  const std::optional<std::uint64_t> blocked = ParseSignalMask(text, "SigBlk:");
  if (blocked.has_value() &&
      (blocked.value() & (std::uint64_t{1} << (signal_number - 1))) != 0U) {
    error = "thread " + std::to_string(tid) + " blocks the stack capture signal " +
            std::to_string(signal_number);
    return CaptureStatus::kFailed;
  }
  return CaptureStatus::kCaptured;
}

std::string Demangle(const std::string& mangled) {
  int status = 0;
  char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
  if (demangled == nullptr || status != 0) {
    std::free(demangled);
    return mangled;
  }
  std::string result(demangled);
  std::free(demangled);
  return result;
}

std::string FormatAddress(const void* address) {
  char buffer[2 + sizeof(void*) * 2 + 1] = {};
  std::snprintf(buffer, sizeof(buffer), "%p", address);
  return std::string(buffer);
}

} // namespace

const char* ToString(CaptureStatus status) {
  switch (status) {
  case CaptureStatus::kCaptured:
    return "captured";
  case CaptureStatus::kThreadGone:
    return "thread_gone";
  case CaptureStatus::kFailed:
    return "failed";
  }
  return "unknown";
}

std::uint64_t CaptureSlotState::Pack(std::uint32_t seq, pid_t tid, Phase phase) {
  return (static_cast<std::uint64_t>(seq) << 32U) |
         ((static_cast<std::uint64_t>(static_cast<std::uint32_t>(tid)) & kTidMask) << 2U) |
         static_cast<std::uint64_t>(phase);
}

void CaptureSlotState::Publish(std::uint32_t seq, pid_t tid) {
  word_.store(Pack(seq, tid, Phase::kRequested), std::memory_order_release);
}

std::uint64_t CaptureSlotState::Observe() const {
  return word_.load(std::memory_order_acquire);
}

bool CaptureSlotState::Claim(std::uint64_t observed, pid_t self) {
  if ((observed & kPhaseMask) != static_cast<std::uint64_t>(Phase::kRequested)) {
    return false;
  }
  const std::uint64_t self_bits =
      static_cast<std::uint64_t>(static_cast<std::uint32_t>(self)) & kTidMask;
  if (((observed >> 2U) & kTidMask) != self_bits) {
    return false;
  }
  std::uint64_t expected = observed;
  const std::uint64_t writing =
      (observed & ~kPhaseMask) | static_cast<std::uint64_t>(Phase::kWriting);
  return word_.compare_exchange_strong(expected, writing, std::memory_order_acq_rel,
                                       std::memory_order_acquire);
}

void CaptureSlotState::Complete(std::uint64_t claimed) {
  word_.store((claimed & ~kPhaseMask) | static_cast<std::uint64_t>(Phase::kDone),
              std::memory_order_release);
}

bool CaptureSlotState::IsDone(std::uint32_t seq, pid_t tid) const {
  return word_.load(std::memory_order_acquire) == Pack(seq, tid, Phase::kDone);
}

bool CaptureSlotState::Withdraw(std::uint32_t seq, pid_t tid) {
  std::uint64_t expected = Pack(seq, tid, Phase::kRequested);
  if (word_.compare_exchange_strong(expected, 0U, std::memory_order_acq_rel,
                                    std::memory_order_acquire)) {
    return true;
  }
  // A handler claimed the request; it only runs backtrace() before completing.
  const std::uint64_t writing = Pack(seq, tid, Phase::kWriting);
  while (word_.load(std::memory_order_acquire) == writing) {
    std::this_thread::yield();
  }
  return !IsDone(seq, tid);
}

void CaptureSlotState::Reset() {
  word_.store(0U, std::memory_order_release);
}

StackSampler& StackSampler::Instance() {
  static StackSampler sampler;
  return sampler;
}

int StackSampler::CaptureSignal() {
  return SIGRTMIN + 4;
}

void StackSampler::SetTimeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  timeout_ = timeout;
}

std::chrono::milliseconds StackSampler::timeout() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timeout_;
}

StackSampler::Snapshot StackSampler::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

bool StackSampler::EnsureHandlerInstalled(std::string& error) {
  if (handler_installed_) {
    return true;
  }

  void* warmup[1] = {};
  (void)backtrace(warmup, 1);

  const int signal_number = CaptureSignal();
  struct sigaction previous{};
  if (sigaction(signal_number, nullptr, &previous) != 0) {
    error = "unable to query stack capture signal disposition: " +
            std::system_category().message(errno);
    return false;
  }
  const bool previous_is_custom = (previous.sa_flags & SA_SIGINFO) != 0
                                      ? previous.sa_sigaction != nullptr
                                      : (previous.sa_handler != SIG_DFL &&
                                         previous.sa_handler != SIG_IGN);
  if (previous_is_custom) {
    error = "stack capture signal " + std::to_string(signal_number) +
            " is already handled by another component";
    return false;
  }

  struct sigaction action{};
  action.sa_sigaction = &HandleCaptureSignal;
  action.sa_flags = SA_SIGINFO | SA_RESTART;
  sigemptyset(&action.sa_mask);
  if (sigaction(signal_number, &action, nullptr) != 0) {
    error = "unable to install stack capture handler: " + std::system_category().message(errno);
    return false;
  }

  handler_installed_ = true;
  return true;
}

CaptureStatus StackSampler::Capture(pid_t tid, std::vector<std::string>& frames,
                                    std::string& error) {
  frames.clear();
  error.clear();

  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.captures_requested;

  if (tid <= 0) {
    error = "invalid thread id " + std::to_string(tid);
    return CaptureStatus::kFailed;
  }

  if (tid == CurrentThreadId()) {
    void* addresses[kMaxFrames] = {};
    const int depth = backtrace(addresses, kMaxFrames);
    if (depth <= 1) {
      error = "backtrace returned no frames for the calling thread";
      return CaptureStatus::kFailed;
    }
    // Drop this function's own frame.
    frames = SymbolizeFrames(addresses + 1, depth - 1);
    ++stats_.captures_completed;
    return CaptureStatus::kCaptured;
  }

  if (!EnsureHandlerInstalled(error)) {
    return CaptureStatus::kFailed;
  }

  const int signal_number = CaptureSignal();
  const CaptureStatus deliverable = CheckSignalDeliverable(tid, signal_number, error);
  if (deliverable == CaptureStatus::kThreadGone) {
    ++stats_.threads_gone;
    return deliverable;
  }
  if (deliverable == CaptureStatus::kFailed) {
    ++stats_.signal_blocked;
    return deliverable;
  }

  const std::uint32_t seq = ++next_seq_;
  g_state.Publish(seq, tid);

  if (::syscall(SYS_tgkill, ::getpid(), tid, signal_number) != 0) {
    const int signal_errno = errno;
    // Nothing was delivered, so no handler can hold the slot.
    g_state.Reset();
    if (signal_errno == ESRCH) {
      ++stats_.threads_gone;
      error = "thread " + std::to_string(tid) + " no longer exists";
      return CaptureStatus::kThreadGone;
    }
    error = "unable to signal thread " + std::to_string(tid) + ": " +
            std::system_category().message(signal_errno);
    return CaptureStatus::kFailed;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (!g_state.IsDone(seq, tid)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      if (g_state.Withdraw(seq, tid)) {
        ++stats_.captures_timed_out;
        error = "thread " + std::to_string(tid) +
                " did not answer the stack capture signal within " +
                std::to_string(timeout_.count()) + " ms";
        return CaptureStatus::kFailed;
      }
      // The handler claimed the request right at the deadline and finished.
      break;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(200));
  }

  const int depth = g_depth.load(std::memory_order_relaxed);
  if (depth > kHandlerFrames) {
    frames = SymbolizeFrames(g_frames + kHandlerFrames, depth - kHandlerFrames);
  }
  g_state.Reset();

  if (frames.empty()) {
    error = "captured stack of thread " + std::to_string(tid) + " is empty";
    return CaptureStatus::kFailed;
  }
  ++stats_.captures_completed;
  return CaptureStatus::kCaptured;
}

std::optional<std::uint64_t> ParseSignalMask(std::string_view status_text, std::string_view key) {
  std::size_t line_start = 0;
  while (line_start < status_text.size()) {
    std::size_t line_end = status_text.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = status_text.size();
    }
    const std::string_view line = status_text.substr(line_start, line_end - line_start);
    line_start = line_end + 1U;

    if (line.rfind(key, 0) != 0U) {
      continue;
    }

    std::string_view value = line.substr(key.size());
    const std::size_t first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
      return std::nullopt;
    }
    value = value.substr(first);
    const std::size_t last = value.find_last_not_of(" \t\r");
    value = value.substr(0, last + 1U);

    std::uint64_t mask = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), mask, 16);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      return std::nullopt;
    }
    return mask;
  }
  return std::nullopt;
}

std::vector<std::string> SymbolizeFrames(void* const* addresses, int depth) {
  std::vector<std::string> frames;
  if (addresses == nullptr || depth <= 0) {
    return frames;
  }
  frames.reserve(static_cast<std::size_t>(depth));

  char** symbols = backtrace_symbols(addresses, depth);
  if (symbols == nullptr) {
    for (int i = 0; i < depth; ++i) {
      frames.push_back(FormatAddress(addresses[i]));
    }
    return frames;
  }

  for (int i = 0; i < depth; ++i) {
    frames.push_back(symbols[i] != nullptr ? FormatSymbolLine(symbols[i])
                                           : FormatAddress(addresses[i]));
  }
  std::free(symbols);
  return frames;
}

std::string FormatSymbolLine(const std::string& line) {
  const std::size_t open = line.find('(');
  if (open == std::string::npos) {
    return line;
  }
  const std::size_t close = line.find(')', open);
  if (close == std::string::npos) {
    return line;
  }

  const std::string inside = line.substr(open + 1U, close - open - 1U);
  const std::size_t plus = inside.find('+');
  const std::string symbol = inside.substr(0, plus);
  if (symbol.empty()) {
    return line;
  }

  const std::string offset = plus == std::string::npos ? std::string() : inside.substr(plus);
  return Demangle(symbol) + offset;
}

} // namespace stallwatch::detector
