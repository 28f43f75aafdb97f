#pragma once

#include "core/logging/logger.hpp"
#include "detector/capabilities.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace stallwatch::detector {

class ScheduledTask;
class SerialWorker;
class StackSampler;

struct DetectorOptions {
  // Minimum time the monitored context must be blocked before a report.
  std::chrono::milliseconds threshold{1'000};

  // Period of the inspection routine. Detection latency lies within
  // [threshold, threshold + inspection_interval].
  std::chrono::milliseconds inspection_interval{200};
};

struct DetectorDependencies {
  std::shared_ptr<ITaskPoster> poster;
  std::shared_ptr<IThreadProvider> thread_provider;
  std::shared_ptr<IBlockedThreadListener> listener;

  // Optional.
  std::shared_ptr<IDetectionExemption> exemption;

  // Optional. A warn-level stderr logger is used when null.
  std::shared_ptr<core::logging::Logger> logger;
};

// Default inspection interval for a threshold: one fifth of it, clamped to
// [100 ms, 500 ms].
std::chrono::milliseconds ResolveInspectionInterval(std::chrono::milliseconds threshold);

// Contract:
// - true: threshold and interval are both positive.
// - false: `error` names the offending option.
bool ValidateDetectorOptions(const DetectorOptions& options, std::string& error);

// Liveness watchdog for one monitored context.
//
// Every inspection tick adds the interval to a blocking accumulator. The first
// tick of an episode posts a probe to the monitored context; the probe resets
// the accumulator once the context gets around to running it. If the
// accumulator reaches the threshold before that happens, one report is built
// on a separate reporter thread and handed to the listener.
//
// Threads:
// - inspector: runs the inspection routine and start-up resets
// - reporter: enumerates and samples threads, calls the listener
// - monitored context: runs only the probe (two atomic stores)
//
// Listeners must not destroy the detector from inside the callback.
class BlockedThreadDetector {
  // Only Create() can make one, so every instance passed validation.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  // Returns nullptr when a required dependency is missing or the options are
  // invalid; `error` explains why.
  static std::unique_ptr<BlockedThreadDetector> Create(DetectorDependencies dependencies,
                                                       const DetectorOptions& options,
                                                       std::string& error);

  BlockedThreadDetector(ConstructionKey key, DetectorDependencies dependencies,
                        const DetectorOptions& options);

  // Stops detection and joins both workers after their due work finished.
  ~BlockedThreadDetector();

  BlockedThreadDetector(const BlockedThreadDetector&) = delete;
  BlockedThreadDetector& operator=(const BlockedThreadDetector&) = delete;

  // Starts periodic inspection. The first tick runs after `delay`. No-op
  // (returns true) when already running. Fails only for a negative delay or a
  // detector whose workers are shut down.
  bool StartDetection(std::chrono::milliseconds delay, std::string& error);
  bool StartDetection(std::string& error);

  // Cancels future ticks. An in-flight tick or report still completes.
  // No-op when stopped.
  void StopDetection();

  bool IsRunning() const;

  std::chrono::milliseconds threshold() const {
    return threshold_;
  }

  std::chrono::milliseconds inspection_interval() const {
    return inspection_interval_;
  }

  struct Snapshot {
    bool running = false;
    std::chrono::milliseconds blocking_time{0};
    bool reported = false;
    std::uint64_t ticks = 0;
    std::uint64_t probes_posted = 0;
    std::uint64_t probes_completed = 0;
    std::uint64_t reports_dispatched = 0;
    std::uint64_t reports_delivered = 0;
    // Live threads left out of a report because their stack capture failed.
    std::uint64_t threads_omitted = 0;
  };

  Snapshot DebugSnapshot() const;

  // Runs one inspection tick on the calling thread. Only for tests that drive
  // ticks by hand on a detector that was never started.
  void DebugInspectOnce();

private:
  // Shared with posted probes, which may outlive the detector.
  struct BlockingState {
    std::atomic<std::int64_t> blocking_ms{0};
    std::atomic<bool> reported{false};
    std::atomic<std::uint64_t> probes_completed{0};
  };

  static void ResetState(BlockingState& state);

  void CheckIfThreadIsBlocked();
  void ResetAsync();
  void PostProbe();
  void ReportBlockedThread(std::chrono::milliseconds blocked_for);
  void BuildAndDeliverReport(std::chrono::milliseconds blocked_for);

  std::shared_ptr<ITaskPoster> poster_;
  std::shared_ptr<IThreadProvider> thread_provider_;
  std::shared_ptr<IBlockedThreadListener> listener_;
  std::shared_ptr<IDetectionExemption> exemption_;
  std::shared_ptr<core::logging::Logger> logger_;
  StackSampler* sampler_ = nullptr;

  const std::chrono::milliseconds threshold_;
  const std::chrono::milliseconds inspection_interval_;

  std::shared_ptr<BlockingState> state_;
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> probes_posted_{0};
  std::atomic<std::uint64_t> reports_dispatched_{0};
  std::atomic<std::uint64_t> reports_delivered_{0};
  std::atomic<std::uint64_t> threads_omitted_{0};

  mutable std::mutex run_mu_;
  std::shared_ptr<ScheduledTask> inspection_task_;

  std::unique_ptr<SerialWorker> inspection_worker_;
  std::unique_ptr<SerialWorker> report_worker_;
};

} // namespace stallwatch::detector
