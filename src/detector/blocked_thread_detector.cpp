#include "detector/blocked_thread_detector.hpp"

#include "core/time_utils.hpp"
#include "detector/blocked_thread_event.hpp"
#include "detector/serial_worker.hpp"
#include "detector/stack_sampler.hpp"
#include "detector/thread_info.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace stallwatch::detector {

namespace {

constexpr std::chrono::milliseconds kMinDefaultInterval{100};
constexpr std::chrono::milliseconds kMaxDefaultInterval{500};

constexpr const char* kInspectorThreadName = "sw-inspector";
constexpr const char* kReporterThreadName = "sw-reporter";

} // namespace

std::chrono::milliseconds ResolveInspectionInterval(std::chrono::milliseconds threshold) {
  return std::clamp(threshold / 5, kMinDefaultInterval, kMaxDefaultInterval);
}

bool ValidateDetectorOptions(const DetectorOptions& options, std::string& error) {
  error.clear();
  if (options.threshold <= std::chrono::milliseconds::zero()) {
    error = "threshold must be positive (got " + core::FormatMillis(options.threshold) + " ms)";
    return false;
  }
  if (options.inspection_interval <= std::chrono::milliseconds::zero()) {
    error = "inspection interval must be positive (got " +
            core::FormatMillis(options.inspection_interval) + " ms)";
    return false;
  }
  return true;
}

std::unique_ptr<BlockedThreadDetector> BlockedThreadDetector::Create(
    DetectorDependencies dependencies, const DetectorOptions& options, std::string& error) {
  if (dependencies.poster == nullptr) {
    error = "detector requires a task poster";
    return nullptr;
  }
  if (dependencies.thread_provider == nullptr) {
    error = "detector requires a thread provider";
    return nullptr;
  }
  if (dependencies.listener == nullptr) {
    error = "detector requires a blocked thread listener";
    return nullptr;
  }
  if (!ValidateDetectorOptions(options, error)) {
    return nullptr;
  }
  if (dependencies.logger == nullptr) {
    dependencies.logger = std::make_shared<core::logging::Logger>(core::logging::LogLevel::kWarn);
  }
  if (options.inspection_interval > options.threshold) {
    dependencies.logger->Warn("inspection interval exceeds threshold; detection latency grows",
                              {{"threshold_ms", core::FormatMillis(options.threshold)},
                               {"interval_ms", core::FormatMillis(options.inspection_interval)}});
  }

  return std::make_unique<BlockedThreadDetector>(ConstructionKey{}, std::move(dependencies),
                                                 options);
}

BlockedThreadDetector::BlockedThreadDetector(ConstructionKey /*key*/,
                                             DetectorDependencies dependencies,
                                             const DetectorOptions& options)
    : poster_(std::move(dependencies.poster)),
      thread_provider_(std::move(dependencies.thread_provider)),
      listener_(std::move(dependencies.listener)),
      exemption_(std::move(dependencies.exemption)),
      logger_(std::move(dependencies.logger)),
      sampler_(&StackSampler::Instance()),
      threshold_(options.threshold),
      inspection_interval_(options.inspection_interval),
      state_(std::make_shared<BlockingState>()),
      inspection_worker_(std::make_unique<SerialWorker>(kInspectorThreadName, logger_)),
      report_worker_(std::make_unique<SerialWorker>(kReporterThreadName, logger_)) {}

BlockedThreadDetector::~BlockedThreadDetector() {
  StopDetection();
  // Reports capture `this`; both workers must be joined before members go away.
  inspection_worker_->Shutdown();
  report_worker_->Shutdown();
}

bool BlockedThreadDetector::StartDetection(std::string& error) {
  return StartDetection(std::chrono::milliseconds::zero(), error);
}

bool BlockedThreadDetector::StartDetection(std::chrono::milliseconds delay, std::string& error) {
  error.clear();
  if (delay < std::chrono::milliseconds::zero()) {
    error = "start delay cannot be negative (got " + core::FormatMillis(delay) + " ms)";
    return false;
  }

  std::lock_guard<std::mutex> lock(run_mu_);
  if (inspection_task_ != nullptr) {
    return true;
  }

  // Queued ahead of the first tick, so every run starts a fresh episode.
  ResetAsync();
  inspection_task_ = inspection_worker_->ScheduleWithFixedDelay(
      [this] { CheckIfThreadIsBlocked(); }, delay, inspection_interval_);
  if (inspection_task_ == nullptr) {
    error = "inspection worker is shut down";
    return false;
  }

  logger_->Debug("blocked thread detection started",
                 {{"threshold_ms", core::FormatMillis(threshold_)},
                  {"interval_ms", core::FormatMillis(inspection_interval_)},
                  {"delay_ms", core::FormatMillis(delay)}});
  return true;
}

void BlockedThreadDetector::StopDetection() {
  std::lock_guard<std::mutex> lock(run_mu_);
  if (inspection_task_ == nullptr) {
    return;
  }
  inspection_task_->Cancel();
  inspection_task_.reset();
  logger_->Debug("blocked thread detection stopped");
}

bool BlockedThreadDetector::IsRunning() const {
  std::lock_guard<std::mutex> lock(run_mu_);
  return inspection_task_ != nullptr;
}

BlockedThreadDetector::Snapshot BlockedThreadDetector::DebugSnapshot() const {
  Snapshot snapshot;
  snapshot.running = IsRunning();
  snapshot.blocking_time = std::chrono::milliseconds(state_->blocking_ms.load());
  snapshot.reported = state_->reported.load();
  snapshot.ticks = ticks_.load();
  snapshot.probes_posted = probes_posted_.load();
  snapshot.probes_completed = state_->probes_completed.load();
  snapshot.reports_dispatched = reports_dispatched_.load();
  snapshot.reports_delivered = reports_delivered_.load();
  snapshot.threads_omitted = threads_omitted_.load();
  return snapshot;
}

void BlockedThreadDetector::DebugInspectOnce() {
  CheckIfThreadIsBlocked();
}

void BlockedThreadDetector::ResetState(BlockingState& state) {
  state.blocking_ms.store(0);
  state.reported.store(false);
}

void BlockedThreadDetector::ResetAsync() {
  std::weak_ptr<BlockingState> weak_state = state_;
  inspection_worker_->Submit([weak_state] {
    if (const auto state = weak_state.lock()) {
      ResetState(*state);
    }
  });
}

void BlockedThreadDetector::CheckIfThreadIsBlocked() {
  ticks_.fetch_add(1U);

  // Exempt periods restart the measurement so leaving the exemption never
  // fires on time accumulated while it was active.
  if (exemption_ != nullptr && exemption_->IsExemptionActive()) {
    ResetState(*state_);
    return;
  }

  const std::int64_t blocked_since = state_->blocking_ms.fetch_add(inspection_interval_.count());
  if (blocked_since == 0) {
    PostProbe();
  } else if (blocked_since >= threshold_.count() && !state_->reported.exchange(true)) {
    ReportBlockedThread(std::chrono::milliseconds(blocked_since));
  }
}

void BlockedThreadDetector::PostProbe() {
  probes_posted_.fetch_add(1U);
  logger_->Debug("probe posted to monitored context");
  std::weak_ptr<BlockingState> weak_state = state_;
  poster_->Post([weak_state] {
    if (const auto state = weak_state.lock()) {
      ResetState(*state);
      state->probes_completed.fetch_add(1U);
    }
  });
}

void BlockedThreadDetector::ReportBlockedThread(std::chrono::milliseconds blocked_for) {
  reports_dispatched_.fetch_add(1U);
  logger_->Info("monitored context blocked, building report",
                {{"blocked_ms", core::FormatMillis(blocked_for)},
                 {"threshold_ms", core::FormatMillis(threshold_)}});
  report_worker_->Submit([this, blocked_for] { BuildAndDeliverReport(blocked_for); });
}

void BlockedThreadDetector::BuildAndDeliverReport(std::chrono::milliseconds blocked_for) {
  std::vector<ThreadRef> threads;
  std::string error;
  if (!thread_provider_->ProvideThreads(threads, error)) {
    logger_->Error("thread provider failed, report skipped",
                   {{"blocked_ms", core::FormatMillis(blocked_for)}, {"error", error}});
    return;
  }

  std::vector<ThreadInfo> thread_infos;
  thread_infos.reserve(threads.size());
  for (const auto& thread : threads) {
    ThreadInfo info;
    const CaptureStatus status = CaptureThreadInfo(thread, *sampler_, info, error);
    if (status == CaptureStatus::kCaptured) {
      thread_infos.push_back(std::move(info));
    } else if (status == CaptureStatus::kFailed) {
      threads_omitted_.fetch_add(1U);
      logger_->Warn("thread stack capture failed, thread omitted from report",
                    {{"tid", std::to_string(thread.tid)}, {"thread", thread.name},
                     {"error", error}});
    }
    // kThreadGone: the thread exited after enumeration and has nothing to show.
  }

  const BlockedThreadEvent event(blocked_for, std::move(thread_infos));
  listener_->OnBlockedThreadDetected(*this, event);
  reports_delivered_.fetch_add(1U);
}

} // namespace stallwatch::detector
