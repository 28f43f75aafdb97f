#include "stallwatch/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "detector/blocked_thread_detector.hpp"
#include "detector/blocked_thread_event.hpp"
#include "detector/detector_builder.hpp"
#include "detector/exemptions.hpp"
#include "detector/stack_sampler.hpp"
#include "detector/thread_filters.hpp"
#include "detector/thread_info.hpp"
#include "detector/thread_providers.hpp"
#include "detector/thread_registry.hpp"
#include "stallwatch/cli/task_loop.hpp"

#include <atomic>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace stallwatch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitStallDetected = core::errors::ToInt(core::errors::ExitCode::kStallDetected);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  stallwatch demo [--threshold-ms <n>] [--interval-ms <n>] [--delay-ms <n>] "
         "[--healthy-ms <n>] [--block-ms <n>] [--duration-ms <n>] [--json] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  stallwatch threads [--all] [--json]\n"
      << "  stallwatch version\n";
}

bool ParseMillis(std::string_view flag, std::string_view raw, std::chrono::milliseconds& value,
                 std::string& error) {
  std::int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected integer milliseconds)";
    return false;
  }
  value = std::chrono::milliseconds(parsed);
  return true;
}

// Prints every event and counts them. Runs on the detector's reporter thread.
class DemoListener final : public detector::IBlockedThreadListener {
public:
  explicit DemoListener(bool json) : json_(json) {}

  void OnBlockedThreadDetected(detector::BlockedThreadDetector& /*detector*/,
                               const detector::BlockedThreadEvent& event) override {
    {
      std::lock_guard<std::mutex> lock(out_mu_);
      if (json_) {
        std::cout << detector::ToJson(event) << '\n';
      } else {
        std::cout << event << '\n';
      }
      std::cout.flush();
    }
    detections_.fetch_add(1U);
  }

  std::uint64_t detections() const {
    return detections_.load();
  }

private:
  const bool json_;
  std::mutex out_mu_;
  std::atomic<std::uint64_t> detections_{0};
};

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "stallwatch 0.1.0\n";
  return kExitSuccess;
}

int CommandDemo(const std::vector<std::string_view>& args) {
  DemoOptions options;
  std::string error;
  if (!ParseDemoOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteDemo(options);
}

int CommandThreads(const std::vector<std::string_view>& args) {
  bool all = false;
  bool json = false;
  for (const std::string_view token : args) {
    if (token == "--all") {
      all = true;
    } else if (token == "--json") {
      json = true;
    } else {
      std::cerr << "error: unknown argument for threads: " << token << '\n';
      PrintUsage(std::cerr);
      return kExitUsage;
    }
  }

  std::unique_ptr<detector::IThreadProvider> provider;
  if (all) {
    provider = std::make_unique<detector::ActiveThreadProvider>();
  } else {
    provider = std::make_unique<detector::FilteredThreadProvider>(
        std::make_shared<detector::BackgroundThreadFilter>());
  }

  std::vector<detector::ThreadRef> threads;
  std::string error;
  if (!provider->ProvideThreads(threads, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::size_t printed = 0;
  for (const auto& thread : threads) {
    detector::ThreadInfo info;
    const detector::CaptureStatus status =
        detector::CaptureThreadInfo(thread, detector::StackSampler::Instance(), info, error);
    if (status == detector::CaptureStatus::kFailed) {
      std::cerr << "warning: skipped thread " << thread.tid << ": " << error << '\n';
    }
    if (status != detector::CaptureStatus::kCaptured) {
      continue;
    }
    if (json) {
      std::cout << detector::ToJson(info) << '\n';
    } else {
      std::cout << info << '\n';
    }
    ++printed;
  }

  if (printed == 0U) {
    std::cerr << "error: no thread stack could be captured\n";
    return kExitFailure;
  }
  return kExitSuccess;
}

} // namespace

bool ParseDemoOptions(const std::vector<std::string_view>& args, DemoOptions& options,
                      std::string& error) {
  error.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (token == "--json") {
      options.json = true;
      continue;
    }

    if (i + 1U >= args.size()) {
      if (token.rfind("--", 0) == 0U) {
        error = "missing value for " + std::string(token);
      } else {
        error = "unknown argument for demo: " + std::string(token);
      }
      return false;
    }

    const std::string_view value = args[i + 1U];
    std::chrono::milliseconds parsed{0};
    if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else if (token == "--threshold-ms") {
      if (!ParseMillis(token, value, options.threshold, error)) {
        return false;
      }
    } else if (token == "--interval-ms") {
      if (!ParseMillis(token, value, parsed, error)) {
        return false;
      }
      options.inspection_interval = parsed;
    } else if (token == "--delay-ms") {
      if (!ParseMillis(token, value, options.start_delay, error)) {
        return false;
      }
    } else if (token == "--healthy-ms") {
      if (!ParseMillis(token, value, options.healthy, error)) {
        return false;
      }
    } else if (token == "--block-ms") {
      if (!ParseMillis(token, value, options.block, error)) {
        return false;
      }
    } else if (token == "--duration-ms") {
      if (!ParseMillis(token, value, options.duration, error)) {
        return false;
      }
    } else {
      error = "unknown argument for demo: " + std::string(token);
      return false;
    }
    ++i;
  }
  return true;
}

int ExecuteDemo(const DemoOptions& options) {
  auto logger = std::make_shared<core::logging::Logger>(options.log_level);
  logger->SetComponent("stallwatch.demo");

  // The main thread is the monitored context; tag it so reports name it.
  const detector::ScopedThreadTag main_tag({
      .name = "demo-loop",
      .group_name = "demo",
      .background = false,
  });

  auto loop = std::make_shared<TaskLoop>();
  auto listener = std::make_shared<DemoListener>(options.json);

  detector::DetectorBuilder builder(std::make_shared<TaskLoopPoster>(loop));
  builder.SetListener(listener)
      .SetLogger(logger)
      .SetExemption(std::make_shared<detector::DebuggerAttachedExemption>())
      .SetThreshold(options.threshold);
  if (options.inspection_interval.has_value()) {
    builder.SetInspectionInterval(options.inspection_interval.value());
  }

  std::string error;
  std::unique_ptr<detector::BlockedThreadDetector> watchdog = builder.Build(error);
  if (watchdog == nullptr) {
    logger->Error("invalid detector configuration", {{"error", error}});
    return kExitFailure;
  }
  if (!watchdog->StartDetection(options.start_delay, error)) {
    logger->Error("failed to start detection", {{"error", error}});
    return kExitFailure;
  }

  logger->Info("demo started",
               {{"threshold_ms", core::FormatMillis(watchdog->threshold())},
                {"interval_ms", core::FormatMillis(watchdog->inspection_interval())},
                {"block_ms", core::FormatMillis(options.block)},
                {"duration_ms", core::FormatMillis(options.duration)}});

  const auto start = std::chrono::steady_clock::now();
  loop->RunUntil(start + options.healthy);

  const std::chrono::milliseconds block = options.block;
  loop->Post([block, logger] {
    logger->Info("monitored loop blocking", {{"block_ms", core::FormatMillis(block)}});
    std::this_thread::sleep_for(block);
  });
  loop->RunUntil(start + options.duration);

  watchdog->StopDetection();
  // Joins the reporter, so a report in progress is printed before the summary.
  watchdog.reset();

  const std::uint64_t detections = listener->detections();
  logger->Info("demo finished", {{"detections", std::to_string(detections)}});
  return detections > 0U ? kExitStallDetected : kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command = argv[1];
  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 2 ? argc - 2 : 0));
  for (int i = 2; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (command == "demo") {
    return CommandDemo(args);
  }
  if (command == "threads") {
    return CommandThreads(args);
  }
  if (command == "version" || command == "--version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown command: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace stallwatch::cli
