#include "detector/detector_builder.hpp"

#include "detector/log_writer_listener.hpp"
#include "detector/thread_filters.hpp"
#include "detector/thread_providers.hpp"

#include <utility>

namespace stallwatch::detector {

namespace {

constexpr std::chrono::milliseconds kDefaultThreshold{1'000};

} // namespace

DetectorBuilder::DetectorBuilder(std::shared_ptr<ITaskPoster> poster) : poster_(std::move(poster)) {}

DetectorBuilder& DetectorBuilder::SetThreadProvider(
    std::shared_ptr<IThreadProvider> thread_provider) {
  thread_provider_ = std::move(thread_provider);
  return *this;
}

DetectorBuilder& DetectorBuilder::SetListener(std::shared_ptr<IBlockedThreadListener> listener) {
  listener_ = std::move(listener);
  return *this;
}

DetectorBuilder& DetectorBuilder::SetExemption(std::shared_ptr<IDetectionExemption> exemption) {
  exemption_ = std::move(exemption);
  return *this;
}

DetectorBuilder& DetectorBuilder::SetLogger(std::shared_ptr<core::logging::Logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

DetectorBuilder& DetectorBuilder::SetThreshold(std::chrono::milliseconds threshold) {
  threshold_ = threshold;
  return *this;
}

DetectorBuilder& DetectorBuilder::SetInspectionInterval(std::chrono::milliseconds interval) {
  inspection_interval_ = interval;
  return *this;
}

DetectorOptions DetectorBuilder::ResolveOptions() const {
  DetectorOptions options;
  options.threshold = threshold_.value_or(kDefaultThreshold);
  options.inspection_interval =
      inspection_interval_.value_or(ResolveInspectionInterval(options.threshold));
  return options;
}

std::unique_ptr<BlockedThreadDetector> DetectorBuilder::Build(std::string& error) const {
  DetectorDependencies dependencies;
  dependencies.poster = poster_;
  dependencies.exemption = exemption_;
  dependencies.logger =
      logger_ != nullptr ? logger_
                         : std::make_shared<core::logging::Logger>(core::logging::LogLevel::kWarn);
  dependencies.thread_provider =
      thread_provider_ != nullptr
          ? thread_provider_
          : std::make_shared<FilteredThreadProvider>(std::make_shared<BackgroundThreadFilter>());
  dependencies.listener = listener_ != nullptr
                              ? listener_
                              : std::make_shared<LogWriterListener>(dependencies.logger);

  return BlockedThreadDetector::Create(std::move(dependencies), ResolveOptions(), error);
}

} // namespace stallwatch::detector
