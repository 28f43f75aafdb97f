#pragma once

#include "core/logging/logger.hpp"
#include "detector/blocked_thread_detector.hpp"
#include "detector/capabilities.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace stallwatch::detector {

// Assembles a `BlockedThreadDetector` from a poster plus optional overrides.
//
// Defaults applied by Build():
// - thread provider: `FilteredThreadProvider(BackgroundThreadFilter)`
// - listener: `LogWriterListener` on the builder's logger
// - threshold: 1000 ms
// - inspection interval: `ResolveInspectionInterval(threshold)`
// - logger: warn-level stderr logger
// - no exemption
class DetectorBuilder {
public:
  explicit DetectorBuilder(std::shared_ptr<ITaskPoster> poster);

  DetectorBuilder& SetThreadProvider(std::shared_ptr<IThreadProvider> thread_provider);
  DetectorBuilder& SetListener(std::shared_ptr<IBlockedThreadListener> listener);
  DetectorBuilder& SetExemption(std::shared_ptr<IDetectionExemption> exemption);
  DetectorBuilder& SetLogger(std::shared_ptr<core::logging::Logger> logger);
  DetectorBuilder& SetThreshold(std::chrono::milliseconds threshold);
  DetectorBuilder& SetInspectionInterval(std::chrono::milliseconds interval);

  // Effective options after defaults, without building anything.
  DetectorOptions ResolveOptions() const;

  // Returns nullptr and fills `error` when the configuration is invalid.
  std::unique_ptr<BlockedThreadDetector> Build(std::string& error) const;

private:
  std::shared_ptr<ITaskPoster> poster_;
  std::shared_ptr<IThreadProvider> thread_provider_;
  std::shared_ptr<IBlockedThreadListener> listener_;
  std::shared_ptr<IDetectionExemption> exemption_;
  std::shared_ptr<core::logging::Logger> logger_;
  std::optional<std::chrono::milliseconds> threshold_;
  std::optional<std::chrono::milliseconds> inspection_interval_;
};

} // namespace stallwatch::detector
