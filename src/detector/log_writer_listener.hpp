#pragma once

#include "core/logging/logger.hpp"
#include "detector/capabilities.hpp"

#include <memory>

namespace stallwatch::detector {

// Default listener: writes each event through the logger at warn level, one
// summary line plus one line per captured thread with its frames.
class LogWriterListener final : public IBlockedThreadListener {
public:
  explicit LogWriterListener(std::shared_ptr<core::logging::Logger> logger);

  void OnBlockedThreadDetected(BlockedThreadDetector& detector,
                               const BlockedThreadEvent& event) override;

private:
  std::shared_ptr<core::logging::Logger> logger_;
};

} // namespace stallwatch::detector
