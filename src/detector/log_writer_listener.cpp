#include "detector/log_writer_listener.hpp"

#include "core/time_utils.hpp"
#include "detector/blocked_thread_detector.hpp"
#include "detector/blocked_thread_event.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace stallwatch::detector {

LogWriterListener::LogWriterListener(std::shared_ptr<core::logging::Logger> logger)
    : logger_(std::move(logger)) {}

void LogWriterListener::OnBlockedThreadDetected(BlockedThreadDetector& detector,
                                                const BlockedThreadEvent& event) {
  if (logger_ == nullptr) {
    return;
  }

  logger_->Warn(Describe(event),
                {{"blocked_ms", core::FormatMillis(event.blocked_duration)},
                 {"threshold_ms", core::FormatMillis(detector.threshold())},
                 {"thread_count", std::to_string(event.thread_infos.size())}});

  for (const auto& info : event.thread_infos) {
    std::ostringstream frames;
    for (std::size_t i = 0; i < info.stack_trace.size(); ++i) {
      if (i != 0U) {
        frames << " <- ";
      }
      frames << info.stack_trace[i];
    }
    logger_->Warn(Describe(info), {{"tid", std::to_string(info.id)},
                                   {"priority", std::to_string(info.priority)},
                                   {"frames", frames.str()}});
  }
}

} // namespace stallwatch::detector
