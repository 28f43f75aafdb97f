#include "detector/exemptions.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace stallwatch::detector {

CombinedDetectionExemption::CombinedDetectionExemption(
    std::vector<std::shared_ptr<IDetectionExemption>> exemptions)
    : exemptions_(std::move(exemptions)) {}

bool CombinedDetectionExemption::IsExemptionActive() const {
  for (const auto& exemption : exemptions_) {
    if (exemption != nullptr && exemption->IsExemptionActive()) {
      return true;
    }
  }
  return false;
}

DebuggerAttachedExemption::DebuggerAttachedExemption(std::filesystem::path status_path)
    : status_path_(std::move(status_path)) {}

bool DebuggerAttachedExemption::IsExemptionActive() const {
  std::ifstream input(status_path_);
  if (!input) {
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  const std::optional<pid_t> tracer = ParseTracerPid(text);
  return tracer.has_value() && tracer.value() != 0;
}

std::optional<pid_t> ParseTracerPid(std::string_view status_text) {
  constexpr std::string_view kKey = "TracerPid:";

  std::size_t line_start = 0;
  while (line_start < status_text.size()) {
    std::size_t line_end = status_text.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = status_text.size();
    }
    const std::string_view line = status_text.substr(line_start, line_end - line_start);
    line_start = line_end + 1U;

    if (line.rfind(kKey, 0) != 0U) {
      continue;
    }

    std::string_view value = line.substr(kKey.size());
    const std::size_t first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
      return std::nullopt;
    }
    value = value.substr(first);
    const std::size_t last = value.find_last_not_of(" \t\r");
    value = value.substr(0, last + 1U);

    pid_t tracer = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), tracer);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      return std::nullopt;
    }
    return tracer;
  }
  return std::nullopt;
}

} // namespace stallwatch::detector
