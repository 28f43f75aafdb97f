#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include "stallwatch/cli/router.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

using stallwatch::tests::common::AssertContains;
using stallwatch::tests::common::AssertNotContains;
using stallwatch::tests::common::DispatchArgs;
using stallwatch::tests::common::Fail;

namespace {

// Redirects std::cout for the lifetime of the object.
class ScopedCoutCapture {
public:
  ScopedCoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~ScopedCoutCapture() {
    std::cout.rdbuf(previous_);
  }

  ScopedCoutCapture(const ScopedCoutCapture&) = delete;
  ScopedCoutCapture& operator=(const ScopedCoutCapture&) = delete;

  std::string str() const {
    return buffer_.str();
  }

private:
  std::ostringstream buffer_;
  std::streambuf* previous_ = nullptr;
};

void ExpectExit(const std::vector<std::string>& args, int expected, std::string_view context) {
  const int code = DispatchArgs(args);
  if (code != expected) {
    std::cerr << context << ": expected exit " << expected << " got " << code << '\n';
    std::abort();
  }
}

void UsageErrorsReturnTwo() {
  ExpectExit({"stallwatch"}, 2, "no command");
  ExpectExit({"stallwatch", "frobnicate"}, 2, "unknown command");
  ExpectExit({"stallwatch", "version", "extra"}, 2, "version with argument");
  ExpectExit({"stallwatch", "demo", "--threshold-ms"}, 2, "missing value");
  ExpectExit({"stallwatch", "demo", "--threshold-ms", "abc"}, 2, "non-integer value");
  ExpectExit({"stallwatch", "demo", "--bogus", "1"}, 2, "unknown demo flag");
  ExpectExit({"stallwatch", "demo", "--log-level", "loud"}, 2, "bad log level");
  ExpectExit({"stallwatch", "threads", "--fast"}, 2, "unknown threads flag");
}

void ParseDemoOptionsFillsEveryFlag() {
  stallwatch::cli::DemoOptions options;
  std::string error;
  const std::vector<std::string_view> args = {
      "--threshold-ms", "250", "--interval-ms", "40",  "--delay-ms",    "5",
      "--healthy-ms",   "10",  "--block-ms",    "600", "--duration-ms", "900",
      "--json",         "--log-level",          "debug"};
  if (!stallwatch::cli::ParseDemoOptions(args, options, error)) {
    Fail("valid demo flags were rejected: " + error);
  }
  if (options.threshold.count() != 250 || !options.inspection_interval.has_value() ||
      options.inspection_interval->count() != 40 || options.start_delay.count() != 5 ||
      options.healthy.count() != 10 || options.block.count() != 600 ||
      options.duration.count() != 900 || !options.json ||
      options.log_level != stallwatch::core::logging::LogLevel::kDebug) {
    Fail("demo flags were not applied");
  }
}

void VersionPrintsName() {
  ScopedCoutCapture capture;
  ExpectExit({"stallwatch", "version"}, 0, "version");
  AssertContains(capture.str(), "stallwatch 0.1.0");
}

void InvalidDetectorConfigFails() {
  ExpectExit({"stallwatch", "demo", "--threshold-ms", "0", "--log-level", "error"}, 1,
             "zero threshold");
  ExpectExit({"stallwatch", "demo", "--delay-ms", "-5", "--log-level", "error"}, 1,
             "negative start delay");
}

void BlockingDemoReportsStall() {
  ScopedCoutCapture capture;
  ExpectExit({"stallwatch", "demo", "--threshold-ms", "100", "--interval-ms", "25",
              "--healthy-ms", "50", "--block-ms", "400", "--duration-ms", "700", "--log-level",
              "error"},
             30, "blocking demo");
  const std::string out = capture.str();
  AssertContains(out, "The monitored thread was blocked for at least 100 ms");
  AssertContains(out, "'demo-loop'");
}

void BlockingDemoPrintsJson() {
  ScopedCoutCapture capture;
  ExpectExit({"stallwatch", "demo", "--threshold-ms", "100", "--interval-ms", "25",
              "--healthy-ms", "50", "--block-ms", "400", "--duration-ms", "700", "--json",
              "--log-level", "error"},
             30, "blocking demo json");
  const std::string out = capture.str();
  AssertContains(out, R"({"blocked_ms":100,"threads":[)");
  AssertContains(out, R"("name":"demo-loop","group":"demo")");
}

void HealthyDemoReportsNothing() {
  ScopedCoutCapture capture;
  ExpectExit({"stallwatch", "demo", "--threshold-ms", "200", "--interval-ms", "25",
              "--healthy-ms", "100", "--block-ms", "0", "--duration-ms", "400", "--log-level",
              "error"},
             0, "healthy demo");
  AssertNotContains(capture.str(), "was blocked");
}

void ThreadsListsCallingThread() {
  ScopedCoutCapture capture;
  ExpectExit({"stallwatch", "threads", "--all"}, 0, "threads --all");
  AssertContains(capture.str(), "Stack trace of thread '");
  AssertContains(capture.str(), "    at ");
}

} // namespace

int main() {
  UsageErrorsReturnTwo();
  ParseDemoOptionsFillsEveryFlag();
  VersionPrintsName();
  InvalidDetectorConfigFails();
  BlockingDemoReportsStall();
  BlockingDemoPrintsJson();
  HealthyDemoReportsNothing();
  ThreadsListsCallingThread();
  return 0;
}
