#include "detector/blocked_thread_event.hpp"
#include "detector/thread_info.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using stallwatch::detector::BlockedThreadEvent;
using stallwatch::detector::ThreadInfo;

namespace {

ThreadInfo MakeInfo(std::string name, std::int64_t id, std::vector<std::string> frames) {
  ThreadInfo info;
  info.name = std::move(name);
  info.group_name = "default";
  info.id = id;
  info.priority = 0;
  info.stack_trace = std::move(frames);
  return info;
}

} // namespace

TEST_CASE("ThreadInfo renders a heading and one line per frame", "[detector][event]") {
  const ThreadInfo info = MakeInfo("main", 42, {"Loop::Run()+0x10", "main+0x2a"});

  REQUIRE(stallwatch::detector::Describe(info) ==
          "Stack trace of thread 'main' (id: 42, group: 'default').");
  REQUIRE(stallwatch::detector::ToString(info) ==
          "Stack trace of thread 'main' (id: 42, group: 'default').\n"
          "    at Loop::Run()+0x10\n"
          "    at main+0x2a");
}

TEST_CASE("ThreadInfo JSON escapes names and frames", "[detector][event][json]") {
  const ThreadInfo info = MakeInfo("io \"worker\"", 7, {"a\\b"});

  REQUIRE(stallwatch::detector::ToJson(info) ==
          R"({"name":"io \"worker\"","group":"default","id":7,"priority":0,"stack_trace":["a\\b"]})");
}

TEST_CASE("BlockedThreadEvent summary counts captured threads", "[detector][event]") {
  const BlockedThreadEvent none(std::chrono::milliseconds(1'000), {});
  REQUIRE(stallwatch::detector::Describe(none) ==
          "The monitored thread was blocked for at least 1000 ms (0 threads captured).");

  const BlockedThreadEvent one(std::chrono::milliseconds(1'200), {MakeInfo("main", 1, {"f"})});
  REQUIRE(stallwatch::detector::Describe(one) ==
          "The monitored thread was blocked for at least 1200 ms (1 thread captured).");
}

TEST_CASE("BlockedThreadEvent keeps thread order in text and JSON", "[detector][event][json]") {
  const BlockedThreadEvent event(std::chrono::milliseconds(1'000),
                                 {MakeInfo("second", 2, {"b"}), MakeInfo("first", 1, {"a"})});

  std::ostringstream out;
  out << event;
  const std::string text = out.str();
  REQUIRE(text == stallwatch::detector::ToString(event));
  REQUIRE(text.find("'second'") < text.find("'first'"));

  const std::string json = stallwatch::detector::ToJson(event);
  REQUIRE(json.rfind(R"({"blocked_ms":1000,"threads":[{"name":"second")", 0) == 0U);
  REQUIRE(json.find(R"({"name":"first")") != std::string::npos);
  REQUIRE(json.back() == '}');
}
