#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "events/event_model.hpp"
#include "events/event_sink.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using siteaudit::tests::common::AssertContains;
using siteaudit::tests::common::Fail;

namespace {

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open events.jsonl");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

} // namespace

int main() {
  using siteaudit::events::BufferedEventSink;
  using siteaudit::events::Event;
  using siteaudit::events::EventType;
  using siteaudit::events::FanoutEventSink;
  using siteaudit::events::JsonlEventSink;

  const fs::path out_dir = siteaudit::tests::common::CreateUniqueTempDir("siteaudit-events-jsonl");
  const fs::path events_path = out_dir / "audit-1" / "events.jsonl";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kAuditStarted;
  first.payload = {
      {"audit_id", "audit-1"},
      {"url", "https://shop.example.com/"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  second.type = EventType::kStageCompleted;
  second.payload = {
      {"stage", "investigate"},
      {"fallback.vision", "simplified"},
  };

  Event third;
  third.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(3'000));
  third.type = EventType::kAuditComplete;
  third.payload = {
      {"final_score", "87"},
      {"risk_level", "probably_safe"},
  };

  std::string error;
  if (!siteaudit::events::AppendEventJsonl(first, events_path, error)) {
    Fail("failed to append first event: " + error);
  }

  // The remaining events go through the sink stack used by streamed audits.
  JsonlEventSink file_sink(events_path);
  BufferedEventSink stream;
  FanoutEventSink fanout({&file_sink, &stream});
  if (!fanout.Send(second, error)) {
    Fail("fanout send failed: " + error);
  }
  if (!fanout.Send(third, error)) {
    Fail("fanout send failed: " + error);
  }

  const std::vector<std::string> lines = ReadNonEmptyLines(events_path);
  if (lines.size() != 3U) {
    Fail("expected exactly three event lines");
  }

  AssertContains(lines[0], "\"ts_utc\":\"1970-01-01T00:00:01.000Z\"");
  AssertContains(lines[0], "\"type\":\"audit_started\"");
  AssertContains(lines[0], "\"audit_id\":\"audit-1\"");

  AssertContains(lines[1], "\"ts_utc\":\"1970-01-01T00:00:02.000Z\"");
  AssertContains(lines[1], "\"type\":\"stage_completed\"");
  AssertContains(lines[1], "\"fallback.vision\":\"simplified\"");

  AssertContains(lines[2], "\"ts_utc\":\"1970-01-01T00:00:03.000Z\"");
  AssertContains(lines[2], "\"type\":\"audit_complete\"");
  AssertContains(lines[2], "\"final_score\":\"87\"");

  if (stream.pending() != 2U) {
    Fail("buffered sink should hold both fanned-out events");
  }
  Event streamed;
  if (!stream.Next(std::chrono::milliseconds(10), streamed) ||
      streamed.type != EventType::kStageCompleted) {
    Fail("buffered sink should yield events in send order");
  }

  // A closed stream rejects sends, but fanout still reaches the file.
  stream.Close();
  if (fanout.Send(first, error)) {
    Fail("fanout should report the closed stream");
  }
  AssertContains(error, "event stream is closed");
  if (ReadNonEmptyLines(events_path).size() != 4U) {
    Fail("file sink should still receive events after another sink fails");
  }

  // Remaining queued events drain after close, then Next reports the end.
  if (!stream.Next(std::chrono::milliseconds(10), streamed) ||
      streamed.type != EventType::kAuditComplete) {
    Fail("closed stream should still drain queued events");
  }
  if (stream.Next(std::chrono::milliseconds(10), streamed)) {
    Fail("drained closed stream should report no more events");
  }

  siteaudit::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "events_jsonl_smoke: ok\n";
  return 0;
}
