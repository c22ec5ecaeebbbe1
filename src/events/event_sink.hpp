#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace siteaudit::events {

// Destination for audit progress events (WebSocket bridge, JSONL file,
// in-memory stream). Send may be called from any thread.
class IEventSink {
public:
  virtual ~IEventSink() = default;
  virtual bool Send(const Event& event, std::string& error) = 0;
};

// Appends every event to one events.jsonl file.
class JsonlEventSink final : public IEventSink {
public:
  explicit JsonlEventSink(std::filesystem::path events_path);

  bool Send(const Event& event, std::string& error) override;

  const std::filesystem::path& path() const {
    return events_path_;
  }

private:
  const std::filesystem::path events_path_;
  std::mutex mu_;
};

// Unbounded in-memory queue read by streaming consumers.
class BufferedEventSink final : public IEventSink {
public:
  bool Send(const Event& event, std::string& error) override;

  // Waits up to `timeout` for the next event. Returns false on timeout, or
  // once the sink is closed and drained.
  bool Next(std::chrono::milliseconds timeout, Event& event);

  // Rejects further sends and wakes blocked readers.
  void Close();

  bool closed() const;
  std::size_t pending() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  bool closed_ = false;
};

// Delivers to every downstream sink, even after one fails. The errors of all
// failing sinks are joined with "; ".
class FanoutEventSink final : public IEventSink {
public:
  explicit FanoutEventSink(std::vector<IEventSink*> sinks);

  bool Send(const Event& event, std::string& error) override;

private:
  std::vector<IEventSink*> sinks_;
};

} // namespace siteaudit::events
