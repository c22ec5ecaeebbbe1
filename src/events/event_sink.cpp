#include "events/event_sink.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace siteaudit::events {

JsonlEventSink::JsonlEventSink(std::filesystem::path events_path)
    : events_path_(std::move(events_path)) {}

bool JsonlEventSink::Send(const Event& event, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, events_path_, error);
}

bool BufferedEventSink::Send(const Event& event, std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      error = "event stream is closed";
      return false;
    }
    queue_.push_back(event);
  }
  cv_.notify_all();
  return true;
}

bool BufferedEventSink::Next(std::chrono::milliseconds timeout, Event& event) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
    return false;
  }
  if (queue_.empty()) {
    return false;
  }
  event = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

void BufferedEventSink::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool BufferedEventSink::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t BufferedEventSink::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

FanoutEventSink::FanoutEventSink(std::vector<IEventSink*> sinks) : sinks_(std::move(sinks)) {}

bool FanoutEventSink::Send(const Event& event, std::string& error) {
  bool all_ok = true;
  std::string joined;
  for (IEventSink* sink : sinks_) {
    if (sink == nullptr) {
      continue;
    }
    std::string sink_error;
    if (!sink->Send(event, sink_error)) {
      all_ok = false;
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += sink_error;
    }
  }
  if (!all_ok) {
    error = joined;
  }
  return all_ok;
}

} // namespace siteaudit::events
