#include "quicgate/event_log.hpp"

#include "quicgate/log.hpp"

#include <fstream>
#include <utility>

namespace quicgate {

// ============================================================================
// EventTrace
// ============================================================================

EventTrace::EventTrace(std::string odcid) : odcid_(std::move(odcid)), start_(std::chrono::steady_clock::now()) {}

void EventTrace::log_event(const std::string& category, const std::string& event, Json data) {
  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);

  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(Json::array({std::to_string(elapsed.count()), category, event, std::move(data)}));
}

Json EventTrace::to_json() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Json trace;
  trace["common_fields"] = {{"ODCID", odcid_}, {"reference_time", "0"}};
  trace["configuration"] = {{"time_units", "us"}};
  trace["event_fields"] = {"relative_time", "category", "event_type", "data"};
  trace["events"] = events_;
  trace["vantage_point"] = {{"name", "quicgate"}, {"type", "server"}};
  return trace;
}

size_t EventTrace::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

// ============================================================================
// EventLog
// ============================================================================

std::shared_ptr<EventTrace> EventLog::start_trace(const std::string& odcid) {
  auto trace = std::make_shared<EventTrace>(odcid);
  std::lock_guard<std::mutex> lock(mutex_);
  traces_.push_back(trace);
  return trace;
}

Json EventLog::to_json() const {
  Json traces = Json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& trace : traces_) {
      traces.push_back(trace->to_json());
    }
  }
  return Json{{"qlog_version", "draft-01"}, {"traces", std::move(traces)}};
}

expected<void, ErrorCode> EventLog::write_file(const std::string& path) const {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    QUICGATE_LOG_ERROR("quicgate.qlog", "cannot open " + path);
    return expected<void, ErrorCode>::error(ErrorCode::kIoError);
  }
  out << to_json().dump(4) << '\n';
  if (!out) {
    QUICGATE_LOG_ERROR("quicgate.qlog", "write failed: " + path);
    return expected<void, ErrorCode>::error(ErrorCode::kIoError);
  }
  return expected<void, ErrorCode>::success();
}

size_t EventLog::trace_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return traces_.size();
}

}  // namespace quicgate
