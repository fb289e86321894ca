/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_EVENT_LOG_HPP_
#define QUICGATE_EVENT_LOG_HPP_

#include "vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quicgate {

using Json = nlohmann::json;

// ============================================================================
// EventTrace - protocol events of one connection
// ============================================================================

class EventTrace {
 public:
  // `odcid` is the hex encoded original destination connection id
  explicit EventTrace(std::string odcid);

  // Times are microseconds relative to the creation of the trace.
  void log_event(const std::string& category, const std::string& event, Json data = Json::object());

  Json to_json() const;

  const std::string& odcid() const { return odcid_; }

  size_t size() const;

 private:
  const std::string odcid_;
  const std::chrono::steady_clock::time_point start_;
  mutable std::mutex mutex_;
  std::vector<Json> events_;
};

// ============================================================================
// EventLog - qlog collection shared by all connections of a server
// ============================================================================

/**
 * @brief Collects one EventTrace per connection and serializes them as a
 *        qlog (draft-01) document.
 */
class EventLog {
 public:
  std::shared_ptr<EventTrace> start_trace(const std::string& odcid);

  Json to_json() const;

  // Writes the document with 4-space indentation, replacing `path`.
  expected<void, ErrorCode> write_file(const std::string& path) const;

  size_t trace_count() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<EventTrace>> traces_;
};

}  // namespace quicgate

#endif  // QUICGATE_EVENT_LOG_HPP_
