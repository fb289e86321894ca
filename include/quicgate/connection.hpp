/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_CONNECTION_HPP_
#define QUICGATE_CONNECTION_HPP_

#include "events.hpp"
#include "framing.hpp"
#include "handler.hpp"
#include "messages.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace quicgate {

class EventTrace;

// Builds the request Scope from the initiating headers of a stream.
// `:protocol websocket` on a CONNECT selects a websocket scope.
Scope build_scope(const HeaderList& headers, const std::string& http_version);

struct ConnectionConfig {
  std::string server_name = "quicgate";    // value of the `server` response header
  std::shared_ptr<EventTrace> trace;       // optional qlog trace
  size_t max_message_size = WsCodec::kDefaultMaxMessageSize;
};

// ============================================================================
// Connection - stream dispatcher of one QUIC connection
// ============================================================================

/**
 * @brief Routes the transport events of one connection to per-stream handlers.
 *
 * Selects the HTTP framing on protocol negotiation, creates a RequestHandler
 * or WebSocketHandler for every new request stream and schedules its
 * application task. Stream tasks only run from run_pending(), on the thread
 * that feeds the events.
 */
class Connection {
 public:
  Connection(Transport& transport, Application app, FramingFactory factory = default_framing_factory(),
             ConnectionConfig config = ConnectionConfig());

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Entry point for the engine. Ends with exactly one transmit().
  void handle_transport_event(const TransportEvent& event);

  // First negotiation wins. Unknown protocols leave the connection idle.
  void on_transport_negotiated(std::string_view alpn);

  void handle_http_event(const HttpEvent& event);

  // Runs the scheduled stream tasks, then flushes. An exception raised by an
  // application propagates to the caller.
  size_t run_pending();

  Scheduler& scheduler() { return scheduler_; }

  bool negotiated() const { return framing_ != nullptr; }

  optional<FramingKind> framing_kind() const;

  // Streams still routed to a handler
  size_t active_streams() const { return streams_.size(); }

  bool has_stream(uint64_t stream_id) const { return streams_.count(stream_id) != 0; }

  bool stream_closed(uint64_t stream_id) const { return closed_ids_.count(stream_id) != 0; }

  // Handlers whose application has not called done yet
  size_t running_tasks() const { return streams_.size() + detached_.size(); }

  StreamHandler::Ptr handler(uint64_t stream_id) const;

 private:
  void open_stream(const HeadersReceived& event);
  void abort_stream(uint64_t stream_id);
  void abort_all();
  void on_stream_finished(uint64_t stream_id);
  void trace_stream(const char* event, uint64_t stream_id);

  Transport& transport_;
  Application app_;
  FramingFactory factory_;
  ConnectionConfig config_;
  bool terminated_ = false;

  std::unique_ptr<HttpFraming> framing_;
  std::unordered_map<uint64_t, StreamHandler::Ptr> streams_;
  // Reset streams whose application is still running
  std::unordered_map<uint64_t, StreamHandler::Ptr> detached_;
  std::unordered_set<uint64_t> closed_ids_;

  // Declared last: queued tasks release their handlers first
  Scheduler scheduler_;
};

}  // namespace quicgate

#endif  // QUICGATE_CONNECTION_HPP_
