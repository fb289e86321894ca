#include "quicgate/connection.hpp"

#include "quicgate/event_log.hpp"
#include "quicgate/log.hpp"
#include "quicgate/utils.hpp"

#include <utility>
#include <vector>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.connection";

}  // namespace

// ============================================================================
// Scope construction
// ============================================================================

Scope build_scope(const HeaderList& headers, const std::string& http_version) {
  Scope scope;
  scope.http_version = http_version;

  std::string protocol;
  const std::string* subprotocol_header = nullptr;

  for (const auto& header : headers) {
    if (header.name == ":authority") {
      scope.headers.push_back({"host", header.value});
    } else if (header.name == ":method") {
      scope.method = header.value;
    } else if (header.name == ":path") {
      scope.raw_path = header.value;
    } else if (header.name == ":protocol") {
      protocol = header.value;
    } else if (!header.name.empty() && header.name[0] != ':') {
      if (header.name == "sec-websocket-protocol") {
        subprotocol_header = &header.value;
      }
      scope.headers.push_back(header);
    }
  }

  size_t question = scope.raw_path.find('?');
  if (question == std::string::npos) {
    scope.path = scope.raw_path;
  } else {
    scope.path = scope.raw_path.substr(0, question);
    scope.query_string = scope.raw_path.substr(question + 1);
  }

  if (scope.method == "CONNECT" && protocol == "websocket") {
    scope.type = ScopeType::kWebSocket;
    scope.scheme = "wss";
    if (subprotocol_header != nullptr) {
      scope.subprotocols = split_comma_list(*subprotocol_header);
    }
  } else {
    scope.type = ScopeType::kHttp;
    scope.scheme = "https";
  }
  return scope;
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(Transport& transport, Application app, FramingFactory factory, ConnectionConfig config)
    : transport_(transport), app_(std::move(app)), factory_(std::move(factory)), config_(std::move(config)) {}

Connection::~Connection() = default;

optional<FramingKind> Connection::framing_kind() const {
  if (!framing_) {
    return {};
  }
  return framing_->kind();
}

StreamHandler::Ptr Connection::handler(uint64_t stream_id) const {
  auto it = streams_.find(stream_id);
  if (it != streams_.end()) {
    return it->second;
  }
  it = detached_.find(stream_id);
  return it != detached_.end() ? it->second : nullptr;
}

void Connection::handle_transport_event(const TransportEvent& event) {
  std::visit(overloaded{
                 [this](const ProtocolNegotiated& ev) { on_transport_negotiated(ev.alpn_protocol); },
                 [this](const HandshakeCompleted& ev) {
                   if (!ev.alpn_protocol.empty()) {
                     on_transport_negotiated(ev.alpn_protocol);
                   }
                   if (ev.session_resumed) {
                     QUICGATE_LOG_DEBUG(kLogName, "session resumed");
                   }
                 },
                 [](const StreamDataReceived&) {},
                 [](const StreamReset&) {},
                 [this](const ConnectionTerminated& ev) {
                   QUICGATE_LOG_DEBUG(kLogName, "connection terminated: " + ev.reason);
                   terminated_ = true;
                   abort_all();
                 },
             },
             event);

  if (framing_) {
    for (const HttpEvent& http_event : framing_->handle_event(event)) {
      handle_http_event(http_event);
    }
  }

  transport_.transmit();
}

void Connection::on_transport_negotiated(std::string_view alpn) {
  if (framing_) {
    return;
  }

  optional<FramingKind> kind = framing_for_alpn(alpn);
  if (!kind) {
    QUICGATE_LOG_WARN(kLogName, "unsupported ALPN protocol " + std::string(alpn));
    return;
  }

  framing_ = factory_ ? factory_(kind.value(), transport_) : nullptr;
  if (!framing_) {
    QUICGATE_LOG_ERROR(kLogName, "no framing available for " + std::string(alpn));
    return;
  }

  QUICGATE_LOG_INFO(kLogName, "negotiated " + std::string(alpn));
  if (config_.trace) {
    config_.trace->log_event("http", "protocol_negotiated", {{"alpn", std::string(alpn)}});
  }
}

void Connection::handle_http_event(const HttpEvent& event) {
  if (!framing_) {
    return;
  }
  std::visit(overloaded{
                 [this](const HeadersReceived& ev) { open_stream(ev); },
                 [this](const DataReceived& ev) {
                   auto it = streams_.find(ev.stream_id);
                   if (it == streams_.end()) {
                     return;
                   }
                   it->second->handle_data(ev);
                 },
                 [this](const StreamAborted& ev) { abort_stream(ev.stream_id); },
             },
             event);
}

size_t Connection::run_pending() {
  size_t ran = scheduler_.run_pending();
  transport_.transmit();
  return ran;
}

void Connection::open_stream(const HeadersReceived& event) {
  const uint64_t stream_id = event.stream_id;
  if (terminated_ || streams_.count(stream_id) != 0 || closed_ids_.count(stream_id) != 0 ||
      detached_.count(stream_id) != 0) {
    QUICGATE_LOG_DEBUG(kLogName, "ignoring headers on stream " + std::to_string(stream_id));
    return;
  }

  Scope scope = build_scope(event.headers, http_version_of(framing_->kind()));

  StreamContext context{*framing_, scheduler_, [this]() { transport_.transmit(); },
                        [this](uint64_t id) { on_stream_finished(id); }, config_.server_name,
                        config_.max_message_size};

  StreamHandler::Ptr handler;
  if (scope.type == ScopeType::kWebSocket) {
    handler = std::make_shared<WebSocketHandler>(stream_id, std::move(scope), std::move(context));
  } else {
    handler = std::make_shared<RequestHandler>(stream_id, std::move(scope), std::move(context));
  }
  streams_.emplace(stream_id, handler);

  QUICGATE_LOG_DEBUG(kLogName, handler->scope().method + " " + handler->scope().raw_path + " on stream " +
                                   std::to_string(stream_id));
  trace_stream("stream_opened", stream_id);

  scheduler_.post([this, handler]() { handler->run_application(app_); });

  if (event.stream_ended) {
    handler->handle_data(DataReceived{stream_id, std::string(), true});
  }
}

void Connection::abort_stream(uint64_t stream_id) {
  auto it = streams_.find(stream_id);
  if (it == streams_.end()) {
    return;
  }
  StreamHandler::Ptr handler = std::move(it->second);
  streams_.erase(it);
  closed_ids_.insert(stream_id);
  if (!handler->finished()) {
    detached_.emplace(stream_id, handler);
  }
  trace_stream("stream_closed", stream_id);
  handler->handle_reset();
}

void Connection::abort_all() {
  std::vector<uint64_t> ids;
  ids.reserve(streams_.size());
  for (const auto& entry : streams_) {
    ids.push_back(entry.first);
  }
  for (uint64_t id : ids) {
    abort_stream(id);
  }
}

void Connection::on_stream_finished(uint64_t stream_id) {
  bool routed = streams_.erase(stream_id) != 0;
  detached_.erase(stream_id);
  closed_ids_.insert(stream_id);
  if (routed) {
    trace_stream("stream_closed", stream_id);
  }
}

void Connection::trace_stream(const char* event, uint64_t stream_id) {
  if (config_.trace) {
    config_.trace->log_event("http", event, {{"stream_id", stream_id}});
  }
}

}  // namespace quicgate
