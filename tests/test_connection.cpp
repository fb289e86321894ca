#include "quicgate/connection.hpp"
#include "quicgate/event_log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>

#include "test_helpers.hpp"

using namespace quicgate;
using namespace quicgate::test;

namespace {

// Replies "ok:<path>" to every request after reading its body
Application responding_app() {
  return [](const Scope& scope, Receive receive, Send send, Done done) {
    std::string path = scope.path;
    receive([path, send, done](InboundMessage) {
      REQUIRE(send(HttpResponseStart{200, {}}).has_value());
      REQUIRE(send(HttpResponseBody{"ok:" + path}).has_value());
      done(nullptr);
    });
  };
}

// Parks on receive and records everything it gets
Application parking_app(std::shared_ptr<std::vector<InboundMessage>> received) {
  return [received](const Scope&, Receive receive, Send, Done done) {
    receive_n(receive, 1, received, [done]() { done(nullptr); });
  };
}

struct ConnectionFixture {
  explicit ConnectionFixture(Application app, ConnectionConfig config = ConnectionConfig())
      : connection(transport, std::move(app), recording_factory(record), std::move(config)) {}

  void negotiate(const std::string& alpn = "h3-22") {
    connection.handle_transport_event(ProtocolNegotiated{alpn});
  }

  void open(uint64_t stream_id, const std::string& path = "/", bool ended = false) {
    connection.handle_http_event(HeadersReceived{stream_id, request_headers("GET", path), ended});
  }

  std::shared_ptr<FramingRecord> record = std::make_shared<FramingRecord>();
  RecordingTransport transport;
  Connection connection;
};

}  // namespace

// ============================================================================
// Negotiation
// ============================================================================

TEST_CASE("Connection - first negotiation wins", "[connection]") {
  ConnectionFixture fx(responding_app());
  REQUIRE_FALSE(fx.connection.negotiated());

  fx.negotiate("hq-22");
  fx.negotiate("h3-22");

  REQUIRE(fx.connection.negotiated());
  REQUIRE(fx.connection.framing_kind().value() == FramingKind::kH0);
}

TEST_CASE("Connection - unknown protocol leaves the connection idle", "[connection]") {
  ConnectionFixture fx(responding_app());

  fx.negotiate("spdy/3");
  REQUIRE_FALSE(fx.connection.negotiated());
  REQUIRE_FALSE(fx.connection.framing_kind().has_value());

  fx.connection.handle_transport_event(HandshakeCompleted{"h3-22", false});
  REQUIRE(fx.connection.framing_kind().value() == FramingKind::kH3);
}

TEST_CASE("Connection - events before negotiation are dropped", "[connection]") {
  ConnectionFixture fx(responding_app());

  fx.open(0);
  REQUIRE(fx.connection.active_streams() == 0);
  REQUIRE(fx.record->events.empty());

  fx.negotiate();
  fx.open(0);
  REQUIRE(fx.connection.active_streams() == 1);
}

TEST_CASE("Connection - missing framing keeps the connection idle", "[connection]") {
  RecordingTransport transport;
  Connection connection(transport, responding_app());

  // The default factory has no HTTP/3 framing
  connection.handle_transport_event(ProtocolNegotiated{"h3-22"});
  REQUIRE_FALSE(connection.negotiated());
  REQUIRE(transport.transmits == 1);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("Connection - one transmit per transport event", "[connection]") {
  ConnectionFixture fx(responding_app());

  fx.negotiate();
  REQUIRE(fx.transport.transmits == 1);

  fx.connection.handle_transport_event(StreamDataReceived{0, "x", false});
  REQUIRE(fx.transport.transmits == 2);
  REQUIRE(fx.record->events.size() == 2);
}

TEST_CASE("Connection - request runs its application", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.open(0, "/hello", true);
  REQUIRE(fx.connection.has_stream(0));
  REQUIRE(fx.connection.running_tasks() == 1);
  // Nothing runs until the scheduler is pumped
  REQUIRE(fx.record->frames.empty());

  fx.connection.run_pending();

  auto frames = fx.record->frames_for(0);
  REQUIRE(frames.size() == 3);
  REQUIRE(frames[0].header(":status") == "200");
  REQUIRE(frames[1].data == "ok:/hello");
  REQUIRE(frames[2].end_stream);

  REQUIRE_FALSE(fx.connection.has_stream(0));
  REQUIRE(fx.connection.stream_closed(0));
  REQUIRE(fx.connection.running_tasks() == 0);
}

TEST_CASE("Connection - headers with end of stream deliver an empty body", "[connection]") {
  auto received = std::make_shared<std::vector<InboundMessage>>();
  ConnectionFixture fx(parking_app(received));
  fx.negotiate();

  fx.open(0, "/", true);
  fx.connection.run_pending();

  REQUIRE(received->size() == 1);
  const auto& request = std::get<HttpRequest>((*received)[0]);
  REQUIRE(request.body.empty());
  REQUIRE_FALSE(request.more_body);
}

TEST_CASE("Connection - concurrent streams are independent", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.open(0, "/a");
  fx.open(4, "/b");
  REQUIRE(fx.connection.active_streams() == 2);

  fx.connection.handle_http_event(DataReceived{4, "", true});
  fx.connection.run_pending();

  REQUIRE(fx.record->frames_for(4).size() == 3);
  REQUIRE(fx.record->frames_for(0).empty());
  REQUIRE(fx.connection.has_stream(0));

  fx.connection.handle_http_event(DataReceived{0, "", true});
  fx.connection.run_pending();
  REQUIRE(fx.record->frames_for(0)[1].data == "ok:/a");
  REQUIRE(fx.connection.active_streams() == 0);
}

TEST_CASE("Connection - duplicate headers are ignored", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.open(0, "/first");
  auto handler = fx.connection.handler(0);
  fx.open(0, "/second");

  REQUIRE(fx.connection.active_streams() == 1);
  REQUIRE(fx.connection.handler(0) == handler);
  REQUIRE(handler->scope().path == "/first");
}

TEST_CASE("Connection - data for unknown streams is dropped", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.connection.handle_http_event(DataReceived{8, "stray", true});
  fx.connection.handle_http_event(StreamAborted{8});
  REQUIRE(fx.connection.active_streams() == 0);
  REQUIRE(fx.connection.run_pending() == 0);
}

TEST_CASE("Connection - websocket streams get a websocket handler", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.connection.handle_http_event(HeadersReceived{0, websocket_headers("/ws"), false});
  auto handler = fx.connection.handler(0);
  REQUIRE(handler != nullptr);
  REQUIRE(handler->scope().type == ScopeType::kWebSocket);
  REQUIRE(std::dynamic_pointer_cast<WebSocketHandler>(handler) != nullptr);
}

// ============================================================================
// Abort and termination
// ============================================================================

TEST_CASE("Connection - aborted stream delivers a disconnect", "[connection]") {
  auto received = std::make_shared<std::vector<InboundMessage>>();
  ConnectionFixture fx(parking_app(received));
  fx.negotiate();

  fx.open(0);
  fx.connection.run_pending();
  REQUIRE(received->empty());

  fx.connection.handle_http_event(StreamAborted{0});
  REQUIRE_FALSE(fx.connection.has_stream(0));
  REQUIRE(fx.connection.stream_closed(0));
  REQUIRE(fx.connection.running_tasks() == 1);

  // Data on the aborted stream no longer reaches the handler
  fx.connection.handle_http_event(DataReceived{0, "late", true});
  fx.connection.run_pending();

  REQUIRE(received->size() == 1);
  REQUIRE(std::holds_alternative<HttpDisconnect>((*received)[0]));
  REQUIRE(fx.connection.running_tasks() == 0);
  REQUIRE(fx.record->frames.empty());
}

TEST_CASE("Connection - aborted stream task ends even when it keeps receiving", "[connection]") {
  auto received = std::make_shared<std::vector<InboundMessage>>();
  ConnectionFixture fx([received](const Scope&, Receive receive, Send, Done done) {
    receive_n(receive, 2, received, [done]() { done(nullptr); });
  });
  fx.negotiate();

  fx.open(4);
  fx.connection.run_pending();
  fx.connection.handle_http_event(StreamAborted{4});
  fx.connection.run_pending();

  REQUIRE(received->size() == 2);
  REQUIRE(std::holds_alternative<HttpDisconnect>((*received)[1]));
  REQUIRE(fx.connection.active_streams() == 0);
  REQUIRE(fx.connection.running_tasks() == 0);
}

TEST_CASE("Connection - closed stream ids are never reused", "[connection]") {
  ConnectionFixture fx(responding_app());
  fx.negotiate();

  fx.open(0, "/", true);
  fx.connection.run_pending();
  REQUIRE(fx.connection.stream_closed(0));

  fx.open(0, "/again", true);
  REQUIRE(fx.connection.active_streams() == 0);
  REQUIRE(fx.connection.run_pending() == 0);
}

TEST_CASE("Connection - termination aborts every stream", "[connection]") {
  auto received = std::make_shared<std::vector<InboundMessage>>();
  ConnectionFixture fx(parking_app(received));
  fx.negotiate();

  fx.open(0);
  fx.open(4);
  fx.connection.run_pending();

  fx.connection.handle_transport_event(ConnectionTerminated{0, "idle timeout"});
  REQUIRE(fx.connection.active_streams() == 0);
  fx.connection.run_pending();

  REQUIRE(received->size() == 2);
  REQUIRE(std::holds_alternative<HttpDisconnect>((*received)[0]));
  REQUIRE(std::holds_alternative<HttpDisconnect>((*received)[1]));

  // No new streams after termination
  fx.open(8);
  REQUIRE(fx.connection.active_streams() == 0);
}

TEST_CASE("Connection - application failure propagates from run_pending", "[connection]") {
  ConnectionFixture fx([](const Scope&, Receive, Send, Done) { throw std::runtime_error("broken app"); });
  fx.negotiate();
  fx.open(0);

  REQUIRE_THROWS_AS(fx.connection.run_pending(), std::runtime_error);
  REQUIRE_FALSE(fx.connection.has_stream(0));
  REQUIRE(fx.connection.running_tasks() == 0);
}

// ============================================================================
// HTTP/0.9 and tracing
// ============================================================================

TEST_CASE("Connection - hq request over real framing", "[connection]") {
  RecordingTransport transport;
  auto scope_seen = std::make_shared<Scope>();
  Connection connection(transport, [scope_seen](const Scope& scope, Receive receive, Send send, Done done) {
    *scope_seen = scope;
    receive([send, done](InboundMessage) {
      REQUIRE(send(HttpResponseStart{200, {{"content-type", "text/plain"}}}).has_value());
      REQUIRE(send(HttpResponseBody{"hello"}).has_value());
      done(nullptr);
    });
  });

  connection.handle_transport_event(ProtocolNegotiated{"hq-interop"});
  connection.handle_transport_event(StreamDataReceived{0, "GET /index.html\r\n", true});
  connection.run_pending();

  REQUIRE(scope_seen->http_version == "0.9");
  REQUIRE(scope_seen->method == "GET");
  REQUIRE(scope_seen->path == "/index.html");

  // No header block on the wire
  REQUIRE(transport.writes.size() == 2);
  REQUIRE(transport.writes[0].data == "hello");
  REQUIRE_FALSE(transport.writes[0].end_stream);
  REQUIRE(transport.writes[1].data.empty());
  REQUIRE(transport.writes[1].end_stream);
}

TEST_CASE("Connection - stream lifecycle is traced", "[connection]") {
  ConnectionConfig config;
  config.trace = std::make_shared<EventTrace>("8394c8f03e515708");
  ConnectionFixture fx(responding_app(), config);

  fx.negotiate();
  fx.open(0, "/", true);
  fx.connection.run_pending();

  Json events = config.trace->to_json()["events"];
  REQUIRE(events.size() == 3);
  REQUIRE(events[0][1].get<std::string>() == "http");
  REQUIRE(events[0][2].get<std::string>() == "protocol_negotiated");
  REQUIRE(events[1][2].get<std::string>() == "stream_opened");
  REQUIRE(events[2][2].get<std::string>() == "stream_closed");
  REQUIRE(events[2][3]["stream_id"].get<uint64_t>() == 0);
}
