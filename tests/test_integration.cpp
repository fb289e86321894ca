#include "quicgate.hpp"

#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <fstream>
#include <netinet/in.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace quicgate;

// ============================================================================
// Scripted QUIC engine
// ============================================================================
//
// Datagrams are plain text "<cid> <command>". The fake connection turns
// commands into transport events and stream output into "<sid>:<fin>:<data>"
// datagrams, which is enough to drive the server loop end to end.
//

class FakeQuicConnection : public QuicConnection {
 public:
  explicit FakeQuicConnection(std::string cid) : cid_(std::move(cid)) {}

  void receive_datagram(std::string_view data, Clock::time_point /* now */) override {
    std::string command(data.substr(data.find(' ') + 1));
    if (command == "HELLO") {
      events_.emplace_back(ProtocolNegotiated{"hq-interop"});
    } else if (command.compare(0, 4, "GET ") == 0) {
      events_.emplace_back(StreamDataReceived{next_stream_id_, command + "\r\n", true});
      next_stream_id_ += 4;
    } else if (command == "BYE") {
      events_.emplace_back(ConnectionTerminated{0, "closed by peer"});
      closing_ = true;
    }
  }

  std::vector<TransportEvent> next_events() override {
    std::vector<TransportEvent> out;
    out.swap(events_);
    return out;
  }

  std::vector<std::string> datagrams_to_send(Clock::time_point /* now */) override {
    std::vector<std::string> out;
    out.swap(outgoing_);
    if (closing_) {
      closed_ = true;
    }
    return out;
  }

  void send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) override {
    outgoing_.push_back(std::to_string(stream_id) + ":" + (end_stream ? "1" : "0") + ":" + std::string(data));
  }

  optional<Clock::time_point> next_timer() const override { return {}; }

  void handle_timer(Clock::time_point /* now */) override {}

  void close(uint64_t error_code, const std::string& reason) override {
    outgoing_.push_back("CLOSE " + std::to_string(error_code) + " " + reason);
    closing_ = true;
  }

  bool is_closed() const override { return closed_; }

  std::string original_destination_cid() const override { return cid_; }

 private:
  std::string cid_;
  uint64_t next_stream_id_ = 0;
  std::vector<TransportEvent> events_;
  std::vector<std::string> outgoing_;
  bool closing_ = false;
  bool closed_ = false;
};

class FakeQuicEngine : public QuicEngine {
 public:
  std::string route(std::string_view datagram) const override {
    size_t space = datagram.find(' ');
    return space == std::string_view::npos ? std::string() : std::string(datagram.substr(0, space));
  }

  AcceptResult accept(std::string_view datagram, const EngineConfig& config) override {
    ++accept_calls;
    seen_alpn = config.alpn_protocols;
    AcceptResult result;
    std::string cid = route(datagram);
    if (datagram.substr(cid.size() + 1) == "HELLO") {
      result.connection = std::make_unique<FakeQuicConnection>(cid);
    } else {
      // Only a handshake starts a connection
      result.replies.push_back("RETRY " + cid);
    }
    return result;
  }

  std::atomic<int> accept_calls{0};
  std::vector<std::string> seen_alpn;
};

// ============================================================================
// Minimal UDP test client (raw POSIX socket)
// ============================================================================

class UdpTestClient {
 public:
  explicit UdpTestClient(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    server_.sin_family = AF_INET;
    server_.sin_port = htons(port);
    server_.sin_addr.s_addr = inet_addr("127.0.0.1");
  }

  ~UdpTestClient() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  bool send(const std::string& datagram) {
    ssize_t n = ::sendto(fd_, datagram.data(), datagram.size(), 0, reinterpret_cast<const sockaddr*>(&server_),
                         sizeof(server_));
    return n == static_cast<ssize_t>(datagram.size());
  }

  // Empty on timeout
  std::string recv(int timeout_ms = 1000) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buf[2048];
    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n <= 0) {
      return {};
    }
    return std::string(buf, static_cast<size_t>(n));
  }

  bool valid() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
  sockaddr_in server_{};
};

// ============================================================================
// Fixtures
// ============================================================================

namespace {

// Answers "hello <path>" to every request
Application greeting_app() {
  return [](const Scope& scope, Receive receive, Send send, Done done) {
    std::string path = scope.path;
    receive([path, send, done](InboundMessage) {
      if (send(HttpResponseStart{200, {}})) {
        auto sent = send(HttpResponseBody{"hello " + path});
        static_cast<void>(sent);
      }
      done(nullptr);
    });
  };
}

ServerConfig loopback_config() {
  ServerConfig config;
  config.host = "127.0.0.1";
  config.port = 0;
  return config;
}

struct ServerFixture {
  explicit ServerFixture(Application app = greeting_app(), ServerConfig config = loopback_config())
      : server(config, engine, std::move(app)), client(server.local_port()) {}

  // Send one datagram and let the server handle it
  void exchange(const std::string& datagram) {
    REQUIRE(client.send(datagram));
    server.poll_once(500);
  }

  FakeQuicEngine engine;
  Server server;
  UdpTestClient client;
};

// Owns a mutable argv
class Args {
 public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    for (auto& arg : storage_) {
      argv_.push_back(&arg[0]);
    }
    argv_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage_.size()); }

  char** argv() { return argv_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
};

}  // namespace

// ============================================================================
// Tests
// ============================================================================

TEST_CASE("Integration - Server binds an ephemeral port", "[integration]") {
  ServerFixture fixture;
  REQUIRE(fixture.server.local_port() != 0);
  REQUIRE(fixture.server.session_count() == 0);
  REQUIRE(fixture.client.valid());
  REQUIRE(fixture.server.engine_config().alpn_protocols == std::vector<std::string>{"h3-22", "hq-22"});
}

TEST_CASE("Integration - Request round trip", "[integration]") {
  ServerFixture fixture;

  fixture.exchange("c1 HELLO");
  REQUIRE(fixture.server.session_count() == 1);
  REQUIRE(fixture.engine.seen_alpn == std::vector<std::string>{"h3-22", "hq-22"});

  fixture.exchange("c1 GET /index.html");
  REQUIRE(fixture.client.recv() == "0:0:hello /index.html");
  REQUIRE(fixture.client.recv() == "0:1:");

  // A second request on the same connection gets the next stream
  fixture.exchange("c1 GET /two");
  REQUIRE(fixture.client.recv() == "4:0:hello /two");
  REQUIRE(fixture.client.recv() == "4:1:");

  const ServerStats& stats = fixture.server.stats();
  REQUIRE(stats.datagrams_in.load() == 3);
  REQUIRE(stats.datagrams_out.load() == 4);
  REQUIRE(stats.total_connections.load() == 1);
  REQUIRE(stats.active_connections.load() == 1);
  REQUIRE(fixture.engine.accept_calls.load() == 1);
}

TEST_CASE("Integration - Unroutable datagrams are dropped", "[integration]") {
  ServerFixture fixture;

  fixture.exchange("garbage");
  REQUIRE(fixture.server.stats().dropped_datagrams.load() == 1);

  // Engine answers but creates no connection
  fixture.exchange("c9 GET /");
  REQUIRE(fixture.client.recv() == "RETRY c9");
  REQUIRE(fixture.server.stats().dropped_datagrams.load() == 2);
  REQUIRE(fixture.server.session_count() == 0);
}

TEST_CASE("Integration - Closed connections are removed", "[integration]") {
  ServerFixture fixture;

  fixture.exchange("c1 HELLO");
  fixture.exchange("c2 HELLO");
  REQUIRE(fixture.server.session_count() == 2);

  fixture.exchange("c1 BYE");
  REQUIRE(fixture.server.session_count() == 1);
  REQUIRE(fixture.server.stats().active_connections.load() == 1);
  REQUIRE(fixture.server.stats().total_connections.load() == 2);
}

TEST_CASE("Integration - Application error closes the connection", "[integration]") {
  ServerFixture fixture([](const Scope&, Receive, Send, Done) { throw std::runtime_error("boom"); });

  fixture.exchange("c1 HELLO");
  fixture.exchange("c1 GET /");

  REQUIRE(fixture.client.recv() == "CLOSE 258 boom");
  REQUIRE(fixture.server.stats().application_errors.load() == 1);
  REQUIRE(fixture.server.session_count() == 0);
}

TEST_CASE("Integration - Non-standard exception closes only its connection", "[integration]") {
  ServerFixture fixture([](const Scope& scope, Receive, Send, Done) {
    if (scope.path == "/bad") {
      throw 42;
    }
  });

  fixture.exchange("c1 HELLO");
  fixture.exchange("c2 HELLO");
  fixture.exchange("c1 GET /bad");

  REQUIRE(fixture.client.recv() == "CLOSE 258 unknown application error");
  REQUIRE(fixture.server.stats().application_errors.load() == 1);
  REQUIRE(fixture.server.session_count() == 1);

  // The server keeps serving the other connection
  fixture.exchange("c2 GET /good");
  REQUIRE(fixture.server.session_count() == 1);
}

TEST_CASE("Integration - Session tickets go to the shared cache", "[integration]") {
  ServerFixture fixture;
  const EngineConfig& config = fixture.server.engine_config();

  SessionTicket ticket;
  ticket.ticket = "label";
  config.session_ticket_handler(ticket);
  REQUIRE(fixture.server.ticket_cache().size() == 1);
  REQUIRE(config.session_ticket_fetcher("label").has_value());
  REQUIRE_FALSE(config.session_ticket_fetcher("label").has_value());
}

TEST_CASE("Integration - Run, stop and qlog output", "[integration]") {
  const std::string qlog_path = "quicgate_integration.qlog";
  ServerConfig config = loopback_config();
  config.quic_log = qlog_path;

  FakeQuicEngine engine;
  Server server(config, engine, greeting_app());
  server.set_poll_timeout_ms(20);
  REQUIRE(server.event_log() != nullptr);

  std::thread thread([&server]() { server.run(); });

  UdpTestClient client(server.local_port());
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (server.stats().total_connections.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    client.send("c7 HELLO");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  server.stop();
  thread.join();
  REQUIRE(server.session_count() == 0);

  std::ifstream in(qlog_path);
  REQUIRE(in.good());
  Json doc = Json::parse(in);
  REQUIRE(doc["traces"].size() == 1);
  REQUIRE(doc["traces"][0]["common_fields"]["ODCID"].get<std::string>() == "c7");
  REQUIRE(doc["traces"][0]["events"][0][2].get<std::string>() == "protocol_negotiated");
  std::remove(qlog_path.c_str());
}

TEST_CASE("Integration - Bind failure throws", "[integration]") {
  ServerConfig config = loopback_config();
  config.host = "203.0.113.1";  // not a local address

  FakeQuicEngine engine;
  REQUIRE_THROWS_AS(Server(config, engine, greeting_app()), std::runtime_error);
}

TEST_CASE("Integration - serve command line", "[integration]") {
  FakeQuicEngine engine;

  Args help{"quicgate", "--help"};
  REQUIRE(serve(help.argc(), help.argv(), engine, greeting_app()) == 0);

  Args missing{"quicgate", "--port", "4433"};
  REQUIRE(serve(missing.argc(), missing.argv(), engine, greeting_app()) == 1);

  Args bad_files{"quicgate", "-c", "/nonexistent/cert.pem", "-k", "/nonexistent/key.pem"};
  REQUIRE(serve(bad_files.argc(), bad_files.argv(), engine, greeting_app()) == 1);
}
