#include "demo_app.hpp"

#include "quicgate/log.hpp"

#include <memory>
#include <string>
#include <utility>

namespace quicgate {
namespace demo {

namespace {

constexpr std::string_view kLogName = "quicgate.demo";

const char kIndexPage[] =
    "<!DOCTYPE html>\n"
    "<html>\n"
    "<head><title>quicgate</title></head>\n"
    "<body>\n"
    "<h1>Welcome to quicgate</h1>\n"
    "<p>This page was served over QUIC.</p>\n"
    "<ul>\n"
    "<li><a href=\"/echo\">/echo</a> returns the request body</li>\n"
    "<li><code>/ws</code> is a WebSocket echo endpoint</li>\n"
    "</ul>\n"
    "</body>\n"
    "</html>\n";

// ============================================================================
// HTTP exchange
// ============================================================================

class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
 public:
  HttpExchange(const Scope& scope, Receive receive, Send send, Done done)
      : scope_(scope), receive_(std::move(receive)), send_(std::move(send)), done_(std::move(done)) {}

  // Collect the whole body, then answer
  void read_body() {
    auto self = shared_from_this();
    receive_([self](InboundMessage message) {
      if (auto* request = std::get_if<HttpRequest>(&message)) {
        self->body_ += request->body;
        if (request->more_body) {
          self->read_body();
        } else {
          self->respond();
        }
        return;
      }
      // Disconnected
      self->done_(nullptr);
    });
  }

 private:
  void respond() {
    if (scope_.path == "/" && (scope_.method == "GET" || scope_.method.empty())) {
      reply(200, "text/html; charset=utf-8", kIndexPage);
    } else if (scope_.path == "/echo") {
      reply(200, "application/octet-stream", body_);
    } else {
      reply(404, "text/plain", "Not Found\n");
    }
    done_(nullptr);
  }

  void reply(uint16_t status, const std::string& content_type, const std::string& body) {
    HeaderList headers = {{"content-type", content_type}, {"content-length", std::to_string(body.size())}};
    auto started = send_(HttpResponseStart{status, std::move(headers)});
    if (!started) {
      QUICGATE_LOG_DEBUG(kLogName, std::string("response start failed: ") + error_code_name(started.get_error()));
      return;
    }
    auto sent = send_(HttpResponseBody{body});
    if (!sent) {
      QUICGATE_LOG_DEBUG(kLogName, std::string("response body failed: ") + error_code_name(sent.get_error()));
    }
  }

  const Scope scope_;
  Receive receive_;
  Send send_;
  Done done_;
  std::string body_;
};

// ============================================================================
// WebSocket echo session
// ============================================================================

class EchoSession : public std::enable_shared_from_this<EchoSession> {
 public:
  EchoSession(const Scope& scope, Receive receive, Send send, Done done)
      : scope_(scope), receive_(std::move(receive)), send_(std::move(send)), done_(std::move(done)) {}

  void next() {
    auto self = shared_from_this();
    receive_([self](InboundMessage message) { self->on_message(std::move(message)); });
  }

 private:
  void on_message(InboundMessage message) {
    bool keep_going = std::visit(overloaded{
                                     [this](WebSocketConnect&) { return on_connect(); },
                                     [this](WebSocketReceiveText& msg) {
                                       return static_cast<bool>(send_(WebSocketSendText{std::move(msg.text)}));
                                     },
                                     [this](WebSocketReceiveBytes& msg) {
                                       return static_cast<bool>(send_(WebSocketSendBytes{std::move(msg.bytes)}));
                                     },
                                     [](WebSocketDisconnect&) { return false; },
                                     [](auto&) { return false; },
                                 },
                                 message);
    if (keep_going) {
      next();
    } else {
      done_(nullptr);
    }
  }

  bool on_connect() {
    if (scope_.path != "/ws") {
      // Refuse the upgrade
      auto closed = send_(WebSocketClose{});
      if (!closed) {
        QUICGATE_LOG_DEBUG(kLogName, std::string("refusing upgrade failed: ") + error_code_name(closed.get_error()));
      }
      return false;
    }
    std::string subprotocol = scope_.subprotocols.empty() ? std::string() : scope_.subprotocols.front();
    return static_cast<bool>(send_(WebSocketAccept{subprotocol}));
  }

  const Scope scope_;
  Receive receive_;
  Send send_;
  Done done_;
};

}  // namespace

Application make_demo_app() {
  return [](const Scope& scope, Receive receive, Send send, Done done) {
    if (scope.type == ScopeType::kWebSocket) {
      std::make_shared<EchoSession>(scope, std::move(receive), std::move(send), std::move(done))->next();
    } else {
      std::make_shared<HttpExchange>(scope, std::move(receive), std::move(send), std::move(done))->read_body();
    }
  };
}

}  // namespace demo
}  // namespace quicgate
