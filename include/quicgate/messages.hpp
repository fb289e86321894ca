/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_MESSAGES_HPP_
#define QUICGATE_MESSAGES_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quicgate {

// ============================================================================
// Headers and Scope
// ============================================================================

// Header names and values are raw bytes.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header& other) const { return name == other.name && value == other.value; }
};

using HeaderList = std::vector<Header>;

enum class ScopeType { kHttp, kWebSocket };

// Immutable description of one request, built once from the stream's headers.
struct Scope {
  ScopeType type = ScopeType::kHttp;
  std::string http_version;  // "3" or "0.9"
  std::string method;
  std::string path;
  std::string query_string;
  std::string raw_path;
  std::string root_path;
  std::string scheme;  // "https" or "wss"
  HeaderList headers;
  std::vector<std::string> subprotocols;  // websocket only
};

// ============================================================================
// Inbound messages (transport -> application)
// ============================================================================

struct HttpRequest {  // "http.request"
  std::string body;
  bool more_body = false;
};

struct HttpDisconnect {};  // "http.disconnect"

struct WebSocketConnect {};  // "websocket.connect"

struct WebSocketReceiveText {  // "websocket.receive" with text
  std::string text;
};

struct WebSocketReceiveBytes {  // "websocket.receive" with bytes
  std::string bytes;
};

struct WebSocketDisconnect {  // "websocket.disconnect"
  uint16_t code = 1000;
};

using InboundMessage = std::variant<HttpRequest, HttpDisconnect, WebSocketConnect, WebSocketReceiveText,
                                    WebSocketReceiveBytes, WebSocketDisconnect>;

// ============================================================================
// Outbound messages (application -> transport)
// ============================================================================

struct HttpResponseStart {  // "http.response.start"
  uint16_t status = 200;
  HeaderList headers;
};

struct HttpResponseBody {  // "http.response.body"
  std::string body;
};

struct WebSocketAccept {  // "websocket.accept"
  std::string subprotocol;  // empty: none selected
};

struct WebSocketClose {  // "websocket.close"
  uint16_t code = 1000;
};

struct WebSocketSendText {  // "websocket.send" with text
  std::string text;
};

struct WebSocketSendBytes {  // "websocket.send" with bytes
  std::string bytes;
};

using OutboundMessage = std::variant<HttpResponseStart, HttpResponseBody, WebSocketAccept, WebSocketClose,
                                     WebSocketSendText, WebSocketSendBytes>;

const char* message_type(const InboundMessage& message);
const char* message_type(const OutboundMessage& message);

// ============================================================================
// Application interface
// ============================================================================

// Continuation invoked once with the next inbound message of the stream.
using ReceiveCallback = std::function<void(InboundMessage)>;

// Parks `callback` until the stream's mailbox holds a message.
using Receive = std::function<void(ReceiveCallback)>;

// Emits one outbound message; flushes the connection.
using Send = std::function<expected<void, ErrorCode>(OutboundMessage)>;

// Signals that the application is finished with the stream. A non-null
// exception marks the stream task as failed and is rethrown by the scheduler.
using Done = std::function<void(std::exception_ptr)>;

// Invoked once per stream. Must call `done` exactly once.
using Application = std::function<void(const Scope&, Receive, Send, Done)>;

// Helper for exhaustive std::visit over the message variants.
template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace quicgate

#endif  // QUICGATE_MESSAGES_HPP_
