/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_HANDLER_HPP_
#define QUICGATE_HANDLER_HPP_

#include "events.hpp"
#include "framing.hpp"
#include "mailbox.hpp"
#include "messages.hpp"
#include "scheduler.hpp"
#include "vocabulary.hpp"
#include "ws_codec.hpp"

#include <cstddef>
#include <cstdint>

#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace quicgate {

// What a Connection lends to each of its stream handlers.
struct StreamContext {
  HttpFraming& framing;
  Scheduler& scheduler;
  std::function<void()> transmit;
  std::function<void(uint64_t)> on_finished;  // application done, drop the stream
  std::string server_name;
  size_t max_message_size = WsCodec::kDefaultMaxMessageSize;  // websocket messages and pre-accept bytes
};

// ============================================================================
// StreamHandler - bridges one stream to one application invocation
// ============================================================================

class StreamHandler : public std::enable_shared_from_this<StreamHandler> {
 public:
  using Ptr = std::shared_ptr<StreamHandler>;

  StreamHandler(uint64_t stream_id, Scope scope, StreamContext context)
      : stream_id_(stream_id),
        scope_(std::move(scope)),
        context_(std::move(context)),
        mailbox_(context_.scheduler) {}

  virtual ~StreamHandler() = default;

  StreamHandler(const StreamHandler&) = delete;
  StreamHandler& operator=(const StreamHandler&) = delete;

  uint64_t stream_id() const { return stream_id_; }

  const Scope& scope() const { return scope_; }

  // Data arrived on the stream.
  virtual void handle_data(const DataReceived& event) = 0;

  // The stream was reset by the peer or the connection went away.
  virtual void handle_reset() = 0;

  // Emit one application message. Every call flushes the connection.
  virtual expected<void, ErrorCode> send(const OutboundMessage& message) = 0;

  // Body of the stream task: invokes the application with the stream's
  // receive / send / done capabilities. Exceptions raised by the application
  // propagate out of here (or out of the receive continuation that raised
  // them) after the stream has been dropped.
  void run_application(const Application& app);

  bool finished() const { return finished_; }

  bool is_reset() const { return reset_; }

  size_t pending_messages() const { return mailbox_.size(); }

 protected:
  // Variant specific completion, before the stream leaves the table.
  virtual void on_application_finished(bool failed) = 0;

  void flush() {
    if (context_.transmit) {
      context_.transmit();
    }
  }

  HttpFraming& framing() { return context_.framing; }

  const std::string& server_name() const { return context_.server_name; }

  HeaderList base_response_headers(uint16_t status) const;

  const uint64_t stream_id_;
  const Scope scope_;
  StreamContext context_;
  Mailbox mailbox_;
  bool reset_ = false;

 private:
  void receive(ReceiveCallback callback);
  void complete(std::exception_ptr error);

  bool finished_ = false;
};

// ============================================================================
// RequestHandler - one HTTP request / response exchange
// ============================================================================

enum class RequestState {
  kAwaitingBody,   // No request data yet
  kStreamingBody,  // Request data flowing to the application
  kHalfClosed,     // Application returned, end of stream pending
  kClosed          // End of stream sent
};

class RequestHandler : public StreamHandler {
 public:
  RequestHandler(uint64_t stream_id, Scope scope, StreamContext context)
      : StreamHandler(stream_id, std::move(scope), std::move(context)) {}

  void handle_data(const DataReceived& event) override;
  void handle_reset() override;
  expected<void, ErrorCode> send(const OutboundMessage& message) override;

  RequestState state() const { return state_; }

  bool response_started() const { return response_started_; }

 protected:
  void on_application_finished(bool failed) override;

 private:
  RequestState state_ = RequestState::kAwaitingBody;
  bool request_complete_ = false;
  bool response_started_ = false;
};

// ============================================================================
// WebSocketHandler - one WebSocket session over extended CONNECT
// ============================================================================

enum class WebSocketState {
  kConnecting,  // Waiting for websocket.accept
  kOpen,        // Accepted, messages flowing
  kClosing,     // Close frame received from the peer
  kClosed       // Our close sent (or upgrade rejected)
};

class WebSocketHandler : public StreamHandler {
 public:
  WebSocketHandler(uint64_t stream_id, Scope scope, StreamContext context)
      : StreamHandler(stream_id, std::move(scope), std::move(context)) {
    // The application always observes the connect event first
    mailbox_.push(WebSocketConnect{});
  }

  void handle_data(const DataReceived& event) override;
  void handle_reset() override;
  expected<void, ErrorCode> send(const OutboundMessage& message) override;

  WebSocketState state() const { return state_; }

  bool closed() const { return closed_; }

 protected:
  void on_application_finished(bool failed) override;

 private:
  expected<void, ErrorCode> accept(const WebSocketAccept& message);
  expected<void, ErrorCode> close(uint16_t code);
  expected<void, ErrorCode> send_frame(expected<std::string, ErrorCode> frame, bool end_stream);

  // Feed buffered bytes to the codec and translate what it decodes
  void drain_codec();
  void deliver_disconnect(uint16_t code);

  WebSocketState state_ = WebSocketState::kConnecting;
  std::unique_ptr<WsCodec> codec_;
  std::string pending_;  // bytes received before accept
  bool peer_finished_ = false;
  bool closed_ = false;
  bool disconnect_delivered_ = false;
};

}  // namespace quicgate

#endif  // QUICGATE_HANDLER_HPP_
