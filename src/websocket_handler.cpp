#include "quicgate/handler.hpp"

#include "quicgate/log.hpp"

#include <utility>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.websocket";

using SendResult = expected<void, ErrorCode>;

}  // namespace

// ============================================================================
// Inbound path
// ============================================================================

void WebSocketHandler::handle_data(const DataReceived& event) {
  if (reset_ || disconnect_delivered_) {
    return;
  }
  if (event.stream_ended) {
    peer_finished_ = true;
  }
  if (!codec_) {
    if (pending_.size() + event.data.size() > context_.max_message_size) {
      QUICGATE_LOG_WARN(kLogName, "stream " + std::to_string(stream_id_) + ": too much data before accept");
      pending_.clear();
      auto closed = close(ws::kCloseMessageTooBig);
      if (!closed) {
        QUICGATE_LOG_ERROR(kLogName, std::string("close failed: ") + error_code_name(closed.get_error()));
      }
      deliver_disconnect(ws::kCloseMessageTooBig);
      return;
    }
    // Not accepted yet, decode once the session exists
    pending_.append(event.data);
    return;
  }
  codec_->receive_data(event.data);
  drain_codec();
}

void WebSocketHandler::drain_codec() {
  for (WsEvent& event : codec_->events()) {
    std::visit(overloaded{
                   [this](WsTextMessage& msg) { mailbox_.push(WebSocketReceiveText{std::move(msg.data)}); },
                   [this](WsBinaryMessage& msg) { mailbox_.push(WebSocketReceiveBytes{std::move(msg.data)}); },
                   [this](WsCloseConnection& msg) {
                     if (codec_->failed()) {
                       QUICGATE_LOG_WARN(kLogName, "stream " + std::to_string(stream_id_) + ": " + msg.reason);
                       auto closed = close(msg.code);
                       if (!closed) {
                         QUICGATE_LOG_ERROR(kLogName, std::string("close failed: ") +
                                                          error_code_name(closed.get_error()));
                       }
                     } else if (state_ == WebSocketState::kOpen) {
                       state_ = WebSocketState::kClosing;
                     }
                     deliver_disconnect(msg.code);
                   },
                   [this](WsPing& msg) {
                     auto pong = codec_->send_pong(msg.payload);
                     if (pong) {
                       framing().send_data(stream_id_, pong.value(), false);
                     }
                   },
                   [](WsPong&) {},
               },
               event);
  }

  // Stream ended without a close frame
  if (peer_finished_) {
    deliver_disconnect(ws::kCloseAbnormal);
  }
}

void WebSocketHandler::deliver_disconnect(uint16_t code) {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;
  mailbox_.close(WebSocketDisconnect{code});
}

void WebSocketHandler::handle_reset() {
  if (reset_) {
    return;
  }
  reset_ = true;
  deliver_disconnect(ws::kCloseAbnormal);
}

// ============================================================================
// Outbound path
// ============================================================================

SendResult WebSocketHandler::send(const OutboundMessage& message) {
  if (reset_) {
    return SendResult::error(ErrorCode::kConnectionClosed);
  }

  SendResult result = std::visit(
      overloaded{
          [this](const WebSocketAccept& msg) { return accept(msg); },
          [this](const WebSocketClose& msg) { return close(msg.code); },
          [this](const WebSocketSendText& msg) {
            if (state_ != WebSocketState::kOpen) {
              return SendResult::error(ErrorCode::kInvalidState);
            }
            return send_frame(codec_->send_text(msg.text), false);
          },
          [this](const WebSocketSendBytes& msg) {
            if (state_ != WebSocketState::kOpen) {
              return SendResult::error(ErrorCode::kInvalidState);
            }
            return send_frame(codec_->send_binary(msg.bytes), false);
          },
          [](const auto&) { return SendResult::error(ErrorCode::kInvalidMessage); },
      },
      message);

  if (!result) {
    QUICGATE_LOG_DEBUG(kLogName, std::string("rejected ") + message_type(message) + " on stream " +
                                     std::to_string(stream_id_) + ": " + error_code_name(result.get_error()));
  }
  flush();
  return result;
}

SendResult WebSocketHandler::accept(const WebSocketAccept& message) {
  if (state_ != WebSocketState::kConnecting || closed_) {
    return SendResult::error(ErrorCode::kInvalidState);
  }

  codec_ = std::make_unique<WsCodec>(context_.max_message_size);
  HeaderList headers = base_response_headers(200);
  if (!message.subprotocol.empty()) {
    headers.push_back({"sec-websocket-protocol", message.subprotocol});
  }
  framing().send_headers(stream_id_, headers);
  state_ = WebSocketState::kOpen;

  if (!pending_.empty() || peer_finished_) {
    codec_->receive_data(pending_);
    pending_.clear();
    drain_codec();
  }
  return SendResult::success();
}

SendResult WebSocketHandler::close(uint16_t code) {
  if (closed_) {
    return SendResult::success();
  }
  closed_ = true;

  if (!codec_) {
    // Upgrade never accepted: refuse it
    framing().send_headers(stream_id_, base_response_headers(403));
    framing().send_data(stream_id_, "", true);
    state_ = WebSocketState::kClosed;
    return SendResult::success();
  }

  state_ = WebSocketState::kClosed;
  return send_frame(codec_->send_close(code), true);
}

SendResult WebSocketHandler::send_frame(expected<std::string, ErrorCode> frame, bool end_stream) {
  if (!frame) {
    return SendResult::error(frame.get_error());
  }
  framing().send_data(stream_id_, frame.value(), end_stream);
  return SendResult::success();
}

void WebSocketHandler::on_application_finished(bool /* failed */) {
  if (closed_ || reset_) {
    return;
  }
  auto closed = close(ws::kCloseNormal);
  if (!closed) {
    QUICGATE_LOG_ERROR(kLogName, std::string("close failed: ") + error_code_name(closed.get_error()));
  }
  flush();
}

}  // namespace quicgate
