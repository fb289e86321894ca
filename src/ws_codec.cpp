#include "quicgate/ws_codec.hpp"

#include "quicgate/utils.hpp"

#include <algorithm>
#include <utility>

namespace quicgate {

namespace ws {

size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  if (data.size() < 2) return 0;

  const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
  uint8_t byte0 = bytes[0];
  uint8_t byte1 = bytes[1];

  header.fin = (byte0 & 0x80) != 0;
  header.rsv = static_cast<uint8_t>((byte0 >> 4) & 0x07);
  header.opcode = static_cast<OpCode>(byte0 & 0x0F);
  header.masked = (byte1 & 0x80) != 0;

  uint64_t len = byte1 & 0x7F;
  size_t header_size = 2;

  if (len == 126) {
    if (data.size() < 4) return 0;
    len = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
    header_size = 4;
  } else if (len == 127) {
    if (data.size() < 10) return 0;
    len = 0;
    for (size_t i = 2; i < 10; ++i) {
      len = (len << 8) | bytes[i];
    }
    header_size = 10;
  }

  header.payload_len = len;

  if (header.masked) {
    if (data.size() < header_size + 4) return 0;
    for (size_t i = 0; i < 4; ++i) {
      header.mask_key[i] = bytes[header_size + i];
    }
    header_size += 4;
  }

  return header_size;
}

size_t encode_frame_header(uint8_t* buf, OpCode opcode, size_t payload_len, bool mask) {
  size_t pos = 0;
  buf[pos++] = 0x80 | static_cast<uint8_t>(opcode);
  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>((mask ? 0x80 : 0x00) | payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = static_cast<uint8_t>((mask ? 0x80 : 0x00) | 126);
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = static_cast<uint8_t>((mask ? 0x80 : 0x00) | 127);
    for (int i = 7; i >= 0; --i)
      buf[pos++] = static_cast<uint8_t>((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
  }
  return pos;
}

void apply_mask(char* payload, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) {
    payload[i] = static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask_key[i % 4]);
  }
}

}  // namespace ws

namespace {

bool is_valid_close_code(uint16_t code) {
  if (code >= 3000 && code <= 4999) return true;
  switch (code) {
    case 1000:
    case 1001:
    case 1002:
    case 1003:
    case 1007:
    case 1008:
    case 1009:
    case 1010:
    case 1011:
      return true;
    default:
      return false;
  }
}

}  // namespace

// ============================================================================
// Receive path
// ============================================================================

void WsCodec::receive_data(std::string_view data) {
  // Nothing is decoded after a close frame or a protocol violation
  if (failed_ || state_ == WsState::kRemoteClosing || state_ == WsState::kClosed) {
    return;
  }
  rx_.append(data.data(), data.size());
}

std::vector<WsEvent> WsCodec::events() {
  std::vector<WsEvent> out;

  while (!failed_ && !rx_.empty()) {
    ws::FrameHeader header;
    size_t header_size = ws::parse_frame_header(rx_, header);
    if (header_size == 0)
      break;  // Incomplete header

    if (header.rsv != 0) {
      fail(ws::kCloseProtocolError, "reserved bits set", out);
      break;
    }
    if (!header.masked) {
      fail(ws::kCloseProtocolError, "client frames must be masked", out);
      break;
    }
    if (ws::is_control(header.opcode) && (!header.fin || header.payload_len > 125)) {
      fail(ws::kCloseProtocolError, "invalid control frame", out);
      break;
    }
    if (header.payload_len > max_message_size_ ||
        (!ws::is_control(header.opcode) && message_.size() + header.payload_len > max_message_size_)) {
      fail(ws::kCloseMessageTooBig, "message too big", out);
      break;
    }

    size_t total_frame_size = header_size + static_cast<size_t>(header.payload_len);
    if (rx_.size() < total_frame_size)
      break;  // Incomplete payload

    std::string payload = rx_.substr(header_size, static_cast<size_t>(header.payload_len));
    ws::apply_mask(&payload[0], payload.size(), header.mask_key);
    rx_.erase(0, total_frame_size);

    switch (header.opcode) {
      case ws::OpCode::kContinuation:
        if (!in_message_) {
          fail(ws::kCloseProtocolError, "unexpected continuation frame", out);
          break;
        }
        message_.append(payload);
        if (header.fin) {
          deliver_message(out);
        }
        break;

      case ws::OpCode::kText:
      case ws::OpCode::kBinary:
        if (in_message_) {
          fail(ws::kCloseProtocolError, "expected continuation frame", out);
          break;
        }
        in_message_ = true;
        message_opcode_ = header.opcode;
        message_ = std::move(payload);
        if (header.fin) {
          deliver_message(out);
        }
        break;

      case ws::OpCode::kClose:
        handle_close_payload(payload, out);
        rx_.clear();
        return out;

      case ws::OpCode::kPing:
        out.emplace_back(WsPing{std::move(payload)});
        break;

      case ws::OpCode::kPong:
        out.emplace_back(WsPong{std::move(payload)});
        break;

      default:
        fail(ws::kCloseProtocolError, "unknown opcode", out);
        break;
    }
  }

  return out;
}

void WsCodec::deliver_message(std::vector<WsEvent>& out) {
  in_message_ = false;
  if (message_opcode_ == ws::OpCode::kText) {
    if (!is_valid_utf8(message_)) {
      message_.clear();
      fail(ws::kCloseInvalidPayload, "invalid utf-8 in text message", out);
      return;
    }
    out.emplace_back(WsTextMessage{std::move(message_)});
  } else {
    out.emplace_back(WsBinaryMessage{std::move(message_)});
  }
  message_.clear();
}

void WsCodec::handle_close_payload(std::string_view payload, std::vector<WsEvent>& out) {
  uint16_t code = ws::kCloseNoStatus;
  std::string reason;

  if (payload.size() == 1) {
    fail(ws::kCloseProtocolError, "invalid close payload", out);
    return;
  }
  if (payload.size() >= 2) {
    code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
    if (!is_valid_close_code(code)) {
      fail(ws::kCloseProtocolError, "invalid close code", out);
      return;
    }
    std::string_view text = payload.substr(2);
    if (!is_valid_utf8(text)) {
      fail(ws::kCloseInvalidPayload, "invalid utf-8 in close reason", out);
      return;
    }
    reason.assign(text.data(), text.size());
  }

  state_ = state_ == WsState::kLocalClosing ? WsState::kClosed : WsState::kRemoteClosing;
  out.emplace_back(WsCloseConnection{code, std::move(reason)});
}

void WsCodec::fail(uint16_t code, const char* reason, std::vector<WsEvent>& out) {
  failed_ = true;
  in_message_ = false;
  message_.clear();
  rx_.clear();
  out.emplace_back(WsCloseConnection{code, reason});
}

// ============================================================================
// Send path
// ============================================================================

std::string WsCodec::encode(ws::OpCode opcode, std::string_view payload) {
  uint8_t header_buf[14];
  size_t header_len = ws::encode_frame_header(header_buf, opcode, payload.size(), false);

  std::string frame;
  frame.reserve(header_len + payload.size());
  frame.append(reinterpret_cast<const char*>(header_buf), header_len);
  frame.append(payload.data(), payload.size());
  return frame;
}

expected<std::string, ErrorCode> WsCodec::send_text(std::string_view text) {
  if (state_ != WsState::kOpen) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  return expected<std::string, ErrorCode>::success(encode(ws::OpCode::kText, text));
}

expected<std::string, ErrorCode> WsCodec::send_binary(std::string_view data) {
  if (state_ != WsState::kOpen) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  return expected<std::string, ErrorCode>::success(encode(ws::OpCode::kBinary, data));
}

expected<std::string, ErrorCode> WsCodec::send_ping(std::string_view payload) {
  if (state_ != WsState::kOpen || payload.size() > 125) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  return expected<std::string, ErrorCode>::success(encode(ws::OpCode::kPing, payload));
}

expected<std::string, ErrorCode> WsCodec::send_pong(std::string_view payload) {
  if (state_ != WsState::kOpen || payload.size() > 125) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  return expected<std::string, ErrorCode>::success(encode(ws::OpCode::kPong, payload));
}

expected<std::string, ErrorCode> WsCodec::send_close(uint16_t code, std::string_view reason) {
  if (state_ == WsState::kLocalClosing || state_ == WsState::kClosed) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  std::string payload;
  if (code != ws::kCloseNoStatus) {
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    // Control frame payload is limited to 125 bytes
    payload.append(reason.data(), std::min<size_t>(reason.size(), 123));
  }

  state_ = state_ == WsState::kRemoteClosing ? WsState::kClosed : WsState::kLocalClosing;
  return expected<std::string, ErrorCode>::success(encode(ws::OpCode::kClose, payload));
}

}  // namespace quicgate
