/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_WS_CODEC_HPP_
#define QUICGATE_WS_CODEC_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quicgate {

// ============================================================================
// WebSocket frame primitives (RFC 6455)
// ============================================================================

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

// Close codes used by the codec and the handlers
constexpr uint16_t kCloseNormal = 1000;
constexpr uint16_t kCloseProtocolError = 1002;
constexpr uint16_t kCloseNoStatus = 1005;
constexpr uint16_t kCloseAbnormal = 1006;
constexpr uint16_t kCloseInvalidPayload = 1007;
constexpr uint16_t kCloseMessageTooBig = 1009;

struct FrameHeader {
  bool fin = false;
  uint8_t rsv = 0;
  OpCode opcode = OpCode::kContinuation;
  bool masked = false;
  uint64_t payload_len = 0;
  uint8_t mask_key[4] = {0, 0, 0, 0};
};

inline bool is_control(OpCode opcode) { return (static_cast<uint8_t>(opcode) & 0x08) != 0; }

// Parse WebSocket frame header from buffer
// Returns bytes consumed, or 0 if incomplete
size_t parse_frame_header(std::string_view data, FrameHeader& header);

// Write a frame header into buf (at least 14 bytes)
// Returns header length
size_t encode_frame_header(uint8_t* buf, OpCode opcode, size_t payload_len, bool mask = false);

// XOR payload with the 4-byte masking key
void apply_mask(char* payload, size_t len, const uint8_t* mask_key);

}  // namespace ws

// ============================================================================
// Decoded WebSocket events
// ============================================================================

struct WsTextMessage {
  std::string data;
};

struct WsBinaryMessage {
  std::string data;
};

struct WsCloseConnection {
  uint16_t code = ws::kCloseNormal;
  std::string reason;
};

struct WsPing {
  std::string payload;
};

struct WsPong {
  std::string payload;
};

using WsEvent = std::variant<WsTextMessage, WsBinaryMessage, WsCloseConnection, WsPing, WsPong>;

enum class WsState {
  kOpen,           // Both directions open
  kLocalClosing,   // We sent close, waiting for the peer's
  kRemoteClosing,  // Peer sent close, ours not sent yet
  kClosed          // Close exchanged in both directions
};

// ============================================================================
// WsCodec - server side WebSocket session
// ============================================================================

/**
 * @brief Sans-IO WebSocket server session.
 *
 * Bytes received from the peer go in through receive_data(); decoded
 * messages come out of events(). send_*() return the encoded bytes for the
 * caller to put on the wire. Fragmented messages are reassembled; client
 * frames must be masked.
 */
class WsCodec {
 public:
  static constexpr size_t kDefaultMaxMessageSize = 16 * 1024 * 1024;

  explicit WsCodec(size_t max_message_size = kDefaultMaxMessageSize) : max_message_size_(max_message_size) {}

  void receive_data(std::string_view data);

  // Decode every complete frame buffered so far.
  // A protocol violation yields one WsCloseConnection carrying the close code
  // and stops decoding.
  std::vector<WsEvent> events();

  expected<std::string, ErrorCode> send_text(std::string_view text);
  expected<std::string, ErrorCode> send_binary(std::string_view data);
  expected<std::string, ErrorCode> send_ping(std::string_view payload);
  expected<std::string, ErrorCode> send_pong(std::string_view payload);

  // Code 1005 encodes an empty close payload.
  expected<std::string, ErrorCode> send_close(uint16_t code, std::string_view reason = {});

  WsState state() const { return state_; }

  bool failed() const { return failed_; }

  size_t buffered() const { return rx_.size(); }

 private:
  static std::string encode(ws::OpCode opcode, std::string_view payload);

  void fail(uint16_t code, const char* reason, std::vector<WsEvent>& out);
  void deliver_message(std::vector<WsEvent>& out);
  void handle_close_payload(std::string_view payload, std::vector<WsEvent>& out);

  size_t max_message_size_;
  std::string rx_;
  WsState state_ = WsState::kOpen;
  bool failed_ = false;

  // Fragmented message being reassembled
  bool in_message_ = false;
  ws::OpCode message_opcode_ = ws::OpCode::kText;
  std::string message_;
};

}  // namespace quicgate

#endif  // QUICGATE_WS_CODEC_HPP_
