/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_EVENTS_HPP_
#define QUICGATE_EVENTS_HPP_

#include "messages.hpp"

#include <cstdint>

#include <string>
#include <variant>

namespace quicgate {

// ============================================================================
// Transport events (QUIC engine -> Connection)
// ============================================================================

struct ProtocolNegotiated {
  std::string alpn_protocol;
};

struct HandshakeCompleted {
  std::string alpn_protocol;
  bool session_resumed = false;
};

struct StreamDataReceived {
  uint64_t stream_id = 0;
  std::string data;
  bool end_stream = false;
};

struct StreamReset {
  uint64_t stream_id = 0;
  uint64_t error_code = 0;
};

struct ConnectionTerminated {
  uint64_t error_code = 0;
  std::string reason;
};

using TransportEvent =
    std::variant<ProtocolNegotiated, HandshakeCompleted, StreamDataReceived, StreamReset, ConnectionTerminated>;

// ============================================================================
// HTTP events (framing -> Connection)
// ============================================================================

// Request initiated: the stream's header block arrived.
struct HeadersReceived {
  uint64_t stream_id = 0;
  HeaderList headers;
  bool stream_ended = false;
};

struct DataReceived {
  uint64_t stream_id = 0;
  std::string data;
  bool stream_ended = false;
};

// The peer reset the stream before it completed.
struct StreamAborted {
  uint64_t stream_id = 0;
};

using HttpEvent = std::variant<HeadersReceived, DataReceived, StreamAborted>;

}  // namespace quicgate

#endif  // QUICGATE_EVENTS_HPP_
