/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_QUIC_ENGINE_HPP_
#define QUICGATE_QUIC_ENGINE_HPP_

#include "events.hpp"
#include "ticket_cache.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace quicgate {

class EventLog;
class TlsCredentials;

// ============================================================================
// QUIC engine seam
// ============================================================================
//
// quicgate does not implement QUIC itself. An engine (packet protection,
// loss recovery, congestion control, TLS 1.3 handshake) plugs in through
// the two interfaces below and is driven by the Server's UDP loop.
//

using Clock = std::chrono::steady_clock;

struct EngineConfig {
  std::vector<std::string> alpn_protocols;
  const TlsCredentials* credentials = nullptr;
  std::ostream* secrets_log = nullptr;  // NSS key log lines, when set
  bool stateless_retry = false;
  SessionTicketFetcher session_ticket_fetcher;
  SessionTicketHandler session_ticket_handler;
  EventLog* event_log = nullptr;  // transport level qlog events, when set
};

// Server side state of one QUIC connection
class QuicConnection {
 public:
  virtual ~QuicConnection() = default;

  virtual void receive_datagram(std::string_view data, Clock::time_point now) = 0;

  // Drain the events produced since the last call
  virtual std::vector<TransportEvent> next_events() = 0;

  // Drain the datagrams ready to go to the peer
  virtual std::vector<std::string> datagrams_to_send(Clock::time_point now) = 0;

  virtual void send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) = 0;

  virtual optional<Clock::time_point> next_timer() const = 0;

  virtual void handle_timer(Clock::time_point now) = 0;

  // Starts the close handshake. is_closed() turns true once it has drained.
  virtual void close(uint64_t error_code, const std::string& reason) = 0;

  virtual bool is_closed() const = 0;

  // Hex encoded original destination connection id
  virtual std::string original_destination_cid() const = 0;
};

struct AcceptResult {
  std::unique_ptr<QuicConnection> connection;  // null: no connection created
  std::vector<std::string> replies;            // version negotiation, retry
};

class QuicEngine {
 public:
  virtual ~QuicEngine() = default;

  // Stable key of the connection a datagram belongs to, whichever of the
  // connection's ids it carries. Empty drops the datagram.
  virtual std::string route(std::string_view datagram) const = 0;

  // Called for datagrams whose route is not known yet.
  virtual AcceptResult accept(std::string_view datagram, const EngineConfig& config) = 0;
};

}  // namespace quicgate

#endif  // QUICGATE_QUIC_ENGINE_HPP_
