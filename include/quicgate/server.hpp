/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_SERVER_HPP_
#define QUICGATE_SERVER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "event_log.hpp"
#include "framing.hpp"
#include "messages.hpp"
#include "quic_engine.hpp"
#include "ticket_cache.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <sockpp/datagram_socket.h>
#include <sockpp/sock_address.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace quicgate {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// ServerStats - Atomic performance counters
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  // Throughput counters
  std::atomic<uint64_t> datagrams_in{0};
  std::atomic<uint64_t> datagrams_out{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};

  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> dropped_datagrams{0};

  // Error counters
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> application_errors{0};

  // Latency tracking (microseconds)
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};

  void reset() {
    datagrams_in = 0;
    datagrams_out = 0;
    bytes_in = 0;
    bytes_out = 0;
    total_connections = 0;
    active_connections = 0;
    dropped_datagrams = 0;
    socket_errors = 0;
    application_errors = 0;
    last_poll_latency_us = 0;
    max_poll_latency_us = 0;
  }
};

// ============================================================================
// ServerSession - one QUIC connection and its HTTP dispatcher
// ============================================================================

class ServerSession : public Transport {
 public:
  using DatagramSender = std::function<void(std::string_view, const sockpp::sock_address_any&)>;

  ServerSession(std::unique_ptr<QuicConnection> quic, const sockpp::sock_address_any& peer, DatagramSender sender,
                ServerStats& stats, Application app, FramingFactory factory, ConnectionConfig config);

  // Transport
  void send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) override;
  void transmit() override;

  void handle_datagram(std::string_view data, const sockpp::sock_address_any& peer, Clock::time_point now);

  void handle_timer(Clock::time_point now);

  optional<Clock::time_point> next_timer() const { return quic_->next_timer(); }

  bool is_closed() const { return quic_->is_closed(); }

  Connection& connection() { return connection_; }

  const sockpp::sock_address_any& peer() const { return peer_; }

 private:
  // Feed engine events to the dispatcher and run the stream tasks
  void process_events();
  void close_on_application_error(const std::string& reason);

  std::unique_ptr<QuicConnection> quic_;
  sockpp::sock_address_any peer_;
  DatagramSender sender_;
  ServerStats& stats_;
  Connection connection_;
};

// ============================================================================
// Server - UDP reactor feeding a QUIC engine
// ============================================================================

class Server {
 public:
  // Binds the UDP socket; throws std::runtime_error on failure.
  Server(const ServerConfig& config, QuicEngine& engine, Application app);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Start the server (blocking). Writes the qlog file on return.
  void run();

  // Safe to call from a signal handler
  void stop() { is_running_ = false; }

  // Run one poll round with the given upper bound on the wait
  void poll_once(int timeout_ms);

  // Configuration
  Server& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_framing_factory(FramingFactory factory) {
    framing_factory_ = std::move(factory);
    return *this;
  }

  Server& set_credentials(const TlsCredentials* credentials) {
    engine_config_.credentials = credentials;
    return *this;
  }

  // Status
  size_t session_count() const { return sessions_.size(); }

  uint16_t local_port() const { return local_port_; }

  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

  TicketCache& ticket_cache() { return ticket_cache_; }

  EventLog* event_log() { return event_log_.get(); }

  const EngineConfig& engine_config() const { return engine_config_; }

  // Largest UDP payload read in one call
  static constexpr size_t kMaxDatagramSize = 65536;

 private:
  void read_datagrams(Clock::time_point now);
  void handle_datagram(std::string_view data, const sockpp::sock_address_any& peer, Clock::time_point now);
  void send_datagram(std::string_view data, const sockpp::sock_address_any& peer);
  void handle_timers(Clock::time_point now);
  int next_timeout_ms(Clock::time_point now, int limit_ms) const;
  void remove_closed_sessions();
  void write_event_log();

  ServerConfig config_;
  QuicEngine& engine_;
  Application app_;
  FramingFactory framing_factory_;

  sockpp::datagram_socket socket_;
  uint16_t local_port_ = 0;
  std::atomic<bool> is_running_{false};
  int poll_timeout_ms_ = 1000;
  std::string rx_buffer_;

  TicketCache ticket_cache_;
  std::unique_ptr<EventLog> event_log_;
  std::ofstream secrets_log_;
  EngineConfig engine_config_;

  std::unordered_map<std::string, std::unique_ptr<ServerSession>> sessions_;

  // Performance monitoring
  ServerStats stats_;
};

// Command line entry point: parses the options, loads the credentials,
// serves until SIGINT or SIGTERM. Returns the process exit code.
int serve(int argc, char* argv[], QuicEngine& engine, Application app);

}  // namespace quicgate

#endif  // QUICGATE_SERVER_HPP_
