#include "quicgate/server.hpp"

#include "quicgate/log.hpp"
#include "quicgate/tls.hpp"

#include <sockpp/inet6_address.h>
#include <sockpp/inet_address.h>
#include <sockpp/udp6_socket.h>
#include <sockpp/udp_socket.h>

#include <cerrno>
#include <csignal>

#include <algorithm>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <utility>
#include <vector>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.server";

// HTTP/3 H3_INTERNAL_ERROR, also used for hq connections
constexpr uint64_t kInternalErrorCode = 0x102;

// Upper bound of datagrams read per poll round
constexpr int kMaxReadBatch = 64;

std::string describe(const sockpp::sock_address_any& addr) {
  if (addr.family() == AF_INET6) {
    return sockpp::inet6_address(addr).to_string();
  }
  if (addr.family() == AF_INET) {
    return sockpp::inet_address(addr).to_string();
  }
  return "?";
}

}  // namespace

// ============================================================================
// ServerSession
// ============================================================================

ServerSession::ServerSession(std::unique_ptr<QuicConnection> quic, const sockpp::sock_address_any& peer,
                             DatagramSender sender, ServerStats& stats, Application app, FramingFactory factory,
                             ConnectionConfig config)
    : quic_(std::move(quic)),
      peer_(peer),
      sender_(std::move(sender)),
      stats_(stats),
      connection_(*this, std::move(app), std::move(factory), std::move(config)) {}

void ServerSession::send_stream_data(uint64_t stream_id, std::string_view data, bool end_stream) {
  quic_->send_stream_data(stream_id, data, end_stream);
}

void ServerSession::transmit() {
  for (const std::string& datagram : quic_->datagrams_to_send(Clock::now())) {
    sender_(datagram, peer_);
  }
}

void ServerSession::handle_datagram(std::string_view data, const sockpp::sock_address_any& peer,
                                    Clock::time_point now) {
  peer_ = peer;
  quic_->receive_datagram(data, now);
  process_events();
}

void ServerSession::handle_timer(Clock::time_point now) {
  quic_->handle_timer(now);
  process_events();
}

void ServerSession::process_events() {
  for (const TransportEvent& event : quic_->next_events()) {
    connection_.handle_transport_event(event);
  }

  // The application gave up on a stream; take the connection down with it
  try {
    connection_.run_pending();
  } catch (const std::exception& e) {
    close_on_application_error(e.what());
  } catch (...) {
    close_on_application_error("unknown application error");
  }
}

void ServerSession::close_on_application_error(const std::string& reason) {
  stats_.application_errors.fetch_add(1, std::memory_order_relaxed);
  QUICGATE_LOG_ERROR(kLogName, "application error: " + reason);
  quic_->close(kInternalErrorCode, reason);
  transmit();
}

// ============================================================================
// Server
// ============================================================================

Server::Server(const ServerConfig& config, QuicEngine& engine, Application app)
    : config_(config),
      engine_(engine),
      app_(std::move(app)),
      framing_factory_(default_framing_factory()),
      rx_buffer_(kMaxDatagramSize, '\0') {
  // Bind (IPv6 when the host is an IPv6 literal)
  if (config_.host.find(':') != std::string::npos) {
    sockpp::udp6_socket sock(sockpp::inet6_address(config_.host, config_.port));
    if (!sock) {
      QUICGATE_THROW(std::runtime_error("Failed to bind [" + config_.host + "]:" + std::to_string(config_.port) +
                                        ": " + sock.last_error_str()));
    }
    local_port_ = sockpp::inet6_address(sock.address()).port();
    socket_ = sockpp::datagram_socket(sock.release());
  } else {
    sockpp::udp_socket sock(sockpp::inet_address(config_.host, config_.port));
    if (!sock) {
      QUICGATE_THROW(std::runtime_error("Failed to bind " + config_.host + ":" + std::to_string(config_.port) + ": " +
                                        sock.last_error_str()));
    }
    local_port_ = sockpp::inet_address(sock.address()).port();
    socket_ = sockpp::datagram_socket(sock.release());
  }

  // Set non-blocking
  socket_.set_non_blocking(true);

  if (!config_.quic_log.empty()) {
    event_log_ = std::make_unique<EventLog>();
  }

  if (!config_.secrets_log.empty()) {
    secrets_log_.open(config_.secrets_log, std::ios::out | std::ios::app);
    if (!secrets_log_) {
      QUICGATE_THROW(std::runtime_error("Failed to open secrets log " + config_.secrets_log));
    }
  }

  engine_config_.alpn_protocols = config_.alpn_protocols;
  engine_config_.secrets_log = secrets_log_.is_open() ? &secrets_log_ : nullptr;
  engine_config_.stateless_retry = config_.stateless_retry;
  engine_config_.session_ticket_fetcher = ticket_cache_.fetcher();
  engine_config_.session_ticket_handler = ticket_cache_.handler();
  engine_config_.event_log = event_log_.get();

  QUICGATE_LOG_INFO(kLogName, "Server initialized on " + config_.host + ":" + std::to_string(local_port_));
}

Server::~Server() {
  // Sessions refer to the socket through their sender
  sessions_.clear();
}

void Server::run() {
  is_running_ = true;
  stats_.reset();
  QUICGATE_LOG_INFO(kLogName, "Server starting...");

  while (is_running_) {
    poll_once(poll_timeout_ms_);
  }

  sessions_.clear();
  stats_.active_connections.store(0, std::memory_order_relaxed);
  write_event_log();
  QUICGATE_LOG_INFO(kLogName, "Server stopped");
}

void Server::poll_once(int timeout_ms) {
  pollfd pfd{socket_.handle(), POLLIN, 0};
  int timeout = next_timeout_ms(Clock::now(), timeout_ms);

  // Poll with latency tracking
  auto poll_start = Clock::now();
  int ret = ::poll(&pfd, 1, timeout);
  auto poll_end = Clock::now();

  uint64_t poll_us =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count());
  stats_.last_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  uint64_t prev_max = stats_.max_poll_latency_us.load(std::memory_order_relaxed);
  if (poll_us > prev_max) {
    stats_.max_poll_latency_us.store(poll_us, std::memory_order_relaxed);
  }

  if (ret < 0) {
    if (errno != EINTR) {
      QUICGATE_LOG_ERROR(kLogName, "Poll error");
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      is_running_ = false;
    }
    return;
  }

  if (ret > 0 && (pfd.revents & POLLIN)) {
    read_datagrams(poll_end);
  }

  handle_timers(Clock::now());
  remove_closed_sessions();
}

int Server::next_timeout_ms(Clock::time_point now, int limit_ms) const {
  int timeout = limit_ms;
  for (const auto& entry : sessions_) {
    optional<Clock::time_point> timer = entry.second->next_timer();
    if (!timer) {
      continue;
    }
    if (timer.value() <= now) {
      return 0;
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(timer.value() - now).count() + 1;
    if (timeout < 0 || wait < timeout) {
      timeout = static_cast<int>(wait);
    }
  }
  return timeout;
}

void Server::read_datagrams(Clock::time_point now) {
  for (int i = 0; i < kMaxReadBatch; ++i) {
    sockpp::sock_address_any peer;
    ssize_t n = socket_.recv_from(&rx_buffer_[0], rx_buffer_.size(), 0, &peer);
    if (n < 0) {
      int err = socket_.last_error();
      if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
        QUICGATE_LOG_ERROR(kLogName, "recvfrom failed: " + socket_.last_error_str());
        stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      }
      return;
    }
    stats_.datagrams_in.fetch_add(1, std::memory_order_relaxed);
    stats_.bytes_in.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
    handle_datagram(std::string_view(rx_buffer_.data(), static_cast<size_t>(n)), peer, now);
  }
}

void Server::handle_datagram(std::string_view data, const sockpp::sock_address_any& peer, Clock::time_point now) {
  std::string key = engine_.route(data);
  if (key.empty()) {
    stats_.dropped_datagrams.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    AcceptResult accepted = engine_.accept(data, engine_config_);
    for (const std::string& reply : accepted.replies) {
      send_datagram(reply, peer);
    }
    if (!accepted.connection) {
      stats_.dropped_datagrams.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    ConnectionConfig connection_config;
    connection_config.server_name = config_.server_name;
    if (event_log_) {
      connection_config.trace = event_log_->start_trace(accepted.connection->original_destination_cid());
    }

    auto session = std::make_unique<ServerSession>(
        std::move(accepted.connection), peer,
        [this](std::string_view datagram, const sockpp::sock_address_any& to) { send_datagram(datagram, to); },
        stats_, app_, framing_factory_, std::move(connection_config));
    it = sessions_.emplace(key, std::move(session)).first;

    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
    QUICGATE_LOG_DEBUG(kLogName, "new connection from " + describe(peer));
  }

  it->second->handle_datagram(data, peer, now);
}

void Server::send_datagram(std::string_view data, const sockpp::sock_address_any& peer) {
  ssize_t n = socket_.send_to(data.data(), data.size(), 0, peer);
  if (n < 0) {
    // A lost datagram is recovered by QUIC
    stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    QUICGATE_LOG_DEBUG(kLogName, "sendto " + describe(peer) + " failed: " + socket_.last_error_str());
    return;
  }
  stats_.datagrams_out.fetch_add(1, std::memory_order_relaxed);
  stats_.bytes_out.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
}

void Server::handle_timers(Clock::time_point now) {
  for (auto& entry : sessions_) {
    optional<Clock::time_point> timer = entry.second->next_timer();
    if (timer && timer.value() <= now) {
      entry.second->handle_timer(now);
    }
  }
}

void Server::remove_closed_sessions() {
  uint64_t removed = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second->is_closed()) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    stats_.active_connections.fetch_sub(removed, std::memory_order_relaxed);
  }
}

void Server::write_event_log() {
  if (!event_log_) {
    return;
  }
  auto written = event_log_->write_file(config_.quic_log);
  if (!written) {
    QUICGATE_LOG_ERROR(kLogName, std::string("cannot write qlog: ") + error_code_name(written.get_error()));
  }
}

// ============================================================================
// Command line entry point
// ============================================================================

namespace {

std::atomic<Server*> g_server{nullptr};

void on_signal(int /* signum */) {
  Server* server = g_server.load();
  if (server != nullptr) {
    server->stop();
  }
}

}  // namespace

int serve(int argc, char* argv[], QuicEngine& engine, Application app) {
  const char* program = argc > 0 ? argv[0] : "quicgate";

  auto parsed = parse_command_line(argc, argv);
  if (!parsed) {
    usage(std::cerr, program);
    return 1;
  }
  const ServerConfig& config = parsed.value();
  if (config.show_help) {
    usage(std::cout, program);
    return 0;
  }

  Logger::set_level(config.verbose ? Logger::Level::kDebug : Logger::Level::kInfo);

  TlsCredentials credentials;
  auto loaded = credentials.load(config.certificate, config.private_key);
  if (!loaded) {
    return 1;
  }

  try {
    Server server(config, engine, std::move(app));
    server.set_credentials(&credentials);

    g_server.store(&server);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    server.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_server.store(nullptr);
  } catch (const std::exception& e) {
    g_server.store(nullptr);
    QUICGATE_LOG_ERROR(kLogName, std::string("Error: ") + e.what());
    return 1;
  }
  return 0;
}

}  // namespace quicgate
