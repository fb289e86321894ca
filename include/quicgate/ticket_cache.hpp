/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_TICKET_CACHE_HPP_
#define QUICGATE_TICKET_CACHE_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace quicgate {

// TLS 1.3 session ticket issued by the server. `ticket` doubles as the label.
struct SessionTicket {
  std::string ticket;
  std::string resumption_secret;
  uint16_t cipher_suite = 0;
  std::string server_name;
  std::time_t not_valid_before = 0;
  std::time_t not_valid_after = 0;
  uint32_t age_add = 0;
  uint32_t max_early_data_size = 0;

  bool is_valid(std::time_t now) const { return now >= not_valid_before && now <= not_valid_after; }
};

// Engine callbacks for ticket storage
using SessionTicketHandler = std::function<void(const SessionTicket&)>;
using SessionTicketFetcher = std::function<optional<SessionTicket>(const std::string& label)>;

// ============================================================================
// TicketCache - consume-once session ticket store
// ============================================================================

/**
 * @brief Label to ticket map shared by every connection of a server.
 *
 * A ticket can be redeemed once. Adding a ticket under an existing label
 * replaces it. Nothing is evicted.
 */
class TicketCache {
 public:
  TicketCache() = default;

  TicketCache(const TicketCache&) = delete;
  TicketCache& operator=(const TicketCache&) = delete;

  void add(const SessionTicket& ticket);

  optional<SessionTicket> pop(const std::string& label);

  size_t size() const;

  // The returned callables refer to this cache and must not outlive it.
  SessionTicketHandler handler();
  SessionTicketFetcher fetcher();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionTicket> tickets_;
};

}  // namespace quicgate

#endif  // QUICGATE_TICKET_CACHE_HPP_
