#include "quicgate/ticket_cache.hpp"

#include <utility>

namespace quicgate {

void TicketCache::add(const SessionTicket& ticket) {
  std::lock_guard<std::mutex> lock(mutex_);
  tickets_[ticket.ticket] = ticket;
}

optional<SessionTicket> TicketCache::pop(const std::string& label) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tickets_.find(label);
  if (it == tickets_.end()) {
    return {};
  }
  SessionTicket ticket = std::move(it->second);
  tickets_.erase(it);
  return ticket;
}

size_t TicketCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tickets_.size();
}

SessionTicketHandler TicketCache::handler() {
  return [this](const SessionTicket& ticket) { add(ticket); };
}

SessionTicketFetcher TicketCache::fetcher() {
  return [this](const std::string& label) { return pop(label); };
}

}  // namespace quicgate
