/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_MAILBOX_HPP_
#define QUICGATE_MAILBOX_HPP_

#include "messages.hpp"
#include "scheduler.hpp"
#include "vocabulary.hpp"

#include <cstddef>

#include <deque>

namespace quicgate {

// ============================================================================
// Mailbox - unbounded inbound FIFO of one stream
// ============================================================================

/**
 * @brief Ordered queue of inbound messages with parked receivers.
 *
 * Messages are handed out in push order. A receiver that finds the queue
 * empty is parked until the next push. Delivery always goes through the
 * scheduler, never re-entrantly from push() or pop().
 *
 * close() ends the stream: the terminal message is queued like any other,
 * and from then on every receiver that finds the queue empty gets a copy.
 */
class Mailbox {
 public:
  explicit Mailbox(Scheduler& scheduler) : scheduler_(scheduler) {}

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  void push(InboundMessage message);

  void pop(ReceiveCallback callback);

  // Second and later calls are ignored.
  void close(InboundMessage terminal);

  bool closed() const { return terminal_.has_value(); }

  size_t size() const { return messages_.size(); }

  bool empty() const { return messages_.empty(); }

  size_t waiting() const { return waiters_.size(); }

 private:
  void deliver(ReceiveCallback callback, InboundMessage message);

  Scheduler& scheduler_;
  std::deque<InboundMessage> messages_;
  std::deque<ReceiveCallback> waiters_;
  optional<InboundMessage> terminal_;
};

}  // namespace quicgate

#endif  // QUICGATE_MAILBOX_HPP_
