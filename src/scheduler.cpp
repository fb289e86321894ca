#include "quicgate/scheduler.hpp"

#include "quicgate/mailbox.hpp"

#include <utility>

namespace quicgate {

size_t Scheduler::run_pending() {
  size_t ran = 0;
  while (!tasks_.empty()) {
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    ++ran;
    if (task) {
      task();
    }
  }
  return ran;
}

// ============================================================================
// Mailbox
// ============================================================================

void Mailbox::push(InboundMessage message) {
  if (terminal_) {
    // Nothing follows the terminal message
    return;
  }
  if (!waiters_.empty()) {
    // Queue is empty whenever a receiver is parked
    ReceiveCallback waiter = std::move(waiters_.front());
    waiters_.pop_front();
    deliver(std::move(waiter), std::move(message));
    return;
  }
  messages_.push_back(std::move(message));
}

void Mailbox::pop(ReceiveCallback callback) {
  if (!messages_.empty()) {
    InboundMessage message = std::move(messages_.front());
    messages_.pop_front();
    deliver(std::move(callback), std::move(message));
    return;
  }
  if (terminal_) {
    deliver(std::move(callback), terminal_.value());
    return;
  }
  waiters_.push_back(std::move(callback));
}

void Mailbox::close(InboundMessage terminal) {
  if (terminal_) {
    return;
  }
  push(terminal);
  terminal_ = std::move(terminal);

  // Receivers still parked would otherwise wait forever
  while (!waiters_.empty()) {
    ReceiveCallback waiter = std::move(waiters_.front());
    waiters_.pop_front();
    deliver(std::move(waiter), terminal_.value());
  }
}

void Mailbox::deliver(ReceiveCallback callback, InboundMessage message) {
  scheduler_.post([cb = std::move(callback), msg = std::move(message)]() mutable { cb(std::move(msg)); });
}

}  // namespace quicgate
