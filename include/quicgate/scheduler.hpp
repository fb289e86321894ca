/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_SCHEDULER_HPP_
#define QUICGATE_SCHEDULER_HPP_

#include <cstddef>

#include <deque>
#include <functional>

namespace quicgate {

// ============================================================================
// Scheduler - cooperative task queue of one connection
// ============================================================================

/**
 * @brief Single-threaded FIFO of deferred tasks.
 *
 * Every stream task of a connection runs from here, one at a time, so the
 * connection state needs no locking. A task that throws stops the run; the
 * exception reaches the caller of run_pending() and the remaining tasks stay
 * queued.
 */
class Scheduler {
 public:
  using Task = std::function<void()>;

  Scheduler() = default;

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void post(Task task) { tasks_.push_back(std::move(task)); }

  // Run tasks until the queue is empty, including tasks posted meanwhile.
  // Returns the number of tasks run.
  size_t run_pending();

  bool empty() const { return tasks_.empty(); }

  size_t size() const { return tasks_.size(); }

 private:
  std::deque<Task> tasks_;
};

}  // namespace quicgate

#endif  // QUICGATE_SCHEDULER_HPP_
