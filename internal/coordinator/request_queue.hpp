#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/coordinator/request.hpp"

namespace codestaff::coordinator {

/*
  Bounded, thread-safe FIFO between client handles and the Coordinator.

  Enqueue blocks while the queue is full; this is the only backpressure
  in the system. Once closed, Enqueue fails and blocked producers wake.
*/
class RequestQueue {
 public:
  explicit RequestQueue(std::size_t capacity);

  // false when the queue is closed; the request is then destroyed unanswered
  bool Enqueue(Request request);

  // blocking wait; nullopt once closed and drained
  std::optional<Request> Dequeue();

  void Close();

  // Drops everything still queued and returns how many were dropped.
  std::size_t DiscardPending();

  bool IsClosed() const;

  std::size_t Size() const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Request>     queue_;
  bool                    closed_ = false;
};

} // namespace codestaff::coordinator
