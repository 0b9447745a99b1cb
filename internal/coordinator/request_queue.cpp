#include "request_queue.hpp"

#include <stdexcept>

namespace codestaff::coordinator {

RequestQueue::RequestQueue(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("request queue capacity must be positive");
}

bool RequestQueue::Enqueue(Request request) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || queue_.size() < capacity_; });
    if (closed_) return false;

    queue_.push_back(std::move(request));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<Request> RequestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Request request = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();

  not_full_.notify_one();
  return request;
}

void RequestQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t RequestQueue::DiscardPending() {
  std::deque<Request> dropped;
  {
    std::lock_guard lock(mutex_);
    dropped.swap(queue_);
  }
  not_full_.notify_all();

  // promises are broken outside the lock
  return dropped.size();
}

bool RequestQueue::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t RequestQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace codestaff::coordinator
