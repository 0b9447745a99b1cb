#include "internal/bus/notification_bus.hpp"

#include <stdexcept>

namespace codestaff::bus {

namespace detail {

struct BusState {
  explicit BusState(std::size_t cap) : capacity(cap) {
  }

  mutable std::mutex      mutex;
  std::condition_variable cv;

  const std::size_t    capacity;
  std::deque<BusEvent> ring;

  // sequence number the next published event will get
  uint64_t    next_seq    = 0;
  std::size_t subscribers = 0;
  bool        closed      = false;

  uint64_t OldestSeqLocked() const {
    return next_seq - ring.size();
  }
};

} // namespace detail

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------

Subscription::Subscription(std::shared_ptr<detail::BusState> state, uint64_t cursor)
    : state_(std::move(state)), cursor_(cursor) {
}

Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), cursor_(other.cursor_) {
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    if (state_) {
      std::lock_guard lock(state_->mutex);
      --state_->subscribers;
    }
    state_  = std::move(other.state_);
    cursor_ = other.cursor_;
  }
  return *this;
}

Subscription::~Subscription() {
  if (!state_) return;
  std::lock_guard lock(state_->mutex);
  --state_->subscribers;
}

RecvResult Subscription::TakeLocked() {
  RecvResult out;

  if (cursor_ < state_->next_seq) {
    const uint64_t oldest = state_->OldestSeqLocked();
    if (cursor_ < oldest) {
      out.status = RecvStatus::Lagged;
      out.missed = oldest - cursor_;
      cursor_    = oldest;
      return out;
    }

    out.status = RecvStatus::Event;
    out.event  = state_->ring[static_cast<std::size_t>(cursor_ - oldest)];
    ++cursor_;
    return out;
  }

  out.status = RecvStatus::Closed;
  return out;
}

RecvResult Subscription::Recv() {
  if (!state_) throw std::logic_error("recv on moved-from subscription");

  std::unique_lock lock(state_->mutex);
  state_->cv.wait(lock, [&] { return state_->closed || cursor_ < state_->next_seq; });
  return TakeLocked();
}

RecvResult Subscription::RecvFor(std::chrono::milliseconds timeout) {
  if (!state_) throw std::logic_error("recv on moved-from subscription");

  std::unique_lock lock(state_->mutex);
  const bool ready = state_->cv.wait_for(lock, timeout, [&] { return state_->closed || cursor_ < state_->next_seq; });
  if (!ready) {
    RecvResult out;
    out.status = RecvStatus::Timeout;
    return out;
  }
  return TakeLocked();
}

// ------------------------------------------------------------
// NotificationBus
// ------------------------------------------------------------

NotificationBus::NotificationBus(std::size_t capacity) {
  if (capacity == 0) throw std::invalid_argument("notification bus capacity must be positive");
  state_ = std::make_shared<detail::BusState>(capacity);
}

NotificationBus::~NotificationBus() {
  Close();
}

bool NotificationBus::Publish(BusEvent event) {
  {
    std::lock_guard lock(state_->mutex);
    if (state_->closed || state_->subscribers == 0) return false;

    state_->ring.push_back(std::move(event));
    if (state_->ring.size() > state_->capacity) state_->ring.pop_front();
    ++state_->next_seq;
  }
  state_->cv.notify_all();
  return true;
}

Subscription NotificationBus::Subscribe() {
  std::lock_guard lock(state_->mutex);
  ++state_->subscribers;
  return Subscription(state_, state_->next_seq);
}

void NotificationBus::Close() {
  {
    std::lock_guard lock(state_->mutex);
    state_->closed = true;
  }
  state_->cv.notify_all();
}

std::size_t NotificationBus::SubscriberCount() const {
  std::lock_guard lock(state_->mutex);
  return state_->subscribers;
}

const char* EventName(const BusEvent& event) {
  return std::holds_alternative<NewCode>(event) ? "new_code" : "exit";
}

} // namespace codestaff::bus
