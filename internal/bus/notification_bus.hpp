#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace codestaff::bus {

// A code was announced (or re-announced on request).
struct NewCode {
  std::string code;
};

// The coordinator is shutting down; terminal for every subscriber.
struct Exit {};

using BusEvent = std::variant<NewCode, Exit>;

enum class RecvStatus {
  Event,
  Lagged,   // `missed` events were evicted before this subscriber read them
  Closed,   // publisher gone and everything retained was read
  Timeout,  // RecvFor only
};

struct RecvResult {
  RecvStatus status = RecvStatus::Closed;
  BusEvent   event;
  uint64_t   missed = 0;
};

namespace detail {
struct BusState;
}

/*
  Private, ordered view of the bus from the subscription point onward.

  Only one thread may read from a Subscription at a time.
*/
class Subscription {
 public:
  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Blocks until an event, a lag signal or close.
  RecvResult Recv();

  RecvResult RecvFor(std::chrono::milliseconds timeout);

 private:
  friend class NotificationBus;

  Subscription(std::shared_ptr<detail::BusState> state, uint64_t cursor);

  RecvResult TakeLocked();

  std::shared_ptr<detail::BusState> state_;
  uint64_t                          cursor_ = 0;
};

/*
  Single-publisher, multi-subscriber broadcast.

  Retains the last `capacity` events in a ring. Publish never blocks on
  subscribers: with none attached the event is dropped, and slow
  subscribers see RecvStatus::Lagged instead of stalling the publisher.
*/
class NotificationBus {
 public:
  explicit NotificationBus(std::size_t capacity);
  ~NotificationBus();

  NotificationBus(const NotificationBus&)            = delete;
  NotificationBus& operator=(const NotificationBus&) = delete;

  // Returns false when the event was dropped (no subscribers or closed).
  bool Publish(BusEvent event);

  Subscription Subscribe();

  // Marks the publisher gone; subscribers drain what is retained, then see Closed.
  void Close();

  std::size_t SubscriberCount() const;

 private:
  std::shared_ptr<detail::BusState> state_;
};

const char* EventName(const BusEvent& event);

} // namespace codestaff::bus
