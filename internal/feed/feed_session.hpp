#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/bus/notification_bus.hpp"

namespace codestaff::feed {

enum class ReceiveStatus {
  Message,
  Empty,
  PeerClosed,
};

struct Inbound {
  ReceiveStatus status = ReceiveStatus::Empty;
  std::string   text;
};

/*
  Transport seen by a FeedSession: one text message per call.
*/
class FeedConnection {
 public:
  virtual ~FeedConnection() = default;

  // false when the peer is gone
  virtual bool Send(const std::string& text) = 0;

  // Next inbound message if one is already available. PeerClosed once the
  // peer has gone and nothing is left to read.
  virtual Inbound TryReceive() = 0;

  virtual void Close() = 0;
};

struct FeedSessionOptions {
  // argon2 PHC string the peer's secret is verified against
  std::string               access_key;
  std::chrono::milliseconds poll_interval{50};
};

/*
  One notification subscriber.

  The peer must send FeedAuth JSON whose hash field verifies against the
  configured argon2 access key before anything is forwarded; events seen
  until then are discarded. Once registered, each announced code is sent
  as plain text. Exit sends "close" and ends the session. Inbound "close"
  or a vanished peer ends it from the peer side.
*/
class FeedSession {
 public:
  FeedSession(bus::Subscription subscription, FeedSessionOptions options, std::shared_ptr<FeedConnection> connection);

  // Blocks until the session ends; the connection is closed on return.
  void Run();

  bool Registered() const {
    return registered_;
  }

  const std::string& Codename() const {
    return codename_;
  }

 private:
  // false when the session should end
  bool HandleInbound(const std::string& text);
  bool Verify(const std::string& secret) const;
  bool HandleEvent(const bus::RecvResult& result);

  bus::Subscription               subscription_;
  FeedSessionOptions              options_;
  std::shared_ptr<FeedConnection> connection_;

  bool        registered_ = false;
  std::string codename_;
};

} // namespace codestaff::feed
