#include "internal/feed/feed_session.hpp"

#include <google/protobuf/util/json_util.h>
#include <sodium.h>

#include <stdexcept>

#include "codestaff/v1/state.pb.h"
#include "internal/observability/logging.hpp"

namespace codestaff::feed {

namespace obs = codestaff::observability;

namespace {

constexpr const char* kCloseMessage = "close";

} // namespace

FeedSession::FeedSession(bus::Subscription subscription, FeedSessionOptions options, std::shared_ptr<FeedConnection> connection)
    : subscription_(std::move(subscription)), options_(std::move(options)), connection_(std::move(connection)) {
  if (!connection_) throw std::invalid_argument("feed session requires a connection");
  if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");
}

void FeedSession::Run() {
  bool open = true;
  while (open) {
    while (open) {
      auto inbound = connection_->TryReceive();
      if (inbound.status == ReceiveStatus::Empty) break;
      if (inbound.status == ReceiveStatus::PeerClosed) {
        CODESTAFF_LOG_INFO("feed peer disconnected", {obs::StringField("codename", codename_)});
        open = false;
        break;
      }
      open = HandleInbound(inbound.text);
    }
    if (!open) break;

    auto result = subscription_.RecvFor(options_.poll_interval);
    if (result.status == bus::RecvStatus::Timeout) continue;
    open = HandleEvent(result);
  }

  connection_->Close();
  CODESTAFF_LOG_INFO("feed session ended", {obs::StringField("codename", codename_), obs::BoolField("registered", registered_)});
}

bool FeedSession::HandleInbound(const std::string& text) {
  if (text == kCloseMessage) {
    CODESTAFF_LOG_INFO("feed peer closed", {obs::StringField("codename", codename_)});
    return false;
  }

  codestaff::v1::FeedAuth auth;
  auto status = google::protobuf::util::JsonStringToMessage(text, &auth);
  if (!status.ok()) {
    CODESTAFF_LOG_WARN("ignoring unparseable feed message", {obs::StringField("error", status.ToString())});
    return true;
  }

  if (!Verify(auth.hash())) {
    CODESTAFF_LOG_WARN("feed authentication rejected", {obs::StringField("codename", auth.codename())});
    return true;
  }

  if (!registered_) {
    registered_ = true;
    codename_   = auth.codename();
    CODESTAFF_LOG_INFO("feed subscriber registered", {obs::StringField("codename", codename_)});
  }
  return true;
}

bool FeedSession::Verify(const std::string& secret) const {
  // anything but a valid argon2 string in access_key rejects every peer
  return crypto_pwhash_str_verify(options_.access_key.c_str(), secret.data(), secret.size()) == 0;
}

bool FeedSession::HandleEvent(const bus::RecvResult& result) {
  switch (result.status) {
    case bus::RecvStatus::Closed:
      return false;
    case bus::RecvStatus::Lagged:
      CODESTAFF_LOG_WARN("feed subscriber lagged", {obs::StringField("codename", codename_), obs::IntField("missed", static_cast<int64_t>(result.missed))});
      return true;
    case bus::RecvStatus::Timeout:
      return true;
    case bus::RecvStatus::Event:
      break;
  }

  if (!registered_) return true;

  if (const auto* code = std::get_if<bus::NewCode>(&result.event)) {
    if (!connection_->Send(code->code)) {
      CODESTAFF_LOG_WARN("feed send failed", {obs::StringField("codename", codename_)});
      return false;
    }
    return true;
  }

  // Exit
  if (!connection_->Send(kCloseMessage)) {
    CODESTAFF_LOG_DEBUG("feed peer gone before close", {obs::StringField("codename", codename_)});
  }
  return false;
}

} // namespace codestaff::feed
