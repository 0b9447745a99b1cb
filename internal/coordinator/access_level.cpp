#include "internal/coordinator/access_level.hpp"

namespace codestaff::coordinator {

std::optional<AccessLevel> ParseAccessLevel(std::string_view name) {
  if (name == "all") return AccessLevel::kAll;
  if (name == "cookie") return AccessLevel::kCookie;
  if (name == "send" || name == "message") return AccessLevel::kSend;
  if (name == "none") return AccessLevel::kNone;
  return std::nullopt;
}

const char* AccessLevelName(int32_t stored) {
  switch (stored) {
    case ToValue(AccessLevel::kNone):
      return "none";
    case ToValue(AccessLevel::kSend):
      return "send";
    case ToValue(AccessLevel::kCookie):
      return "cookie";
    case ToValue(AccessLevel::kAll):
      return "all";
    default:
      return "custom";
  }
}

} // namespace codestaff::coordinator
