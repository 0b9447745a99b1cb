#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace codestaff::coordinator {

/*
  Bitwise capability stored in users.authorized.

  kAll is a reserved sentinel chosen to overlap every other capability.
*/
enum class AccessLevel : int32_t {
  kNone   = 0,
  kSend   = 1,
  kCookie = 2,
  kAll    = 0x7fffffff,
};

inline constexpr int32_t ToValue(AccessLevel level) {
  return static_cast<int32_t>(level);
}

// A caller holding `stored` may use `requested` when (requested | stored) > 0.
inline constexpr bool IsAuthorized(AccessLevel requested, int32_t stored) {
  return (ToValue(requested) | stored) > 0;
}

// "all", "cookie", "send" (alias "message"), "none".
std::optional<AccessLevel> ParseAccessLevel(std::string_view name);

// Display name of a stored value; "custom" when it matches no named level.
const char* AccessLevelName(int32_t stored);

} // namespace codestaff::coordinator
