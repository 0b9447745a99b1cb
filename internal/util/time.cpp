#include "time.hpp"

#include <ctime>

namespace codestaff::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int64_t NowUnixSeconds() {
  return ToUnixSeconds(Now());
}

std::string FormatUnixSeconds(int64_t seconds) {
  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
  return std::string(buf, len);
}

} // namespace codestaff::util
