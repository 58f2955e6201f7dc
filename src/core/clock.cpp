#include "finval/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace finval::core {

std::string format_epoch_iso8601(long long epoch_seconds) {
  const auto time_t_value = static_cast<std::time_t>(epoch_seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
  return format_epoch_iso8601(seconds.count());
}

std::string SteppingClock::now_iso8601() {
  return format_epoch_iso8601(next_++);
}

}  // namespace finval::core
