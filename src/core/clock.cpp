#include "takoa/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace takoa::core {

std::string format_iso8601_millis(const long long unix_ms) {
  long long seconds = unix_ms / 1000;
  long long millis = unix_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto t = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&t, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

std::string SystemClock::now_iso8601() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return format_iso8601_millis(
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

}  // namespace takoa::core
