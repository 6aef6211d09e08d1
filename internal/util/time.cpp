#include "time.hpp"

#include <atomic>
#include <cctype>
#include <stdexcept>

namespace avatarpool::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NextDistinctToken() {
  static std::atomic<uint64_t> last{0};

  const auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now().time_since_epoch()).count());

  uint64_t prev = last.load();
  uint64_t next = 0;
  do {
    next = now > prev ? now : prev + 1;
  } while (!last.compare_exchange_weak(prev, next));
  return next;
}

std::chrono::milliseconds ParseDuration(const std::string& text) {
  size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
  if (pos == 0) {
    throw std::invalid_argument("duration must start with a number: '" + text + "'");
  }

  const auto unit = text.substr(pos);

  uint64_t per_unit_ms = 0;
  if (unit == "ms") {
    per_unit_ms = 1;
  } else if (unit == "s" || unit.empty()) {
    per_unit_ms = 1000;
  } else if (unit == "m") {
    per_unit_ms = 60 * 1000;
  } else {
    throw std::invalid_argument("unknown duration unit '" + unit + "' in '" + text + "'");
  }

  // stoull itself throws std::out_of_range past 2^64
  const uint64_t value = std::stoull(text.substr(0, pos));
  const uint64_t limit = static_cast<uint64_t>(std::chrono::milliseconds::max().count()) / per_unit_ms;
  if (value > limit) {
    throw std::out_of_range("duration out of range: '" + text + "'");
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value * per_unit_ms));
}

} // namespace avatarpool::util
