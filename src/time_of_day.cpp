#include "wake/time_of_day.hpp"

#include <cctype>
#include <cstdlib>

namespace wake::time {

namespace {

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
  std::int64_t q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

} // namespace

int wrap(int minutes) {
  return ((minutes % kMinutesPerDay) + kMinutesPerDay) % kMinutesPerDay;
}

int parse_hhmm(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() - colon != 3) {
    throw ValidationError("Expected HH:MM time, got '" + text + "'");
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw ValidationError("Expected HH:MM time, got '" + text + "'");
    }
  }
  const int hours = std::atoi(text.substr(0, colon).c_str());
  const int minutes = std::atoi(text.substr(colon + 1).c_str());
  if (hours > 23 || minutes > 59) {
    throw ValidationError("Time out of range: '" + text + "'");
  }
  return hours * 60 + minutes;
}

std::string format_hhmm(int minute_of_day) {
  const int wrapped = wrap(minute_of_day);
  const int hours = wrapped / 60;
  const int minutes = wrapped % 60;
  std::string out;
  out.push_back(static_cast<char>('0' + hours / 10));
  out.push_back(static_cast<char>('0' + hours % 10));
  out.push_back(':');
  out.push_back(static_cast<char>('0' + minutes / 10));
  out.push_back(static_cast<char>('0' + minutes % 10));
  return out;
}

int signed_delta(int from, int to) {
  int delta = wrap(to - from);
  if (delta >= kMinutesPerDay / 2) {
    delta -= kMinutesPerDay;
  }
  return delta;
}

int circular_distance(int a, int b) {
  return std::abs(signed_delta(a, b));
}

std::int64_t to_epoch_ms(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(std::int64_t ms) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

std::int64_t local_day(Timestamp ts, int utc_offset_minutes) {
  const std::int64_t shifted = to_epoch_ms(ts) + static_cast<std::int64_t>(utc_offset_minutes) * 60000;
  return floor_div(shifted, kMillisPerDay);
}

bool same_local_day(Timestamp a, Timestamp b, int utc_offset_minutes) {
  return local_day(a, utc_offset_minutes) == local_day(b, utc_offset_minutes);
}

} // namespace wake::time
