#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>

namespace wake::time {

constexpr int kMinutesPerDay = 24 * 60;

// Folds any minute count into [0, 1440).
int wrap(int minutes);

// "HH:MM" -> minute of day. Throws ValidationError on malformed input.
int parse_hhmm(const std::string& text);
std::string format_hhmm(int minute_of_day);

// Shortest signed distance from `from` to `to` on the 24h circle, in [-720, 720).
int signed_delta(int from, int to);
int circular_distance(int a, int b);

std::int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(std::int64_t ms);

// Day index of `ts` in the local calendar given a fixed UTC offset.
std::int64_t local_day(Timestamp ts, int utc_offset_minutes);
bool same_local_day(Timestamp a, Timestamp b, int utc_offset_minutes);

} // namespace wake::time
