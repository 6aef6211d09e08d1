#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace avatarpool::util {

/*
  Wall clock for record timestamps, plus the tokens and durations
  derived from it.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);

// Strictly increasing per process; used to make profile image names distinct.
uint64_t NextDistinctToken();

// Parses "250ms", "5s", "2m". Throws std::invalid_argument on bad input and
// std::out_of_range when the value does not fit in milliseconds.
std::chrono::milliseconds ParseDuration(const std::string& text);

} // namespace avatarpool::util
