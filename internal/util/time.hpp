#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace adrgen::util {

/*
  Time utilities — single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; tests pin the creation date with it.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

// Calendar date in local time, YYYY-MM-DD.
std::string FormatDate(TimePoint tp);

} // namespace adrgen::util
