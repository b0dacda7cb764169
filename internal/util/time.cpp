#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace adrgen::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatDate(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);

  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d");
  return out.str();
}

} // namespace adrgen::util
