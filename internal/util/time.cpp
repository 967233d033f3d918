#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace calltrace::util {

TimePoint Now() {
  return Clock::now();
}

double ToUnixSeconds(TimePoint tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
  return static_cast<double>(micros) / 1e6;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

double ElapsedMillis(SteadyClock::time_point start, SteadyClock::time_point end) {
  return std::chrono::duration<double, std::milli>(end - start).count();
}

std::string FormatRunStamp(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d_%H%M%S");
  return out.str();
}

} // namespace calltrace::util
