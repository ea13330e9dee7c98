#include "time.hpp"

namespace aff4::util {

TimePoint Now() {
  return Clock::now();
}

Timestamp ToUnixMicros(TimePoint tp) {
  return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMicros(Timestamp micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

Timestamp SystemTimeSource::NowMicros() const {
  return ToUnixMicros(Now());
}

} // namespace aff4::util
