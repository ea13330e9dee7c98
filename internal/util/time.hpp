#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace aff4::util {

/*
  Time utilities.

  Attribute versions are stamped in microseconds since the unix epoch.
  Everything that needs "now" goes through a TimeSource so tests can
  drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Timestamp = uint64_t;

inline constexpr Timestamp kMicrosPerSecond = 1000000;

TimePoint Now();

Timestamp ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(Timestamp micros);

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual Timestamp NowMicros() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  Timestamp NowMicros() const override;
};

// Manually driven clock for tests and replay.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(Timestamp start_micros = 0) : now_(start_micros) {
  }

  Timestamp NowMicros() const override {
    return now_.load();
  }

  void Set(Timestamp micros) {
    now_.store(micros);
  }

  void SetSeconds(uint64_t seconds) {
    now_.store(seconds * kMicrosPerSecond);
  }

  void AdvanceSeconds(uint64_t seconds) {
    now_.fetch_add(seconds * kMicrosPerSecond);
  }

 private:
  std::atomic<Timestamp> now_;
};

} // namespace aff4::util
