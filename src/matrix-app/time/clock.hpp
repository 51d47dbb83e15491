#pragma once

#include <cstdint>

namespace sunarc {

struct ClockState {
  int64_t epoch_seconds;
  int utc_offset_seconds;

  int64_t local_seconds() const {
    return epoch_seconds + utc_offset_seconds;
  }
  //  [0, 86400), also for local times before the epoch.
  int seconds_into_day() const;
  int hour() const {
    return seconds_into_day() / 3600;
  }
  int minute() const {
    return (seconds_into_day() % 3600) / 60;
  }
};

class Clock {
public:
  virtual ~Clock() = default;
  virtual ClockState now() const = 0;
};

//  Wall-clock time. Steps backwards in the system time are held at the latest value returned.
class SystemClock : public Clock {
public:
  explicit SystemClock(int utc_offset_seconds);
  ClockState now() const override;

protected:
  virtual int64_t read_epoch_seconds() const;

private:
  int utc_offset_seconds;
  mutable int64_t latest_epoch_seconds{};
};

//  Time only moves when told to.
class ManualClock : public Clock {
public:
  ManualClock(int64_t epoch_seconds, int utc_offset_seconds);
  ClockState now() const override;

  void set(int64_t epoch_seconds);
  //  Negative steps are ignored; time never runs backwards.
  void advance(double seconds);

private:
  int64_t epoch_seconds;
  double fractional_seconds{};
  int utc_offset_seconds;
};

}
