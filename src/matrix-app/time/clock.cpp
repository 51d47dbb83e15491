#include "clock.hpp"
#include "sunarc/common/common.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

SUNARC_NAMESPACE_BEGIN

namespace {

constexpr int64_t seconds_per_day = 86400;

} //  anon

int ClockState::seconds_into_day() const {
  auto s = local_seconds() % seconds_per_day;
  return int(s < 0 ? s + seconds_per_day : s);
}

SystemClock::SystemClock(int utc_offset_seconds) : utc_offset_seconds{utc_offset_seconds} {
  //
}

ClockState SystemClock::now() const {
  latest_epoch_seconds = std::max(latest_epoch_seconds, read_epoch_seconds());
  return ClockState{latest_epoch_seconds, utc_offset_seconds};
}

int64_t SystemClock::read_epoch_seconds() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return int64_t(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

ManualClock::ManualClock(int64_t epoch_seconds, int utc_offset_seconds) :
  epoch_seconds{epoch_seconds},
  utc_offset_seconds{utc_offset_seconds} {
  //
}

ClockState ManualClock::now() const {
  return ClockState{epoch_seconds, utc_offset_seconds};
}

void ManualClock::set(int64_t secs) {
  if (secs >= epoch_seconds) {
    epoch_seconds = secs;
    fractional_seconds = 0.0;
  }
}

void ManualClock::advance(double seconds) {
  if (!(seconds > 0.0)) {
    return;
  }
  fractional_seconds += seconds;
  auto whole = std::floor(fractional_seconds);
  epoch_seconds += int64_t(whole);
  fractional_seconds -= whole;
}

SUNARC_NAMESPACE_END
