#include "matrix-app/time/clock.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <utility>
#include <vector>

using namespace sunarc;

namespace {

//  Replays a fixed sequence of wall-clock readings.
class SteppedSystemClock : public SystemClock {
public:
  SteppedSystemClock(std::vector<int64_t> readings, int utc_offset_seconds) :
    SystemClock{utc_offset_seconds},
    readings{std::move(readings)} {
    //
  }

protected:
  int64_t read_epoch_seconds() const override {
    return readings[std::min(next++, readings.size() - 1)];
  }

private:
  std::vector<int64_t> readings;
  mutable size_t next{};
};

} //  anon

TEST(ClockState, LocalTimeOfDay) {
  //  2025-02-19 19:07:04 UTC is 14:07 in UTC-5.
  ClockState state{1739992024, -5 * 3600};
  EXPECT_EQ(state.hour(), 14);
  EXPECT_EQ(state.minute(), 7);

  ClockState utc{1739992024, 0};
  EXPECT_EQ(utc.hour(), 19);
}

TEST(ClockState, WrapsBeforeTheEpoch) {
  ClockState state{0, -3600};
  EXPECT_EQ(state.seconds_into_day(), 86400 - 3600);
  EXPECT_EQ(state.hour(), 23);
  EXPECT_EQ(state.minute(), 0);
}

TEST(ManualClock, AdvancesAndAccumulatesFractions) {
  ManualClock clock{1000, 0};
  EXPECT_EQ(clock.now().epoch_seconds, 1000);
  clock.advance(0.6);
  EXPECT_EQ(clock.now().epoch_seconds, 1000);
  clock.advance(0.6);
  EXPECT_EQ(clock.now().epoch_seconds, 1001);
  clock.advance(60.0);
  EXPECT_EQ(clock.now().epoch_seconds, 1061);
}

TEST(ManualClock, NeverRunsBackwards) {
  ManualClock clock{1000, 7200};
  clock.advance(-50.0);
  EXPECT_EQ(clock.now().epoch_seconds, 1000);
  clock.set(900);
  EXPECT_EQ(clock.now().epoch_seconds, 1000);
  clock.set(2000);
  EXPECT_EQ(clock.now().epoch_seconds, 2000);
  EXPECT_EQ(clock.now().utc_offset_seconds, 7200);
}

TEST(SystemClock, ReportsTheConfiguredOffset) {
  SystemClock clock{-5 * 3600};
  auto state = clock.now();
  EXPECT_EQ(state.utc_offset_seconds, -18000);
  //  Any time after this code was written.
  EXPECT_GT(state.epoch_seconds, int64_t(1700000000));
}

TEST(SystemClock, HoldsTheLatestTimeWhenTheSystemTimeStepsBack) {
  SteppedSystemClock clock{{1000, 1060, 1000, 1030, 1120}, 3600};
  EXPECT_EQ(clock.now().epoch_seconds, 1000);
  EXPECT_EQ(clock.now().epoch_seconds, 1060);
  EXPECT_EQ(clock.now().epoch_seconds, 1060);
  EXPECT_EQ(clock.now().epoch_seconds, 1060);
  auto state = clock.now();
  EXPECT_EQ(state.epoch_seconds, 1120);
  EXPECT_EQ(state.utc_offset_seconds, 3600);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
