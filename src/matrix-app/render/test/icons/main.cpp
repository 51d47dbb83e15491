#include "matrix-app/render/icons.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace sunarc;
using weather::Condition;

TEST(SelectIcon, ClearAndPartlyCloudyFollowTheNightFlag) {
  EXPECT_EQ(select_icon(Condition::Clear, false), IconId::ClearDay);
  EXPECT_EQ(select_icon(Condition::Clear, true), IconId::ClearNight);
  EXPECT_EQ(select_icon(Condition::PartlyCloudy, false), IconId::PartlyCloudyDay);
  EXPECT_EQ(select_icon(Condition::PartlyCloudy, true), IconId::PartlyCloudyNight);
}

TEST(SelectIcon, OtherConditionsIgnoreTheNightFlag) {
  const std::pair<Condition, IconId> expect[] = {
    {Condition::Cloudy, IconId::Cloudy},
    {Condition::Rain, IconId::Rain},
    {Condition::Snow, IconId::Snow},
    {Condition::Thunderstorm, IconId::Thunderstorm},
    {Condition::Mist, IconId::Mist},
    {Condition::Unknown, IconId::Unknown},
  };
  for (auto& e : expect) {
    EXPECT_EQ(select_icon(e.first, false), e.second) << weather::to_string(e.first);
    EXPECT_EQ(select_icon(e.first, true), e.second) << weather::to_string(e.first);
  }
}

TEST(SelectIcon, OutOfRangeConditionIsUnknown) {
  auto bogus = static_cast<Condition>(200);
  EXPECT_EQ(select_icon(bogus, false), IconId::Unknown);
  EXPECT_EQ(select_icon(bogus, true), IconId::Unknown);
}

TEST(AtlasTileIndex, EveryKnownIconHasADistinctTileInsideTheSheet) {
  const int num_tiles = icons::AtlasLayout::num_columns * icons::AtlasLayout::num_rows;
  std::set<int> seen;
  for (int i = 0; i < int(IconId::Unknown); i++) {
    auto id = IconId(i);
    int index = icons::atlas_tile_index(id);
    EXPECT_GE(index, 0) << to_string(id);
    EXPECT_LT(index, num_tiles) << to_string(id);
    EXPECT_TRUE(seen.insert(index).second) << to_string(id);
  }
  EXPECT_EQ(icons::atlas_tile_index(IconId::Unknown), -1);
}

TEST(AtlasTileIndex, NightIconsUseTheSecondColumn) {
  const int cols = icons::AtlasLayout::num_columns;
  EXPECT_EQ(icons::atlas_tile_index(IconId::ClearDay) % cols, 0);
  EXPECT_EQ(icons::atlas_tile_index(IconId::ClearNight) % cols, 1);
  EXPECT_EQ(icons::atlas_tile_index(IconId::PartlyCloudyNight) % cols, 1);
  EXPECT_EQ(icons::atlas_tile_index(IconId::Snow), 14);
}

TEST(ConditionDecoding, IconCodes) {
  using weather::condition_from_icon_code;
  EXPECT_EQ(condition_from_icon_code("01d"), Condition::Clear);
  EXPECT_EQ(condition_from_icon_code("01n"), Condition::Clear);
  EXPECT_EQ(condition_from_icon_code("02n"), Condition::PartlyCloudy);
  EXPECT_EQ(condition_from_icon_code("03d"), Condition::Cloudy);
  EXPECT_EQ(condition_from_icon_code("04n"), Condition::Cloudy);
  EXPECT_EQ(condition_from_icon_code("09d"), Condition::Rain);
  EXPECT_EQ(condition_from_icon_code("10n"), Condition::Rain);
  EXPECT_EQ(condition_from_icon_code("11d"), Condition::Thunderstorm);
  EXPECT_EQ(condition_from_icon_code("13d"), Condition::Snow);
  EXPECT_EQ(condition_from_icon_code("50n"), Condition::Mist);
  EXPECT_EQ(condition_from_icon_code("07d"), Condition::Unknown);
  EXPECT_EQ(condition_from_icon_code(""), Condition::Unknown);
  EXPECT_EQ(condition_from_icon_code("x1d"), Condition::Unknown);
}

TEST(ConditionDecoding, WeatherIds) {
  using weather::condition_from_weather_id;
  EXPECT_EQ(condition_from_weather_id(800), Condition::Clear);
  EXPECT_EQ(condition_from_weather_id(801), Condition::PartlyCloudy);
  EXPECT_EQ(condition_from_weather_id(802), Condition::Cloudy);
  EXPECT_EQ(condition_from_weather_id(804), Condition::Cloudy);
  EXPECT_EQ(condition_from_weather_id(211), Condition::Thunderstorm);
  EXPECT_EQ(condition_from_weather_id(301), Condition::Rain);
  EXPECT_EQ(condition_from_weather_id(502), Condition::Rain);
  EXPECT_EQ(condition_from_weather_id(601), Condition::Snow);
  EXPECT_EQ(condition_from_weather_id(741), Condition::Mist);
  EXPECT_EQ(condition_from_weather_id(0), Condition::Unknown);
  EXPECT_EQ(condition_from_weather_id(900), Condition::Unknown);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
