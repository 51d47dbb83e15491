#include "matrix-app/weather/openweather.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace sunarc;
using weather::Condition;
using weather::FetchError;

namespace {

std::string write_temp_file(const char* name, const std::string& contents) {
  auto path = testing::TempDir() + name;
  std::ofstream out{path, std::ios::binary};
  out << contents;
  return path;
}

std::string current_only(const std::string& weather_entry) {
  return std::string{R"({"current": {"dt": 100, "sunrise": 50, "sunset": 150, "temp": 71.9, "weather": [)"} +
    weather_entry + "]}}";
}

} //  anon

TEST(DecodeOneCall, SampleDocument) {
  auto res = weather::decode_onecall(weather::fixture_onecall_document());
  ASSERT_TRUE(res);
  const auto& reading = res.get_left();
  EXPECT_EQ(reading.temperature(), 45);
  EXPECT_EQ(reading.condition(), Condition::Snow);
  EXPECT_EQ(reading.sunrise(), 1739966652);
  EXPECT_EQ(reading.sunset(), 1740006242);
  EXPECT_EQ(reading.fetched_at(), 1739992024);
  ASSERT_TRUE(reading.daily());
  EXPECT_EQ(reading.daily().value(), (weather::DailyRange{40, 60}));
}

TEST(DecodeOneCall, FixtureSourceMatchesTheSampleDocument) {
  weather::FixtureWeatherSource source;
  auto res = source.fetch();
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), 45);
  EXPECT_STREQ(source.name(), "fixture");
}

TEST(DecodeOneCall, TemperaturesAreTruncated) {
  auto res = weather::decode_onecall(current_only(R"({"id": 800, "icon": "01d"})"));
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), 71);

  res = weather::decode_onecall(
    R"({"current": {"dt": 1, "temp": -3.7, "weather": [{"icon": "13n"}]}})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), -3);
}

TEST(DecodeOneCall, MissingDailyBlockLeavesTheRangeUnknown) {
  auto res = weather::decode_onecall(current_only(R"({"id": 800, "icon": "01d"})"));
  ASSERT_TRUE(res);
  EXPECT_FALSE(res.get_left().daily());
  EXPECT_EQ(res.get_left().condition(), Condition::Clear);
}

TEST(DecodeOneCall, FallsBackToTheWeatherId) {
  auto res = weather::decode_onecall(current_only(R"({"id": 211})"));
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().condition(), Condition::Thunderstorm);

  res = weather::decode_onecall(current_only(R"({"id": 502, "icon": "zz"})"));
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().condition(), Condition::Rain);

  res = weather::decode_onecall(current_only(""));
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().condition(), Condition::Unknown);
}

TEST(DecodeOneCall, DailyRangeIsWidenedToContainTheTemperature) {
  auto res = weather::decode_onecall(R"({
    "current": {"dt": 1, "sunrise": 0, "sunset": 2, "temp": 80.2, "weather": [{"icon": "02d"}]},
    "daily": [{"temp": {"min": 75.5, "max": 62.1}}]
  })");
  ASSERT_TRUE(res);
  ASSERT_TRUE(res.get_left().daily());
  EXPECT_EQ(res.get_left().daily().value(), (weather::DailyRange{62, 80}));
}

TEST(DecodeOneCall, AuthErrorDocument) {
  auto res = weather::decode_onecall(
    R"({"cod": 401, "message": "Invalid API key. Please see https://openweathermap.org/faq#error401 for more info."})");
  ASSERT_FALSE(res);
  EXPECT_EQ(res.get_right().reason, FetchError::Reason::Auth);
  EXPECT_NE(res.get_right().message.find("Invalid API key"), std::string::npos);

  res = weather::decode_onecall(R"({"cod": "401", "message": "nope"})");
  ASSERT_FALSE(res);
  EXPECT_EQ(res.get_right().reason, FetchError::Reason::Auth);
}

TEST(DecodeOneCall, OtherServiceErrorsAreNetworkErrors) {
  auto res = weather::decode_onecall(R"({"cod": 429, "message": "Too many requests"})");
  ASSERT_FALSE(res);
  EXPECT_EQ(res.get_right().reason, FetchError::Reason::Network);
  EXPECT_NE(res.get_right().message.find("429"), std::string::npos);
}

TEST(DecodeOneCall, MalformedDocumentsAreParseErrors) {
  const char* bad[] = {
    "",
    "not json",
    "{\"current\": {",
    "[1, 2, 3]",
    "{}",
    R"({"current": {"dt": 1}})",
    R"({"current": {"dt": "soon", "temp": 40}})",
    R"({"current": {"dt": 1, "temp": "warm"}})",
  };
  for (const char* text : bad) {
    auto res = weather::decode_onecall(text);
    ASSERT_FALSE(res) << text;
    EXPECT_EQ(res.get_right().reason, FetchError::Reason::Parse) << text;
  }
}

TEST(DecodeOneCall, OutOfRangeNumbersAreParseErrors) {
  const char* bad[] = {
    R"({"current": {"dt": 1, "sunrise": 0, "sunset": 100, "temp": 1e12}})",
    R"({"current": {"dt": 1, "sunrise": 0, "sunset": 100, "temp": -3000000000}})",
    R"({"current": {"dt": 1, "sunrise": 0, "sunset": 100, "temp": 501}})",
    R"({"current": {"dt": 1, "sunrise": 18446744073709551000, "sunset": 100, "temp": 40}})",
    R"({"current": {"dt": 1, "sunrise": 0, "sunset": -5, "temp": 40}})",
    R"({"current": {"dt": 1, "sunrise": 0.5, "sunset": 100, "temp": 40}})",
    R"({"current": {"dt": -1, "temp": 40}})",
    R"({"current": {"dt": 9223372036854775808, "temp": 40}})",
  };
  for (const char* text : bad) {
    auto res = weather::decode_onecall(text);
    ASSERT_FALSE(res) << text;
    EXPECT_EQ(res.get_right().reason, FetchError::Reason::Parse) << text;
  }
}

TEST(DecodeOneCall, ExtremeButPlausibleValuesAreKept) {
  auto res = weather::decode_onecall(
    R"({"current": {"dt": 9223372036854775807, "sunrise": 0, "sunset": 100, "temp": -129.9}})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), -129);
  EXPECT_EQ(res.get_left().fetched_at(), int64_t(9223372036854775807));
}

TEST(DecodeOneCall, OutOfRangeDailyBoundsLeaveTheRangeUnknown) {
  auto res = weather::decode_onecall(R"({
    "current": {"dt": 1, "sunrise": 0, "sunset": 2, "temp": 50},
    "daily": [{"temp": {"min": -1e300, "max": 60}}]
  })");
  ASSERT_TRUE(res);
  EXPECT_FALSE(res.get_left().daily());
}

TEST(FileWeatherSource, ReadsTheDocumentOnEveryFetch) {
  auto path = write_temp_file("sunarc_onecall.json", weather::fixture_onecall_document());
  weather::FileWeatherSource source{path};

  auto res = source.fetch();
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), 45);

  write_temp_file("sunarc_onecall.json", current_only(R"({"icon": "50d"})"));
  res = source.fetch();
  ASSERT_TRUE(res);
  EXPECT_EQ(res.get_left().temperature(), 71);
  EXPECT_EQ(res.get_left().condition(), Condition::Mist);

  std::remove(path.c_str());
}

TEST(FileWeatherSource, MissingFileIsANetworkError) {
  weather::FileWeatherSource source{testing::TempDir() + "sunarc_does_not_exist.json"};
  auto res = source.fetch();
  ASSERT_FALSE(res);
  EXPECT_EQ(res.get_right().reason, FetchError::Reason::Network);
  EXPECT_STREQ(weather::to_string(res.get_right().reason), "network");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
