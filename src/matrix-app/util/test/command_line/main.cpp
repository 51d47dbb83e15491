#include "matrix-app/util/command_line.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

using namespace sunarc;

namespace {

struct ArgV {
  explicit ArgV(std::vector<std::string> args) : storage{std::move(args)} {
    storage.insert(storage.begin(), "sunarc-matrix");
    for (auto& s : storage) {
      ptrs.push_back(&s[0]);
    }
  }

  int argc() const {
    return int(ptrs.size());
  }
  char** argv() {
    return ptrs.data();
  }

  std::vector<std::string> storage;
  std::vector<char*> ptrs;
};

bool parse(cmd::Arguments& args, std::vector<std::string> in) {
  ArgV argv{std::move(in)};
  return args.parse(argv.argc(), argv.argv());
}

} //  anon

TEST(CommandLine, DefaultsFollowTheDevice) {
  cmd::Arguments args;
  ASSERT_TRUE(parse(args, {"--fake"}));
  const auto& config = args.config;
  EXPECT_DOUBLE_EQ(config.weather_update_interval_s, 300.0);
  EXPECT_DOUBLE_EQ(config.display_update_interval_s, 60.0);
  EXPECT_EQ(config.utc_offset_hours, -5);
  EXPECT_EQ(config.utc_offset_seconds(), -18000);
  EXPECT_EQ(config.display_width, 64);
  EXPECT_EQ(config.display_height, 32);
  EXPECT_DOUBLE_EQ(config.gradient_temp_min, 20.0);
  EXPECT_DOUBLE_EQ(config.gradient_temp_max, 90.0);
  EXPECT_TRUE(config.use_fixture_data);
  EXPECT_FALSE(config.use_24_hour_clock);
  EXPECT_EQ(config.max_num_ticks, 0);
}

TEST(CommandLine, LongAndShortNames) {
  cmd::Arguments args;
  ASSERT_TRUE(parse(args, {
    "--weather-file", "/tmp/onecall.json",
    "-wi", "600",
    "--display-interval", "30",
    "-u", "1",
    "--width", "128", "-he", "64",
    "-tmin", "0", "--temp-max", "110",
    "-i", "icons.bmp",
    "-o", "frame.png",
    "-t", "--24h", "-q",
    "-dt", "0.5", "-n", "10",
    "--window", "-s", "8"
  }));
  const auto& config = args.config;
  EXPECT_EQ(config.weather_file_path, "/tmp/onecall.json");
  EXPECT_FALSE(config.use_fixture_data);
  EXPECT_DOUBLE_EQ(config.weather_update_interval_s, 600.0);
  EXPECT_DOUBLE_EQ(config.display_update_interval_s, 30.0);
  EXPECT_EQ(config.utc_offset_hours, 1);
  EXPECT_EQ(config.display_width, 128);
  EXPECT_EQ(config.display_height, 64);
  EXPECT_DOUBLE_EQ(config.gradient_temp_min, 0.0);
  EXPECT_DOUBLE_EQ(config.gradient_temp_max, 110.0);
  EXPECT_EQ(config.icon_atlas_path, "icons.bmp");
  EXPECT_EQ(config.frame_output_path, "frame.png");
  EXPECT_TRUE(config.show_terminal_preview);
  EXPECT_TRUE(config.use_24_hour_clock);
  EXPECT_TRUE(config.quiet);
  EXPECT_DOUBLE_EQ(config.tick_interval_s, 0.5);
  EXPECT_EQ(config.max_num_ticks, 10);
  EXPECT_TRUE(config.show_preview_window);
  EXPECT_EQ(config.preview_window_scale, 8);
}

TEST(CommandLine, UnknownOptionsAndPositionalsAreErrors) {
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "--bogus"}));
    EXPECT_TRUE(args.had_parse_error);
  }
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "extra"}));
    EXPECT_TRUE(args.had_parse_error);
  }
}

TEST(CommandLine, BadOrMissingValuesAreErrors) {
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "--width", "wide"}));
    EXPECT_TRUE(args.had_parse_error);
  }
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "--weather-interval"}));
    EXPECT_TRUE(args.had_parse_error);
  }
}

TEST(CommandLine, InvalidConfigurationIsRejected) {
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {}));
    EXPECT_FALSE(args.validation_error.empty());
  }
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "--display-interval", "0"}));
    EXPECT_NE(args.validation_error.find("display"), std::string::npos);
  }
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "--temp-min", "90", "--temp-max", "20"}));
    EXPECT_FALSE(args.validation_error.empty());
  }
  {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, {"--fake", "-w", "8"}));
    EXPECT_FALSE(args.validation_error.empty());
  }
}

TEST(CommandLine, NonFiniteNumbersAreRejected) {
  const std::vector<std::vector<std::string>> cases{
    {"--fake", "--weather-interval", "inf"},
    {"--fake", "--display-interval", "nan"},
    {"--fake", "--temp-min", "-inf"},
    {"--fake", "--temp-max", "infinity"},
  };
  for (auto& in : cases) {
    cmd::Arguments args;
    EXPECT_FALSE(parse(args, in)) << in[1];
    EXPECT_FALSE(args.validation_error.empty()) << in[1];
  }

  AppConfig config;
  config.use_fixture_data = true;
  config.tick_interval_s = std::numeric_limits<double>::infinity();
  EXPECT_EQ(validate(config), "intervals must be finite");
}

TEST(CommandLine, HelpStopsWithoutAnError) {
  cmd::Arguments args;
  EXPECT_FALSE(parse(args, {"--help"}));
  EXPECT_TRUE(args.show_help_text);
  EXPECT_FALSE(args.had_parse_error);
}

TEST(CommandLine, ValidateAcceptsDefaultsWithADataSource) {
  AppConfig config;
  EXPECT_FALSE(validate(config).empty());
  config.use_fixture_data = true;
  EXPECT_TRUE(validate(config).empty());
  config.utc_offset_hours = 20;
  EXPECT_FALSE(validate(config).empty());
}

TEST(CommandLine, NumberParsing) {
  EXPECT_EQ(cmd::parse_int("-5").value(), -5);
  EXPECT_FALSE(cmd::parse_int("5x"));
  EXPECT_FALSE(cmd::parse_int(""));
  EXPECT_FALSE(cmd::parse_int("99999999999"));
  EXPECT_DOUBLE_EQ(cmd::parse_double("2.5").value(), 2.5);
  EXPECT_FALSE(cmd::parse_double("abc"));
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
