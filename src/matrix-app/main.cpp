#include "schedule/RefreshScheduler.hpp"
#include "render/FramebufferSurface.hpp"
#include "preview/PreviewWindow.hpp"
#include "weather/openweather.hpp"
#include "time/clock.hpp"
#include "util/command_line.hpp"
#include "sunarc/common/Stopwatch.hpp"
#include "sunarc/common/fs.hpp"
#include "sunarc/common/logging.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace sunarc;

namespace {

[[maybe_unused]] constexpr const char* logging_id() {
  return "sunarc-matrix";
}

void log_error(const std::string& msg) {
  SUNARC_LOG_ERROR_CAPTURE_META(msg.c_str(), logging_id());
  (void) msg;
}

std::unique_ptr<weather::WeatherSource> make_weather_source(const AppConfig& config) {
  if (config.use_fixture_data) {
    return std::make_unique<weather::FixtureWeatherSource>();
  }

  if (!fs::file_exists(config.weather_file_path)) {
    std::string msg{"No weather file at "};
    msg += config.weather_file_path;
    msg += " yet; showing \"Loading...\" until one appears.";
    SUNARC_LOG_WARNING_CAPTURE_META(msg.c_str(), logging_id());
  }
  return std::make_unique<weather::FileWeatherSource>(config.weather_file_path);
}

//  Fixture data describes one fixed moment; let time run forward from it so the
//  sun arc and clock show something sensible.
std::unique_ptr<ManualClock> make_fixture_clock(const AppConfig& config) {
  weather::FixtureWeatherSource source;
  auto res = source.fetch();
  const int64_t start = res ? res.get_left().fetched_at() : 0;
  return std::make_unique<ManualClock>(start, config.utc_offset_seconds());
}

RefreshSchedulerParams make_scheduler_params(const AppConfig& config) {
  RefreshSchedulerParams params{};
  params.weather_update_interval_s = config.weather_update_interval_s;
  params.display_update_interval_s = config.display_update_interval_s;
  params.compose.layout = DisplayLayout::for_display(config.display_width, config.display_height);
  params.compose.gradient = TemperatureGradient::make_default(
    config.gradient_temp_min, config.gradient_temp_max);
  params.compose.use_24_hour_clock = config.use_24_hour_clock;
  return params;
}

} //  anon

int main(int argc, char** argv) {
  cmd::Arguments args;
  if (!args.parse(argc, argv)) {
    return args.had_parse_error ? 1 : 0;
  }

  const AppConfig config = args.config;
  if (config.quiet) {
    Log::require_global_instance()->set_min_level(Log::Level::Warning);
  }

  IconAtlas icon_atlas;
  if (!config.icon_atlas_path.empty()) {
    bool atlas_success;
    icon_atlas = IconAtlas::load(config.icon_atlas_path.c_str(), &atlas_success);
    if (!atlas_success) {
      log_error("Icon sheet unavailable; drawing placeholder icons.");
    }
  }

  FramebufferSurface surface{config.display_width, config.display_height, &icon_atlas};

  std::unique_ptr<PngFrameSink> png_sink;
  if (!config.frame_output_path.empty()) {
    png_sink = std::make_unique<PngFrameSink>(config.frame_output_path);
    surface.add_sink(png_sink.get());
  }

  TerminalFrameSink terminal_sink;
  if (config.show_terminal_preview) {
    surface.add_sink(&terminal_sink);
  }

  PreviewWindow preview_window;
  if (config.show_preview_window) {
    auto err = preview_window.open(
      config.display_width, config.display_height, config.preview_window_scale);
    if (!err.empty()) {
      log_error(err);
      return 1;
    }
    surface.add_sink(&preview_window);
  }

  auto weather_source = make_weather_source(config);
  std::unique_ptr<ManualClock> fixture_clock;
  std::unique_ptr<SystemClock> system_clock;
  const Clock* clock;
  if (config.use_fixture_data) {
    fixture_clock = make_fixture_clock(config);
    clock = fixture_clock.get();
  } else {
    system_clock = std::make_unique<SystemClock>(config.utc_offset_seconds());
    clock = system_clock.get();
  }

  RefreshScheduler scheduler{
    make_scheduler_params(config),
    RefreshSchedulerCollaborators{*weather_source, *clock, surface}
  };

  {
    std::string msg{"Starting with "};
    msg += weather_source->name();
    msg += " weather data.";
    SUNARC_LOG_INFO_CAPTURE_META(msg.c_str(), logging_id());
  }

  scheduler.request_immediate_update();

  const auto tick_period = std::chrono::duration<double>(config.tick_interval_s);
  Stopwatch stopwatch;
  double dt = 0.0;
  int num_ticks = 0;

  while (config.max_num_ticks == 0 || num_ticks < config.max_num_ticks) {
    if (fixture_clock) {
      fixture_clock->advance(dt);
    }

    scheduler.tick(dt);
    num_ticks++;

    if (config.show_preview_window) {
      preview_window.poll_events();
      if (preview_window.should_close()) {
        break;
      }
      //  Keep the window contents current between redraws.
      preview_window.present(surface.get_framebuffer());
    }

    std::this_thread::sleep_for(tick_period);
    dt = stopwatch.delta_update().count();
  }

  SUNARC_LOG_INFO_CAPTURE_META("Stopped.", logging_id());
  return 0;
}
