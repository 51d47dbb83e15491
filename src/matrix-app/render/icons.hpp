#pragma once

#include "../weather/common.hpp"
#include <cstdint>

namespace sunarc {

enum class IconId : uint8_t {
  ClearDay = 0,
  ClearNight,
  PartlyCloudyDay,
  PartlyCloudyNight,
  Cloudy,
  Rain,
  Snow,
  Thunderstorm,
  Mist,
  Unknown
};

const char* to_string(IconId id);

//  Only clear and partly-cloudy skies have distinct night icons. Values outside the
//  known conditions map to `Unknown`.
IconId select_icon(weather::Condition condition, bool is_night);

namespace icons {

//  Sprite sheet layout: 16x16 tiles in two columns (day, night), one row per sky
//  state: clear, partly cloudy, cloudy, broken clouds, shower rain, rain,
//  thunderstorm, snow, mist.
struct AtlasLayout {
  static constexpr int tile_size = 16;
  static constexpr int num_columns = 2;
  static constexpr int num_rows = 9;
};

//  Index of the tile (row-major) that depicts `id`, or -1 if there is none.
int atlas_tile_index(IconId id);

}

}
