#include "icons.hpp"
#include "sunarc/common/common.hpp"

SUNARC_NAMESPACE_BEGIN

using weather::Condition;

const char* to_string(IconId id) {
  switch (id) {
    case IconId::ClearDay:
      return "clear-day";
    case IconId::ClearNight:
      return "clear-night";
    case IconId::PartlyCloudyDay:
      return "partly-cloudy-day";
    case IconId::PartlyCloudyNight:
      return "partly-cloudy-night";
    case IconId::Cloudy:
      return "cloudy";
    case IconId::Rain:
      return "rain";
    case IconId::Snow:
      return "snow";
    case IconId::Thunderstorm:
      return "thunderstorm";
    case IconId::Mist:
      return "mist";
    case IconId::Unknown:
      return "unknown";
  }
  return "unknown";
}

IconId select_icon(Condition condition, bool is_night) {
  switch (condition) {
    case Condition::Clear:
      return is_night ? IconId::ClearNight : IconId::ClearDay;
    case Condition::PartlyCloudy:
      return is_night ? IconId::PartlyCloudyNight : IconId::PartlyCloudyDay;
    case Condition::Cloudy:
      return IconId::Cloudy;
    case Condition::Rain:
      return IconId::Rain;
    case Condition::Snow:
      return IconId::Snow;
    case Condition::Thunderstorm:
      return IconId::Thunderstorm;
    case Condition::Mist:
      return IconId::Mist;
    case Condition::Unknown:
      return IconId::Unknown;
  }
  return IconId::Unknown;
}

int icons::atlas_tile_index(IconId id) {
  switch (id) {
    case IconId::ClearDay:
      return 0;
    case IconId::ClearNight:
      return 1;
    case IconId::PartlyCloudyDay:
      return 2;
    case IconId::PartlyCloudyNight:
      return 3;
    case IconId::Cloudy:
      return 4;
    case IconId::Rain:
      return 10;
    case IconId::Thunderstorm:
      return 12;
    case IconId::Snow:
      return 14;
    case IconId::Mist:
      return 16;
    case IconId::Unknown:
      return -1;
  }
  return -1;
}

SUNARC_NAMESPACE_END
