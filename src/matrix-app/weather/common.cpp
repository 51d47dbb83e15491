#include "common.hpp"
#include "sunarc/common/common.hpp"
#include <algorithm>
#include <cctype>

SUNARC_NAMESPACE_BEGIN

namespace {

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} //  anon

weather::Reading::Reading(const ReadingFields& in) : fields{in} {
  if (fields.daily) {
    fields.daily = normalize_daily_range(fields.daily.value(), fields.temperature);
  }
}

weather::DailyRange weather::normalize_daily_range(DailyRange range, int temperature) {
  if (range.min > range.max) {
    std::swap(range.min, range.max);
  }
  range.min = std::min(range.min, temperature);
  range.max = std::max(range.max, temperature);
  return range;
}

const char* weather::to_string(Condition condition) {
  switch (condition) {
    case Condition::Clear:
      return "Clear";
    case Condition::PartlyCloudy:
      return "PartlyCloudy";
    case Condition::Cloudy:
      return "Cloudy";
    case Condition::Rain:
      return "Rain";
    case Condition::Snow:
      return "Snow";
    case Condition::Thunderstorm:
      return "Thunderstorm";
    case Condition::Mist:
      return "Mist";
    case Condition::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

const char* weather::to_string(FetchError::Reason reason) {
  switch (reason) {
    case FetchError::Reason::Network:
      return "network";
    case FetchError::Reason::Parse:
      return "parse";
    case FetchError::Reason::Auth:
      return "auth";
  }
  return "unknown";
}

weather::Condition weather::condition_from_icon_code(const std::string& icon_code) {
  if (icon_code.size() < 2 || !is_digit(icon_code[0]) || !is_digit(icon_code[1])) {
    return Condition::Unknown;
  }

  const int group = (icon_code[0] - '0') * 10 + (icon_code[1] - '0');
  switch (group) {
    case 1:
      return Condition::Clear;
    case 2:
      return Condition::PartlyCloudy;
    case 3:
    case 4:
      return Condition::Cloudy;
    case 9:
    case 10:
      return Condition::Rain;
    case 11:
      return Condition::Thunderstorm;
    case 13:
      return Condition::Snow;
    case 50:
      return Condition::Mist;
    default:
      return Condition::Unknown;
  }
}

weather::Condition weather::condition_from_weather_id(int id) {
  if (id == 800) {
    return Condition::Clear;
  } else if (id == 801) {
    return Condition::PartlyCloudy;
  } else if (id >= 802 && id <= 804) {
    return Condition::Cloudy;
  }

  switch (id / 100) {
    case 2:
      return Condition::Thunderstorm;
    case 3:
    case 5:
      return Condition::Rain;
    case 6:
      return Condition::Snow;
    case 7:
      return Condition::Mist;
    default:
      return Condition::Unknown;
  }
}

SUNARC_NAMESPACE_END
