#pragma once

#include "sunarc/common/Optional.hpp"
#include <cstdint>
#include <string>

namespace sunarc::weather {

enum class Condition : uint8_t {
  Clear = 0,
  PartlyCloudy,
  Cloudy,
  Rain,
  Snow,
  Thunderstorm,
  Mist,
  Unknown
};

struct DailyRange {
  int min;
  int max;

  friend inline bool operator==(const DailyRange& a, const DailyRange& b) {
    return a.min == b.min && a.max == b.max;
  }
};

struct ReadingFields {
  int temperature{};
  Condition condition{Condition::Unknown};
  Optional<DailyRange> daily;
  int64_t sunrise{};
  int64_t sunset{};
  int64_t fetched_at{};
};

/*
 * One fetched snapshot. Fields are fixed at construction; a new fetch replaces the
 * whole reading. When a daily range is present it always contains `temperature`.
 */
class Reading {
public:
  Reading() = default;
  explicit Reading(const ReadingFields& fields);

  int temperature() const {
    return fields.temperature;
  }
  Condition condition() const {
    return fields.condition;
  }
  const Optional<DailyRange>& daily() const {
    return fields.daily;
  }
  int64_t sunrise() const {
    return fields.sunrise;
  }
  int64_t sunset() const {
    return fields.sunset;
  }
  int64_t fetched_at() const {
    return fields.fetched_at;
  }

private:
  ReadingFields fields;
};

struct FetchError {
  enum class Reason {
    Network,
    Parse,
    Auth
  };

  Reason reason{Reason::Network};
  std::string message;
};

const char* to_string(Condition condition);
const char* to_string(FetchError::Reason reason);

//  OpenWeather icon codes look like "10d"; only the two leading digits matter.
Condition condition_from_icon_code(const std::string& icon_code);
Condition condition_from_weather_id(int id);

DailyRange normalize_daily_range(DailyRange range, int temperature);

}
