#include "openweather.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/fs.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <limits>

SUNARC_NAMESPACE_BEGIN

using namespace weather;

namespace {

using json = nlohmann::json;

constexpr int http_unauthorized = 401;
//  Anything further out than this is not a Fahrenheit air temperature.
constexpr double max_abs_degrees = 500.0;

const char* const fixture_document = R"({
  "lat": 37.2135,
  "lon": -80.0374,
  "timezone": "America/New_York",
  "timezone_offset": -18000,
  "current": {
    "dt": 1739992024,
    "sunrise": 1739966652,
    "sunset": 1740006242,
    "temp": 45.61,
    "feels_like": 13.12,
    "pressure": 1030,
    "humidity": 84,
    "clouds": 100,
    "visibility": 2816,
    "wind_speed": 10.36,
    "wind_deg": 140,
    "weather": [
      {
        "id": 601,
        "main": "Snow",
        "description": "snow",
        "icon": "13d"
      }
    ]
  },
  "daily": [
    {
      "dt": 1739984400,
      "sunrise": 1739966652,
      "sunset": 1740006242,
      "summary": "Expect a day of partly cloudy with snow",
      "temp": {
        "day": 25.2,
        "min": 40.36,
        "max": 60.72,
        "night": 21.81,
        "eve": 27,
        "morn": 25.43
      },
      "weather": [
        {
          "id": 601,
          "main": "Snow",
          "description": "snow",
          "icon": "13d"
        }
      ]
    }
  ]
})";

FetchResult make_error(FetchError::Reason reason, std::string message) {
  return either::make_right<FetchResult>(FetchError{reason, std::move(message)});
}

//  Displayed temperatures drop the fractional part.
Optional<int> to_display_degrees(const json& value) {
  if (!value.is_number()) {
    return NullOpt{};
  }
  const auto deg = value.get<double>();
  if (!std::isfinite(deg) || std::abs(deg) > max_abs_degrees) {
    return NullOpt{};
  }
  return Optional<int>(int(std::trunc(deg)));
}

//  Unix seconds; negative or fractional values are malformed.
Optional<int64_t> to_timestamp(const json& value) {
  if (value.is_number_unsigned()) {
    auto secs = value.get<uint64_t>();
    if (secs <= uint64_t(std::numeric_limits<int64_t>::max())) {
      return Optional<int64_t>(int64_t(secs));
    }
  } else if (value.is_number_integer()) {
    auto secs = value.get<int64_t>();
    if (secs >= 0) {
      return Optional<int64_t>(secs);
    }
  }
  return NullOpt{};
}

Optional<int> service_status_code(const json& doc) {
  auto it = doc.find("cod");
  if (it == doc.end()) {
    return NullOpt{};
  } else if (it->is_number_integer()) {
    return Optional<int>(it->get<int>());
  } else if (it->is_string()) {
    const auto& str = it->get_ref<const std::string&>();
    char* end{};
    long code = std::strtol(str.c_str(), &end, 10);
    if (end != str.c_str() && *end == '\0') {
      return Optional<int>(int(code));
    }
  }
  return NullOpt{};
}

bool decode_optional_timestamp(const json& obj, const char* key, int64_t* out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    *out = 0;
    return true;
  }
  auto secs = to_timestamp(*it);
  *out = secs ? secs.value() : 0;
  return bool(secs);
}

std::string service_message(const json& doc) {
  auto it = doc.find("message");
  if (it != doc.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "no message";
}

Condition decode_condition(const json& current) {
  auto weather_it = current.find("weather");
  if (weather_it == current.end() || !weather_it->is_array() || weather_it->empty()) {
    return Condition::Unknown;
  }

  const auto& entry = weather_it->front();
  auto condition = Condition::Unknown;

  auto icon_it = entry.find("icon");
  if (icon_it != entry.end() && icon_it->is_string()) {
    condition = condition_from_icon_code(icon_it->get<std::string>());
  }

  auto id_it = entry.find("id");
  if (condition == Condition::Unknown && id_it != entry.end() && id_it->is_number_integer()) {
    condition = condition_from_weather_id(id_it->get<int>());
  }

  return condition;
}

Optional<DailyRange> decode_daily_range(const json& doc) {
  auto daily_it = doc.find("daily");
  if (daily_it == doc.end() || !daily_it->is_array() || daily_it->empty()) {
    return NullOpt{};
  }

  const auto& today = daily_it->front();
  auto temp_it = today.find("temp");
  if (temp_it == today.end() || !temp_it->is_object()) {
    return NullOpt{};
  }

  auto min_it = temp_it->find("min");
  auto max_it = temp_it->find("max");
  if (min_it == temp_it->end() || max_it == temp_it->end()) {
    return NullOpt{};
  }

  auto min = to_display_degrees(*min_it);
  auto max = to_display_degrees(*max_it);
  if (!min || !max) {
    return NullOpt{};
  }

  DailyRange range{};
  range.min = min.value();
  range.max = max.value();
  return Optional<DailyRange>(range);
}

} //  anon

const char* weather::fixture_onecall_document() {
  return fixture_document;
}

FetchResult weather::decode_onecall(const std::string& json_text) {
  auto doc = json::parse(json_text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return make_error(FetchError::Reason::Parse, "Response is not a JSON object.");
  }

  if (auto code = service_status_code(doc)) {
    if (code.value() == http_unauthorized) {
      return make_error(FetchError::Reason::Auth, service_message(doc));
    } else if (code.value() != 200) {
      std::string msg{"Service returned "};
      msg += std::to_string(code.value());
      msg += ": ";
      msg += service_message(doc);
      return make_error(FetchError::Reason::Network, std::move(msg));
    }
  }

  try {
    const auto& current = doc.at("current");

    auto temperature = to_display_degrees(current.at("temp"));
    if (!temperature) {
      return make_error(FetchError::Reason::Parse, "Current temperature is out of range.");
    }
    auto fetched_at = to_timestamp(current.at("dt"));
    if (!fetched_at) {
      return make_error(FetchError::Reason::Parse, "Observation time is not a valid timestamp.");
    }

    ReadingFields fields{};
    fields.temperature = temperature.value();
    fields.fetched_at = fetched_at.value();

    //  Absent near the poles during polar day / night.
    if (!decode_optional_timestamp(current, "sunrise", &fields.sunrise) ||
        !decode_optional_timestamp(current, "sunset", &fields.sunset)) {
      return make_error(FetchError::Reason::Parse, "Sunrise or sunset is not a valid timestamp.");
    }
    fields.condition = decode_condition(current);
    fields.daily = decode_daily_range(doc);

    return either::make_left<FetchResult>(Reading{fields});

  } catch (const json::exception& err) {
    return make_error(FetchError::Reason::Parse, err.what());
  }
}

FetchResult weather::FixtureWeatherSource::fetch() {
  return decode_onecall(fixture_document);
}

weather::FileWeatherSource::FileWeatherSource(std::string file_path) :
  file_path{std::move(file_path)} {
  //
}

FetchResult weather::FileWeatherSource::fetch() {
  bool success;
  auto text = read_text_file(file_path.c_str(), &success);
  if (!success) {
    return make_error(FetchError::Reason::Network, "Failed to read " + file_path);
  }
  return decode_onecall(text);
}

SUNARC_NAMESPACE_END
