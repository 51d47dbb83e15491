#pragma once

#include "WeatherSource.hpp"
#include <string>

namespace sunarc::weather {

/*
 * Decode an OpenWeather "One Call" (3.0) response requested with imperial units.
 *
 * Uses `current.temp`, `current.dt`, `current.sunrise`, `current.sunset`,
 * `current.weather[0].icon` (falling back to `.id`) and `daily[0].temp.min/max`.
 * An error document such as `{"cod": 401, "message": "..."}` yields an Auth error;
 * anything else that is not a usable response yields a Parse error.
 */
FetchResult decode_onecall(const std::string& json_text);

const char* fixture_onecall_document();

}
