#pragma once

#include "common.hpp"
#include "sunarc/common/Either.hpp"
#include <string>

namespace sunarc::weather {

using FetchResult = Either<Reading, FetchError>;

/*
 * Produces one reading per call. Implementations may block; they report failure
 * through the result and never retry on their own.
 */
class WeatherSource {
public:
  virtual ~WeatherSource() = default;
  virtual FetchResult fetch() = 0;
  virtual const char* name() const = 0;
};

//  Canned one-call document, decoded on every fetch.
class FixtureWeatherSource : public WeatherSource {
public:
  FetchResult fetch() override;
  const char* name() const override {
    return "fixture";
  }
};

//  Reads a one-call document from disk on every fetch. Something else (a cron job,
//  a sidecar process) is responsible for keeping the file fresh.
class FileWeatherSource : public WeatherSource {
public:
  explicit FileWeatherSource(std::string file_path);
  FetchResult fetch() override;
  const char* name() const override {
    return "file";
  }

private:
  std::string file_path;
};

}
