#include "RefreshScheduler.hpp"
#include "../render/DrawingSurface.hpp"
#include "../time/clock.hpp"
#include "sunarc/common/logging.hpp"
#include <string>

SUNARC_NAMESPACE_BEGIN

namespace {

[[maybe_unused]] constexpr const char* logging_id() {
  return "RefreshScheduler";
}

[[maybe_unused]] std::string describe(const weather::Reading& reading) {
  std::string res{"Weather updated: "};
  res += std::to_string(reading.temperature());
  res += "F, ";
  res += weather::to_string(reading.condition());
  if (reading.daily()) {
    res += ", range ";
    res += std::to_string(reading.daily().value().min);
    res += "..";
    res += std::to_string(reading.daily().value().max);
  }
  return res;
}

[[maybe_unused]] std::string describe(const weather::FetchError& err, bool have_reading) {
  std::string res{"Weather fetch failed ("};
  res += weather::to_string(err.reason);
  res += "): ";
  res += err.message;
  res += have_reading ? "; keeping previous reading." : "; no reading yet.";
  return res;
}

} //  anon

struct RefreshSchedulerImpl {
  RefreshSchedulerImpl(const RefreshSchedulerParams& params,
                       const RefreshSchedulerCollaborators& collaborators) :
    params{params},
    collaborators{collaborators},
    weather_timer{params.weather_update_interval_s},
    display_timer{params.display_update_interval_s} {
    //
  }

  void update_weather(RefreshTickResult& result);
  void update_display(RefreshTickResult& result);

  RefreshSchedulerParams params;
  RefreshSchedulerCollaborators collaborators;
  RefreshTimer weather_timer;
  RefreshTimer display_timer;
  Optional<weather::Reading> reading;
  int num_fetch_failures{};
};

void RefreshSchedulerImpl::update_weather(RefreshTickResult& result) {
  auto fetch_res = collaborators.weather_source.fetch();
  result.fetched = true;

  if (fetch_res) {
    reading = std::move(fetch_res.get_left());
    SUNARC_LOG_INFO_CAPTURE_META(describe(reading.value()).c_str(), logging_id());
  } else {
    num_fetch_failures++;
    SUNARC_LOG_WARNING_CAPTURE_META(
      describe(fetch_res.get_right(), reading.has_value()).c_str(), logging_id());
    result.fetch_error = std::move(fetch_res.get_right());
  }

  weather_timer.fire();
}

void RefreshSchedulerImpl::update_display(RefreshTickResult& result) {
  auto plan = compose_display(reading, collaborators.clock.now(), params.compose);
  collaborators.surface.render(plan);
  result.redrawn = true;
  display_timer.fire();
}

RefreshScheduler::RefreshScheduler(const RefreshSchedulerParams& params,
                                   const RefreshSchedulerCollaborators& collaborators) :
  impl{new RefreshSchedulerImpl(params, collaborators)} {
  //  A slower redraw than fetch leaves "Loading..." up longer than needed.
  if (params.display_update_interval_s > params.weather_update_interval_s) {
    SUNARC_LOG_WARNING_CAPTURE_META(
      "Display interval exceeds weather interval.", logging_id());
  }
}

RefreshScheduler::~RefreshScheduler() {
  delete impl;
}

RefreshTickResult RefreshScheduler::tick(double dt_s) {
  RefreshTickResult result{};

  if (impl->weather_timer.update(dt_s) == RefreshTimer::State::Due) {
    impl->update_weather(result);
  }
  if (impl->display_timer.update(dt_s) == RefreshTimer::State::Due) {
    impl->update_display(result);
  }

  return result;
}

void RefreshScheduler::request_immediate_update() {
  impl->weather_timer.force_due();
  impl->display_timer.force_due();
}

const Optional<weather::Reading>& RefreshScheduler::get_reading() const {
  return impl->reading;
}

const RefreshTimer& RefreshScheduler::get_weather_timer() const {
  return impl->weather_timer;
}

const RefreshTimer& RefreshScheduler::get_display_timer() const {
  return impl->display_timer;
}

const RefreshSchedulerParams& RefreshScheduler::get_params() const {
  return impl->params;
}

int RefreshScheduler::get_num_fetch_failures() const {
  return impl->num_fetch_failures;
}

SUNARC_NAMESPACE_END
