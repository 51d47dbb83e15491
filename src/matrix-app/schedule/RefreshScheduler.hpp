#pragma once

#include "RefreshTimer.hpp"
#include "../render/compose.hpp"
#include "../weather/WeatherSource.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/Optional.hpp"

namespace sunarc {

class Clock;
class DrawingSurface;
struct RefreshSchedulerImpl;

struct RefreshSchedulerParams {
  double weather_update_interval_s{300.0};
  double display_update_interval_s{60.0};
  ComposeParams compose;
};

//  Collaborators are borrowed and must outlive the scheduler.
struct RefreshSchedulerCollaborators {
  weather::WeatherSource& weather_source;
  const Clock& clock;
  DrawingSurface& surface;
};

struct RefreshTickResult {
  bool fetched{};
  bool redrawn{};
  Optional<weather::FetchError> fetch_error;
};

/*
 * Drives the two refresh channels from an external loop. Each `tick` advances both
 * timers by `dt_s`; the weather channel is handled before the display channel, so a
 * redraw on the same tick as a fetch sees the fresh reading. A failed fetch keeps
 * the previous reading and still restarts the weather interval.
 */
class RefreshScheduler {
public:
  RefreshScheduler(const RefreshSchedulerParams& params,
                   const RefreshSchedulerCollaborators& collaborators);
  ~RefreshScheduler();

  SUNARC_DELETE_COPY_CTOR_AND_ASSIGNMENT(RefreshScheduler)

  RefreshTickResult tick(double dt_s);

  //  Both channels fire on the next tick, whatever their elapsed time.
  void request_immediate_update();

  const Optional<weather::Reading>& get_reading() const;
  const RefreshTimer& get_weather_timer() const;
  const RefreshTimer& get_display_timer() const;
  const RefreshSchedulerParams& get_params() const;
  int get_num_fetch_failures() const;

private:
  RefreshSchedulerImpl* impl;
};

}
