#include "RefreshTimer.hpp"
#include "sunarc/common/common.hpp"

SUNARC_NAMESPACE_BEGIN

RefreshTimer::RefreshTimer(double interval_s) : interval_s{interval_s} {
  //
}

RefreshTimer::State RefreshTimer::update(double dt_s) {
  if (dt_s > 0.0) {
    elapsed_s += dt_s;
  }
  if (elapsed_s >= interval_s) {
    state = State::Due;
  }
  return state;
}

void RefreshTimer::fire() {
  elapsed_s = 0.0;
  state = State::Waiting;
}

void RefreshTimer::force_due() {
  state = State::Due;
}

const char* to_string(RefreshTimer::State state) {
  switch (state) {
    case RefreshTimer::State::Waiting:
      return "Waiting";
    case RefreshTimer::State::Due:
      return "Due";
  }
  return "";
}

SUNARC_NAMESPACE_END
