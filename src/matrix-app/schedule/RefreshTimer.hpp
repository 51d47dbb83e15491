#pragma once

namespace sunarc {

/*
 * One refresh channel: Waiting until the accumulated time reaches the interval,
 * then Due until `fire()` resets it.
 */
class RefreshTimer {
public:
  enum class State {
    Waiting,
    Due
  };

public:
  explicit RefreshTimer(double interval_s);

  State update(double dt_s);
  void fire();
  void force_due();

  State get_state() const {
    return state;
  }
  bool is_due() const {
    return state == State::Due;
  }
  double get_elapsed() const {
    return elapsed_s;
  }
  double get_interval() const {
    return interval_s;
  }

private:
  double interval_s;
  double elapsed_s{};
  State state{State::Waiting};
};

const char* to_string(RefreshTimer::State state);

}
