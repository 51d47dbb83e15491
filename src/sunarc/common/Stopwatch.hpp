#pragma once

#include <chrono>

namespace sunarc {

class Stopwatch {
public:
  using Clock = std::chrono::steady_clock;
  using Delta = std::chrono::duration<double>;

  //  Calculate delta as (current time - last time), and set last time = current time.
  Delta delta_update() {
    auto now = Clock::now();
    auto d = Delta(now - t0);
    t0 = now;
    return d;
  }

public:
  Clock::time_point t0{Clock::now()};
};

}
