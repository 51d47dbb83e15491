#pragma once

namespace sunarc {

constexpr double pi() {
  return 3.14159265358979323846264338327950288;
}

}
