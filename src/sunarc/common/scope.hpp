#pragma once

#include <utility>

namespace sunarc {

//  Via Andrei Alexandrescu, cpp con 2015.
namespace detail {
  enum class ScopeGuardOnExit {};
  template <typename Function>
  struct ScopeGuard {
    ScopeGuard(Function&& fun) : function(std::forward<Function>(fun)) {
      //
    }
    ~ScopeGuard() {
      function();
    }

    Function function;
  };

  template <typename Function>
  inline ScopeGuard<Function> operator+(ScopeGuardOnExit, Function&& fun) {
    return ScopeGuard<Function>(std::forward<Function>(fun));
  }
}

#define SUNARC_CONCAT_IMPL(s1, s2) s1##s2
#define SUNARC_CONCAT(s1, s2) SUNARC_CONCAT_IMPL(s1, s2)
#ifdef __COUNTER__
#define SUNARC_ANONYMOUS_VARIABLE(str) SUNARC_CONCAT(str, __COUNTER__)
#else
#define SUNARC_ANONYMOUS_VARIABLE(str) SUNARC_CONCAT(str, __LINE__)
#endif

#define SUNARC_SCOPE_EXIT \
  auto SUNARC_ANONYMOUS_VARIABLE(SCOPE_EXIT_STATE) = ::sunarc::detail::ScopeGuardOnExit() + [&]()

}
