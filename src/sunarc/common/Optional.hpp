#pragma once

#include <utility>
#include <cassert>

namespace sunarc {
  template <typename T>
  class Optional;

  class NullOpt {
    //
  };
}

//  Value-or-nothing holder. `T` must be default constructible; the empty state
//  holds a value-initialized `T`.
template <typename T>
class sunarc::Optional {
public:
  constexpr Optional() noexcept : val(), is_null(true) {
    //
  }

  constexpr explicit Optional(const T& value) : val(value), is_null(false) {
    //
  }

  constexpr explicit Optional(T&& value) : val(std::move(value)), is_null(false) {
    //
  }

  constexpr Optional(const NullOpt&) noexcept : Optional() {
    //
  }

  Optional(const Optional& other) = default;
  Optional(Optional&& other) noexcept = default;
  Optional& operator=(const Optional& other) = default;
  Optional& operator=(Optional&& other) noexcept = default;
  ~Optional() = default;

  Optional& operator=(const NullOpt&) {
    val = T{};
    is_null = true;
    return *this;
  }

  Optional& operator=(const T& value) {
    val = value;
    is_null = false;
    return *this;
  }

  Optional& operator=(T&& value) noexcept {
    val = std::move(value);
    is_null = false;
    return *this;
  }

  explicit operator bool() const {
    return !is_null;
  }

  bool has_value() const {
    return !is_null;
  }

  const T& value() const {
    assert(!is_null);
    return val;
  }

  T& value() {
    assert(!is_null);
    return val;
  }

private:
  T val;
  bool is_null;
};

template <typename T>
inline bool operator==(const sunarc::Optional<T>& lhs, const sunarc::NullOpt&) {
  return !lhs.has_value();
}

template <typename T>
inline bool operator!=(const sunarc::Optional<T>& lhs, const sunarc::NullOpt& rhs) {
  return !(lhs == rhs);
}

template <typename T>
inline bool operator==(const sunarc::Optional<T>& lhs, const sunarc::Optional<T>& rhs) {
  if (lhs.has_value() != rhs.has_value()) {
    return false;
  }
  return !lhs.has_value() || lhs.value() == rhs.value();
}
