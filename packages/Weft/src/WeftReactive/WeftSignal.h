#pragma once

#include "WeftReactive/WeftComputation.h"

#include <type_traits>
#include <utility>

namespace weft {

namespace detail {

template <typename T, typename = void>
struct IsEqualityComparable : std::false_type {};

template <typename T>
struct IsEqualityComparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

template <typename T>
class Signal final : public SourceBase {
public:
  Signal() = default;
  explicit Signal(T initial) : value_(std::move(initial)) {}

  const T& get() {
    track();
    return value_;
  }

  [[nodiscard]] const T& peek() const noexcept {
    return value_;
  }

  // Notifies observers only when the value changed. Types without operator==
  // always notify.
  void set(T next) {
    if constexpr (detail::IsEqualityComparable<T>::value) {
      if (next == value_) {
        return;
      }
    }
    value_ = std::move(next);
    notifyObservers();
  }

  template <typename Fn>
  void update(Fn&& fn) {
    set(fn(value_));
  }

private:
  T value_{};
};

} // namespace weft
