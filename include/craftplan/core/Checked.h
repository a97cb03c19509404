#pragma once

#include <limits>
#include <type_traits>

namespace craftplan::core {

// Overflow-checked unsigned arithmetic.
//
// Each helper writes the result to `out` and returns true, or returns false and leaves
// `out` untouched when the exact result does not fit in T.

template <class T>
constexpr bool checkedAdd(T a, T b, T& out) {
  static_assert(std::is_unsigned_v<T>, "checkedAdd expects an unsigned type");
  if (a > std::numeric_limits<T>::max() - b) return false;
  out = static_cast<T>(a + b);
  return true;
}

template <class T>
constexpr bool checkedMul(T a, T b, T& out) {
  static_assert(std::is_unsigned_v<T>, "checkedMul expects an unsigned type");
  if (a != 0 && b > std::numeric_limits<T>::max() / a) return false;
  out = static_cast<T>(a * b);
  return true;
}

// Smallest n with n * divisor >= value. divisor must be non-zero.
template <class T>
constexpr T ceilDiv(T value, T divisor) {
  static_assert(std::is_unsigned_v<T>, "ceilDiv expects an unsigned type");
  return static_cast<T>(value / divisor + ((value % divisor) != 0 ? 1 : 0));
}

} // namespace craftplan::core
