/**
  Arithmetic on the count type of a Counter.

  A count type needs ordering, addition, subtraction and construction from the
  literals 0 and 1. The default, DefaultCount, is an arbitrary precision
  integer and never overflows. Built-in integral types are accepted too; for
  those, Increment and Sum are checked and throw std::overflow_error instead
  of wrapping.
 */

#pragma once

#include <limits>
#include <stdexcept>
#include <type_traits>

#include <boost/multiprecision/cpp_int.hpp>

using DefaultCount = boost::multiprecision::cpp_int;

template <typename Count, typename = void>
struct CountTraits {
  static Count Zero() { return Count{0}; }
  static Count One() { return Count{1}; }
  static void Increment(Count& count) { count += One(); }
  static void Decrement(Count& count) { count -= One(); }
  static Count Sum(const Count& lhs, const Count& rhs) { return Count{lhs + rhs}; }
  static Count Difference(const Count& lhs, const Count& rhs) {
    return Count{lhs - rhs};
  }
};

template <typename Count>
struct CountTraits<Count, std::enable_if_t<std::is_integral_v<Count> and
                                           not std::is_same_v<Count, bool>>> {
  static constexpr Count Zero() { return Count{0}; }
  static constexpr Count One() { return Count{1}; }

  static void Increment(Count& count) {
    if (count == std::numeric_limits<Count>::max()) {
      throw std::overflow_error("Counter: count overflow on increment");
    }
    ++count;
  }

  static void Decrement(Count& count) {
    if (count == std::numeric_limits<Count>::min()) {
      throw std::overflow_error("Counter: count underflow on decrement");
    }
    --count;
  }

  static Count Sum(Count lhs, Count rhs) {
    if constexpr (std::is_signed_v<Count>) {
      if (rhs < 0 and lhs < std::numeric_limits<Count>::min() - rhs) {
        throw std::overflow_error("Counter: count underflow on addition");
      }
    }
    if (rhs > 0 and lhs > std::numeric_limits<Count>::max() - rhs) {
      throw std::overflow_error("Counter: count overflow on addition");
    }
    return static_cast<Count>(lhs + rhs);
  }

  // Only called with lhs > rhs, so the result is positive and in range.
  static Count Difference(Count lhs, Count rhs) { return static_cast<Count>(lhs - rhs); }
};
