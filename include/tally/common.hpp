#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

//////////////////////////////////////////////////////////////////////////////////////

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wstack-usage="
#include <range/v3/all.hpp>
#pragma GCC diagnostic pop

template <typename T>
struct remove_cvref {
  using type = std::remove_cv_t<std::remove_reference_t<T>>;
};

template <typename T>
using remove_cvref_t = typename remove_cvref<T>::type;

template <typename Fn>
struct finally {
  finally(Fn&& fn) : fn_{std::forward<Fn>(fn)} {}
  ~finally() { std::invoke(fn_); }

 private:
  Fn fn_;
};

///////////////////////////////////////////////////////

// True when iterating a const Range yields something convertible to Elem.
template <typename Range, typename Elem, typename = void>
struct is_range_of : std::false_type {};

template <typename Range, typename Elem>
struct is_range_of<Range, Elem, std::enable_if_t<ranges::range<const Range&>>>
    : std::is_convertible<ranges::range_reference_t<const Range&>, Elem> {};

template <typename Range, typename Elem>
inline constexpr bool is_range_of_v = is_range_of<Range, Elem>::value;

///////////////////////////////////////////////////////

inline constexpr const auto HashCombine = [](size_t lhs, size_t rhs) noexcept {
  constexpr const size_t GoldenRatioFractional = 0x9e3779b97f4a7c15;
  constexpr const size_t LeftShift64 = 12;
  constexpr const size_t RightShift64 = 4;
  lhs ^= rhs + GoldenRatioFractional + (lhs << LeftShift64) + (lhs >> RightShift64);
  return lhs;
};

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

#ifdef TALLY_KEEP_ASSERTS
#define Assert(x)                                                       \
  {                                                                     \
    if (not(x)) {                                                       \
      std::cerr << "Assert failed: \"" #x "\" in " __FILE__             \
                   ":" TOSTRING(__LINE__) "\n";                         \
      throw std::runtime_error("Assert failed: \"" #x "\" in " __FILE__ \
                               ":" TOSTRING(__LINE__));                 \
    }                                                                   \
  }
#else
#define Assert(x) \
  {}
#endif

[[noreturn]] inline void Fail(const char* msg) {
#ifdef TALLY_KEEP_ASSERTS
  std::cerr << msg << "\n";
#endif
  throw std::runtime_error(msg);
}

#define NO_COPY(x)      \
  x(const x&) = delete; \
  x& operator=(const x&) = delete

#define NO_COPY_NO_MOVE(x)          \
  NO_COPY(x);                       \
  x(x&&) = delete;                  \
  x& operator=(x&&) = delete

//////////////////////////////////////////////////////////////////////////////////////

// Generic containers to stream.

template <typename T1, typename T2>
inline std::ostream& operator<<(std::ostream& os, const std::pair<T1, T2>& tup) {
  os << "[ " << tup.first << ", " << tup.second << " ]";
  return os;
}

template <typename T>
inline std::ostream& operator<<(std::ostream& os, const std::vector<T>& vector) {
  os << "[ ";
  for (const auto& element : vector) {
    os << element << ", ";
  }
  os << "]";
  return os;
}

//////////////////////////////////////////////////////////////////////////////////////

// Common utilities

class RandomNumberGenerator {
 public:
  RandomNumberGenerator(std::optional<uint32_t> user_seed) {
    std::random_device rd;
    seed_ = user_seed.value_or(rd());
    generator_ = std::mt19937(seed_);
  }

  template <typename T>
  T Generate(T min, T max) {
    static_assert(std::is_integral<T>::value);
    std::uniform_int_distribution<T> dist{min, max};
    return dist(generator_);
  }

  uint32_t GetSeed() const { return seed_; }

 private:
  std::mt19937 generator_;
  uint32_t seed_;
};

//////////////////////////////////////////////////////////////////////////////////////
