#pragma once

#include "types.hpp"
#include <algorithm>
#include <cstring>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);
static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559);

namespace fina {

namespace internal {

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using fina::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline Status ParseUint32(const std::byte* data, uint64_t maxSize, uint32_t* output) {
  if (maxSize < 4) {
    const auto msg = StrCat("cannot read uint32 from ", maxSize, " bytes");
    return Status{StatusCode::Corrupt, msg};
  }
  *output = ParseUint32(data);
  return StatusCode::Success;
}

inline float ParseFloat32(const std::byte* data) {
  const uint32_t bits = ParseUint32(data);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

// Integer division rounding towards negative infinity. `b` must be positive.
inline int64_t FloorDiv(int64_t a, int64_t b) {
  const int64_t q = a / b;
  return (a % b != 0 && a < 0) ? q - 1 : q;
}

// Remainder with the sign of the divisor, in [0, b). `b` must be positive.
inline int64_t FloorMod(int64_t a, int64_t b) {
  return a - FloorDiv(a, b) * b;
}

inline int64_t CeilDiv(int64_t a, int64_t b) {
  return -FloorDiv(-a, b);
}

// a / b rounded to the nearest integer, ties to even. `b` must be positive.
inline int64_t RoundHalfEven(int64_t a, int64_t b) {
  const int64_t q = FloorDiv(a, b);
  const int64_t twice = 2 * (a - q * b);
  if (twice > b || (twice == b && q % 2 != 0)) {
    return q + 1;
  }
  return q;
}

inline uint64_t RoundUpTo(uint64_t value, uint64_t base) {
  return ((value + base - 1) / base) * base;
}

// Rounds down to a multiple of `base`, never below `base` itself.
inline uint64_t RoundDownTo(uint64_t value, uint64_t base) {
  return std::max(base, (value / base) * base);
}

}  // namespace internal

}  // namespace fina
