
#include <cstdint>
#include <cmath>
#include <string>
#include <algorithm>

#ifndef _SFIB_UINT128_H_
#define _SFIB_UINT128_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* 128-bit unsigned terms */

using uint128 = unsigned __int128;

using index_type = uint64_t;

namespace u128 {

static constexpr
uint128 max_value = ~((uint128) 0);

// largest value the bounded sequence is allowed to emit
static constexpr
uint128 half_max_value = max_value / 2;

static inline
uint128 saturating_add(uint128 x, uint128 y) {
  uint128 r = x + y;
  return (r < x) ? max_value : r;
}

static inline
double to_double(uint128 x) {
  return (double) x;
}

// truncates toward zero; NaN and values below one give zero, values past
// the 128-bit range saturate
static inline
uint128 of_double(double d) {
  if (! (d >= 1.0)) {
    return 0;
  }
  if (d >= std::ldexp(1.0, 128)) {
    return max_value;
  }
  return (uint128) d;
}

// floor(x * multiplier) with the product taken in double precision; the
// unit multiplier leaves x exact
static inline
uint128 scale(uint128 x, double multiplier) {
  if (multiplier == 1.0) {
    return x;
  }
  return of_double(to_double(x) * multiplier);
}

static inline
std::string to_string(uint128 x) {
  if (x == 0) {
    return "0";
  }
  char buffer[48];
  int pos = 0;
  while (x > 0) {
    buffer[pos++] = (char) ('0' + (int) (x % 10));
    x /= 10;
  }
  std::string result(buffer, buffer + pos);
  std::reverse(result.begin(), result.end());
  return result;
}

} // end namespace
} // end namespace

#endif
