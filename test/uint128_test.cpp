#include <cmath>
#include <limits>
#include <string>

#include "gtest/gtest.h"

#include "sfuint128.hpp"

namespace sfib {
namespace {

TEST(Uint128Test, ToStringRendersDecimal) {
  EXPECT_EQ("0", u128::to_string(0));
  EXPECT_EQ("7", u128::to_string(7));
  EXPECT_EQ("18446744073709551616", u128::to_string(((uint128) 1) << 64));
  EXPECT_EQ("340282366920938463463374607431768211455", u128::to_string(u128::max_value));
  EXPECT_EQ("170141183460469231731687303715884105727", u128::to_string(u128::half_max_value));
}

TEST(Uint128Test, SaturatingAddClampsAtMax) {
  EXPECT_TRUE(u128::saturating_add(2, 3) == 5);
  EXPECT_TRUE(u128::saturating_add(u128::max_value, 1) == u128::max_value);
  EXPECT_TRUE(u128::saturating_add(u128::half_max_value, u128::half_max_value + 1) == u128::max_value);
  EXPECT_TRUE(u128::saturating_add(u128::max_value, u128::max_value) == u128::max_value);
}

TEST(Uint128Test, OfDoubleTruncatesTowardZero) {
  EXPECT_TRUE(u128::of_double(3.99) == 3);
  EXPECT_TRUE(u128::of_double(1.0) == 1);
  EXPECT_TRUE(u128::of_double(0.8) == 0);
  EXPECT_TRUE(u128::of_double(-5.0) == 0);
  EXPECT_TRUE(u128::of_double(std::numeric_limits<double>::quiet_NaN()) == 0);
}

TEST(Uint128Test, OfDoubleSaturatesPastRange) {
  EXPECT_TRUE(u128::of_double(std::ldexp(1.0, 128)) == u128::max_value);
  EXPECT_TRUE(u128::of_double(std::numeric_limits<double>::infinity()) == u128::max_value);
  EXPECT_EQ("170141183460469231731687303715884105728", u128::to_string(u128::of_double(std::ldexp(1.0, 127))));
}

TEST(Uint128Test, ScaleByUnitIsExact) {
  // not representable as a double
  uint128 x = (((uint128) 1) << 100) + 1;
  EXPECT_TRUE(u128::scale(x, 1.0) == x);
  EXPECT_TRUE(u128::scale(u128::max_value, 1.0) == u128::max_value);
}

TEST(Uint128Test, ScaleFloorsTheProduct) {
  EXPECT_TRUE(u128::scale(5, 1.2) == 6);
  EXPECT_TRUE(u128::scale(8, 1.2) == 9);
  EXPECT_TRUE(u128::scale(1, 0.8) == 0);
  EXPECT_TRUE(u128::scale(10, 0.8) == 8);
  EXPECT_TRUE(u128::scale(u128::max_value, 1.2) == u128::max_value);
}

} // namespace
} // namespace sfib
