#include <ios>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "sfio.hpp"

namespace sfib {
namespace {

TEST(IoTest, WriteSequence) {
  std::ostringstream out;
  io::write_sequence(out, { 0, 1, 1, 2 });
  EXPECT_EQ("{ 0, 1, 1, 2 }", out.str());
}

TEST(IoTest, WriteTermsAlignsValues) {
  std::ostringstream out;
  io::write_terms(out, { 3, 144 }, 4, 6);
  EXPECT_EQ("F( 4) =      3\nF( 5) =    144\n", out.str());
}

TEST(IoTest, WriteTableFollowsKeyOrder) {
  std::map<index_type, uint128> xs;
  xs[12] = 144;
  xs[10] = 55;
  std::ostringstream out;
  io::write_table(out, xs, 4);
  EXPECT_EQ("F(10) =   55\nF(12) =  144\n", out.str());
}

TEST(IoTest, WriteRatiosRestoresStreamFormat) {
  std::ostringstream out;
  io::write_ratios(out, { 1.0, 2.0 });
  std::string text = out.str();
  EXPECT_NE(std::string::npos, text.find("F( 2)/F( 1) = 1.000000000000 (error: 6.18e-01)"));
  EXPECT_NE(std::string::npos, text.find("F( 3)/F( 2) = 2.000000000000 (error: 3.82e-01)"));
  std::ostringstream after;
  after.flags(out.flags());
  after.precision(out.precision());
  after << 0.5;
  EXPECT_EQ("0.5", after.str());
  EXPECT_EQ(std::streamsize(6), out.precision());
}

} // namespace
} // namespace sfib
