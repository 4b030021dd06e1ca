#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "sfsequence.hpp"

namespace sfib {
namespace {

std::vector<std::string> drain(bounded_sequence& seq) {
  std::vector<std::string> r;
  uint128 x;
  while (seq.next(x)) {
    r.push_back(u128::to_string(x));
  }
  return r;
}

TEST(BoundedSequenceTest, HybridYieldsFibonacci) {
  bounded_sequence seq(strain::hybrid);
  std::vector<std::string> expected = {
    "0", "1", "1", "2", "3", "5", "8", "13", "21", "34", "55", "89"
  };
  std::vector<std::string> xs;
  for (auto x : take(seq, 12)) {
    xs.push_back(u128::to_string(x));
  }
  EXPECT_EQ(expected, xs);
  EXPECT_EQ(12u, seq.get_nb_emitted());
  EXPECT_FALSE(seq.is_ended());
}

TEST(BoundedSequenceTest, StopsAfterMaximumLength) {
  bounded_sequence seq(strain::hybrid);
  std::vector<std::string> xs = drain(seq);
  ASSERT_EQ(max_sequence_length, xs.size());
  EXPECT_EQ("218922995834555169026", xs.back());
  EXPECT_TRUE(seq.is_ended());
}

TEST(BoundedSequenceTest, SativaReachesMaximumLength) {
  bounded_sequence seq(strain::sativa);
  std::vector<std::string> xs = drain(seq);
  ASSERT_EQ(100u, xs.size());
  EXPECT_EQ("6", xs[5]);
  EXPECT_EQ("214", xs[11]);
  EXPECT_EQ("66208487465572282383990784", xs.back());
}

TEST(BoundedSequenceTest, StopsBeforeHalfOfCapacity) {
  bounded_sequence seq(3.0);
  std::vector<std::string> xs = drain(seq);
  ASSERT_EQ(68u, xs.size());
  EXPECT_EQ("131100150967038049769242277141595291648", xs.back());
  EXPECT_TRUE(seq.is_ended());
}

TEST(BoundedSequenceTest, StaysEnded) {
  bounded_sequence seq(3.0);
  drain(seq);
  uint128 x = 42;
  EXPECT_FALSE(seq.next(x));
  EXPECT_FALSE(seq.next(x));
  EXPECT_TRUE(x == 42);
  EXPECT_EQ(68u, seq.get_nb_emitted());
}

TEST(BoundedSequenceTest, FreshInstanceStartsOver) {
  bounded_sequence first(strain::hybrid);
  take(first, 50);
  bounded_sequence second(strain::hybrid);
  uint128 x = 7;
  ASSERT_TRUE(second.next(x));
  EXPECT_TRUE(x == 0);
}

TEST(BoundedSequenceTest, TakeResumesWhereItStopped) {
  bounded_sequence seq(strain::hybrid);
  EXPECT_EQ(5u, take(seq, 5).size());
  std::vector<uint128> rest = take(seq, 2);
  ASSERT_EQ(2u, rest.size());
  EXPECT_TRUE(rest[0] == 5);
  EXPECT_TRUE(rest[1] == 8);
}

TEST(BoundedSequenceTest, TakeStopsAtEnd) {
  bounded_sequence seq(3.0);
  EXPECT_EQ(68u, take(seq, 500).size());
  EXPECT_TRUE(take(seq, 10).empty());
}

TEST(BoundedSequenceTest, IndicaSettlesAtZero) {
  bounded_sequence seq(strain::indica);
  std::vector<std::string> xs = drain(seq);
  ASSERT_EQ(100u, xs.size());
  EXPECT_EQ("0", xs[0]);
  EXPECT_EQ("1", xs[1]);
  EXPECT_EQ("0", xs[2]);
  EXPECT_EQ("0", xs.back());
}

} // namespace
} // namespace sfib
