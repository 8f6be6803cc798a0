#include "util/entropy.hpp"
#include <set>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(Entropy, LengthAndAlphabet) {
  for (size_t len : {0, 1, 16, 1000}) {
    std::string s = util::EntropyHex(len);
    EXPECT_EQ(s.size(), len);
    EXPECT_EQ(s.find_first_not_of("0123456789abcdef"), std::string::npos);
  }
}

// NOLINTNEXTLINE
TEST(Entropy, Seed) {
  EXPECT_THAT(util::EntropyHex(16), MatchesRegex("[0-9a-f]{16}"));
}

// NOLINTNEXTLINE
TEST(Entropy, UsesWholeAlphabet) {
  std::string s = util::EntropyHex(4096);
  std::set<char> seen(s.begin(), s.end());
  EXPECT_EQ(seen.size(), 16u);
}

// NOLINTNEXTLINE
TEST(Entropy, Differs) {
  EXPECT_NE(util::EntropyHex(32), util::EntropyHex(32));
}

}  // namespace
