#include "manifest/limits.hpp"
#include <kj/debug.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// Value of a limit, or -1 if it is not set.
int64_t Value(const kj::Maybe<uint64_t>& lim) {
  KJ_IF_MAYBE(value, lim) { return *value; }
  return -1;
}

manifest::Limits Make(kj::Maybe<uint64_t> memory, kj::Maybe<uint64_t> time,
                      kj::Maybe<uint64_t> process_count) {
  manifest::Limits lim;
  lim.memory = memory;
  lim.time = time;
  lim.process_count = process_count;
  return lim;
}

// NOLINTNEXTLINE
TEST(MergeLimits, Empty) {
  auto merged = manifest::MergeLimits({});
  EXPECT_EQ(Value(merged.memory), -1);
  EXPECT_EQ(Value(merged.time), -1);
  EXPECT_EQ(Value(merged.process_count), -1);
}

// NOLINTNEXTLINE
TEST(MergeLimits, OverrideWinsPerField) {
  auto defaults = Make(uint64_t(256) << 20, uint64_t(1000), nullptr);
  auto test = Make(nullptr, uint64_t(3000), nullptr);
  auto merged = manifest::MergeLimits({defaults, test});
  EXPECT_EQ(Value(merged.memory), int64_t(256) << 20);
  EXPECT_EQ(Value(merged.time), 3000);
  EXPECT_EQ(Value(merged.process_count), -1);
}

// NOLINTNEXTLINE
TEST(MergeLimits, AbsentOverrideKeepsDefault) {
  auto defaults = Make(uint64_t(64) << 20, uint64_t(500), uint64_t(1));
  auto merged = manifest::MergeLimits({defaults, manifest::Limits()});
  EXPECT_EQ(Value(merged.memory), int64_t(64) << 20);
  EXPECT_EQ(Value(merged.time), 500);
  EXPECT_EQ(Value(merged.process_count), 1);
}

// NOLINTNEXTLINE
TEST(MergeLimits, LongerSequences) {
  auto merged = manifest::MergeLimits({
      Make(uint64_t(1), uint64_t(1), nullptr),
      Make(nullptr, uint64_t(2), uint64_t(2)),
      Make(uint64_t(3), nullptr, nullptr),
      Make(nullptr, nullptr, nullptr),
  });
  EXPECT_EQ(Value(merged.memory), 3);
  EXPECT_EQ(Value(merged.time), 2);
  EXPECT_EQ(Value(merged.process_count), 2);
}

// NOLINTNEXTLINE
TEST(MergeLimits, SingleElement) {
  auto merged =
      manifest::MergeLimits({Make(nullptr, uint64_t(750), nullptr)});
  EXPECT_EQ(Value(merged.memory), -1);
  EXPECT_EQ(Value(merged.time), 750);
}

}  // namespace
