#include "util/command.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

// NOLINTNEXTLINE
TEST(Command, Builder) {
  util::Command cmd("/out/assets/testgen-gen/bin");
  cmd.Arg("small").Args({"--seed", "7"}).CurrentDir("/problem");
  EXPECT_EQ(cmd.Path(), "/out/assets/testgen-gen/bin");
  EXPECT_THAT(cmd.GetArgs(), ElementsAre("small", "--seed", "7"));
  EXPECT_EQ(cmd.GetCurrentDir(), "/problem");
}

// NOLINTNEXTLINE
TEST(Command, EnvReplacesPreviousValue) {
  util::Command cmd("/bin/true");
  cmd.Env("JJS_TEST_ID", "1").Env("JJS_RANDOM_SEED", "ab").Env("JJS_TEST_ID",
                                                               "2");
  EXPECT_THAT(cmd.GetEnv(), ElementsAre(Pair("JJS_TEST_ID", "2"),
                                        Pair("JJS_RANDOM_SEED", "ab")));
}

// NOLINTNEXTLINE
TEST(Command, CopyIsIndependent) {
  util::Command base("/out/assets/sol-main/bin");
  base.Env("JJS_PROBLEM_SRC", "/problem");
  util::Command copy = base;
  copy.Arg("extra").Env("JJS_TEST_ID", "3");
  EXPECT_THAT(base.GetArgs(), IsEmpty());
  EXPECT_EQ(base.GetEnv().size(), 1u);
  EXPECT_EQ(copy.GetEnv().size(), 2u);
}

// NOLINTNEXTLINE
TEST(Command, ToStringQuotes) {
  util::Command cmd("/usr/bin/c++");
  cmd.Args({"-O2", "-o", "/tmp/pps-build-1/bin", "my file.cpp", "it's", ""});
  EXPECT_EQ(cmd.ToString(),
            "/usr/bin/c++ -O2 -o /tmp/pps-build-1/bin 'my file.cpp' "
            "'it'\\''s' ''");
}

}  // namespace
