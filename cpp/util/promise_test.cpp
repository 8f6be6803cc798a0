#include "util/promise.hpp"
#include <kj/async.h>
#include <stdexcept>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

std::string Failure(kj::Promise<int>&& promise, kj::WaitScope& scope) {
  KJ_IF_MAYBE(exception,
              kj::runCatchingExceptions([&]() { promise.wait(scope); })) {
    return kj::str(*exception).cStr();
  }
  ADD_FAILURE() << "the promise did not fail";
  return "";
}

// NOLINTNEXTLINE
TEST(Promise, WithContextKeepsValues) {
  kj::EventLoop loop;
  kj::WaitScope scope(loop);
  EXPECT_EQ(util::WithContext(kj::Promise<int>(42), "answer").wait(scope), 42);
}

// NOLINTNEXTLINE
TEST(Promise, WithContextWrapsFailures) {
  kj::EventLoop loop;
  kj::WaitScope scope(loop);
  auto promise = kj::Promise<int>(42).then([](int) -> int {
    KJ_FAIL_REQUIRE("inner failure");
  });
  std::string error =
      Failure(util::WithContext(kj::mv(promise), "outer step"), scope);
  EXPECT_THAT(error, HasSubstr("inner failure"));
  EXPECT_THAT(error, HasSubstr("outer step"));
}

// NOLINTNEXTLINE
TEST(Promise, StageTurnsThrowsIntoRejections) {
  kj::EventLoop loop;
  kj::WaitScope scope(loop);
  auto promise = util::Stage("parsing", []() -> int {
    throw std::runtime_error("bad input");
  });
  std::string error = Failure(kj::mv(promise), scope);
  EXPECT_THAT(error, HasSubstr("bad input"));
  EXPECT_THAT(error, HasSubstr("parsing"));
}

// NOLINTNEXTLINE
TEST(Promise, StageFlattensPromises) {
  kj::EventLoop loop;
  kj::WaitScope scope(loop);
  auto promise =
      util::Stage("step", []() { return kj::Promise<int>(7); });
  EXPECT_EQ(promise.wait(scope), 7);
}

}  // namespace
