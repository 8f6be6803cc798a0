#include "compile/task_runner.hpp"
#include <kj/async-io.h>
#include <kj/debug.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/test_util.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class FakeBackend : public compile::BuildBackend {
 public:
  kj::Promise<compile::TaskResult> ProcessTask(
      compile::BuildTask task) override {
    scratch_existed.push_back(util::File::IsDirectory(task.tmp));
    tasks.push_back(task);
    if (fail_with.is<compile::TaskError>()) {
      return compile::Failed(fail_with.get<compile::TaskError>());
    }
    return compile::Built(
        util::Command(util::File::JoinPath(task.dest, "bin")));
  }

  std::vector<compile::BuildTask> tasks;
  std::vector<bool> scratch_existed;
  compile::TaskResult fail_with = compile::Built(util::Command());
};

class TaskRunnerTest : public ::testing::Test {
 protected:
  TaskRunnerTest()
      : io_(kj::setupAsyncIo()), tmp_(util::MakeTestDir("task_runner")) {}

  compile::TaskRunner Runner(bool keep = false) {
    return compile::TaskRunner(&backend_, tmp_.Path(), keep);
  }

  std::string Failure(kj::Promise<util::Command> promise) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions(
                               [&]() { promise.wait(io_.waitScope); })) {
      return exception->getDescription().cStr();
    }
    ADD_FAILURE() << "the build did not fail";
    return "";
  }

  std::string Path(const std::string& path) const {
    return util::File::JoinPath(tmp_.Path(), path);
  }

  kj::AsyncIoContext io_;
  util::TempDir tmp_;
  FakeBackend backend_;
};

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, ReturnsTheBackendCommand) {
  auto runner = Runner();
  util::Command command =
      runner.Run(Path("src/sol.cpp"), Path("out/sol")).wait(io_.waitScope);
  EXPECT_EQ(command.Path(), Path("out/sol/bin"));
  ASSERT_EQ(backend_.tasks.size(), 1);
  EXPECT_EQ(backend_.tasks[0].src, Path("src/sol.cpp"));
  EXPECT_EQ(backend_.tasks[0].dest, Path("out/sol"));
  EXPECT_TRUE(util::File::IsDirectory(Path("out/sol")));
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, ScratchDirectoryLivesOnlyDuringTheBuild) {
  auto runner = Runner();
  runner.Run(Path("a.cpp"), Path("out/a")).wait(io_.waitScope);
  ASSERT_EQ(backend_.tasks.size(), 1);
  EXPECT_TRUE(backend_.scratch_existed[0]);
  EXPECT_THAT(backend_.tasks[0].tmp, StartsWith(Path("pps-build-")));
  EXPECT_FALSE(util::File::Exists(backend_.tasks[0].tmp));
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, ScratchDirectoryIsRemovedAfterAFailure) {
  backend_.fail_with = compile::Failed(compile::TaskError::Other("boom"));
  auto runner = Runner();
  Failure(runner.Run(Path("a.cpp"), Path("out/a")));
  ASSERT_EQ(backend_.tasks.size(), 1);
  EXPECT_FALSE(util::File::Exists(backend_.tasks[0].tmp));
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, KeepsScratchDirectoryWhenAsked) {
  auto runner = Runner(/*keep=*/true);
  runner.Run(Path("a.cpp"), Path("out/a")).wait(io_.waitScope);
  ASSERT_EQ(backend_.tasks.size(), 1);
  EXPECT_TRUE(util::File::IsDirectory(backend_.tasks[0].tmp));
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, EveryTaskGetsItsOwnScratchDirectory) {
  auto runner = Runner(/*keep=*/true);
  runner.Run(Path("a.cpp"), Path("out/a")).wait(io_.waitScope);
  runner.Run(Path("b.cpp"), Path("out/b")).wait(io_.waitScope);
  ASSERT_EQ(backend_.tasks.size(), 2);
  EXPECT_NE(backend_.tasks[0].tmp, backend_.tasks[1].tmp);
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, NonZeroExitReportsCommandAndStreams) {
  backend_.fail_with = compile::Failed(compile::TaskError::ExitCodeNonZero(
      "c++ -o bin sol.cpp", "some output", "sol.cpp:1: error"));
  auto runner = Runner();
  std::string error = Failure(runner.Run(Path("sol.cpp"), Path("out/sol")));
  EXPECT_THAT(error, HasSubstr("unable to run build task"));
  EXPECT_THAT(error, HasSubstr("Command: c++ -o bin sol.cpp"));
  EXPECT_THAT(error, HasSubstr("--- stdout ---\nsome output"));
  EXPECT_THAT(error, HasSubstr("--- stderr ---\nsol.cpp:1: error"));
  EXPECT_THAT(error, HasSubstr("BuildTask"));
  EXPECT_THAT(error, HasSubstr(Path("sol.cpp")));
  EXPECT_THAT(error, HasSubstr(Path("out/sol")));
}

// NOLINTNEXTLINE
TEST_F(TaskRunnerTest, OtherFailuresReportTheirDescription) {
  backend_.fail_with =
      compile::Failed(compile::TaskError::Other("no entry point"));
  auto runner = Runner();
  std::string error = Failure(runner.Run(Path("dir"), Path("out/dir")));
  EXPECT_THAT(error, HasSubstr("no entry point"));
  EXPECT_THAT(error, HasSubstr("BuildTask"));
  EXPECT_THAT(error, Not(HasSubstr("--- stdout ---")));
}

}  // namespace
