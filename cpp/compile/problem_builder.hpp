#ifndef COMPILE_PROBLEM_BUILDER_HPP
#define COMPILE_PROBLEM_BUILDER_HPP

#include <map>
#include <string>
#include <vector>

#include <kj/async.h>

#include "compile/build_backend.hpp"
#include "compile/progress.hpp"
#include "compile/task_runner.hpp"
#include "compile/test_generator.hpp"
#include "manifest/package.hpp"
#include "manifest/problem.hpp"
#include "util/command.hpp"
#include "util/process.hpp"

namespace compile {

// Turns a problem directory into a package in options.out_dir: builds every
// program, generates the tests, copies the valuer and its configuration and
// finally writes manifest.json. Stages run one after the other and the first
// error aborts the build.
class ProblemBuilder {
 public:
  ProblemBuilder(manifest::Problem problem, BuildOptions options,
                 BuildBackend* backend, ProgressWriter* progress,
                 util::ProcessRunner* runner)
      : problem_(kj::mv(problem)),
        options_(kj::mv(options)),
        progress_(*progress),
        runner_(*runner),
        task_runner_(backend, options_.build_root, options_.keep_build_dirs) {}

  // The builder must outlive the returned promise.
  kj::Promise<manifest::Package> Build() KJ_WARN_UNUSED_RESULT;

 private:
  using Commands = std::map<std::string, util::Command>;
  using UpdateFn = CompileUpdate (*)(std::string);

  // Fails if a test names an unknown generator or if answers are needed
  // without a valid primary solution.
  kj::Promise<void> Validate();

  // Builds every <dir>/* of the problem into assets/<prefix><stem>.
  kj::Promise<void> BuildAll(const std::string& dir, const std::string& prefix,
                             UpdateFn update, Commands* built);
  kj::Promise<void> BuildFrom(std::vector<std::string> paths, size_t index,
                              const std::string& prefix, UpdateFn update,
                              Commands* built);

  kj::Promise<manifest::FileRef> BuildChecker();
  kj::Promise<std::vector<manifest::Test>> GenerateTests();
  void CopyValuerConfig();
  manifest::ChildValuer CopyValuer();

  std::string Source(const std::string& path) const;
  std::string Asset(const std::string& path) const;

  manifest::Problem problem_;
  BuildOptions options_;
  ProgressWriter& progress_;
  util::ProcessRunner& runner_;
  TaskRunner task_runner_;

  Commands modules_;
  Commands solutions_;
  Commands testgens_;
  manifest::Package package_;
};

}  // namespace compile

#endif
