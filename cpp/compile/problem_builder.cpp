#include "compile/problem_builder.hpp"

#include <algorithm>

#include <kj/debug.h>
#include <kj/encoding.h>

#include "util/file.hpp"
#include "util/glob.hpp"
#include "util/misc.hpp"
#include "util/promise.hpp"

namespace compile {

namespace {
void RequireUtf8(const std::string& path) {
  KJ_REQUIRE(!kj::encodeUtf16(kj::ArrayPtr<const char>(path.data(),
                                                       path.size()))
                  .hadErrors,
             "path is not utf8", path);
}

std::vector<std::string> Stems(const std::vector<std::string>& paths) {
  std::vector<std::string> stems;
  for (const std::string& path : paths) {
    RequireUtf8(path);
    stems.push_back(util::File::Stem(path));
  }
  return stems;
}

bool Contains(const std::vector<std::string>& list, const std::string& s) {
  return std::find(list.begin(), list.end(), s) != list.end();
}
}  // namespace

std::string ProblemBuilder::Source(const std::string& path) const {
  return util::File::JoinPath(options_.problem_dir, path);
}

std::string ProblemBuilder::Asset(const std::string& path) const {
  return util::File::JoinPath(util::File::JoinPath(options_.out_dir, "assets"),
                              path);
}

kj::Promise<manifest::Package> ProblemBuilder::Build() {
  return util::Stage("validating problem manifest",
                     [this]() { return Validate(); })
      .then([this]() {
        return util::Stage("building modules", [this]() {
          return BuildAll("modules", "module-", CompileUpdate::BuildModule,
                          &modules_);
        });
      })
      .then([this]() {
        return util::Stage("building solutions", [this]() {
          return BuildAll("solutions", "sol-", CompileUpdate::BuildSolution,
                          &solutions_);
        });
      })
      .then([this]() {
        return util::Stage("building generators", [this]() {
          return BuildAll("generators", "testgen-",
                          CompileUpdate::BuildTestgen, &testgens_);
        });
      })
      .then([this]() {
        return util::Stage("building checker",
                           [this]() { return BuildChecker(); });
      })
      .then([this](manifest::FileRef checker) {
        package_.checker_exe = kj::mv(checker);
        return util::Stage("generating tests",
                           [this]() { return GenerateTests(); });
      })
      .then([this](std::vector<manifest::Test> tests) {
        package_.tests = kj::mv(tests);
        return util::Stage("copying valuer", [this]() {
          CopyValuerConfig();
          package_.valuer = CopyValuer();
          package_.title = problem_.title;
          package_.name = problem_.name;
          package_.checker_cmd = problem_.check_args;
          package_.valuer_config = manifest::FileRef::Problem("valuer-cfg");
          manifest::WritePackage(package_, options_.out_dir);
          return package_;
        });
      });
}

kj::Promise<void> ProblemBuilder::Validate() {
  return util::Glob(Source("generators/*"))
      .then([this](std::vector<std::string> paths) {
        std::vector<std::string> generators = Stems(paths);
        for (size_t i = 0; i < problem_.tests.size(); i++) {
          const auto& gen = problem_.tests[i].gen;
          if (!gen.is<manifest::GenerateTest>()) continue;
          const std::string& name = gen.get<manifest::GenerateTest>().testgen;
          if (!Contains(generators, name)) {
            KJ_FAIL_REQUIRE("unknown testgen", name, i + 1,
                            util::join(generators, ", "));
          }
        }
        if (!problem_.NeedsAnswers()) return kj::Promise<void>(kj::READY_NOW);
        return util::Glob(Source("solutions/*"))
            .then([this](std::vector<std::string> paths) {
              std::vector<std::string> solutions = Stems(paths);
              KJ_IF_MAYBE(primary, problem_.primary_solution) {
                if (!Contains(solutions, *primary)) {
                  KJ_FAIL_REQUIRE("unknown primary solution", *primary,
                                  util::join(solutions, ", "));
                }
              } else {
                KJ_FAIL_REQUIRE(
                    "primary_solution must be set to generate the reference "
                    "answers");
              }
            });
      });
}

kj::Promise<void> ProblemBuilder::BuildAll(const std::string& dir,
                                           const std::string& prefix,
                                           UpdateFn update, Commands* built) {
  return util::Glob(Source(dir + "/*"))
      .then([this, prefix, update, built](std::vector<std::string> paths) {
        return BuildFrom(kj::mv(paths), 0, prefix, update, built);
      });
}

kj::Promise<void> ProblemBuilder::BuildFrom(std::vector<std::string> paths,
                                            size_t index,
                                            const std::string& prefix,
                                            UpdateFn update, Commands* built) {
  if (index == paths.size()) return kj::READY_NOW;
  std::string path = paths[index];
  RequireUtf8(path);
  std::string id = util::File::Stem(path);
  KJ_REQUIRE(!id.empty(), "unable to get the name of", path);

  progress_.Send(update(id));
  auto promise = util::WithContext(task_runner_.Run(path, Asset(prefix + id)),
                                   "building " + path);
  return promise.then([this, paths = kj::mv(paths), index, prefix, update,
                       built, id](util::Command command) mutable {
    (*built)[id] = kj::mv(command);
    return BuildFrom(kj::mv(paths), index + 1, prefix, update, built);
  });
}

kj::Promise<manifest::FileRef> ProblemBuilder::BuildChecker() {
  progress_.Send(CompileUpdate::BuildChecker());
  manifest::FileRef checker = manifest::FileRef::Problem("checker/bin");
  std::string dest = Asset("checker");

  if (problem_.check.is<manifest::BuiltinCheck>()) {
    const std::string& name = problem_.check.get<manifest::BuiltinCheck>().name;
    std::string src =
        util::File::JoinPath(options_.build_env, "bin/builtin-checker-" + name);
    KJ_REQUIRE(util::File::IsRegularFile(src), "unknown builtin checker", name,
               src);
    std::string exe = Asset(checker.path);
    util::File::HardCopy(src, exe, /*overwrite=*/true);
    util::File::MakeExecutable(exe);
    return checker;
  }
  // Only single-file checkers are supported.
  return task_runner_.Run(Source("checkers/main.cpp"), dest)
      .then([checker](util::Command) { return checker; });
}

kj::Promise<std::vector<manifest::Test>> ProblemBuilder::GenerateTests() {
  kj::Maybe<util::Command> primary;
  if (problem_.NeedsAnswers()) {
    KJ_IF_MAYBE(name, problem_.primary_solution) {
      auto solution = solutions_.find(*name);
      KJ_REQUIRE(solution != solutions_.end(), "unknown primary solution",
                 *name);
      primary = solution->second;
    } else {
      KJ_FAIL_REQUIRE(
          "primary_solution must be set to generate the reference answers");
    }
  }
  auto generator =
      kj::heap<TestGenerator>(problem_, options_, &progress_, &runner_,
                              testgens_, kj::mv(primary));
  auto promise = generator->Generate();
  return promise.attach(kj::mv(generator));
}

void ProblemBuilder::CopyValuerConfig() {
  KJ_IF_MAYBE(cfg, problem_.valuer_cfg) {
    progress_.Send(CompileUpdate::CopyValuerConfig());
    std::string src = Source(util::trimLeft(*cfg, '/'));
    KJ_REQUIRE(util::File::Exists(src), "valuer config not found", src);
    KJ_REQUIRE(util::File::IsRegularFile(src),
               "multi-file valuer config is not supported", src);
    util::File::HardCopy(src, Asset("valuer-cfg/cfg.yaml"),
                         /*overwrite=*/true);
  }
}

manifest::ChildValuer ProblemBuilder::CopyValuer() {
  std::string src = util::File::JoinPath(options_.build_env, "bin/svaluer");
  std::string exe = Asset("valuer");
  util::File::HardCopy(src, exe, /*overwrite=*/true);
  util::File::MakeExecutable(exe);

  manifest::ChildValuer valuer;
  valuer.exe = manifest::FileRef::Problem("valuer");
  return valuer;
}

}  // namespace compile
