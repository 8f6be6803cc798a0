#include "compile/main.hpp"

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>

#include "compile/compiler_backend.hpp"
#include "compile/problem_builder.hpp"
#include "compile/progress.hpp"
#include "manifest/problem.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/process.hpp"
#include "util/version.hpp"

namespace compile {
kj::MainBuilder::Validity Main::Run() {
  if (Flags::problem_dir.empty()) {
    return "You need to specify the problem directory!";
  }
  if (Flags::out_dir.empty()) {
    return "You need to specify the output directory!";
  }
  if (Flags::build_env.empty()) {
    return "You need to specify the build environment!";
  }
  // Before any thread or event loop exists.
  kj::UnixEventPort::captureChildExit();
  util::LogManager log_manager(context);

  BuildOptions options;
  options.problem_dir = Flags::problem_dir;
  options.out_dir = Flags::out_dir;
  options.build_env = Flags::build_env;
  options.build_root = Flags::build_root;
  options.keep_build_dirs = Flags::keep_build_dirs;
  std::string manifest_path =
      Flags::manifest.empty()
          ? util::File::JoinPath(Flags::problem_dir, "manifest.json")
          : Flags::manifest;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                manifest::Problem problem =
                    manifest::LoadProblem(manifest_path);
                auto io = kj::setupAsyncIo();
                util::ProcessRunner runner(io.lowLevelProvider.get(),
                                           &io.unixEventPort);
                CompilerBackend backend(&runner);
                LogProgressWriter progress;
                ProblemBuilder builder(kj::mv(problem), options, &backend,
                                       &progress, &runner);
                manifest::Package package = builder.Build().wait(io.waitScope);
                KJ_LOG(INFO, "Package written", package.name,
                       package.tests.size(), options.out_dir);
              })) {
    KJ_LOG(ERROR, "Compilation failed", *exception);
    context.exitError(kj::str("Compilation failed: ",
                              exception->getDescription()));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  static const std::string title = "pps compile (" + util::version + ")";
  return kj::MainBuilder(context, title,
                         "Builds a problem directory into a package")
      .addOptionWithArg({'p', "problem-dir"},
                        util::setString(Flags::problem_dir), "<DIR>",
                        "Directory of the problem to build")
      .addOptionWithArg({'o', "out-dir"}, util::setString(Flags::out_dir),
                        "<DIR>", "Where the package should be written")
      .addOptionWithArg({'e', "build-env"}, util::setString(Flags::build_env),
                        "<DIR>",
                        "Directory with the builtin checkers and the valuer")
      .addOptionWithArg({'m', "manifest"}, util::setString(Flags::manifest),
                        "<FILE>",
                        "Problem manifest, <problem-dir>/manifest.json if "
                        "not given")
      .addOptionWithArg({'T', "build-root"},
                        util::setString(Flags::build_root), "<DIR>",
                        "Where the build directories should be created")
      .addOption({'k', "keep-build-dirs"},
                 util::setBool(Flags::keep_build_dirs),
                 "Keep the build directories after the build")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log every command and the stack trace of errors")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace compile
