#include "compile/compiler_backend.hpp"

#include <algorithm>

#include "util/file.hpp"
#include "util/glob.hpp"
#include "util/which.hpp"

namespace compile {

namespace {
const std::vector<std::string> kCxxExtensions = {".cpp", ".cc", ".cxx"};
const std::vector<std::string> kScriptExtensions = {".py", ".sh", ""};

bool Contains(const std::vector<std::string>& list, const std::string& s) {
  return std::find(list.begin(), list.end(), s) != list.end();
}

kj::Promise<TaskResult> Install(const std::string& artifact,
                                const std::string& dest) {
  std::string exe = util::File::JoinPath(dest, "bin");
  util::File::HardCopy(artifact, exe, /*overwrite=*/true);
  util::File::MakeExecutable(exe);
  return Built(util::Command(exe));
}
}  // namespace

std::string EntryPoint(const std::string& src) {
  if (!util::File::IsDirectory(src)) return src;
  for (const std::string& entry :
       util::GlobSync(util::File::JoinPath(src, "main.*"))) {
    if (util::File::IsRegularFile(entry)) return entry;
  }
  return "";
}

std::vector<std::string> CompilerCommand(const std::string& source,
                                         const std::string& output) {
  std::string ext = util::File::Extension(source);
  if (Contains(kCxxExtensions, ext)) {
    return {"c++", "-O2", "-std=c++17", "-DEVAL", "-Wall",
            "-o",  output, source};
  }
  if (ext == ".c") {
    return {"cc", "-O2", "-std=c11", "-DEVAL", "-Wall",
            "-o", output, source, "-lm"};
  }
  return {};
}

kj::Promise<TaskResult> CompilerBackend::ProcessTask(BuildTask task) {
  std::string source = EntryPoint(task.src);
  if (source.empty()) {
    return Failed(TaskError::Other("no entry point in " + task.src));
  }

  std::string artifact = util::File::JoinPath(task.tmp, "bin");
  std::vector<std::string> args = CompilerCommand(source, artifact);
  if (args.empty()) {
    std::string ext = util::File::Extension(source);
    if (!Contains(kScriptExtensions, ext)) {
      return Failed(
          TaskError::Other("unsupported source type " + ext + ": " + source));
    }
    return Install(source, task.dest);
  }

  std::string compiler = util::which(args[0]);
  if (compiler.empty()) {
    return Failed(TaskError::Other("compiler not found: " + args[0]));
  }
  util::Command command(compiler);
  command.Args(std::vector<std::string>(args.begin() + 1, args.end()));
  return runner_.Run(command).then(
      [command, artifact, task](util::ProcessOutput output) {
        if (!output.Success()) {
          return kj::Promise<TaskResult>(Failed(TaskError::ExitCodeNonZero(
              command.ToString(), output.stdout_data, output.stderr_data)));
        }
        return Install(artifact, task.dest);
      });
}

}  // namespace compile
