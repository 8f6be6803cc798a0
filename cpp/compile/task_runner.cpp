#include "compile/task_runner.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <kj/debug.h>

#include "util/file.hpp"

namespace compile {

namespace {
std::string Describe(const TaskError& error) {
  switch (error.kind) {
    case TaskError::Kind::EXIT_CODE_NON_ZERO:
      return "build command exited with a non-zero code\nCommand: " +
             error.command + "\n--- stdout ---\n" + error.stdout_data +
             "\n--- stderr ---\n" + error.stderr_data;
    case TaskError::Kind::OTHER:
      return error.description;
  }
  KJ_UNREACHABLE;
}
}  // namespace

std::string TaskRunner::NextScratchDir() {
  uint64_t id = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
  if (id <= last_id_) id = last_id_ + 1;
  last_id_ = id;
  return util::File::JoinPath(build_root_, "pps-build-" + std::to_string(id));
}

kj::Promise<util::Command> TaskRunner::Run(const std::string& src,
                                           const std::string& dest) {
  util::File::MakeDirs(dest);

  BuildTask task;
  task.src = src;
  task.dest = dest;
  task.tmp = NextScratchDir();
  KJ_ASSERT(mkdir(task.tmp.c_str(), S_IRWXU) == 0,
            "unable to create build directory", task.tmp, strerror(errno));
  auto scratch = kj::heap<util::TempDir>(util::TempDir::Adopt(task.tmp));
  if (keep_build_dirs_) {
    scratch->Keep();
    KJ_LOG(INFO, "Keeping build directory", task.tmp, src);
  }

  std::string description = task.ToString();
  return backend_.ProcessTask(kj::mv(task))
      .attach(kj::mv(scratch))
      .then([description](TaskResult result) -> util::Command {
        if (result.is<util::Command>()) {
          return kj::mv(result.get<util::Command>());
        }
        KJ_FAIL_REQUIRE("unable to run build task",
                        Describe(result.get<TaskError>()), description);
      });
}

}  // namespace compile
