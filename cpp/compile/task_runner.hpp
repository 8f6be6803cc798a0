#ifndef COMPILE_TASK_RUNNER_HPP
#define COMPILE_TASK_RUNNER_HPP

#include <cstdint>
#include <string>

#include <kj/async.h>

#include "compile/build_backend.hpp"
#include "util/command.hpp"

namespace compile {

// Runs single builds through a BuildBackend, each one in a fresh scratch
// directory <build_root>/pps-build-<micros>.
class TaskRunner {
 public:
  // The scratch directories are removed when their build is over, unless
  // keep_build_dirs is set.
  TaskRunner(BuildBackend* backend, std::string build_root,
             bool keep_build_dirs)
      : backend_(*backend),
        build_root_(std::move(build_root)),
        keep_build_dirs_(keep_build_dirs) {}

  // Builds the program at src into dest. A failed build rejects the promise
  // with a description of the failing command and of the task.
  kj::Promise<util::Command> Run(const std::string& src,
                                 const std::string& dest)
      KJ_WARN_UNUSED_RESULT;

 private:
  std::string NextScratchDir();

  BuildBackend& backend_;
  std::string build_root_;
  bool keep_build_dirs_;
  uint64_t last_id_ = 0;
};

}  // namespace compile

#endif
