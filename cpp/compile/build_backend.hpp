#ifndef COMPILE_BUILD_BACKEND_HPP
#define COMPILE_BUILD_BACKEND_HPP

#include <string>
#include <utility>

#include <kj/async.h>
#include <kj/one-of.h>

#include "util/command.hpp"

namespace compile {

// A single delegated build: turn the program at src into an executable
// installed under dest. tmp is a private, empty scratch directory.
struct BuildTask {
  std::string src;
  std::string dest;
  std::string tmp;

  std::string ToString() const {
    return "BuildTask {\n  src: " + src + "\n  dest: " + dest +
           "\n  tmp: " + tmp + "\n}";
  }
};

struct TaskError {
  enum class Kind { EXIT_CODE_NON_ZERO, OTHER };

  Kind kind = Kind::OTHER;
  // Set for EXIT_CODE_NON_ZERO.
  std::string command;
  std::string stdout_data;
  std::string stderr_data;
  // Set for OTHER.
  std::string description;

  static TaskError ExitCodeNonZero(std::string command, std::string out,
                                   std::string err) {
    TaskError error;
    error.kind = Kind::EXIT_CODE_NON_ZERO;
    error.command = std::move(command);
    error.stdout_data = std::move(out);
    error.stderr_data = std::move(err);
    return error;
  }
  static TaskError Other(std::string description) {
    TaskError error;
    error.description = std::move(description);
    return error;
  }
};

// The command that runs the built program, or why the build failed.
using TaskResult = kj::OneOf<util::Command, TaskError>;

inline TaskResult Built(util::Command command) {
  TaskResult result;
  result.init<util::Command>(std::move(command));
  return result;
}

inline TaskResult Failed(TaskError error) {
  TaskResult result;
  result.init<TaskError>(std::move(error));
  return result;
}

// Knows how to build programs. Implementations may reject the promise for
// unexpected failures; build failures are reported as a TaskError.
class BuildBackend {
 public:
  virtual kj::Promise<TaskResult> ProcessTask(BuildTask task) = 0;
  virtual ~BuildBackend() = default;
};

}  // namespace compile

#endif
