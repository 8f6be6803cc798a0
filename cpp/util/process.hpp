#ifndef UTIL_PROCESS_HPP
#define UTIL_PROCESS_HPP

#include <string>

#include <kj/async-io.h>
#include <kj/async-unix.h>

#include "util/command.hpp"

namespace util {

struct ProcessOutput {
  int status = 0;  // As returned by waitpid.
  std::string stdout_data;
  std::string stderr_data;

  // True if the process exited normally with code 0.
  bool Success() const;
  // "exited with code N" or "killed by signal N".
  std::string Describe() const;
};

// Descriptors to install as the standard streams of the child. -1 means
// /dev/null for stdin and a captured pipe for stdout. The descriptors are
// not closed by the runner.
struct Redirect {
  int stdin_fd = -1;
  int stdout_fd = -1;
};

// Runs commands as child processes of the current event loop.
// kj::UnixEventPort::captureChildExit() must have been called before the
// event port was created.
class ProcessRunner {
 public:
  ProcessRunner(kj::LowLevelAsyncIoProvider* io, kj::UnixEventPort* port)
      : io_(*io), port_(*port) {}

  // Starts the command and resolves when it has exited and its captured
  // streams are drained. Failing to start the command rejects the promise,
  // a non-zero exit does not. Dropping the promise kills the child.
  kj::Promise<ProcessOutput> Run(const Command& command,
                                 Redirect redirect = {}) KJ_WARN_UNUSED_RESULT;

 private:
  kj::LowLevelAsyncIoProvider& io_;
  kj::UnixEventPort& port_;
};

// Human readable report of a failed run: command line, exit status and both
// captured streams.
std::string DescribeFailure(const Command& command,
                            const ProcessOutput& output);

}  // namespace util

#endif
