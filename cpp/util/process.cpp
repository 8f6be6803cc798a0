#include "util/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

#include <kj/debug.h>
#include <kj/vector.h>

#include "util/flags.hpp"

extern char** environ;

namespace {

// Owns the strings passed to execve, so that nothing is allocated after fork.
class ExecArgs {
 public:
  explicit ExecArgs(const util::Command& command) {
    args_.push_back(command.Path());
    for (const std::string& arg : command.GetArgs()) args_.push_back(arg);
    for (char** var = environ; *var != nullptr; var++) {
      std::string entry = *var;
      std::string name = entry.substr(0, entry.find('='));
      bool overridden = false;
      for (const auto& kv : command.GetEnv()) {
        if (kv.first == name) overridden = true;
      }
      if (!overridden) env_.push_back(std::move(entry));
    }
    for (const auto& kv : command.GetEnv()) {
      env_.push_back(kv.first + "=" + kv.second);
    }
    for (std::string& arg : args_) argv_.push_back(&arg[0]);
    argv_.push_back(nullptr);
    for (std::string& var : env_) envp_.push_back(&var[0]);
    envp_.push_back(nullptr);
  }
  char* const* Argv() { return argv_.data(); }
  char* const* Envp() { return envp_.data(); }

 private:
  std::vector<std::string> args_;
  std::vector<std::string> env_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

struct Pipe {
  kj::AutoCloseFd read;
  kj::AutoCloseFd write;
};

Pipe MakePipe() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC), "pipe");
  return Pipe{kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1])};
}

// Only async-signal-safe calls from here on: the parent may have threads.
[[noreturn]] void Child(ExecArgs* exec, const char* cwd, int stdin_fd,
                        int stdout_fd, int stderr_fd, int error_fd) {
  auto die = [error_fd](const char* prefix) {
    int err = errno;
    ssize_t unused = write(error_fd, &err, sizeof(err));
    unused = write(error_fd, prefix, strlen(prefix));
    (void)unused;
    _exit(127);
  };

  // Undo the signal setup of the event loop.
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1) die("sigprocmask");
  struct sigaction dfl {};
  dfl.sa_handler = SIG_DFL;
  if (sigaction(SIGPIPE, &dfl, nullptr) == -1) die("sigaction");

#define DUP(field, fd)                          \
  if (dup2(field##_fd, fd) == -1) {             \
    die("redirect " #field);                    \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  if (cwd != nullptr && chdir(cwd) == -1) die("chdir");
  execve(exec->Argv()[0], exec->Argv(), exec->Envp());
  die("exec");
  _exit(127);
}

kj::Promise<std::string> ReadAll(kj::LowLevelAsyncIoProvider& io,
                                 kj::AutoCloseFd fd) {
  auto stream = io.wrapInputFd(
      fd.release(), kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                        kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
  auto promise = stream->readAllBytes();
  return promise.attach(kj::mv(stream))
      .then([](kj::Array<kj::byte> data) {
        return std::string(data.asChars().begin(), data.size());
      });
}

}  // namespace

namespace util {

bool ProcessOutput::Success() const {
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string ProcessOutput::Describe() const {
  if (WIFSIGNALED(status)) {
    return "killed by signal " + std::to_string(WTERMSIG(status));
  }
  return "exited with code " + std::to_string(WEXITSTATUS(status));
}

kj::Promise<ProcessOutput> ProcessRunner::Run(const Command& command,
                                              Redirect redirect) {
  if (Flags::verbose) {
    KJ_LOG(INFO, "Executing", command.ToString(), command.GetCurrentDir());
  }
  ExecArgs exec(command);

  kj::AutoCloseFd dev_null;
  int stdin_fd = redirect.stdin_fd;
  if (stdin_fd == -1) {
    int fd;
    KJ_SYSCALL(fd = open("/dev/null", O_RDONLY | O_CLOEXEC), "/dev/null");
    dev_null = kj::AutoCloseFd(fd);
    stdin_fd = fd;
  }
  kj::Maybe<Pipe> stdout_pipe;
  int stdout_fd = redirect.stdout_fd;
  if (stdout_fd == -1) {
    auto& pipe = stdout_pipe.emplace(MakePipe());
    stdout_fd = pipe.write;
  }
  Pipe stderr_pipe = MakePipe();
  Pipe error_pipe = MakePipe();

  const char* cwd = command.GetCurrentDir().empty()
                        ? nullptr
                        : command.GetCurrentDir().c_str();
  pid_t pid;
  KJ_SYSCALL(pid = fork(), "fork");
  if (pid == 0) {
    Child(&exec, cwd, stdin_fd, stdout_fd, stderr_pipe.write, error_pipe.write);
  }

  // Only the child keeps the writing ends open.
  error_pipe.write = nullptr;
  stderr_pipe.write = nullptr;
  KJ_IF_MAYBE(pipe, stdout_pipe) { pipe->write = nullptr; }
  dev_null = nullptr;

  // The error pipe is closed on exec, so this returns as soon as the child
  // has either started the program or failed to.
  int err = 0;
  ssize_t got;
  KJ_SYSCALL(got = read(error_pipe.read, &err, sizeof(err)), "read");
  if (got > 0) {
    char what[64] = {};
    ssize_t len = read(error_pipe.read, what, sizeof(what) - 1);
    if (len < 0) len = 0;
    int status = 0;
    KJ_SYSCALL(waitpid(pid, &status, 0), "waitpid");
    KJ_FAIL_REQUIRE("unable to start command", command.ToString(),
                    kj::StringPtr(what, len), strerror(err));
  }

  auto output = kj::heap<ProcessOutput>();
  ProcessOutput& out = *output;
  auto child = kj::heap<kj::Maybe<pid_t>>(pid);
  kj::Maybe<pid_t>& child_ref = *child;

  kj::Vector<kj::Promise<void>> pending;
  pending.add(port_.onChildExit(child_ref).then(
      [&out](int status) { out.status = status; }));
  KJ_IF_MAYBE(pipe, stdout_pipe) {
    pending.add(ReadAll(io_, kj::mv(pipe->read))
                    .then([&out](std::string data) {
                      out.stdout_data = kj::mv(data);
                    }));
  }
  pending.add(ReadAll(io_, kj::mv(stderr_pipe.read))
                  .then([&out](std::string data) {
                    out.stderr_data = kj::mv(data);
                  }));

  // Runs after the pending promises are gone: a child that is still tracked
  // has not exited yet.
  auto reap = kj::defer([child = kj::mv(child)]() {
    KJ_IF_MAYBE(pid, *child) {
      KJ_LOG(WARNING, "Killing unfinished child", *pid);
      kill(*pid, SIGKILL);
      waitpid(*pid, nullptr, 0);
    }
  });
  return kj::joinPromises(pending.releaseAsArray())
      .attach(kj::mv(reap))
      .then([output = kj::mv(output)]() mutable { return kj::mv(*output); });
}

std::string DescribeFailure(const Command& command,
                            const ProcessOutput& output) {
  std::string report = "Command: " + command.ToString() + "\n";
  report += "Status: " + output.Describe() + "\n";
  report += "--- stdout ---\n" + output.stdout_data + "\n";
  report += "--- stderr ---\n" + output.stderr_data;
  return report;
}

}  // namespace util
