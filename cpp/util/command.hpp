#ifndef UTIL_COMMAND_HPP
#define UTIL_COMMAND_HPP

#include <string>
#include <utility>
#include <vector>

namespace util {

// Describes how to invoke a program: executable, arguments, environment
// overrides and working directory. Copying a Command clones it.
class Command {
 public:
  Command() = default;
  explicit Command(std::string path) : path_(std::move(path)) {}

  Command& Arg(std::string arg) {
    args_.push_back(std::move(arg));
    return *this;
  }
  Command& Args(const std::vector<std::string>& args) {
    args_.insert(args_.end(), args.begin(), args.end());
    return *this;
  }

  // Sets an environment variable, replacing a previous value for the same
  // name. Every other variable is inherited from the parent process.
  Command& Env(const std::string& name, std::string value);

  Command& CurrentDir(std::string dir) {
    cwd_ = std::move(dir);
    return *this;
  }

  const std::string& Path() const { return path_; }
  const std::vector<std::string>& GetArgs() const { return args_; }
  const std::vector<std::pair<std::string, std::string>>& GetEnv() const {
    return env_;
  }
  // Empty means the working directory of the parent.
  const std::string& GetCurrentDir() const { return cwd_; }

  // The command line, with every word quoted when needed.
  std::string ToString() const;

 private:
  std::string path_;
  std::vector<std::string> args_;
  std::vector<std::pair<std::string, std::string>> env_;
  std::string cwd_;
};

}  // namespace util

#endif
