#include "util/command.hpp"

namespace util {

namespace {
std::string Quote(const std::string& word) {
  if (!word.empty() &&
      word.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTU"
                             "VWXYZ0123456789_-+=.,:/@%") == std::string::npos)
    return word;
  std::string quoted = "'";
  for (char c : word) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  return quoted + "'";
}
}  // namespace

Command& Command::Env(const std::string& name, std::string value) {
  for (auto& var : env_) {
    if (var.first == name) {
      var.second = std::move(value);
      return *this;
    }
  }
  env_.emplace_back(name, std::move(value));
  return *this;
}

std::string Command::ToString() const {
  std::string cmdline = Quote(path_);
  for (const std::string& arg : args_) cmdline += " " + Quote(arg);
  return cmdline;
}

}  // namespace util
