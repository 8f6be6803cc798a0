#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (File::IsRegularFile(fullpath) && access(fullpath.c_str(), X_OK) == 0) {
      if (!use_cache) return fullpath;
      return cmd_cache[cmd] = fullpath;
    }
  }
  return "";
}

}  // namespace util
