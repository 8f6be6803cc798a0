#include "util/glob.hpp"

#include <glob.h>
#include <kj/debug.h>
#include <kj/thread.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace util {

std::vector<std::string> GlobSync(const std::string& pattern) {
  glob_t matches{};
  KJ_DEFER(globfree(&matches));
  int ret = glob(pattern.c_str(), GLOB_NOSORT, [](const char* path, int err) {
    return err == ENOENT || err == ENOTDIR ? 0 : 1;
  }, &matches);
  if (ret == GLOB_NOMATCH) return {};
  KJ_REQUIRE(ret == 0, "glob failed", pattern,
             ret == GLOB_NOSPACE ? "out of memory" : "read error");
  std::vector<std::string> paths(matches.gl_pathv,
                                 matches.gl_pathv + matches.gl_pathc);
  std::sort(paths.begin(), paths.end());
  return paths;
}

kj::Promise<std::vector<std::string>> Glob(std::string pattern) {
  auto paf = kj::newPromiseAndCrossThreadFulfiller<std::vector<std::string>>();
  auto thread = kj::heap<kj::Thread>(
      [pattern = std::move(pattern),
       fulfiller = kj::mv(paf.fulfiller)]() mutable {
        std::vector<std::string> paths;
        KJ_IF_MAYBE(exception, kj::runCatchingExceptions(
                                   [&]() { paths = GlobSync(pattern); })) {
          fulfiller->reject(kj::mv(*exception));
        } else {
          fulfiller->fulfill(kj::mv(paths));
        }
      });
  return paf.promise.attach(kj::mv(thread));
}

}  // namespace util
