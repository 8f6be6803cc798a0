#ifndef UTIL_GLOB_HPP
#define UTIL_GLOB_HPP

#include <string>
#include <vector>

#include <kj/async.h>

namespace util {

// Expands a glob(3) pattern on a separate thread. A pattern that matches
// nothing, or whose directory does not exist, expands to an empty list. The
// result is sorted.
kj::Promise<std::vector<std::string>> Glob(std::string pattern)
    KJ_WARN_UNUSED_RESULT;

// Blocking version of Glob.
std::vector<std::string> GlobSync(const std::string& pattern);

}  // namespace util

#endif
