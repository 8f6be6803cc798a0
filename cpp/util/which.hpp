#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// named cmd in the directories of $PATH, or an empty string. Throws if $PATH
// is not set.
// Lookups are cached unless explicitly disabled; a cached entry is returned
// even if the file has been removed in the meantime.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
