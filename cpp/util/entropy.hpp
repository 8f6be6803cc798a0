#ifndef UTIL_ENTROPY_HPP
#define UTIL_ENTROPY_HPP

#include <string>

namespace util {

// Returns length random characters from [0-9a-f], taken from the kernel
// CSPRNG. Failing to read random bytes is fatal.
std::string EntropyHex(size_t length);

}  // namespace util

#endif
