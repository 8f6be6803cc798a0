#include "util/entropy.hpp"

#include <kj/debug.h>
#include <sys/random.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace util {

std::string EntropyHex(size_t length) {
  static const constexpr char* kAlphabet = "0123456789abcdef";
  std::vector<unsigned char> bytes(length);
  size_t filled = 0;
  while (filled < length) {
    ssize_t got = getrandom(bytes.data() + filled, length - filled, 0);
    if (got == -1 && errno == EINTR) continue;
    KJ_ASSERT(got > 0, "unable to read random bytes", strerror(errno));
    filled += got;
  }
  std::string res(length, '0');
  for (size_t i = 0; i < length; i++) res[i] = kAlphabet[bytes[i] % 16];
  return res;
}

}  // namespace util
