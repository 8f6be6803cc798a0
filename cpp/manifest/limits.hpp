#ifndef MANIFEST_LIMITS_HPP
#define MANIFEST_LIMITS_HPP

#include <cstdint>
#include <vector>

#include <kj/common.h>

namespace manifest {

// Resource limits of a test run. Every field is optional.
struct Limits {
  kj::Maybe<uint64_t> memory;  // Bytes.
  kj::Maybe<uint64_t> time;    // Milliseconds.
  kj::Maybe<uint64_t> process_count;
};

// Combines limits ordered by increasing priority: every field takes the last
// value that is set, and stays unset if no element sets it.
Limits MergeLimits(const std::vector<Limits>& limits);

}  // namespace manifest

#endif
