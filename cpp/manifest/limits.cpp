#include "manifest/limits.hpp"

namespace manifest {

Limits MergeLimits(const std::vector<Limits>& limits) {
  Limits merged;
  for (const Limits& lim : limits) {
    KJ_IF_MAYBE(memory, lim.memory) { merged.memory = *memory; }
    KJ_IF_MAYBE(time, lim.time) { merged.time = *time; }
    KJ_IF_MAYBE(count, lim.process_count) { merged.process_count = *count; }
  }
  return merged;
}

}  // namespace manifest
