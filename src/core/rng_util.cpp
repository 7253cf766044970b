#include "core/rng_util.h"

#include <chrono>

namespace runthrough {
namespace rng_util {

uint32_t resolveSeed(uint32_t seed) {
  if (seed == 0) {
    return static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  }
  return seed;
}

}  // namespace rng_util
}  // namespace runthrough
