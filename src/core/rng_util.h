/**
 * @file rng_util.h
 * @brief Random number generation utility helpers.
 *
 * Concise wrappers around std::uniform_int_distribution for the draws
 * made by the shuffler and the weighted selector.
 */

#ifndef RUNTHROUGH_CORE_RNG_UTIL_H
#define RUNTHROUGH_CORE_RNG_UTIL_H

#include <cstdint>
#include <random>

namespace runthrough {
namespace rng_util {

/// @brief Generate a random integer in [0, bound).
/// @param rng Random engine
/// @param bound Exclusive upper bound, must be > 0
/// @return Random integer in [0, bound - 1]
inline uint64_t rollBelow(std::mt19937& rng, uint64_t bound) {
  std::uniform_int_distribution<uint64_t> dist(0, bound - 1);
  return dist(rng);
}

/// @brief Resolve a user seed: 0 means derive one from the clock.
/// @param seed Requested seed
/// @return seed, or a time-derived value when seed is 0
uint32_t resolveSeed(uint32_t seed);

}  // namespace rng_util
}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_RNG_UTIL_H
