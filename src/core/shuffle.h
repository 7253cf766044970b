/**
 * @file shuffle.h
 * @brief Uniform random permutation of a sequence.
 */

#ifndef RUNTHROUGH_CORE_SHUFFLE_H
#define RUNTHROUGH_CORE_SHUFFLE_H

#include <algorithm>
#include <random>
#include <vector>

namespace runthrough {

/**
 * @brief Return a uniformly random permutation of items.
 *
 * Every permutation is reachable. Sequences of 0 or 1 elements come back
 * unchanged without consuming entropy.
 *
 * @param rng Random engine
 * @param items Sequence to permute (taken by value)
 * @return Permuted sequence
 */
template <typename T>
std::vector<T> shuffle(std::mt19937& rng, std::vector<T> items) {
  if (items.size() > 1) {
    std::shuffle(items.begin(), items.end(), rng);
  }
  return items;
}

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_SHUFFLE_H
