/**
 * @file weighted_selector.h
 * @brief Weighted random ordering without replacement.
 */

#ifndef RUNTHROUGH_CORE_WEIGHTED_SELECTOR_H
#define RUNTHROUGH_CORE_WEIGHTED_SELECTOR_H

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "core/rng_util.h"
#include "core/shuffle.h"
#include "core/types.h"

namespace runthrough {

// Selection error codes.
enum class SelectionError : uint8_t {
  OK = 0,
  InvalidWeight  // weight_fn returned a negative value
};

// Returns a human-readable message for a selection error.
const char* selectionErrorString(SelectionError error);

/**
 * @brief Order items so that heavier items tend to come first.
 *
 * At each step a remaining item is picked with probability proportional to
 * its weight among the remaining weights. Items of weight 0 always end up
 * after every positive-weight item, in uniformly random relative order.
 *
 * The input is shuffled first so that the result never depends on the
 * original order. Draws are O(n^2) overall; catalogs are small.
 *
 * @param rng Random engine
 * @param items Items to order
 * @param weight_fn Callable T -> integer weight, must be >= 0
 * @param out Receives the ordering (cleared on error)
 * @return SelectionError::OK, or InvalidWeight if any weight is negative
 */
template <typename T, typename WeightFn>
SelectionError weightedSelect(std::mt19937& rng, const std::vector<T>& items, WeightFn weight_fn,
                              std::vector<T>& out) {
  out.clear();

  std::vector<T> values = shuffle(rng, items);
  std::vector<Weight> weights;
  weights.reserve(values.size());

  uint64_t total = 0;
  for (const auto& value : values) {
    Weight w = static_cast<Weight>(weight_fn(value));
    if (w < 0) {
      return SelectionError::InvalidWeight;
    }
    weights.push_back(w);
    total += static_cast<uint64_t>(w);
  }

  const size_t count = values.size();
  size_t start = 0;
  while (start + 1 < count) {
    // Only zero weights left: the pre-shuffled order is final
    if (total == 0) break;

    uint64_t target = rng_util::rollBelow(rng, total);
    size_t i = start;
    while (i + 1 < count && static_cast<uint64_t>(weights[i]) <= target) {
      target -= static_cast<uint64_t>(weights[i]);
      ++i;
    }

    // i is either the drawn element or the last one (forced pick)
    std::swap(values[i], values[start]);
    std::swap(weights[i], weights[start]);
    total -= static_cast<uint64_t>(weights[start]);
    ++start;
  }

  out = std::move(values);
  return SelectionError::OK;
}

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_WEIGHTED_SELECTOR_H
