/**
 * @file weight_calculator.cpp
 * @brief Implementation of recency ranking and the weight formula.
 */

#include "core/weight_calculator.h"

#include <algorithm>

#include "core/shuffle.h"

namespace runthrough {

Catalog assignRecencyRanks(std::mt19937& rng, const Catalog& catalog) {
  Catalog ranked = shuffle(rng, catalog);

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Track& a, const Track& b) { return a.lastplay > b.lastplay; });

  for (size_t i = 0; i < ranked.size(); ++i) {
    ranked[i].recency_rank = static_cast<uint32_t>(i + 1);
  }
  return ranked;
}

Weight computeTrackWeight(const Track& track, size_t catalog_size) {
  if (track.rating == RATING_EXCLUDED) {
    return 0;
  }
  if (catalog_size == 0) {
    return 0;
  }

  const int64_t base = (track.rating == RATING_UNRATED) ? UNRATED_BASE : track.rating;
  const int64_t recency_term =
      WEIGHT_SCALE * static_cast<int64_t>(track.recency_rank) / static_cast<int64_t>(catalog_size);
  // Floor of WEIGHT_SCALE / (playcount + 1) is 0 from here on
  const int64_t playcount_term =
      (track.playcount >= WEIGHT_SCALE) ? 0 : WEIGHT_SCALE / (track.playcount + 1);

  return base * (recency_term + playcount_term);
}

Catalog computeWeights(std::mt19937& rng, const Catalog& catalog) {
  Catalog weighted = assignRecencyRanks(rng, catalog);
  for (auto& track : weighted) {
    track.weight = computeTrackWeight(track, weighted.size());
  }
  return weighted;
}

}  // namespace runthrough
