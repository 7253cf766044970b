#include "core/ranked_playlist.h"

#include "core/weight_calculator.h"

namespace runthrough {

SelectionError rankTracks(std::mt19937& rng, const Catalog& catalog, Catalog& out) {
  Catalog weighted = computeWeights(rng, catalog);
  return weightedSelect(rng, weighted, [](const Track& t) { return t.weight; }, out);
}

SelectionError rankedPlaylist(std::mt19937& rng, const Catalog& catalog,
                              std::vector<TrackId>& out) {
  out.clear();

  Catalog ordered;
  SelectionError err = rankTracks(rng, catalog, ordered);
  if (err != SelectionError::OK) {
    return err;
  }

  out.reserve(ordered.size());
  for (const auto& track : ordered) {
    out.push_back(track.id);
  }
  return SelectionError::OK;
}

}  // namespace runthrough
