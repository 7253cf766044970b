/**
 * @file weight_calculator.h
 * @brief Recency ranking and selection weights for catalog tracks.
 */

#ifndef RUNTHROUGH_CORE_WEIGHT_CALCULATOR_H
#define RUNTHROUGH_CORE_WEIGHT_CALCULATOR_H

#include <cstddef>
#include <random>

#include "core/types.h"

namespace runthrough {

/**
 * @brief Rank tracks by last play, most recent first.
 *
 * The catalog is shuffled before a stable sort so that tracks sharing a
 * timestamp (typically never-played tracks at 0) are ordered randomly
 * instead of by catalog position.
 *
 * @param rng Random engine
 * @param catalog Tracks to rank
 * @return Tracks sorted by descending lastplay, recency_rank set to 1..N
 */
Catalog assignRecencyRanks(std::mt19937& rng, const Catalog& catalog);

/**
 * @brief Selection weight of a single ranked track.
 *
 * rating 20 gives 0. Otherwise base * (1000 * rank / N + 1000 / (playcount + 1))
 * with integer division, where base is the rating, or 200 for an unrated
 * (rating 0) track.
 *
 * @param track Track with recency_rank already assigned
 * @param catalog_size Number of tracks the rank was computed over (> 0)
 * @return Selection weight
 */
Weight computeTrackWeight(const Track& track, size_t catalog_size);

/**
 * @brief Rank the catalog and attach a weight to every track.
 * @param rng Random engine
 * @param catalog Tracks to weigh
 * @return Annotated copies of the tracks, in recency order
 */
Catalog computeWeights(std::mt19937& rng, const Catalog& catalog);

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_WEIGHT_CALCULATOR_H
