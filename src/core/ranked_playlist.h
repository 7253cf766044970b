/**
 * @file ranked_playlist.h
 * @brief Catalog to playlist pipeline: weights, then weighted selection.
 */

#ifndef RUNTHROUGH_CORE_RANKED_PLAYLIST_H
#define RUNTHROUGH_CORE_RANKED_PLAYLIST_H

#include <random>
#include <vector>

#include "core/types.h"
#include "core/weighted_selector.h"

namespace runthrough {

/**
 * @brief Weigh the catalog and order it by weighted selection.
 * @param rng Random engine
 * @param catalog Tracks as loaded
 * @param out Receives annotated tracks in playback order
 * @return Selection status
 */
SelectionError rankTracks(std::mt19937& rng, const Catalog& catalog, Catalog& out);

/**
 * @brief Same as rankTracks(), reduced to track identifiers.
 * @param rng Random engine
 * @param catalog Tracks as loaded
 * @param out Receives identifiers in playback order
 * @return Selection status
 */
SelectionError rankedPlaylist(std::mt19937& rng, const Catalog& catalog,
                              std::vector<TrackId>& out);

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_RANKED_PLAYLIST_H
