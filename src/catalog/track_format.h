#ifndef RUNTHROUGH_CATALOG_TRACK_FORMAT_H
#define RUNTHROUGH_CATALOG_TRACK_FORMAT_H

#include <cstddef>
#include <string>

#include "core/types.h"

namespace runthrough {

// Width of the title and album columns of a listing line.
constexpr size_t LISTING_TEXT_WIDTH = 20;

/**
 * @brief Format a GNUpod timestamp as "YYYY-MM-DD HH:MM:SS" (UTC).
 * @param timestamp Seconds since the GNUpod epoch, 0 = never played
 * @return Formatted time, or "--" for 0
 */
std::string formatTimestamp(int64_t timestamp);

/**
 * @brief Cut a string to at most max_bytes without splitting a UTF-8 sequence.
 */
std::string truncateUtf8(const std::string& text, size_t max_bytes);

/**
 * @brief Fixed-width listing line: id, title, album, last play, rating, play count.
 * @param track Track to describe
 * @return Line including the trailing newline
 */
std::string formatTrackLine(const Track& track);

/**
 * @brief Listing line followed by recency rank and weight columns.
 */
std::string formatWeightedTrackLine(const Track& track);

/// @brief Column header matching formatWeightedTrackLine().
std::string weightedListingHeader();

}  // namespace runthrough

#endif  // RUNTHROUGH_CATALOG_TRACK_FORMAT_H
