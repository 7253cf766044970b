#ifndef RUNTHROUGH_CORE_TYPES_H
#define RUNTHROUGH_CORE_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace runthrough {

// Track identifier as stored in the GNUpod database
using TrackId = int64_t;

// Selection weight (never negative once computed)
using Weight = int64_t;

// Rating sentinel: track is never preferentially selected
constexpr int32_t RATING_EXCLUDED = 20;

// Rating of a track that was never rated
constexpr int32_t RATING_UNRATED = 0;

// Base used for unrated tracks (highest priority, not lowest)
constexpr int64_t UNRATED_BASE = 200;

// Scale of the recency and play count terms
constexpr int64_t WEIGHT_SCALE = 1000;

// Seconds between the GNUpod timestamp origin and the Unix epoch
constexpr int64_t GNUPOD_EPOCH_OFFSET = 2082848400;

constexpr const char* DEFAULT_PLAYLIST_NAME = "Runthrough";
constexpr const char* DEFAULT_DATABASE_PATH = "/mnt/ipod/iPod_Control/.gnupod/GNUtunesDB.xml";

constexpr const char* RUNTHROUGH_VERSION = "1.0.0";

/// @brief A catalog entry with its derived ranking fields.
struct Track {
  TrackId id = 0;            ///< Unique within the catalog
  std::string title;
  std::string album;
  int32_t rating = 0;        ///< 0 = unrated, 20 = excluded
  int64_t playcount = 0;     ///< Non-negative
  int64_t lastplay = 0;      ///< GNUpod timestamp, 0 = never played
  uint32_t recency_rank = 0; ///< Derived: 1 = most recently played
  Weight weight = 0;         ///< Derived selection weight
};

using Catalog = std::vector<Track>;

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_TYPES_H
