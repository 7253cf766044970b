#ifndef RUNTHROUGH_CORE_RUN_CONFIG_H
#define RUNTHROUGH_CORE_RUN_CONFIG_H

#include <cstdint>
#include <string>

#include "core/types.h"

namespace runthrough {

// Options of a single runthrough invocation.
struct RunConfig {
  std::string database_path = DEFAULT_DATABASE_PATH;
  std::string output_path;  // Empty = standard output
  std::string playlist_name = DEFAULT_PLAYLIST_NAME;
  uint32_t seed = 0;        // 0 = auto-random
  bool list_tracks = false; // Print a table instead of the XML document
};

// Validation error codes.
enum class RunConfigError : uint8_t {
  OK = 0,
  EmptyDatabasePath,
  EmptyPlaylistName,
  OutputIsInput  // Output path names the database being read
};

// Validates a RunConfig.
// @param config RunConfig to validate
// @returns Error code (OK if valid)
RunConfigError validateRunConfig(const RunConfig& config);

// Returns a human-readable message for the given config error.
const char* runConfigErrorString(RunConfigError error);

}  // namespace runthrough

#endif  // RUNTHROUGH_CORE_RUN_CONFIG_H
