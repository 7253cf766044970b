/**
 * @file cli_main.cpp
 * @brief Command-line interface: rank a GNUpod catalog into a playlist.
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "catalog/gnupod_database.h"
#include "catalog/track_format.h"
#include "core/ranked_playlist.h"
#include "core/rng_util.h"
#include "core/run_config.h"

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] [DATABASE]\n\n";
  std::cout << "Writes DATABASE with a playlist of all its tracks, ordered so that\n";
  std::cout << "highly rated, rarely and not recently played tracks tend to come first.\n\n";
  std::cout << "DATABASE defaults to " << runthrough::DEFAULT_DATABASE_PATH << "\n\n";
  std::cout << "Options:\n";
  std::cout << "  --seed N          Set random seed (0 = auto-random)\n";
  std::cout << "  --name NAME       Playlist name (default: " << runthrough::DEFAULT_PLAYLIST_NAME
            << ")\n";
  std::cout << "  --output FILE     Write the updated database to FILE (default: stdout)\n";
  std::cout << "  --list            Print the ranked tracks instead of the database\n";
  std::cout << "  --help            Show this help message\n";
}

void printListing(const runthrough::Catalog& ordered) {
  std::cout << runthrough::weightedListingHeader();
  for (const auto& track : ordered) {
    std::cout << runthrough::formatWeightedTrackLine(track);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  runthrough::RunConfig config;
  bool database_given = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      config.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--name") == 0 && i + 1 < argc) {
      config.playlist_name = argv[++i];
    } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      config.output_path = argv[++i];
    } else if (std::strcmp(argv[i], "--list") == 0) {
      config.list_tracks = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (argv[i][0] == '-') {
      std::cerr << "Unknown option: " << argv[i] << " (see --help)\n";
      return 1;
    } else if (!database_given) {
      config.database_path = argv[i];
      database_given = true;
    } else {
      std::cerr << "Unexpected argument: " << argv[i] << "\n";
      return 1;
    }
  }

  auto config_error = runthrough::validateRunConfig(config);
  if (config_error != runthrough::RunConfigError::OK) {
    std::cerr << "Error: " << runthrough::runConfigErrorString(config_error) << "\n";
    return 1;
  }

  // stdout may carry the XML document, so status goes to stderr
  std::cerr << "runthrough v" << runthrough::RUNTHROUGH_VERSION << "\n";

  runthrough::GnupodDatabase database;
  if (!database.read(config.database_path)) {
    std::cerr << "Error: " << database.getError() << "\n";
    return 1;
  }

  uint32_t seed = runthrough::rng_util::resolveSeed(config.seed);
  std::mt19937 rng(seed);
  std::cerr << "Tracks: " << database.tracks().size() << ", seed: " << seed << "\n";

  runthrough::Catalog ordered;
  auto select_error = runthrough::rankTracks(rng, database.tracks(), ordered);
  if (select_error != runthrough::SelectionError::OK) {
    std::cerr << "Error: " << runthrough::selectionErrorString(select_error) << "\n";
    return 1;
  }

  if (config.list_tracks) {
    printListing(ordered);
    return 0;
  }

  std::vector<runthrough::TrackId> ids;
  ids.reserve(ordered.size());
  for (const auto& track : ordered) {
    ids.push_back(track.id);
  }
  database.setPlaylist(config.playlist_name, ids);

  bool written = config.output_path.empty() ? database.write(std::cout)
                                            : database.write(config.output_path);
  if (!written) {
    std::cerr << "Error: " << database.getError() << "\n";
    return 1;
  }

  if (!config.output_path.empty()) {
    std::cerr << "Saved: " << config.output_path << " (playlist '" << config.playlist_name
              << "', " << ids.size() << " tracks)\n";
  }
  return 0;
}
