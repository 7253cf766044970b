/**
 * @file bench_select.cpp
 * @brief Benchmark binary for the weighting and selection pipeline.
 *
 * Usage:
 *   ./build/bench_select               # Default: 20 seeds x sizes 100..5000
 *   ./build/bench_select --seeds 100   # More seeds
 *   ./build/bench_select --size 2000   # Single catalog size
 */

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "core/ranked_playlist.h"
#include "core/types.h"

using Clock = std::chrono::high_resolution_clock;

namespace {

// Catalog with a realistic mix: many unplayed and unrated tracks, a few excluded.
runthrough::Catalog makeCatalog(size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> rating_dist(0, 5);
  std::uniform_int_distribution<int64_t> playcount_dist(0, 40);
  std::uniform_int_distribution<int64_t> lastplay_dist(3300000000LL, 3400000000LL);

  runthrough::Catalog catalog(size);
  for (size_t i = 0; i < size; ++i) {
    auto& track = catalog[i];
    track.id = static_cast<runthrough::TrackId>(i + 1);
    track.rating = rating_dist(rng) * 20;  // GNUpod stars: 0, 20 .. 100
    track.playcount = (i % 3 == 0) ? 0 : playcount_dist(rng);
    track.lastplay = (track.playcount == 0) ? 0 : lastplay_dist(rng);
  }
  return catalog;
}

}  // namespace

int main(int argc, char* argv[]) {
  int num_seeds = 20;
  long single_size = -1;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--seeds") == 0 && i + 1 < argc) {
      num_seeds = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
      single_size = std::atol(argv[++i]);
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: " << argv[0] << " [options]\n"
                << "  --seeds N   Number of seeds per catalog size (default: 20)\n"
                << "  --size N    Single catalog size to test (default: 100..5000)\n";
      return 0;
    }
  }
  if (num_seeds <= 0) num_seeds = 1;

  std::vector<size_t> sizes;
  if (single_size > 0) {
    sizes.push_back(static_cast<size_t>(single_size));
  } else {
    sizes = {100, 500, 1000, 2000, 5000};
  }

  std::cout << "Benchmark: " << num_seeds << " seeds x " << sizes.size() << " catalog sizes\n";

  std::cout << "\n  " << std::left << std::setw(10) << "Tracks" << std::right << std::setw(10)
            << "Mean" << std::setw(10) << "Med" << std::setw(10) << "Max" << "  (ms)\n";
  std::cout << "  " << std::string(40, '-') << "\n";

  for (size_t size : sizes) {
    std::vector<double> times;
    times.reserve(static_cast<size_t>(num_seeds));

    for (int seed = 1; seed <= num_seeds; ++seed) {
      runthrough::Catalog catalog = makeCatalog(size, static_cast<uint32_t>(seed));
      std::mt19937 rng(static_cast<uint32_t>(seed));
      std::vector<runthrough::TrackId> ids;

      auto t0 = Clock::now();
      auto err = runthrough::rankedPlaylist(rng, catalog, ids);
      auto t1 = Clock::now();

      if (err != runthrough::SelectionError::OK) {
        std::cerr << "Selection failed: " << runthrough::selectionErrorString(err) << "\n";
        return 1;
      }
      times.push_back(std::chrono::duration<double, std::milli>(t1 - t0).count());
    }

    std::sort(times.begin(), times.end());
    double avg = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
    std::cout << "  " << std::left << std::setw(10) << size << std::right << std::fixed
              << std::setprecision(2) << std::setw(10) << avg << std::setw(10)
              << times[times.size() / 2] << std::setw(10) << times.back() << "\n";
  }

  return 0;
}
