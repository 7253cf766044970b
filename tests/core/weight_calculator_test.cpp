/**
 * @file weight_calculator_test.cpp
 * @brief Tests for recency ranking and the selection weight formula.
 */

#include "core/weight_calculator.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>
#include <vector>

#include "test_support/catalog_test_helper.h"

namespace runthrough {
namespace {

using test::makeTrack;

class WeightCalculatorTest : public ::testing::Test {
 protected:
  std::mt19937 rng_{4242};
};

// ============================================================================
// Recency ranking
// ============================================================================

TEST_F(WeightCalculatorTest, RanksArePermutationOfOneToN) {
  Catalog catalog;
  for (TrackId id = 1; id <= 25; ++id) {
    catalog.push_back(makeTrack(id, 0, 0, (id % 4 == 0) ? 0 : 3300000000LL + id * 17 % 11));
  }

  Catalog ranked = assignRecencyRanks(rng_, catalog);
  ASSERT_EQ(ranked.size(), catalog.size());

  std::vector<uint32_t> ranks;
  for (const auto& track : ranked) ranks.push_back(track.recency_rank);
  std::sort(ranks.begin(), ranks.end());
  for (size_t i = 0; i < ranks.size(); ++i) {
    EXPECT_EQ(ranks[i], i + 1);
  }
}

TEST_F(WeightCalculatorTest, MostRecentlyPlayedRanksFirst) {
  Catalog catalog = {
      makeTrack(1, 0, 1, 100),
      makeTrack(2, 0, 1, 300),
      makeTrack(3, 0, 0, 0),
      makeTrack(4, 0, 1, 200),
  };

  Catalog ranked = assignRecencyRanks(rng_, catalog);
  ASSERT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked[0].id, 2);
  EXPECT_EQ(ranked[1].id, 4);
  EXPECT_EQ(ranked[2].id, 1);
  EXPECT_EQ(ranked[3].id, 3);
  for (size_t i = 0; i < ranked.size(); ++i) {
    EXPECT_EQ(ranked[i].recency_rank, i + 1);
    if (i > 0) EXPECT_GE(ranked[i - 1].lastplay, ranked[i].lastplay);
  }
}

TEST_F(WeightCalculatorTest, NeverPlayedTiesAreBrokenRandomly) {
  Catalog catalog = {makeTrack(1, 0, 0, 0), makeTrack(2, 0, 0, 0)};

  int first_wins = 0;
  const int trials = 2000;
  for (int trial = 0; trial < trials; ++trial) {
    Catalog ranked = assignRecencyRanks(rng_, catalog);
    if (ranked.front().id == 1) ++first_wins;
  }
  // Not tied to catalog order: expected 1000, standard deviation ~22
  EXPECT_GT(first_wins, 900);
  EXPECT_LT(first_wins, 1100);
}

TEST_F(WeightCalculatorTest, EmptyCatalogRanksToEmpty) {
  EXPECT_TRUE(assignRecencyRanks(rng_, Catalog{}).empty());
  EXPECT_TRUE(computeWeights(rng_, Catalog{}).empty());
}

// ============================================================================
// Weight formula
// ============================================================================

TEST_F(WeightCalculatorTest, UnratedUnplayedSingleTrack) {
  Track track = makeTrack(1, RATING_UNRATED, 0, 0);
  track.recency_rank = 1;
  // base 200 * (1000 * 1 / 1 + 1000 / 1)
  EXPECT_EQ(computeTrackWeight(track, 1), 400000);
}

TEST_F(WeightCalculatorTest, ExcludedRatingIsAlwaysZero) {
  for (int64_t playcount : {0, 1, 50}) {
    for (uint32_t rank : {1u, 3u, 10u}) {
      Track track = makeTrack(1, RATING_EXCLUDED, playcount, 12345);
      track.recency_rank = rank;
      EXPECT_EQ(computeTrackWeight(track, 10), 0);
    }
  }
}

TEST_F(WeightCalculatorTest, RatedTrackUsesRatingAsBase) {
  Track track = makeTrack(1, 60, 3, 999);
  track.recency_rank = 2;
  // recency 1000 * 2 / 4 = 500, playcount 1000 / 4 = 250
  EXPECT_EQ(computeTrackWeight(track, 4), 60 * (500 + 250));
}

TEST_F(WeightCalculatorTest, TermsUseIntegerFloorDivision) {
  Track track = makeTrack(1, 5, 2, 999);
  track.recency_rank = 1;
  // 1000 / 3 = 333 for both terms
  EXPECT_EQ(computeTrackWeight(track, 3), 5 * (333 + 333));
}

TEST_F(WeightCalculatorTest, HugePlaycountContributesNothing) {
  Track track = makeTrack(1, 60, std::numeric_limits<int64_t>::max(), 999);
  track.recency_rank = 2;
  // Only the recency term 1000 * 2 / 4 = 500 remains
  EXPECT_EQ(computeTrackWeight(track, 4), 60 * 500);

  track.playcount = WEIGHT_SCALE;
  EXPECT_EQ(computeTrackWeight(track, 4), 60 * 500);
  track.playcount = WEIGHT_SCALE - 1;
  EXPECT_EQ(computeTrackWeight(track, 4), 60 * (500 + 1));
}

TEST_F(WeightCalculatorTest, UnratedOutweighsAnyOrdinaryRating) {
  Track unrated = makeTrack(1, RATING_UNRATED, 4, 0);
  Track rated = makeTrack(2, 19, 4, 0);
  unrated.recency_rank = rated.recency_rank = 5;
  EXPECT_GT(computeTrackWeight(unrated, 8), computeTrackWeight(rated, 8));
}

TEST_F(WeightCalculatorTest, LessRecentAndLessPlayedWeighMore) {
  Track recent = makeTrack(1, 10, 0, 0);
  Track stale = makeTrack(2, 10, 0, 0);
  recent.recency_rank = 1;
  stale.recency_rank = 8;
  EXPECT_LT(computeTrackWeight(recent, 8), computeTrackWeight(stale, 8));

  Track often = makeTrack(3, 10, 20, 0);
  Track rarely = makeTrack(4, 10, 1, 0);
  often.recency_rank = rarely.recency_rank = 4;
  EXPECT_LT(computeTrackWeight(often, 8), computeTrackWeight(rarely, 8));
}

// ============================================================================
// computeWeights
// ============================================================================

TEST_F(WeightCalculatorTest, ComputeWeightsAnnotatesEveryTrack) {
  Catalog catalog = {
      makeTrack(1, 0, 0, 0),
      makeTrack(2, 20, 9, 500),
      makeTrack(3, 12, 2, 400),
  };

  Catalog weighted = computeWeights(rng_, catalog);
  ASSERT_EQ(weighted.size(), 3u);
  for (const auto& track : weighted) {
    EXPECT_GE(track.weight, 0);
    EXPECT_EQ(track.weight, computeTrackWeight(track, weighted.size()));
    if (track.id == 2) {
      EXPECT_EQ(track.weight, 0);
      EXPECT_EQ(track.recency_rank, 1u);
    }
    if (track.id == 1) {
      // Never played: last in recency, 200 * (1000 + 1000)
      EXPECT_EQ(track.recency_rank, 3u);
      EXPECT_EQ(track.weight, 400000);
    }
  }
}

TEST_F(WeightCalculatorTest, ComputeWeightsLeavesInputUntouched) {
  Catalog catalog = {makeTrack(1, 0, 0, 0), makeTrack(2, 7, 1, 10)};
  Catalog copy = catalog;
  computeWeights(rng_, catalog);
  for (size_t i = 0; i < catalog.size(); ++i) {
    EXPECT_EQ(catalog[i].id, copy[i].id);
    EXPECT_EQ(catalog[i].recency_rank, 0u);
    EXPECT_EQ(catalog[i].weight, 0);
  }
}

}  // namespace
}  // namespace runthrough
