#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <vector>

#include "ratinggraph_preprocess/split/seeded_shuffler.h"

namespace ratinggraph::split {
namespace {

TEST(SeededShufflerTest, MatchesLegacyMersenneTwisterPermutation) {
  // Legacy RandomState(0).permutation(10).
  SeededShuffler shuffler(0);
  EXPECT_EQ(shuffler.Permutation(10), (std::vector<int64_t>{2, 8, 4, 9, 1, 6, 7, 3, 0, 5}));
}

TEST(SeededShufflerTest, SameSeedSameOrder) {
  SeededShuffler a(1234);
  SeededShuffler b(1234);
  EXPECT_EQ(a.Permutation(500), b.Permutation(500));
}

TEST(SeededShufflerTest, DifferentSeedsDiffer) {
  SeededShuffler a(1);
  SeededShuffler b(2);
  EXPECT_NE(a.Permutation(100), b.Permutation(100));
}

TEST(SeededShufflerTest, PermutationIsAPermutation) {
  SeededShuffler shuffler(7);
  auto perm = shuffler.Permutation(257);
  std::sort(perm.begin(), perm.end());
  std::vector<int64_t> expected(257);
  std::iota(expected.begin(), expected.end(), int64_t{0});
  EXPECT_EQ(perm, expected);
}

TEST(SeededShufflerTest, ShuffleAgreesWithPermutation) {
  std::vector<int64_t> values(50);
  std::iota(values.begin(), values.end(), int64_t{0});
  SeededShuffler(99).Shuffle(values);
  EXPECT_EQ(values, SeededShuffler(99).Permutation(50));
}

TEST(SeededShufflerTest, IntervalStaysInRange) {
  SeededShuffler shuffler(5);
  EXPECT_EQ(shuffler.Interval(0), 0u);
  for (uint64_t max : {1ull, 2ull, 3ull, 1000ull, 0x100000000ull}) {
    for (int i = 0; i < 200; ++i) {
      EXPECT_LE(shuffler.Interval(max), max);
    }
  }
}

TEST(SeededShufflerTest, ChooseWithoutReplacementIsPermutationHead) {
  auto head = SeededShuffler(42).ChooseWithoutReplacement(30, 4);
  auto perm = SeededShuffler(42).Permutation(30);
  ASSERT_EQ(head.size(), 4u);
  EXPECT_TRUE(std::equal(head.begin(), head.end(), perm.begin()));
}

TEST(SeededShufflerTest, RejectsBadCounts) {
  SeededShuffler shuffler(1);
  EXPECT_THROW(shuffler.Permutation(-1), std::invalid_argument);
  EXPECT_THROW(shuffler.ChooseWithoutReplacement(3, 4), std::invalid_argument);
  EXPECT_THROW(shuffler.ChooseWithoutReplacement(3, -1), std::invalid_argument);
  EXPECT_TRUE(shuffler.ChooseWithoutReplacement(0, 0).empty());
}

}  // namespace
}  // namespace ratinggraph::split
