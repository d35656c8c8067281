#include <gtest/gtest.h>

#include <vector>

#include "ratinggraph_preprocess/io/split_cache.h"
#include "test_utils.h"

namespace ratinggraph::io {
namespace {

using ratinggraph::testing::TempDir;
using ratinggraph::testing::WriteFile;

CachedRatings SampleRatings() {
  CachedRatings cached;
  cached.edges.num_users = 3;
  cached.edges.num_items = 2;
  cached.edges.users = {2, 0, 1, 0};
  cached.edges.items = {1, 0, 1, 1};
  cached.edges.ratings = {4.0, 1.5, 3.0, 5.0};

  std::vector<Triplet> user = {{0, 0, 0.5f}, {2, 3, 1.0f}};
  cached.user_features = SparseMatrix(3, 4);
  cached.user_features.setFromTriplets(user.begin(), user.end());
  std::vector<Triplet> item = {{1, 0, 2.0f}};
  cached.item_features = SparseMatrix(2, 1);
  cached.item_features.setFromTriplets(item.begin(), item.end());
  return cached;
}

TEST(SplitCacheTest, PreservesEdgeOrderAndFeatures) {
  TempDir dir;
  SplitCache cache(dir.File("nested/split_seed1234.parquet"));
  EXPECT_FALSE(cache.Exists());

  const auto original = SampleRatings();
  cache.Write(original);
  ASSERT_TRUE(cache.Exists());

  const auto loaded = cache.Read();
  EXPECT_EQ(loaded.edges.num_users, 3);
  EXPECT_EQ(loaded.edges.num_items, 2);
  EXPECT_EQ(loaded.edges.users, original.edges.users);
  EXPECT_EQ(loaded.edges.items, original.edges.items);
  EXPECT_EQ(loaded.edges.ratings, original.edges.ratings);

  EXPECT_EQ(loaded.user_features.rows(), 3);
  EXPECT_EQ(loaded.user_features.cols(), 4);
  EXPECT_FLOAT_EQ(loaded.user_features.coeff(2, 3), 1.0f);
  EXPECT_EQ(loaded.item_features.rows(), 2);
  EXPECT_EQ(loaded.item_features.cols(), 1);
  EXPECT_FLOAT_EQ(loaded.item_features.coeff(1, 0), 2.0f);
}

TEST(SplitCacheTest, MissingFileThrows) {
  TempDir dir;
  EXPECT_THROW(SplitCache(dir.File("absent.parquet")).Read(), std::runtime_error);
  EXPECT_FALSE(SplitCache("").Exists());
}

TEST(SplitCacheTest, InvalidEdgesAreNotWritten) {
  TempDir dir;
  auto cached = SampleRatings();
  cached.edges.users[0] = 3;
  SplitCache cache(dir.File("bad.parquet"));
  EXPECT_THROW(cache.Write(cached), std::invalid_argument);
  EXPECT_FALSE(cache.Exists());
}

}  // namespace
}  // namespace ratinggraph::io
