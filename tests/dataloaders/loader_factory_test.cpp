#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fixtures/dataset_fixtures.h"
#include "fixtures/mat_file_writer.h"
#include "ratinggraph_preprocess/dataloaders/book_crossing_loader.h"
#include "ratinggraph_preprocess/dataloaders/loader_factory.h"
#include "ratinggraph_preprocess/dataloaders/monti_loader.h"
#include "ratinggraph_preprocess/dataloaders/rating_files.h"
#include "ratinggraph_preprocess/dataloaders/ratio_split_loader.h"
#include "test_utils.h"

namespace ratinggraph::dataloaders {
namespace {

using ratinggraph::testing::MatFileWriter;
using ratinggraph::testing::TempDir;

size_t TotalEdges(const split::SplitBundle& bundle) {
  return bundle.train.size() + bundle.val.size() + bundle.test.size();
}

TEST(LoaderOptionsTest, DefaultsAndCachePath) {
  LoaderOptions options;
  options.LoadConfig({{"dataset", "ml_1m"}, {"data_root", "/data"}, {"seed", 7}});
  EXPECT_EQ(options.DatasetName(), "ml_1m");
  EXPECT_EQ(options.split, "official");
  EXPECT_FALSE(options.testing);
  EXPECT_EQ(options.DatasetDir(), "/data/ml_1m");
  EXPECT_EQ(options.CachePath(), "/data/ml_1m/split_seed7.parquet");

  options.LoadConfig({{"datasplit_path", "/tmp/custom.parquet"}});
  EXPECT_EQ(options.CachePath(), "/tmp/custom.parquet");
}

TEST(LoaderOptionsTest, RejectsUnknownKeysAndBadTypes) {
  LoaderOptions options;
  EXPECT_THROW(options.LoadConfig({{"datset", "ml_1m"}}), std::invalid_argument);
  EXPECT_THROW(options.LoadConfig({{"seed", "abc"}}), std::invalid_argument);
  EXPECT_THROW(options.LoadConfig({{"dataset", "netflix"}}), std::invalid_argument);
  EXPECT_THROW(options.LoadConfig(nlohmann::json::array()), std::invalid_argument);
}

TEST(LoaderFactoryTest, SelectsLoaderPerDatasetAndSplit) {
  EXPECT_EQ(MakeLoader({{"dataset", "ml_100k"}})->Name(), "OfficialSplitLoader");
  EXPECT_EQ(MakeLoader({{"dataset", "ml_100k"}, {"split", "ratio"}})->Name(), "RatioSplitLoader");
  EXPECT_EQ(MakeLoader({{"dataset", "ml_1m"}, {"split", "ratio"}})->Name(), "RatioSplitLoader");
  EXPECT_EQ(MakeLoader({{"dataset", "douban"}, {"split", "masked"}})->Name(), "MontiLoader");
  EXPECT_EQ(MakeLoader({{"dataset", "yahoo_music"}})->Name(), "MontiLoader");
  EXPECT_EQ(MakeLoader({{"dataset", "book_crossing"}})->Name(), "BookCrossingLoader");
}

TEST(LoaderFactoryTest, UnsupportedPairsThrow) {
  EXPECT_THROW(MakeLoader({{"dataset", "ml_1m"}, {"split", "official"}}), std::invalid_argument);
  EXPECT_THROW(MakeLoader({{"dataset", "flixster"}, {"split", "ratio"}}), std::invalid_argument);
  EXPECT_THROW(MakeLoader({{"dataset", "ml_100k"}, {"split", "random"}}), std::invalid_argument);
  EXPECT_THROW(MakeLoader({{"dataset", "book_crossing"}, {"split", "ratio"}}),
               std::invalid_argument);
}

TEST(RatingFilesTest, MapsIdsByFirstOccurrence) {
  RawRatings raw;
  raw.users = {10, 20, 10};
  raw.items = {5, 5, 9};
  raw.ratings = {1, 2, 3};
  const auto mapped = MapRatings(raw);
  EXPECT_EQ(mapped.edges.num_users, 2);
  EXPECT_EQ(mapped.edges.num_items, 2);
  EXPECT_EQ(mapped.edges.users, (std::vector<int64_t>{0, 1, 0}));
  EXPECT_EQ(mapped.edges.items, (std::vector<int64_t>{0, 0, 1}));
  EXPECT_EQ(mapped.user_ids.RawId(1), 20);

  const auto picked = raw.Select({2, 0});
  EXPECT_EQ(picked.users, (std::vector<int64_t>{10, 10}));
  EXPECT_EQ(picked.ratings, (std::vector<double>{3, 1}));
}

TEST(RatingFilesTest, ReadsDoubleColonRatings) {
  TempDir dir;
  ratinggraph::testing::WriteMl1m(dir.str());
  const auto raw = ReadDoubleColonRatings(dir.File("ratings.dat"));
  ASSERT_EQ(raw.size(), 8u);
  EXPECT_EQ(raw.users[1], 1);
  EXPECT_EQ(raw.items[1], 3);
  EXPECT_DOUBLE_EQ(raw.ratings[1], 3.0);
}

TEST(OfficialSplitLoaderTest, Ml100kEndToEnd) {
  TempDir root;
  ratinggraph::testing::WriteMl100k((root.path() / "ml_100k").string());

  auto bundle = LoadSplit({{"dataset", "ml_100k"}, {"data_root", root.str()}});
  EXPECT_EQ(bundle.num_users, 4);
  EXPECT_EQ(bundle.num_items, 5);
  EXPECT_EQ(bundle.class_values, (std::vector<double>{1, 2, 3, 4, 5}));
  // ceil(0.2 * 10) validation rows carved from u1.base; u1.test is the test set.
  EXPECT_EQ(bundle.val.size(), 2u);
  EXPECT_EQ(bundle.train.size(), 8u);
  ASSERT_EQ(bundle.test.size(), 4u);
  // u1.test row 0: user 3 / movie 1 -> dense (2, 0), rating 4 -> class 3.
  EXPECT_EQ(bundle.test.users[0], 2);
  EXPECT_EQ(bundle.test.items[0], 0);
  EXPECT_EQ(bundle.test.labels[0], 3);

  EXPECT_EQ(bundle.user_features.rows(), 4);
  EXPECT_EQ(bundle.user_features.cols(), 5);
  EXPECT_EQ(bundle.item_features.rows(), 5);
  EXPECT_EQ(bundle.item_features.cols(), 19);
  EXPECT_EQ(bundle.train_adjacency.nonZeros(), 8);
}

TEST(OfficialSplitLoaderTest, TestingModeTrainsOnValidation) {
  TempDir root;
  ratinggraph::testing::WriteMl100k((root.path() / "ml_100k").string());
  auto bundle =
      LoadSplit({{"dataset", "ml_100k"}, {"data_root", root.str()}, {"testing", true}});
  EXPECT_EQ(bundle.train.size(), 10u);
  EXPECT_EQ(bundle.train_adjacency.nonZeros(), 10);
  EXPECT_EQ(bundle.test.size(), 4u);
}

TEST(RatioSplitLoaderTest, Ml1mWritesAndReusesTheCache) {
  TempDir root;
  ratinggraph::testing::WriteMl1m((root.path() / "ml_1m").string());
  const nlohmann::json cfg = {{"dataset", "ml_1m"},
                              {"split", "ratio"},
                              {"data_root", root.str()},
                              {"seed", 1234},
                              {"datasplit_from_file", true}};

  auto first = LoadSplit(cfg);
  EXPECT_EQ(TotalEdges(first), 8u);
  // ceil(0.8) test, ceil(0.36) validation.
  EXPECT_EQ(first.test.size(), 1u);
  EXPECT_EQ(first.val.size(), 1u);
  EXPECT_EQ(first.train.size(), 6u);
  EXPECT_EQ(first.user_features.cols(), 11);
  EXPECT_EQ(first.item_features.cols(), 9);

  const auto cache_path = (root.path() / "ml_1m" / "split_seed1234.parquet").string();
  ASSERT_TRUE(std::filesystem::exists(cache_path));
  // Remove the raw ratings so a second load can only come from the cache.
  std::filesystem::remove(root.path() / "ml_1m" / "ratings.dat");

  auto second = LoadSplit(cfg);
  EXPECT_EQ(second.train.users, first.train.users);
  EXPECT_EQ(second.train.items, first.train.items);
  EXPECT_EQ(second.test.labels, first.test.labels);
  EXPECT_EQ(second.user_features.nonZeros(), first.user_features.nonZeros());
}

TEST(RatioSplitLoaderTest, SeedChangesTheShuffle) {
  TempDir root;
  ratinggraph::testing::WriteMl100k((root.path() / "ml_100k").string());
  RatioSplitLoader a(LoaderOptions{});
  a.LoadConfig({{"dataset", "ml_100k"}, {"split", "ratio"}, {"data_root", root.str()}});
  RatioSplitLoader b(LoaderOptions{});
  b.LoadConfig({{"dataset", "ml_100k"}, {"split", "ratio"}, {"data_root", root.str()},
                {"seed", 99}});

  const auto raw_a = a.LoadRaw();
  const auto raw_b = b.LoadRaw();
  EXPECT_EQ(raw_a.edges.size(), 14u);
  EXPECT_EQ(raw_a.edges.num_users, 4);
  EXPECT_NE(raw_a.edges.ratings, raw_b.edges.ratings);
  EXPECT_EQ(a.LoadRaw().edges.users, raw_a.edges.users);
}

TEST(MontiLoaderTest, MasksDefineTheSplit) {
  TempDir root;
  const auto dir = root.path() / "douban";
  std::filesystem::create_directories(dir);
  {
    MatFileWriter writer((dir / "training_test_dataset.mat").string());
    ASSERT_TRUE(writer.ok());
    // M (3 x 4), column-major:
    // [[5, 0, 3, 0],
    //  [0, 4, 0, 1],
    //  [2, 0, 0, 5]]
    writer.WriteDense("M", 3, 4, {5, 0, 2, 0, 4, 0, 3, 0, 0, 0, 1, 5});
    writer.WriteDense("Otraining", 3, 4, {1, 0, 1, 0, 1, 0, 1, 0, 0, 0, 0, 0});
    writer.WriteDense("Otest", 3, 4, {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1});
    writer.WriteDense("W_users", 3, 2, {1, 0, 1, 0, 1, 1});
  }

  auto bundle = LoadSplit({{"dataset", "douban"}, {"split", "masked"}, {"data_root", root.str()}});
  EXPECT_EQ(bundle.num_users, 3);
  EXPECT_EQ(bundle.num_items, 4);
  EXPECT_EQ(TotalEdges(bundle), 6u);
  EXPECT_EQ(bundle.val.size(), 1u);
  ASSERT_EQ(bundle.test.size(), 2u);
  // Otest scanned row-major: (1, 3) then (2, 3).
  EXPECT_EQ(bundle.test.users, (std::vector<int64_t>{1, 2}));
  EXPECT_EQ(bundle.test.items, (std::vector<int64_t>{3, 3}));
  EXPECT_EQ(bundle.class_values, (std::vector<double>{1, 2, 3, 4, 5}));
  EXPECT_EQ(bundle.user_features.cols(), 2);
  EXPECT_EQ(bundle.item_features.rows(), 4);
  EXPECT_EQ(bundle.item_features.cols(), 4);
}

TEST(MontiLoaderTest, EdgesScanRowMajor) {
  std::vector<Triplet> triplets = {{1, 0, 2.0f}, {0, 2, 4.0f}, {0, 1, 3.0f}};
  SparseMatrix m(2, 3);
  m.setFromTriplets(triplets.begin(), triplets.end());
  const auto edges = MontiLoader::EdgesFromMatrix(m);
  EXPECT_EQ(edges.users, (std::vector<int64_t>{0, 0, 1}));
  EXPECT_EQ(edges.items, (std::vector<int64_t>{1, 2, 0}));
  EXPECT_EQ(edges.ratings, (std::vector<double>{3, 4, 2}));
}

TEST(MontiLoaderTest, StoredZerosAreNotEdges) {
  std::vector<Triplet> triplets = {{0, 1, 5.0f}, {1, 1, 1.0f}};
  SparseMatrix m(2, 3);
  m.setFromTriplets(triplets.begin(), triplets.end());
  m.coeffRef(1, 2) = 0.0f;
  m.makeCompressed();
  ASSERT_EQ(m.nonZeros(), 3);

  const auto edges = MontiLoader::EdgesFromMatrix(m);
  EXPECT_EQ(edges.users, (std::vector<int64_t>{0, 1}));
  EXPECT_EQ(edges.items, (std::vector<int64_t>{1, 1}));
  EXPECT_EQ(edges.ratings, (std::vector<double>{5, 1}));
}

TEST(BookCrossingLoaderTest, TestRowsAreSortedAndSized) {
  const auto rows = BookCrossingLoader::TestRows(25, 10, 42);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_LT(rows[0], rows[1]);
  EXPECT_LT(rows[1], 25u);
  EXPECT_EQ(rows, BookCrossingLoader::TestRows(25, 10, 42));
  EXPECT_TRUE(BookCrossingLoader::TestRows(9, 10, 42).empty());
}

TEST(BookCrossingLoaderTest, FiltersThenSplits) {
  TempDir root;
  ratinggraph::testing::WriteBookCrossingRaw((root.path() / "book_crossing_original").string());

  const nlohmann::json cfg = {{"dataset", "book_crossing"},
                              {"data_root", root.str()},
                              {"book_crossing", {{"test_divisor", 5}}}};
  auto bundle = LoadSplit(cfg);
  EXPECT_TRUE(std::filesystem::exists(root.path() / "book_crossing_edited" /
                                      "BX-Book-Ratings_filtered.csv"));
  EXPECT_EQ(TotalEdges(bundle), 5u);
  EXPECT_EQ(bundle.test.size(), 1u);
  EXPECT_EQ(bundle.val.size(), 1u);
  EXPECT_EQ(bundle.num_users, 3);
  EXPECT_EQ(bundle.num_items, 3);
  // Ratings 3, 6, 8, 9, 10.
  EXPECT_EQ(bundle.class_values.size(), 5u);
  EXPECT_EQ(bundle.user_features.cols(), 1);
  // Scaled year plus three authors.
  EXPECT_EQ(bundle.item_features.cols(), 4);

  EXPECT_THROW(MakeLoader({{"dataset", "book_crossing"}, {"book_crossing", {{"test_divisor", 0}}}}),
               std::invalid_argument);
}

}  // namespace
}  // namespace ratinggraph::dataloaders
