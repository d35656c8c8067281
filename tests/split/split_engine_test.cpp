#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "ratinggraph_preprocess/graph/label_grid.h"
#include "ratinggraph_preprocess/split/split_engine.h"

namespace ratinggraph::split {
namespace {

// 4 users x 5 items, 12 observed cells, ratings drawn from {1, 2, 3, 4, 5}.
RatingEdges SampleEdges() {
  RatingEdges edges;
  edges.num_users = 4;
  edges.num_items = 5;
  const int64_t cells[][2] = {{0, 0}, {0, 3}, {1, 1}, {1, 4}, {2, 0}, {2, 2},
                              {3, 1}, {3, 3}, {0, 4}, {2, 4}, {1, 2}, {3, 0}};
  const double ratings[] = {5, 3, 1, 4, 2, 5, 3, 1, 4, 2, 3, 5};
  for (size_t i = 0; i < 12; ++i) {
    edges.users.push_back(cells[i][0]);
    edges.items.push_back(cells[i][1]);
    edges.ratings.push_back(ratings[i]);
  }
  return edges;
}

std::set<int64_t> FlatSet(const EdgeSet& set, int64_t num_items) {
  std::set<int64_t> out;
  for (size_t i = 0; i < set.size(); ++i) {
    out.insert(FlatIndex(set.users[i], set.items[i], num_items));
  }
  return out;
}

TEST(SplitEngineTest, PartitionsAreDisjointAndExhaustive) {
  const auto edges = SampleEdges();
  auto bundle = SplitEngine().Run(edges, OfficialSplit(10));

  EXPECT_EQ(bundle.train.size() + bundle.val.size() + bundle.test.size(), edges.size());
  const auto train = FlatSet(bundle.train, edges.num_items);
  const auto val = FlatSet(bundle.val, edges.num_items);
  const auto test = FlatSet(bundle.test, edges.num_items);
  std::set<int64_t> all(train.begin(), train.end());
  all.insert(val.begin(), val.end());
  all.insert(test.begin(), test.end());
  EXPECT_EQ(all.size(), edges.size());
}

TEST(SplitEngineTest, LabelsAreClassIndicesOfRatings) {
  const auto edges = SampleEdges();
  auto bundle = SplitEngine().Run(edges, OfficialSplit(10));
  EXPECT_EQ(bundle.class_values, (std::vector<double>{1, 2, 3, 4, 5}));

  for (const auto* set : {&bundle.train, &bundle.val, &bundle.test}) {
    for (size_t i = 0; i < set->size(); ++i) {
      double rating = 0;
      for (size_t e = 0; e < edges.size(); ++e) {
        if (edges.users[e] == set->users[i] && edges.items[e] == set->items[i]) {
          rating = edges.ratings[e];
        }
      }
      EXPECT_EQ(bundle.class_values[static_cast<size_t>(set->labels[i])], rating);
    }
  }
}

TEST(SplitEngineTest, AdjacencyHoldsExactlyTrainingEdges) {
  const auto edges = SampleEdges();
  auto bundle = SplitEngine().Run(edges, OfficialSplit(10));

  EXPECT_EQ(bundle.train_adjacency.rows(), 4);
  EXPECT_EQ(bundle.train_adjacency.cols(), 5);
  EXPECT_EQ(bundle.train_adjacency.nonZeros(), static_cast<int64_t>(bundle.train.size()));
  for (size_t i = 0; i < bundle.train.size(); ++i) {
    EXPECT_FLOAT_EQ(bundle.train_adjacency.coeff(bundle.train.users[i], bundle.train.items[i]),
                    static_cast<float>(bundle.train.labels[i] + 1));
  }
}

TEST(SplitEngineTest, TestingModeMergesValidationIntoTrain) {
  const auto edges = SampleEdges();
  auto tuning = SplitEngine(false).Run(edges, OfficialSplit(10));
  auto testing = SplitEngine(true).Run(edges, OfficialSplit(10));

  EXPECT_EQ(testing.train.size(), tuning.train.size() + tuning.val.size());
  EXPECT_EQ(testing.train_adjacency.nonZeros(), static_cast<int64_t>(testing.train.size()));
  EXPECT_EQ(testing.test.users, tuning.test.users);
  EXPECT_EQ(testing.test.items, tuning.test.items);
}

TEST(SplitEngineTest, RunIsDeterministic) {
  const auto edges = SampleEdges();
  auto a = SplitEngine().Run(edges, OfficialSplit(10));
  auto b = SplitEngine().Run(edges, OfficialSplit(10));
  EXPECT_EQ(a.train.users, b.train.users);
  EXPECT_EQ(a.train.items, b.train.items);
  EXPECT_EQ(a.val.labels, b.val.labels);
}

TEST(SplitEngineTest, MaskOnUnobservedCellIsRejected) {
  const auto edges = SampleEdges();
  EdgePairs train_mask;
  train_mask.Append(0, 0);
  EdgePairs test_mask;
  // (0, 1) carries no rating.
  test_mask.Append(0, 1);
  EXPECT_THROW(SplitEngine().Run(edges, MaskedSplit(train_mask, test_mask)), std::logic_error);
}

TEST(SplitEngineTest, InvalidEdgesAreRejected) {
  auto edges = SampleEdges();
  edges.items[0] = 5;
  EXPECT_THROW(SplitEngine().Run(edges, OfficialSplit(10)), std::invalid_argument);
}

}  // namespace
}  // namespace ratinggraph::split
