#pragma once

#include <string>

#include "ratinggraph_preprocess/dataloaders/base_loader.h"
#include "ratinggraph_preprocess/graph/sparse_types.h"
#include "ratinggraph_preprocess/split/rating_edges.h"

namespace ratinggraph::dataloaders {

// Flixster, Douban and Yahoo Music from training_test_dataset.mat: the rating
// matrix M and the Otraining / Otest observation masks.
class MontiLoader : public RatingLoader {
 public:
  using RatingLoader::RatingLoader;

  split::SplitBundle Load() const override;
  std::string Name() const override { return "MontiLoader"; }

  // Nonzeros of `m` in row-major order.
  static split::RatingEdges EdgesFromMatrix(const SparseMatrix& m);
  static split::EdgePairs PositionsFromMask(const SparseMatrix& mask);
};

}  // namespace ratinggraph::dataloaders
