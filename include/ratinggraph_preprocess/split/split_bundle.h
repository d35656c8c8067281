#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::split {

// Labeled edges of one partition; the three arrays are parallel.
struct EdgeSet {
  std::vector<int32_t> labels;
  std::vector<int64_t> users;
  std::vector<int64_t> items;

  size_t size() const { return labels.size(); }
};

// Everything the training loop consumes for one preprocessing run.
struct SplitBundle {
  SparseMatrix user_features;
  SparseMatrix item_features;
  SparseMatrix train_adjacency;  // class_index + 1 on training edges
  EdgeSet train;
  EdgeSet val;
  EdgeSet test;
  std::vector<double> class_values;  // sorted; class index = position
  int64_t num_users{0};
  int64_t num_items{0};
};

}  // namespace ratinggraph::split
