#pragma once

#include <cstdint>

#include <Eigen/Sparse>

namespace ratinggraph {

// Compressed sparse row matrix used for adjacency and side features.
using SparseMatrix = Eigen::SparseMatrix<float, Eigen::RowMajor, int64_t>;
using Triplet = Eigen::Triplet<float, int64_t>;

// Cell (u, v) of a num_users x num_items grid flattened row-major.
inline int64_t FlatIndex(int64_t user, int64_t item, int64_t num_items) {
  return user * num_items + item;
}

}  // namespace ratinggraph
