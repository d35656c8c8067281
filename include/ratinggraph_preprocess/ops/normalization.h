#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::ops {

// Divides every row by its sum. Rows summing to zero come out all-zero.
// Throws std::runtime_error if the whole result is the zero matrix.
SparseMatrix NormalizeFeatures(const SparseMatrix& features);

// Sums the adjacencies, takes row (user) and column (item) degrees of the sum
// and rescales each input. Symmetric: D_u^-1/2 A D_v^-1/2. Otherwise: D_u^-1 A.
// Zero degrees act as infinite, zeroing their rows/columns.
std::vector<SparseMatrix> GloballyNormalizeBipartiteAdjacency(
    const std::vector<SparseMatrix>& adjacencies,
    bool symmetric = true);

struct StackedFeatures {
  SparseMatrix user_features;  // [users | 0]
  SparseMatrix item_features;  // [0 | items]
};

// Pads both sides into one shared column space: user columns first, item columns second.
StackedFeatures StackUserItemFeatures(const SparseMatrix& user_features,
                                      const SparseMatrix& item_features);

// Coordinate form of a sparse matrix, entries in row-major scan order.
struct SparseTuple {
  std::vector<std::pair<int64_t, int64_t>> coords;
  std::vector<float> values;
  std::pair<int64_t, int64_t> shape{0, 0};
};

SparseTuple SparseToTuple(const SparseMatrix& matrix);
SparseMatrix TupleToSparse(const SparseTuple& tuple);

}  // namespace ratinggraph::ops
