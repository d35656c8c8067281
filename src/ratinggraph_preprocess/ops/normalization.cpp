#include "ratinggraph_preprocess/ops/normalization.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <Eigen/Core>
#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::ops {

namespace {

using Vector = Eigen::Matrix<float, Eigen::Dynamic, 1>;

// 1 / degree^power with zero degrees treated as infinite.
Vector InverseDegree(Vector degree, float power) {
  for (Eigen::Index i = 0; i < degree.size(); ++i) {
    if (degree[i] == 0.0f) {
      degree[i] = std::numeric_limits<float>::infinity();
    }
    degree[i] = 1.0f / std::pow(degree[i], power);
  }
  return degree;
}

Vector RowSums(const SparseMatrix& m) {
  Vector sums = Vector::Zero(m.rows());
  for (Eigen::Index r = 0; r < m.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(m, r); it; ++it) {
      sums[r] += it.value();
    }
  }
  return sums;
}

Vector ColSums(const SparseMatrix& m) {
  Vector sums = Vector::Zero(m.cols());
  for (Eigen::Index r = 0; r < m.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(m, r); it; ++it) {
      sums[it.col()] += it.value();
    }
  }
  return sums;
}

}  // namespace

SparseMatrix NormalizeFeatures(const SparseMatrix& features) {
  utils::timing::ScopedTimer timer("ops.normalize_features");
  const Vector inv = InverseDegree(RowSums(features), 1.0f);
  SparseMatrix out = inv.asDiagonal() * features;
  out.prune(0.0f);
  out.makeCompressed();
  if (out.nonZeros() == 0) {
    spdlog::error("[Normalization] normalized matrix ({}x{}) has only zero entries.", out.rows(),
                  out.cols());
    throw std::runtime_error("NormalizeFeatures: normalized matrix has only zero entries.");
  }
  return out;
}

std::vector<SparseMatrix> GloballyNormalizeBipartiteAdjacency(
    const std::vector<SparseMatrix>& adjacencies,
    bool symmetric) {
  utils::timing::ScopedTimer timer("ops.normalize_bipartite_adjacency");
  if (adjacencies.empty()) {
    return {};
  }
  spdlog::debug("[Normalization] {} normalizing {} bipartite adjacencies",
                symmetric ? "symmetrically" : "row-", adjacencies.size());

  SparseMatrix total = adjacencies.front();
  for (size_t i = 1; i < adjacencies.size(); ++i) {
    const auto& adj = adjacencies[i];
    if (adj.rows() != total.rows() || adj.cols() != total.cols()) {
      throw std::invalid_argument("Bipartite adjacencies must share one shape.");
    }
    total += adj;
  }

  const Vector degree_u_inv_sqrt = InverseDegree(RowSums(total), 0.5f);
  const Vector degree_v_inv_sqrt = InverseDegree(ColSums(total), 0.5f);

  std::vector<SparseMatrix> out;
  out.reserve(adjacencies.size());
  if (symmetric) {
    for (const auto& adj : adjacencies) {
      SparseMatrix norm = degree_u_inv_sqrt.asDiagonal() * adj * degree_v_inv_sqrt.asDiagonal();
      norm.makeCompressed();
      out.push_back(std::move(norm));
    }
  } else {
    const Vector degree_u_inv = degree_u_inv_sqrt.cwiseProduct(degree_u_inv_sqrt);
    for (const auto& adj : adjacencies) {
      SparseMatrix norm = degree_u_inv.asDiagonal() * adj;
      norm.makeCompressed();
      out.push_back(std::move(norm));
    }
  }
  return out;
}

StackedFeatures StackUserItemFeatures(const SparseMatrix& user_features,
                                      const SparseMatrix& item_features) {
  const int64_t user_cols = user_features.cols();
  const int64_t total_cols = user_cols + item_features.cols();

  StackedFeatures out;
  out.user_features = SparseMatrix(user_features.rows(), total_cols);
  out.item_features = SparseMatrix(item_features.rows(), total_cols);

  std::vector<Triplet> triplets;
  triplets.reserve(static_cast<size_t>(user_features.nonZeros()));
  for (Eigen::Index r = 0; r < user_features.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(user_features, r); it; ++it) {
      triplets.emplace_back(it.row(), it.col(), it.value());
    }
  }
  out.user_features.setFromTriplets(triplets.begin(), triplets.end());

  triplets.clear();
  triplets.reserve(static_cast<size_t>(item_features.nonZeros()));
  for (Eigen::Index r = 0; r < item_features.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(item_features, r); it; ++it) {
      triplets.emplace_back(it.row(), user_cols + it.col(), it.value());
    }
  }
  out.item_features.setFromTriplets(triplets.begin(), triplets.end());
  return out;
}

SparseTuple SparseToTuple(const SparseMatrix& matrix) {
  SparseTuple out;
  out.shape = {matrix.rows(), matrix.cols()};
  out.coords.reserve(static_cast<size_t>(matrix.nonZeros()));
  out.values.reserve(static_cast<size_t>(matrix.nonZeros()));
  for (Eigen::Index r = 0; r < matrix.outerSize(); ++r) {
    for (SparseMatrix::InnerIterator it(matrix, r); it; ++it) {
      out.coords.emplace_back(it.row(), it.col());
      out.values.push_back(it.value());
    }
  }
  return out;
}

SparseMatrix TupleToSparse(const SparseTuple& tuple) {
  if (tuple.coords.size() != tuple.values.size()) {
    throw std::invalid_argument("SparseTuple coords and values differ in length.");
  }
  std::vector<Triplet> triplets;
  triplets.reserve(tuple.values.size());
  for (size_t i = 0; i < tuple.values.size(); ++i) {
    const auto& rc = tuple.coords[i];
    if (rc.first < 0 || rc.first >= tuple.shape.first || rc.second < 0 ||
        rc.second >= tuple.shape.second) {
      throw std::out_of_range("SparseTuple coordinate outside its shape.");
    }
    triplets.emplace_back(rc.first, rc.second, tuple.values[i]);
  }
  SparseMatrix out(tuple.shape.first, tuple.shape.second);
  out.setFromTriplets(triplets.begin(), triplets.end());
  return out;
}

}  // namespace ratinggraph::ops
