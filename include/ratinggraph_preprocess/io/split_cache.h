#pragma once

#include <string>
#include <utility>

#include "ratinggraph_preprocess/graph/sparse_types.h"
#include "ratinggraph_preprocess/split/rating_edges.h"

namespace ratinggraph::io {

// Pre-split ratings plus side features, as produced by a raw-file parse.
struct CachedRatings {
  split::RatingEdges edges;
  SparseMatrix user_features;
  SparseMatrix item_features;
};

// One-row Parquet file of list columns holding a CachedRatings.
class SplitCache {
 public:
  explicit SplitCache(std::string path) : path_(std::move(path)) {}

  bool Exists() const;
  void Write(const CachedRatings& cached) const;
  // Throws std::runtime_error on a missing file or column.
  CachedRatings Read() const;

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace ratinggraph::io
