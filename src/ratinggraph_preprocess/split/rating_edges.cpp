#include "ratinggraph_preprocess/split/rating_edges.h"

#include <stdexcept>
#include <string>

#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::split {

void RatingEdges::Validate() const {
  if (users.size() != ratings.size() || items.size() != ratings.size()) {
    throw std::invalid_argument("RatingEdges arrays have different lengths.");
  }
  if (num_users < 0 || num_items < 0) {
    throw std::invalid_argument("RatingEdges dimensions must be non-negative.");
  }
  for (size_t i = 0; i < ratings.size(); ++i) {
    if (users[i] < 0 || users[i] >= num_users || items[i] < 0 || items[i] >= num_items) {
      throw std::invalid_argument("RatingEdges index out of range at edge " + std::to_string(i));
    }
  }
}

std::vector<int64_t> EdgePairs::FlatIndices(int64_t num_items) const {
  std::vector<int64_t> out;
  out.reserve(users.size());
  for (size_t i = 0; i < users.size(); ++i) {
    out.push_back(FlatIndex(users[i], items[i], num_items));
  }
  return out;
}

}  // namespace ratinggraph::split
