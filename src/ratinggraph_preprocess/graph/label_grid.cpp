#include "ratinggraph_preprocess/graph/label_grid.h"

#include <stdexcept>
#include <string>

#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::graph {

LabelGrid::LabelGrid(int64_t num_users, int64_t num_items)
    : num_users_(num_users), num_items_(num_items) {
  if (num_users < 0 || num_items < 0) {
    throw std::invalid_argument("LabelGrid dimensions must be non-negative.");
  }
}

void LabelGrid::CheckBounds(int64_t user, int64_t item) const {
  if (user < 0 || user >= num_users_ || item < 0 || item >= num_items_) {
    throw std::out_of_range("LabelGrid cell out of range: (" + std::to_string(user) + ", " +
                            std::to_string(item) + ")");
  }
}

void LabelGrid::Assign(int64_t user, int64_t item, int32_t label) {
  CheckBounds(user, item);
  if (label < 0) {
    throw std::invalid_argument("LabelGrid labels must be class indices (>= 0).");
  }
  labels_[FlatIndex(user, item, num_items_)] = label;
}

int32_t LabelGrid::At(int64_t user, int64_t item) const {
  CheckBounds(user, item);
  return AtFlat(FlatIndex(user, item, num_items_));
}

int32_t LabelGrid::AtFlat(int64_t flat_index) const {
  auto it = labels_.find(flat_index);
  return it == labels_.end() ? kNeutralLabel : it->second;
}

std::vector<int32_t> LabelGrid::Gather(const std::vector<int64_t>& flat_indices) const {
  std::vector<int32_t> out;
  out.reserve(flat_indices.size());
  for (auto idx : flat_indices) {
    out.push_back(AtFlat(idx));
  }
  return out;
}

}  // namespace ratinggraph::graph
