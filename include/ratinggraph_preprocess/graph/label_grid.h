#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace ratinggraph::graph {

// Label of a (user, item) cell with no observed rating. Class indices are >= 0.
constexpr int32_t kNeutralLabel = -1;

// Sparse num_users x num_items grid of class indices keyed by flat index.
class LabelGrid {
 public:
  LabelGrid(int64_t num_users, int64_t num_items);

  // Later assignments to the same cell overwrite earlier ones.
  void Assign(int64_t user, int64_t item, int32_t label);

  int32_t At(int64_t user, int64_t item) const;
  int32_t AtFlat(int64_t flat_index) const;
  std::vector<int32_t> Gather(const std::vector<int64_t>& flat_indices) const;

  int64_t NumUsers() const { return num_users_; }
  int64_t NumItems() const { return num_items_; }
  int64_t NumObserved() const { return static_cast<int64_t>(labels_.size()); }

 private:
  void CheckBounds(int64_t user, int64_t item) const;

  int64_t num_users_;
  int64_t num_items_;
  std::unordered_map<int64_t, int32_t> labels_;
};

}  // namespace ratinggraph::graph
