#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ratinggraph::split {

// Observed ratings in dense index space. Order is significant to the split strategies.
struct RatingEdges {
  int64_t num_users{0};
  int64_t num_items{0};
  std::vector<int64_t> users;
  std::vector<int64_t> items;
  std::vector<double> ratings;

  size_t size() const { return ratings.size(); }

  // Throws std::invalid_argument on ragged arrays or out-of-range indices.
  void Validate() const;
};

// (user, item) pairs without labels.
struct EdgePairs {
  std::vector<int64_t> users;
  std::vector<int64_t> items;

  size_t size() const { return users.size(); }

  void Append(int64_t user, int64_t item) {
    users.push_back(user);
    items.push_back(item);
  }

  std::vector<int64_t> FlatIndices(int64_t num_items) const;
};

struct EdgePartition {
  EdgePairs train;
  EdgePairs val;
  EdgePairs test;
};

}  // namespace ratinggraph::split
