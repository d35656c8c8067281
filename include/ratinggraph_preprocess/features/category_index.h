#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

#include "ratinggraph_preprocess/mapping/id_mapper.h"

namespace ratinggraph::features {

// One-hot column block: distinct values numbered by first occurrence,
// shifted so the block begins at column `start`.
template <typename Value>
class CategoryIndex {
 public:
  explicit CategoryIndex(int64_t start = 0) : start_(start) {}

  template <typename Range>
  static CategoryIndex FromValues(const Range& values, int64_t start = 0) {
    CategoryIndex index(start);
    for (const auto& v : values) {
      index.Add(v);
    }
    return index;
  }

  int64_t Add(const Value& value) { return start_ + ids_.Add(value); }

  std::optional<int64_t> Column(const Value& value) const {
    auto id = ids_.Find(value);
    if (!id) {
      return std::nullopt;
    }
    return start_ + *id;
  }

  int64_t Start() const { return start_; }
  int64_t End() const { return start_ + ids_.size(); }
  int64_t size() const { return ids_.size(); }

 private:
  int64_t start_;
  mapping::IdMap<Value> ids_;
};

// value / max(values). An all-zero or empty column leaves the values at zero.
inline std::vector<float> ScaleByMax(const std::vector<double>& values) {
  std::vector<float> out(values.size(), 0.0f);
  if (values.empty()) {
    return out;
  }
  const double max_value = *std::max_element(values.begin(), values.end());
  if (max_value == 0.0) {
    return out;
  }
  for (size_t i = 0; i < values.size(); ++i) {
    out[i] = static_cast<float>(values[i] / max_value);
  }
  return out;
}

}  // namespace ratinggraph::features
