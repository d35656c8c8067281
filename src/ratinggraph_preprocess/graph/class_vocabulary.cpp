#include "ratinggraph_preprocess/graph/class_vocabulary.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ratinggraph::graph {

ClassVocabulary ClassVocabulary::FromRatings(const std::vector<double>& ratings) {
  ClassVocabulary out;
  out.values_ = ratings;
  std::sort(out.values_.begin(), out.values_.end());
  out.values_.erase(std::unique(out.values_.begin(), out.values_.end()), out.values_.end());
  return out;
}

int32_t ClassVocabulary::ClassOf(double rating) const {
  auto it = std::lower_bound(values_.begin(), values_.end(), rating);
  if (it == values_.end() || *it != rating) {
    throw std::out_of_range("ClassVocabulary: rating not in vocabulary: " + std::to_string(rating));
  }
  return static_cast<int32_t>(it - values_.begin());
}

}  // namespace ratinggraph::graph
