#pragma once

#include <cstdint>
#include <vector>

namespace ratinggraph::graph {

// Sorted unique rating values; a rating's class index is its position here.
class ClassVocabulary {
 public:
  static ClassVocabulary FromRatings(const std::vector<double>& ratings);

  // Throws std::out_of_range for a value that was never observed.
  int32_t ClassOf(double rating) const;

  const std::vector<double>& Values() const { return values_; }
  int32_t NumClasses() const { return static_cast<int32_t>(values_.size()); }

 private:
  std::vector<double> values_;
};

}  // namespace ratinggraph::graph
