#include "ratinggraph_preprocess/graph/adjacency_builder.h"

#include <stdexcept>
#include <string>

#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::graph {

SparseMatrix BuildTrainingAdjacency(const LabelGrid& labels,
                                    const std::vector<int64_t>& flat_indices) {
  utils::timing::ScopedTimer timer("graph.build_training_adjacency");
  const int64_t num_items = labels.NumItems();
  std::vector<Triplet> triplets;
  triplets.reserve(flat_indices.size());
  for (auto flat : flat_indices) {
    const int32_t label = labels.AtFlat(flat);
    if (label == kNeutralLabel) {
      throw std::logic_error("Training edge has no observed label: flat index " +
                             std::to_string(flat));
    }
    triplets.emplace_back(flat / num_items, flat % num_items, static_cast<float>(label) + 1.0f);
  }

  SparseMatrix adjacency(labels.NumUsers(), num_items);
  // Repeated cells keep one value, matching an assignment into a dense grid.
  adjacency.setFromTriplets(triplets.begin(), triplets.end(),
                            [](const float&, const float& b) { return b; });
  adjacency.makeCompressed();
  return adjacency;
}

}  // namespace ratinggraph::graph
