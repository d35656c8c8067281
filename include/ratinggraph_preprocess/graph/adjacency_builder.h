#pragma once

#include <cstdint>
#include <vector>

#include "ratinggraph_preprocess/graph/label_grid.h"
#include "ratinggraph_preprocess/graph/sparse_types.h"

namespace ratinggraph::graph {

// CSR adjacency over the given flat indices holding class_index + 1, so an
// implicit zero means "no edge" and stays distinct from class 0.
SparseMatrix BuildTrainingAdjacency(const LabelGrid& labels,
                                    const std::vector<int64_t>& flat_indices);

}  // namespace ratinggraph::graph
