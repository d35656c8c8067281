#pragma once

#include "ratinggraph_preprocess/graph/class_vocabulary.h"
#include "ratinggraph_preprocess/graph/label_grid.h"
#include "ratinggraph_preprocess/split/rating_edges.h"
#include "ratinggraph_preprocess/split/split_bundle.h"
#include "ratinggraph_preprocess/split/split_strategy.h"

namespace ratinggraph::split {

// Labels a strategy's partition through the label grid and builds the training
// adjacency. Side features are left empty for the caller to attach.
class SplitEngine {
 public:
  // With `testing` set, validation edges are merged into the training arrays
  // and adjacency (final evaluation rather than tuning).
  explicit SplitEngine(bool testing = false) : testing_(testing) {}

  SplitBundle Run(const RatingEdges& edges, const SplitStrategy& strategy) const;

  // Label grid over `edges`, cross-checked against the vocabulary.
  static graph::LabelGrid BuildLabelGrid(const RatingEdges& edges,
                                         const graph::ClassVocabulary& vocabulary);

 private:
  EdgeSet LabelPairs(const EdgePairs& pairs,
                     const graph::LabelGrid& labels,
                     const char* which) const;

  bool testing_;
};

}  // namespace ratinggraph::split
