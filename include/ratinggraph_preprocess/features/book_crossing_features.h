#pragma once

#include <string>

#include "ratinggraph_preprocess/features/feature_builder.h"

namespace ratinggraph::features {

// Filtered Book-Crossing side files. Items: [year/max, one-hot author].
// Users: [age/max]. `ctx.data_dir` is the directory the filter wrote to.
class BookCrossingFeatureBuilder : public FeatureBuilder {
 public:
  SideFeatures Build(const FeatureContext& ctx) const override;
  std::string Name() const override { return "book_crossing"; }

  SparseMatrix BuildItemFeatures(const FeatureContext& ctx) const;
  SparseMatrix BuildUserFeatures(const FeatureContext& ctx) const;
};

}  // namespace ratinggraph::features
