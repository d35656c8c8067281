#pragma once

#include <string>

#include "ratinggraph_preprocess/features/feature_builder.h"

namespace ratinggraph::features {

// u.item genre flags (19 columns) and u.user [age/max, gender, one-hot occupation].
class Ml100kFeatureBuilder : public FeatureBuilder {
 public:
  SideFeatures Build(const FeatureContext& ctx) const override;
  std::string Name() const override { return "ml_100k"; }

  SparseMatrix BuildItemFeatures(const FeatureContext& ctx) const;
  SparseMatrix BuildUserFeatures(const FeatureContext& ctx) const;

  static constexpr int64_t kNumGenres = 19;
};

// movies.dat multi-hot genres and users.dat one-hot gender, age, occupation and zip code.
class Ml1mFeatureBuilder : public FeatureBuilder {
 public:
  SideFeatures Build(const FeatureContext& ctx) const override;
  std::string Name() const override { return "ml_1m"; }

  SparseMatrix BuildItemFeatures(const FeatureContext& ctx) const;
  SparseMatrix BuildUserFeatures(const FeatureContext& ctx) const;
};

}  // namespace ratinggraph::features
