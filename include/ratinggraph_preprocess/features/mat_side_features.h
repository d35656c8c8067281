#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "ratinggraph_preprocess/features/feature_builder.h"

namespace ratinggraph::features {

// Side matrices stored next to the ratings in training_test_dataset.mat.
// An empty field name yields the identity for that side.
class MatSideFeatureBuilder : public FeatureBuilder {
 public:
  MatSideFeatureBuilder(std::string name, std::string user_field, std::string item_field)
      : name_(std::move(name)),
        user_field_(std::move(user_field)),
        item_field_(std::move(item_field)) {}

  SideFeatures Build(const FeatureContext& ctx) const override;
  std::string Name() const override { return name_; }

  static SparseMatrix Identity(int64_t n);
  static constexpr const char* kMatFile = "training_test_dataset.mat";

 private:
  std::string name_;
  std::string user_field_;
  std::string item_field_;
};

}  // namespace ratinggraph::features
