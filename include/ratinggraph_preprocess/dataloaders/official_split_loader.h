#pragma once

#include <string>

#include "ratinggraph_preprocess/dataloaders/base_loader.h"

namespace ratinggraph::dataloaders {

// MovieLens 100K with its published u1.base / u1.test split.
class OfficialSplitLoader : public RatingLoader {
 public:
  using RatingLoader::RatingLoader;

  split::SplitBundle Load() const override;
  std::string Name() const override { return "OfficialSplitLoader"; }
};

}  // namespace ratinggraph::dataloaders
