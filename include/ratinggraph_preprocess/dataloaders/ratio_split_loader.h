#pragma once

#include <string>

#include "ratinggraph_preprocess/dataloaders/base_loader.h"
#include "ratinggraph_preprocess/io/split_cache.h"

namespace ratinggraph::dataloaders {

// MovieLens ratings shuffled with the configured seed, then cut by ratio.
// The shuffled, id-mapped ratings and features are cached in Parquet.
class RatioSplitLoader : public RatingLoader {
 public:
  using RatingLoader::RatingLoader;

  split::SplitBundle Load() const override;
  std::string Name() const override { return "RatioSplitLoader"; }

  // Raw parse without the cache: shuffle, map ids, build features.
  io::CachedRatings LoadRaw() const;
};

}  // namespace ratinggraph::dataloaders
