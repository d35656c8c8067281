#include "ratinggraph_preprocess/dataloaders/ratio_split_loader.h"

#include <numeric>
#include <utility>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/dataloaders/rating_files.h"
#include "ratinggraph_preprocess/split/seeded_shuffler.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::dataloaders {

io::CachedRatings RatioSplitLoader::LoadRaw() const {
  utils::timing::ScopedTimer timer("loader.ratio.raw");
  const auto dir = options_.DatasetDir();
  RawRatings raw;
  switch (options_.dataset) {
    case features::DatasetId::kMl100k:
      raw = ReadTabRatings(dir + "/u.data");
      break;
    case features::DatasetId::kMl1m:
      raw = ReadDoubleColonRatings(dir + "/ratings.dat");
      break;
    default:
      throw std::invalid_argument("RatioSplitLoader does not support dataset " +
                                  options_.DatasetName());
  }

  // Rows move together; the shuffle decides both the split and the id order.
  std::vector<size_t> order(raw.size());
  std::iota(order.begin(), order.end(), size_t{0});
  split::SeededShuffler(options_.seed).Shuffle(order);
  const auto mapped = MapRatings(raw.Select(order));

  features::FeatureContext ctx;
  ctx.data_dir = dir;
  ctx.user_ids = &mapped.user_ids;
  ctx.item_ids = &mapped.item_ids;
  ctx.num_users = mapped.edges.num_users;
  ctx.num_items = mapped.edges.num_items;
  auto side = features::MakeFeatureBuilder(options_.dataset)->Build(ctx);

  io::CachedRatings out;
  out.edges = mapped.edges;
  out.user_features = std::move(side.user_features);
  out.item_features = std::move(side.item_features);
  return out;
}

split::SplitBundle RatioSplitLoader::Load() const {
  utils::timing::ScopedTimer timer("loader.ratio");
  io::SplitCache cache(options_.CachePath());

  io::CachedRatings cached;
  if (options_.datasplit_from_file && cache.Exists()) {
    spdlog::info("[{}] Reading dataset splits from {}", Name(), cache.Path());
    cached = cache.Read();
  } else {
    cached = LoadRaw();
    cache.Write(cached);
  }
  LogRatingCounts(cached.edges);

  split::RatioSplit strategy;
  strategy.LoadConfig(options_.ratio);
  features::SideFeatures side{std::move(cached.user_features), std::move(cached.item_features)};
  return Finish(cached.edges, strategy, std::move(side));
}

}  // namespace ratinggraph::dataloaders
