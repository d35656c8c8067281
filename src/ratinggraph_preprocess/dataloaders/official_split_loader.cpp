#include "ratinggraph_preprocess/dataloaders/official_split_loader.h"

#include <utility>

#include "ratinggraph_preprocess/dataloaders/rating_files.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::dataloaders {

split::SplitBundle OfficialSplitLoader::Load() const {
  utils::timing::ScopedTimer timer("loader.official");
  const auto dir = options_.DatasetDir();
  auto raw = ReadTabRatings(dir + "/u1.base");
  const auto num_train_rows = static_cast<int64_t>(raw.size());
  raw.Append(ReadTabRatings(dir + "/u1.test"));

  const auto mapped = MapRatings(raw);
  LogRatingCounts(mapped.edges);

  split::OfficialSplit strategy(num_train_rows);
  strategy.LoadConfig(options_.holdout);

  features::FeatureContext ctx;
  ctx.data_dir = dir;
  ctx.user_ids = &mapped.user_ids;
  ctx.item_ids = &mapped.item_ids;
  ctx.num_users = mapped.edges.num_users;
  ctx.num_items = mapped.edges.num_items;
  auto side = features::MakeFeatureBuilder(options_.dataset)->Build(ctx);

  return Finish(mapped.edges, strategy, std::move(side));
}

}  // namespace ratinggraph::dataloaders
