#include "ratinggraph_preprocess/dataloaders/book_crossing_loader.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "ratinggraph_preprocess/dataloaders/rating_files.h"
#include "ratinggraph_preprocess/preprocess/book_crossing_filter.h"
#include "ratinggraph_preprocess/split/seeded_shuffler.h"
#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

namespace ratinggraph::dataloaders {

BookCrossingLoader::BookCrossingLoader(LoaderOptions options) : RatingLoader(std::move(options)) {
  ReadSettings();
}

void BookCrossingLoader::LoadConfig(const nlohmann::json& cfg) {
  RatingLoader::LoadConfig(cfg);
  ReadSettings();
}

void BookCrossingLoader::ReadSettings() {
  const auto& cfg = options_.book_crossing;
  if (cfg.contains("test_divisor")) {
    test_divisor_ = cfg.at("test_divisor").get<int64_t>();
  }
  if (test_divisor_ <= 0) {
    throw std::invalid_argument("book_crossing.test_divisor must be positive.");
  }
}

std::string BookCrossingLoader::OriginalDir() const {
  return (std::filesystem::path(options_.data_root) / "book_crossing_original").string();
}

std::string BookCrossingLoader::EditedDir() const {
  return (std::filesystem::path(options_.data_root) / "book_crossing_edited").string();
}

std::vector<size_t> BookCrossingLoader::TestRows(size_t num_rows, int64_t test_divisor,
                                                 uint32_t seed) {
  const auto n = static_cast<int64_t>(num_rows);
  split::SeededShuffler shuffler(seed);
  const auto chosen = shuffler.ChooseWithoutReplacement(n, n / test_divisor);
  std::vector<size_t> rows(chosen.begin(), chosen.end());
  std::sort(rows.begin(), rows.end());
  return rows;
}

split::SplitBundle BookCrossingLoader::Load() const {
  utils::timing::ScopedTimer timer("loader.book_crossing");
  preprocess::BookCrossingFilter filter(OriginalDir(), EditedDir());
  filter.LoadConfig(options_.book_crossing);
  filter.EnsureFiltered();

  const auto source = ReadCsvRatings(
      EditedDir() + "/" + preprocess::BookCrossingFiles::kFilteredRatings, "User_Idx", "Book_Idx",
      "Book-Rating");

  // Both subsets keep file order; training rows come first.
  const auto test_rows = TestRows(source.size(), test_divisor_, kTestSelectionSeed);
  std::vector<size_t> train_rows;
  train_rows.reserve(source.size() - test_rows.size());
  size_t t = 0;
  for (size_t i = 0; i < source.size(); ++i) {
    if (t < test_rows.size() && test_rows[t] == i) {
      ++t;
      continue;
    }
    train_rows.push_back(i);
  }
  auto raw = source.Select(train_rows);
  raw.Append(source.Select(test_rows));

  const auto mapped = MapRatings(raw);
  LogRatingCounts(mapped.edges);

  split::OfficialSplit strategy(static_cast<int64_t>(train_rows.size()));
  strategy.LoadConfig(options_.holdout);

  features::FeatureContext ctx;
  ctx.data_dir = EditedDir();
  ctx.user_ids = &mapped.user_ids;
  ctx.item_ids = &mapped.item_ids;
  ctx.num_users = mapped.edges.num_users;
  ctx.num_items = mapped.edges.num_items;
  auto side = features::MakeFeatureBuilder(options_.dataset)->Build(ctx);

  return Finish(mapped.edges, strategy, std::move(side));
}

}  // namespace ratinggraph::dataloaders
