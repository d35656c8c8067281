#include "ratinggraph_preprocess/features/feature_registry.h"

#include <stdexcept>

#include "ratinggraph_preprocess/features/book_crossing_features.h"
#include "ratinggraph_preprocess/features/mat_side_features.h"
#include "ratinggraph_preprocess/features/movielens_features.h"

namespace ratinggraph::features {

const std::vector<DatasetId>& AllDatasets() {
  static const std::vector<DatasetId> ids = {DatasetId::kMl100k,   DatasetId::kMl1m,
                                             DatasetId::kFlixster, DatasetId::kDouban,
                                             DatasetId::kYahooMusic, DatasetId::kBookCrossing};
  return ids;
}

std::string DatasetName(DatasetId id) {
  switch (id) {
    case DatasetId::kMl100k:
      return "ml_100k";
    case DatasetId::kMl1m:
      return "ml_1m";
    case DatasetId::kFlixster:
      return "flixster";
    case DatasetId::kDouban:
      return "douban";
    case DatasetId::kYahooMusic:
      return "yahoo_music";
    case DatasetId::kBookCrossing:
      return "book_crossing";
  }
  throw std::invalid_argument("Invalid dataset id");
}

DatasetId ParseDatasetId(const std::string& name) {
  for (auto id : AllDatasets()) {
    if (DatasetName(id) == name) {
      return id;
    }
  }
  throw std::invalid_argument("Invalid dataset option " + name);
}

bool IsMatDataset(DatasetId id) {
  return id == DatasetId::kFlixster || id == DatasetId::kDouban || id == DatasetId::kYahooMusic;
}

std::unique_ptr<FeatureBuilder> MakeFeatureBuilder(DatasetId id) {
  switch (id) {
    case DatasetId::kMl100k:
      return std::make_unique<Ml100kFeatureBuilder>();
    case DatasetId::kMl1m:
      return std::make_unique<Ml1mFeatureBuilder>();
    case DatasetId::kFlixster:
      return std::make_unique<MatSideFeatureBuilder>("flixster", "W_users", "W_movies");
    case DatasetId::kDouban:
      return std::make_unique<MatSideFeatureBuilder>("douban", "W_users", "");
    case DatasetId::kYahooMusic:
      return std::make_unique<MatSideFeatureBuilder>("yahoo_music", "", "W_tracks");
    case DatasetId::kBookCrossing:
      return std::make_unique<BookCrossingFeatureBuilder>();
  }
  throw std::invalid_argument("Invalid dataset id");
}

}  // namespace ratinggraph::features
