#include "ratinggraph_preprocess/dataloaders/loader_factory.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/dataloaders/book_crossing_loader.h"
#include "ratinggraph_preprocess/dataloaders/monti_loader.h"
#include "ratinggraph_preprocess/dataloaders/official_split_loader.h"
#include "ratinggraph_preprocess/dataloaders/ratio_split_loader.h"

namespace ratinggraph::dataloaders {

std::unique_ptr<RatingLoader> MakeLoader(const nlohmann::json& preprocess_cfg) {
  LoaderOptions options;
  options.LoadConfig(preprocess_cfg);

  using features::DatasetId;
  const auto& split = options.split;
  std::unique_ptr<RatingLoader> loader;
  switch (options.dataset) {
    case DatasetId::kMl100k:
      if (split == "official") {
        loader = std::make_unique<OfficialSplitLoader>(options);
      } else if (split == "ratio") {
        loader = std::make_unique<RatioSplitLoader>(options);
      }
      break;
    case DatasetId::kMl1m:
      if (split == "ratio") {
        loader = std::make_unique<RatioSplitLoader>(options);
      }
      break;
    case DatasetId::kFlixster:
    case DatasetId::kDouban:
    case DatasetId::kYahooMusic:
      // The masks are the published split.
      if (split == "masked" || split == "official") {
        loader = std::make_unique<MontiLoader>(options);
      }
      break;
    case DatasetId::kBookCrossing:
      if (split == "official") {
        loader = std::make_unique<BookCrossingLoader>(options);
      }
      break;
  }
  if (!loader) {
    throw std::invalid_argument("Unsupported split '" + split + "' for dataset " +
                                options.DatasetName());
  }
  spdlog::debug("[LoaderFactory] {} / {} -> {}", options.DatasetName(), split, loader->Name());
  return loader;
}

split::SplitBundle LoadSplit(const nlohmann::json& preprocess_cfg) {
  return MakeLoader(preprocess_cfg)->Load();
}

}  // namespace ratinggraph::dataloaders
