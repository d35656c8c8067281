#include "ratinggraph_preprocess/dataloaders/base_loader.h"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "ratinggraph_preprocess/split/split_engine.h"
#include "ratinggraph_preprocess/utils/json/json_utils.h"

namespace ratinggraph::dataloaders {

void LoaderOptions::LoadConfig(const nlohmann::json& cfg) {
  using utils::json::JsonUtils;
  const std::string context = "preprocess";
  JsonUtils::RequireObject(cfg, context);
  JsonUtils::ValidateAllowedKeys(cfg,
                                 {"dataset", "split", "data_root", "seed", "testing",
                                  "datasplit_path", "datasplit_from_file", "ratio", "holdout",
                                  "book_crossing"},
                                 context);

  if (cfg.contains("dataset")) {
    dataset = features::ParseDatasetId(JsonUtils::RequireStringField(cfg, "dataset", context));
  }
  split = JsonUtils::ValueOr<std::string>(cfg, "split", split, context);
  data_root = JsonUtils::ValueOr<std::string>(cfg, "data_root", data_root, context);
  seed = JsonUtils::ValueOr<uint32_t>(cfg, "seed", seed, context);
  testing = JsonUtils::ValueOr<bool>(cfg, "testing", testing, context);
  datasplit_path = JsonUtils::ValueOr<std::string>(cfg, "datasplit_path", datasplit_path, context);
  datasplit_from_file =
      JsonUtils::ValueOr<bool>(cfg, "datasplit_from_file", datasplit_from_file, context);
  if (cfg.contains("ratio")) {
    ratio = JsonUtils::OptionalObjectField(cfg, "ratio", context);
  }
  if (cfg.contains("holdout")) {
    holdout = JsonUtils::OptionalObjectField(cfg, "holdout", context);
  }
  if (cfg.contains("book_crossing")) {
    book_crossing = JsonUtils::OptionalObjectField(cfg, "book_crossing", context);
  }
}

std::string LoaderOptions::DatasetDir() const {
  return (std::filesystem::path(data_root) / DatasetName()).string();
}

std::string LoaderOptions::CachePath() const {
  if (!datasplit_path.empty()) {
    return datasplit_path;
  }
  return (std::filesystem::path(DatasetDir()) / ("split_seed" + std::to_string(seed) + ".parquet"))
      .string();
}

split::SplitBundle RatingLoader::Finish(const split::RatingEdges& edges,
                                        const split::SplitStrategy& strategy,
                                        features::SideFeatures side) const {
  split::SplitEngine engine(options_.testing);
  auto bundle = engine.Run(edges, strategy);
  bundle.user_features = std::move(side.user_features);
  bundle.item_features = std::move(side.item_features);
  spdlog::info("[{}] User features shape: ({}, {})", Name(), bundle.user_features.rows(),
               bundle.user_features.cols());
  spdlog::info("[{}] Item features shape: ({}, {})", Name(), bundle.item_features.rows(),
               bundle.item_features.cols());
  return bundle;
}

void RatingLoader::LogRatingCounts(const split::RatingEdges& edges) const {
  spdlog::info("[{}] Number of users = {}", Name(), edges.num_users);
  spdlog::info("[{}] Number of items = {}", Name(), edges.num_items);
  spdlog::info("[{}] Number of links = {}", Name(), edges.size());
  const double cells = static_cast<double>(edges.num_users) * static_cast<double>(edges.num_items);
  if (cells > 0) {
    spdlog::info("[{}] Fraction of positive links = {:.4f}", Name(),
                 static_cast<double>(edges.size()) / cells);
  }
}

}  // namespace ratinggraph::dataloaders
