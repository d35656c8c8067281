#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "ratinggraph_preprocess/configurable/configurable.h"
#include "ratinggraph_preprocess/features/feature_builder.h"
#include "ratinggraph_preprocess/features/feature_registry.h"
#include "ratinggraph_preprocess/split/rating_edges.h"
#include "ratinggraph_preprocess/split/split_bundle.h"
#include "ratinggraph_preprocess/split/split_strategy.h"

namespace ratinggraph::dataloaders {

// The "preprocess" config section.
struct LoaderOptions : public ratinggraph::configurable::Configurable {
  features::DatasetId dataset{features::DatasetId::kMl100k};
  std::string split{"official"};
  std::string data_root{"data"};
  uint32_t seed{1234};
  bool testing{false};
  std::string datasplit_path;
  bool datasplit_from_file{false};
  nlohmann::json ratio{nlohmann::json::object()};
  nlohmann::json holdout{nlohmann::json::object()};
  nlohmann::json book_crossing{nlohmann::json::object()};

  // Unknown keys are rejected with std::invalid_argument.
  void LoadConfig(const nlohmann::json& cfg) override;

  std::string DatasetName() const { return features::DatasetName(dataset); }
  // <data_root>/<dataset>
  std::string DatasetDir() const;
  // datasplit_path, or <dataset dir>/split_seed<seed>.parquet when unset.
  std::string CachePath() const;
};

// Contract for reading one dataset's raw files into a split bundle.
class RatingLoader : public ratinggraph::configurable::Configurable {
 public:
  explicit RatingLoader(LoaderOptions options) : options_(std::move(options)) {}
  virtual ~RatingLoader() = default;

  void LoadConfig(const nlohmann::json& cfg) override { options_.LoadConfig(cfg); }

  virtual split::SplitBundle Load() const = 0;
  virtual std::string Name() const = 0;

  const LoaderOptions& Options() const { return options_; }

 protected:
  // Runs the split and attaches the side features.
  split::SplitBundle Finish(const split::RatingEdges& edges,
                            const split::SplitStrategy& strategy,
                            features::SideFeatures side) const;

  void LogRatingCounts(const split::RatingEdges& edges) const;

  LoaderOptions options_;
};

}  // namespace ratinggraph::dataloaders
