#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ratinggraph_preprocess/features/feature_builder.h"

namespace ratinggraph::features {

enum class DatasetId {
  kMl100k,
  kMl1m,
  kFlixster,
  kDouban,
  kYahooMusic,
  kBookCrossing,
};

// Throws std::invalid_argument for an unknown name.
DatasetId ParseDatasetId(const std::string& name);
std::string DatasetName(DatasetId id);
const std::vector<DatasetId>& AllDatasets();

// Datasets whose ratings and side matrices come from one .mat container.
bool IsMatDataset(DatasetId id);

std::unique_ptr<FeatureBuilder> MakeFeatureBuilder(DatasetId id);

}  // namespace ratinggraph::features
