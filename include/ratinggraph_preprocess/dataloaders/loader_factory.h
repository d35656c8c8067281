#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ratinggraph_preprocess/dataloaders/base_loader.h"

namespace ratinggraph::dataloaders {

// Loader for the (dataset, split) pair named by a "preprocess" section.
// Throws std::invalid_argument for an unknown dataset or an unsupported pair.
std::unique_ptr<RatingLoader> MakeLoader(const nlohmann::json& preprocess_cfg);

// MakeLoader(cfg)->Load().
split::SplitBundle LoadSplit(const nlohmann::json& preprocess_cfg);

}  // namespace ratinggraph::dataloaders
