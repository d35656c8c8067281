#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ratinggraph_preprocess/configurable/configurable.h"
#include "ratinggraph_preprocess/graph/sparse_types.h"
#include "ratinggraph_preprocess/mapping/id_mapper.h"

namespace ratinggraph::features {

// Where side files live and how their raw ids map onto the dense index space.
// Null maps mean the dataset is already dense (row i is entity i).
struct FeatureContext {
  std::string data_dir;
  const mapping::IdMap<int64_t>* user_ids{nullptr};
  const mapping::IdMap<int64_t>* item_ids{nullptr};
  int64_t num_users{0};
  int64_t num_items{0};

  std::optional<int64_t> UserRow(int64_t raw_id) const;
  std::optional<int64_t> ItemRow(int64_t raw_id) const;
};

struct SideFeatures {
  SparseMatrix user_features;
  SparseMatrix item_features;
};

// Contract for per-dataset side feature schemas.
class FeatureBuilder : public ratinggraph::configurable::Configurable {
 public:
  virtual ~FeatureBuilder() = default;

  virtual SideFeatures Build(const FeatureContext& ctx) const = 0;
  virtual std::string Name() const = 0;
};

}  // namespace ratinggraph::features
